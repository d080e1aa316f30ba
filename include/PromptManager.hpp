#pragma once
#include "BackupManager.hpp"
#include "PromptTypes.hpp"
#include "VaultConfig.hpp"
#include "VaultStore.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

class DatabaseManager;

// Thread-safe owner of the live vault and the single entry point for callers.
// Reads run concurrently; mutations and restore are exclusive. Each call
// either fully applies and is visible to the next caller, or throws and leaves
// the vault as it was.
class PromptManager {
public:
    explicit PromptManager(VaultStore store = VaultStore{});

    // Write-through mode: the database must already hold the same state as
    // `store` (see open()).
    PromptManager(VaultStore store, std::unique_ptr<DatabaseManager> db);

    ~PromptManager();

    PromptManager(const PromptManager&) = delete;
    PromptManager& operator=(const PromptManager&) = delete;

    // With storage.database set, loads the live vault from SQLite; otherwise
    // restores storage.vault_file (an absent file gives an empty vault).
    static std::unique_ptr<PromptManager> open(const VaultConfig& config,
                                               const std::optional<std::string>& password = std::nullopt);

    // ---- Mutations
    std::uint32_t add(const std::string& key, const std::string& content);
    std::uint32_t update(const std::string& key,
                         const std::string& content,
                         const std::optional<std::string>& message = std::nullopt);
    void tag(const std::string& key, const std::string& name, std::uint64_t version);
    void promote(const std::string& key, const std::string& name);

    // ---- Reads
    std::string get(const std::string& key,
                    const VersionSelector& selector = VersionSelector::latest()) const;
    std::string get(const std::string& key, const std::string& selectorText) const;
    std::vector<VersionSummary> history(const std::string& key) const;
    std::uint32_t latestVersionNumber(const std::string& key) const;
    std::vector<std::string> keys() const;
    VaultStore snapshot() const;

    // ---- Backup
    void dump(const std::string& path,
              const std::optional<std::string>& password = std::nullopt) const;

    // Full replace of the live vault.
    void restore(const std::string& path,
                 const std::optional<std::string>& password = std::nullopt);

    // As restore; a missing file installs an empty vault and returns false.
    bool restoreOrDefault(const std::string& path,
                          const std::optional<std::string>& password = std::nullopt);

    bool persistent() const { return m_db != nullptr; }

private:
    // Writers hold m_gate while waiting for m_lock, so readers that arrive
    // after a waiting writer queue behind it.
    std::shared_lock<std::shared_mutex> lockShared() const;
    std::unique_lock<std::shared_mutex> lockExclusive() const;

    void install(VaultStore next);

    mutable std::mutex        m_gate;
    mutable std::shared_mutex m_lock;
    VaultStore                m_store;
    std::unique_ptr<DatabaseManager> m_db;
    BackupManager             m_backup;
};
