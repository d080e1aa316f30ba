#include "PromptManager.hpp"
#include "DatabaseManager.hpp"
#include "Logger.hpp"
#include "VaultErrors.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace {
    // Applies a store mutation, then persists it inside one database
    // transaction. On any persistence failure the transaction is rolled back
    // and the prompt is put back exactly as it was, so memory and disk agree.
    template <typename Mutation, typename Persist>
    auto writeThrough(VaultStore& store, DatabaseManager* db, const std::string& key,
                      Mutation&& mutate, Persist&& persist) {
        if (!db) return mutate();

        std::optional<Prompt> before;
        if (store.contains(key)) before = store.prompt(key);

        auto result = mutate();
        try {
            db->beginTransaction();
            try {
                persist(*db);
                db->commit();
            } catch (...) {
                db->rollback();
                throw;
            }
        } catch (const std::exception& e) {
            Logger::core()->error("Persisting change to '{}' failed, reverted: {}", key, e.what());
            store.revertPrompt(key, before);
            throw;
        }
        return result;
    }
}

PromptManager::PromptManager(VaultStore store)
: m_store(std::move(store)) {}

PromptManager::PromptManager(VaultStore store, std::unique_ptr<DatabaseManager> db)
: m_store(std::move(store)), m_db(std::move(db)) {}

PromptManager::~PromptManager() = default;

std::unique_ptr<PromptManager> PromptManager::open(const VaultConfig& config,
                                                   const std::optional<std::string>& password) {
    if (!config.storage.database.empty()) {
        auto db = std::make_unique<DatabaseManager>(config.storage.database);
        db->init();
        VaultStore store = db->loadVault();
        Logger::core()->info("Opened live vault '{}' with {} prompt(s)",
                             config.storage.database, store.size());
        return std::make_unique<PromptManager>(std::move(store), std::move(db));
    }

    BackupManager backup;
    return std::make_unique<PromptManager>(
        backup.restoreOrDefault(config.storage.vault_file, password));
}

std::shared_lock<std::shared_mutex> PromptManager::lockShared() const {
    std::lock_guard<std::mutex> gate(m_gate);
    return std::shared_lock<std::shared_mutex>(m_lock);
}

std::unique_lock<std::shared_mutex> PromptManager::lockExclusive() const {
    std::lock_guard<std::mutex> gate(m_gate);
    return std::unique_lock<std::shared_mutex>(m_lock);
}

// ---- Mutations

std::uint32_t PromptManager::add(const std::string& key, const std::string& content) {
    auto lock = lockExclusive();
    const auto number = writeThrough(m_store, m_db.get(), key,
        [&] { return m_store.add(key, content); },
        [&](DatabaseManager& db) { db.insertPrompt(m_store.prompt(key)); });
    Logger::core()->debug("Added prompt '{}'", key);
    return number;
}

std::uint32_t PromptManager::update(const std::string& key,
                                    const std::string& content,
                                    const std::optional<std::string>& message) {
    auto lock = lockExclusive();
    const auto number = writeThrough(m_store, m_db.get(), key,
        [&] { return m_store.update(key, content, message); },
        [&](DatabaseManager& db) {
            const Prompt& p = m_store.prompt(key);
            db.insertVersion(key, p.versions.back());
            db.upsertTag(key, VaultStore::DEV_TAG, p.latestNumber());
        });
    Logger::core()->debug("Updated prompt '{}' to v{}", key, number);
    return number;
}

void PromptManager::tag(const std::string& key, const std::string& name, std::uint64_t version) {
    auto lock = lockExclusive();
    writeThrough(m_store, m_db.get(), key,
        [&] { m_store.tag(key, name, version); return true; },
        [&](DatabaseManager& db) { db.upsertTag(key, name, m_store.prompt(key).tags.at(name)); });
    Logger::core()->debug("Tagged '{}' v{} as '{}'", key, version, name);
}

void PromptManager::promote(const std::string& key, const std::string& name) {
    auto lock = lockExclusive();
    writeThrough(m_store, m_db.get(), key,
        [&] { m_store.promote(key, name); return true; },
        [&](DatabaseManager& db) { db.upsertTag(key, name, m_store.prompt(key).tags.at(name)); });
    Logger::core()->debug("Promoted tag '{}' of '{}' to latest", name, key);
}

// ---- Reads

std::string PromptManager::get(const std::string& key, const VersionSelector& selector) const {
    auto lock = lockShared();
    return m_store.get(key, selector);
}

std::string PromptManager::get(const std::string& key, const std::string& selectorText) const {
    return get(key, VersionSelector::parse(selectorText));
}

std::vector<VersionSummary> PromptManager::history(const std::string& key) const {
    auto lock = lockShared();
    return m_store.history(key);
}

std::uint32_t PromptManager::latestVersionNumber(const std::string& key) const {
    auto lock = lockShared();
    return m_store.latestVersionNumber(key);
}

std::vector<std::string> PromptManager::keys() const {
    auto lock = lockShared();
    return m_store.keys();
}

VaultStore PromptManager::snapshot() const {
    auto lock = lockShared();
    return m_store;
}

// ---- Backup

void PromptManager::dump(const std::string& path, const std::optional<std::string>& password) const {
    // Encoding, encryption and disk I/O run on the copy with no lock held.
    const VaultStore copy = snapshot();
    m_backup.dump(copy, path, password);
}

void PromptManager::install(VaultStore next) {
    auto lock = lockExclusive();
    if (m_db) m_db->replaceVault(next);
    m_store = std::move(next);
}

void PromptManager::restore(const std::string& path, const std::optional<std::string>& password) {
    install(m_backup.restore(path, password));
}

bool PromptManager::restoreOrDefault(const std::string& path, const std::optional<std::string>& password) {
    std::error_code ec;
    const bool found = std::filesystem::exists(path, ec);
    install(m_backup.restoreOrDefault(path, password));
    return found;
}
