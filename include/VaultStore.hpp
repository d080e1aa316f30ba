#pragma once
#include "PromptTypes.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

// In-memory versioned key -> prompt store. Not thread-safe on its own;
// PromptManager serializes access to it.
class VaultStore {
public:
    // Returns "now" as epoch seconds. Injected so tests can pin timestamps.
    using Clock = std::function<std::int64_t()>;

    VaultStore();
    explicit VaultStore(Clock clock);

    // Build a store from untrusted records (decoded bytes, database rows).
    // Every invariant is re-checked; throws CorruptDataError on violation.
    static VaultStore fromPrompts(std::vector<Prompt> prompts);
    static void validatePrompt(const Prompt& prompt);

    static std::int64_t systemClock();

    // ---- Mutations
    // Creates version 1 and tag dev -> 1. Throws DuplicateKeyError.
    std::uint32_t add(const std::string& key, const std::string& content);

    // Appends version N+1 and repoints dev. Throws KeyNotFoundError.
    std::uint32_t update(const std::string& key,
                         const std::string& content,
                         const std::optional<std::string>& message = std::nullopt);

    // Creates or overwrites a tag. Throws KeyNotFoundError / VersionNotFoundError.
    void tag(const std::string& key, const std::string& name, std::uint64_t number);

    // tag(key, name, latest)
    void promote(const std::string& key, const std::string& name);

    // ---- Queries
    std::string get(const std::string& key, const VersionSelector& selector) const;
    std::uint32_t resolve(const std::string& key, const VersionSelector& selector) const;
    std::vector<VersionSummary> history(const std::string& key) const;
    std::uint32_t latestVersionNumber(const std::string& key) const;
    std::vector<std::string> keys() const;

    bool contains(const std::string& key) const;
    std::size_t size() const { return m_prompts.size(); }
    bool empty() const { return m_prompts.empty(); }

    // Throws KeyNotFoundError.
    const Prompt& prompt(const std::string& key) const;
    const std::map<std::string, Prompt>& prompts() const { return m_prompts; }

    // Rollback hook: put back a prompt exactly as captured before a failed
    // mutation, or drop the key when there was none.
    void revertPrompt(const std::string& key, const std::optional<Prompt>& before);

    friend bool operator==(const VaultStore& a, const VaultStore& b) {
        return a.m_prompts == b.m_prompts;
    }
    friend bool operator!=(const VaultStore& a, const VaultStore& b) { return !(a == b); }

    static constexpr const char* DEV_TAG = "dev";

private:
    Prompt& mutablePrompt(const std::string& key);

    std::map<std::string, Prompt> m_prompts;
    Clock m_clock;
};
