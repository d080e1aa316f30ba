#include "VaultStore.hpp"
#include "VaultErrors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <utility>

namespace {
    std::string sha256Hex(const std::string& data) {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int mdLen = 0;
        if (EVP_Digest(data.data(), data.size(), md, &mdLen, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_Digest(sha256) failed");
        }
        static const char* HEX = "0123456789abcdef";
        std::string out;
        out.reserve(mdLen * 2);
        for (unsigned int i = 0; i < mdLen; ++i) {
            out.push_back(HEX[md[i] >> 4]);
            out.push_back(HEX[md[i] & 0x0F]);
        }
        return out;
    }

    void requireKey(const std::string& key) {
        if (key.empty()) throw std::invalid_argument("prompt key must not be empty");
    }

    void requireTagName(const std::string& name) {
        if (name.empty()) throw std::invalid_argument("tag name must not be empty");
    }
}

VaultStore::VaultStore()
: m_clock(&VaultStore::systemClock) {}

VaultStore::VaultStore(Clock clock)
: m_clock(clock ? std::move(clock) : Clock(&VaultStore::systemClock)) {}

std::int64_t VaultStore::systemClock() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

void VaultStore::validatePrompt(const Prompt& prompt) {
    if (prompt.key.empty()) {
        throw CorruptDataError("prompt with empty key");
    }
    if (prompt.versions.empty()) {
        throw CorruptDataError("prompt '" + prompt.key + "' has no versions");
    }
    std::uint32_t expected = 1;
    for (const auto& v : prompt.versions) {
        if (v.number != expected) {
            throw CorruptDataError("prompt '" + prompt.key + "' expected version "
                                   + std::to_string(expected) + ", found "
                                   + std::to_string(v.number));
        }
        ++expected;
    }
    const std::uint32_t latest = prompt.latestNumber();
    for (const auto& [name, target] : prompt.tags) {
        if (name.empty()) {
            throw CorruptDataError("prompt '" + prompt.key + "' has an empty tag name");
        }
        if (target < 1 || target > latest) {
            throw CorruptDataError("tag '" + name + "' of prompt '" + prompt.key
                                   + "' targets missing version " + std::to_string(target));
        }
    }
    if (prompt.tags.find(DEV_TAG) == prompt.tags.end()) {
        throw CorruptDataError("prompt '" + prompt.key + "' has no dev tag");
    }
}

VaultStore VaultStore::fromPrompts(std::vector<Prompt> prompts) {
    VaultStore store;
    for (auto& p : prompts) {
        validatePrompt(p);
        std::string key = p.key;
        if (!store.m_prompts.emplace(key, std::move(p)).second) {
            throw CorruptDataError("duplicate prompt key '" + key + "'");
        }
    }
    return store;
}

std::uint32_t VaultStore::add(const std::string& key, const std::string& content) {
    requireKey(key);
    if (contains(key)) throw DuplicateKeyError(key);

    Prompt p;
    p.key = key;
    p.versions.push_back(Version{1, content, m_clock(), std::nullopt});
    p.tags[DEV_TAG] = 1;
    m_prompts.emplace(key, std::move(p));
    return 1;
}

std::uint32_t VaultStore::update(const std::string& key,
                                 const std::string& content,
                                 const std::optional<std::string>& message) {
    requireKey(key);
    Prompt& p = mutablePrompt(key);
    if (p.latestNumber() == std::numeric_limits<std::uint32_t>::max()) {
        throw std::overflow_error("prompt '" + key + "' has exhausted its version numbers");
    }
    const std::uint32_t next = p.latestNumber() + 1;
    p.versions.push_back(Version{next, content, m_clock(), message});
    p.tags[DEV_TAG] = next;
    return next;
}

void VaultStore::tag(const std::string& key, const std::string& name, std::uint64_t number) {
    requireKey(key);
    requireTagName(name);
    Prompt& p = mutablePrompt(key);
    if (number < 1 || number > p.latestNumber()) {
        throw VersionNotFoundError("Version " + std::to_string(number)
                                   + " does not exist for prompt '" + key + "'");
    }
    p.tags[name] = static_cast<std::uint32_t>(number);
}

void VaultStore::promote(const std::string& key, const std::string& name) {
    tag(key, name, latestVersionNumber(key));
}

std::uint32_t VaultStore::resolve(const std::string& key, const VersionSelector& selector) const {
    const Prompt& p = prompt(key);
    switch (selector.kind()) {
        case VersionSelector::Kind::Latest:
            return p.latestNumber();

        case VersionSelector::Kind::Number:
            if (selector.versionNumber() < 1 || selector.versionNumber() > p.latestNumber()) {
                throw VersionNotFoundError("Version " + std::to_string(selector.versionNumber())
                                           + " does not exist for prompt '" + key + "'");
            }
            return static_cast<std::uint32_t>(selector.versionNumber());

        case VersionSelector::Kind::Tag: {
            auto it = p.tags.find(selector.tagName());
            if (it == p.tags.end()) throw TagNotFoundError(key, selector.tagName());
            return it->second;
        }

        case VersionSelector::Kind::Time: {
            // Versions are append-only, so created_at is scanned newest first.
            for (auto it = p.versions.rbegin(); it != p.versions.rend(); ++it) {
                if (it->createdAt <= selector.time()) return it->number;
            }
            throw VersionNotFoundError("No version of prompt '" + key + "' existed at "
                                       + std::to_string(selector.time()));
        }
    }
    throw std::logic_error("unhandled selector kind");
}

std::string VaultStore::get(const std::string& key, const VersionSelector& selector) const {
    const std::uint32_t number = resolve(key, selector);
    return prompt(key).versions[number - 1].content;
}

std::vector<VersionSummary> VaultStore::history(const std::string& key) const {
    const Prompt& p = prompt(key);

    std::vector<std::vector<std::string>> tagsByVersion(p.versions.size());
    for (const auto& [name, target] : p.tags) {
        tagsByVersion[target - 1].push_back(name);  // std::map iterates names in order
    }

    std::vector<VersionSummary> out;
    out.reserve(p.versions.size());
    for (const auto& v : p.versions) {
        VersionSummary s;
        s.number      = v.number;
        s.createdAt   = v.createdAt;
        s.message     = v.message;
        s.tags        = std::move(tagsByVersion[v.number - 1]);
        s.contentHash = sha256Hex(v.content);
        out.push_back(std::move(s));
    }
    return out;
}

std::uint32_t VaultStore::latestVersionNumber(const std::string& key) const {
    return prompt(key).latestNumber();
}

std::vector<std::string> VaultStore::keys() const {
    std::vector<std::string> out;
    out.reserve(m_prompts.size());
    for (const auto& entry : m_prompts) out.push_back(entry.first);
    return out;
}

bool VaultStore::contains(const std::string& key) const {
    return m_prompts.find(key) != m_prompts.end();
}

const Prompt& VaultStore::prompt(const std::string& key) const {
    auto it = m_prompts.find(key);
    if (it == m_prompts.end()) throw KeyNotFoundError(key);
    return it->second;
}

Prompt& VaultStore::mutablePrompt(const std::string& key) {
    auto it = m_prompts.find(key);
    if (it == m_prompts.end()) throw KeyNotFoundError(key);
    return it->second;
}

void VaultStore::revertPrompt(const std::string& key, const std::optional<Prompt>& before) {
    if (before) {
        m_prompts[key] = *before;
    } else {
        m_prompts.erase(key);
    }
}
