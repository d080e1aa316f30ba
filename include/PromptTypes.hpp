#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

// One immutable snapshot of a prompt's content.
struct Version {
    std::uint32_t number = 0;                 // 1-based, gap-free per prompt
    std::string content;
    std::int64_t createdAt = 0;               // epoch seconds (UTC)
    std::optional<std::string> message;
};

bool operator==(const Version& a, const Version& b);
bool operator!=(const Version& a, const Version& b);

// A keyed, append-only version log plus its mutable tag table.
struct Prompt {
    std::string key;
    std::vector<Version> versions;                 // ascending by number
    std::map<std::string, std::uint32_t> tags;     // tag name -> version number

    std::uint32_t latestNumber() const {
        return versions.empty() ? 0 : versions.back().number;
    }
};

bool operator==(const Prompt& a, const Prompt& b);
bool operator!=(const Prompt& a, const Prompt& b);

// Row returned by history(): one per version, tags computed from the tag table.
struct VersionSummary {
    std::uint32_t number = 0;
    std::int64_t createdAt = 0;
    std::optional<std::string> message;
    std::vector<std::string> tags;             // sorted tag names pointing here
    std::string contentHash;                   // lowercase hex SHA-256 of content
};

// Which version a read asks for.
class VersionSelector {
public:
    enum class Kind { Latest, Number, Tag, Time };

    static VersionSelector latest();
    static VersionSelector number(std::uint64_t n);
    static VersionSelector tag(const std::string& name);
    static VersionSelector at(std::int64_t epochSeconds);

    // "" and "latest" -> Latest, digits -> Number, anything else -> Tag.
    static VersionSelector parse(const std::string& text);

    Kind kind() const { return m_kind; }
    std::uint64_t versionNumber() const { return m_number; }
    const std::string& tagName() const { return m_tag; }
    std::int64_t time() const { return m_time; }

    std::string describe() const;

private:
    explicit VersionSelector(Kind kind) : m_kind(kind) {}

    Kind          m_kind;
    std::uint64_t m_number = 0;
    std::string   m_tag;
    std::int64_t  m_time = 0;
};
