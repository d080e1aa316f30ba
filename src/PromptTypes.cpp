#include "PromptTypes.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

bool operator==(const Version& a, const Version& b) {
    return a.number == b.number
        && a.content == b.content
        && a.createdAt == b.createdAt
        && a.message == b.message;
}

bool operator!=(const Version& a, const Version& b) { return !(a == b); }

bool operator==(const Prompt& a, const Prompt& b) {
    return a.key == b.key && a.versions == b.versions && a.tags == b.tags;
}

bool operator!=(const Prompt& a, const Prompt& b) { return !(a == b); }

VersionSelector VersionSelector::latest() {
    return VersionSelector(Kind::Latest);
}

VersionSelector VersionSelector::number(std::uint64_t n) {
    VersionSelector s(Kind::Number);
    s.m_number = n;
    return s;
}

VersionSelector VersionSelector::tag(const std::string& name) {
    VersionSelector s(Kind::Tag);
    s.m_tag = name;
    return s;
}

VersionSelector VersionSelector::at(std::int64_t epochSeconds) {
    VersionSelector s(Kind::Time);
    s.m_time = epochSeconds;
    return s;
}

VersionSelector VersionSelector::parse(const std::string& text) {
    if (text.empty()) return latest();

    const bool allDigits = std::all_of(text.begin(), text.end(),
        [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (allDigits) {
        // Numeric parse first; a digit string too large for u64 falls through to a tag name.
        std::uint64_t value = 0;
        bool overflow = false;
        for (unsigned char ch : text) {
            const std::uint64_t digit = ch - '0';
            if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
                overflow = true;
                break;
            }
            value = value * 10 + digit;
        }
        if (!overflow) return number(value);
    }

    if (text == "latest") return latest();
    return tag(text);
}

std::string VersionSelector::describe() const {
    switch (m_kind) {
        case Kind::Latest: return "latest";
        case Kind::Number: return "v" + std::to_string(m_number);
        case Kind::Tag:    return "tag '" + m_tag + "'";
        case Kind::Time:   return "time " + std::to_string(m_time);
    }
    return "?";
}
