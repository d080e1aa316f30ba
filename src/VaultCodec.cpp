#include "VaultCodec.hpp"
#include "VaultErrors.hpp"

#include <cstring>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
    class ByteWriter {
    public:
        explicit ByteWriter(std::vector<std::uint8_t>& out) : m_out(out) {}

        void u8(std::uint8_t v) { m_out.push_back(v); }

        void u32(std::uint32_t v) {
            for (int i = 0; i < 4; ++i) m_out.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
        }

        void i64(std::int64_t v) {
            const auto u = static_cast<std::uint64_t>(v);
            for (int i = 0; i < 8; ++i) m_out.push_back(static_cast<std::uint8_t>(u >> (8 * i)));
        }

        void str(const std::string& s) {
            if (s.size() > std::numeric_limits<std::uint32_t>::max()) {
                throw std::length_error("string too long for vault encoding");
            }
            u32(static_cast<std::uint32_t>(s.size()));
            m_out.insert(m_out.end(), s.begin(), s.end());
        }

        void count(std::size_t n) {
            if (n > std::numeric_limits<std::uint32_t>::max()) {
                throw std::length_error("collection too large for vault encoding");
            }
            u32(static_cast<std::uint32_t>(n));
        }

    private:
        std::vector<std::uint8_t>& m_out;
    };

    class ByteReader {
    public:
        explicit ByteReader(const std::vector<std::uint8_t>& in) : m_in(in) {}

        std::size_t remaining() const { return m_in.size() - m_pos; }

        void need(std::size_t n, const char* what) const {
            if (n > remaining()) {
                throw CorruptDataError(std::string("truncated while reading ") + what);
            }
        }

        void skip(std::size_t n, const char* what) {
            need(n, what);
            m_pos += n;
        }

        std::uint8_t u8(const char* what) {
            need(1, what);
            return m_in[m_pos++];
        }

        std::uint32_t u32(const char* what) {
            need(4, what);
            std::uint32_t v = 0;
            for (int i = 0; i < 4; ++i) v |= static_cast<std::uint32_t>(m_in[m_pos + i]) << (8 * i);
            m_pos += 4;
            return v;
        }

        std::int64_t i64(const char* what) {
            need(8, what);
            std::uint64_t v = 0;
            for (int i = 0; i < 8; ++i) v |= static_cast<std::uint64_t>(m_in[m_pos + i]) << (8 * i);
            m_pos += 8;
            return static_cast<std::int64_t>(v);
        }

        std::string str(const char* what) {
            const std::uint32_t len = u32(what);
            need(len, what);
            std::string s(reinterpret_cast<const char*>(m_in.data() + m_pos), len);
            m_pos += len;
            return s;
        }

        // A count of N records needs at least N * minRecordSize more bytes;
        // rejecting early keeps a forged count from driving a huge reserve().
        std::uint32_t count(const char* what, std::size_t minRecordSize) {
            const std::uint32_t n = u32(what);
            if (static_cast<std::uint64_t>(n) * minRecordSize > remaining()) {
                throw CorruptDataError(std::string("implausible ") + what + " " + std::to_string(n));
            }
            return n;
        }

    private:
        const std::vector<std::uint8_t>& m_in;
        std::size_t m_pos = 0;
    };

    // number + created_at + has_message + content_len
    constexpr std::size_t MIN_VERSION_BYTES = 4 + 8 + 1 + 4;
    // name_len + target_version
    constexpr std::size_t MIN_TAG_BYTES = 4 + 4;
    // key_len + version_count + tag_count
    constexpr std::size_t MIN_PROMPT_BYTES = 4 + 4 + 4;
}

std::vector<std::uint8_t> VaultCodec::encode(const VaultStore& store) {
    std::vector<std::uint8_t> out;
    ByteWriter w(out);

    out.insert(out.end(), std::begin(MAGIC), std::end(MAGIC));
    w.u8(FORMAT_VERSION);
    w.count(store.size());

    for (const auto& [key, prompt] : store.prompts()) {
        w.str(key);

        w.count(prompt.versions.size());
        for (const auto& v : prompt.versions) {
            w.u32(v.number);
            w.i64(v.createdAt);
            w.u8(v.message ? 1 : 0);
            if (v.message) w.str(*v.message);
            w.str(v.content);
        }

        w.count(prompt.tags.size());
        for (const auto& [name, target] : prompt.tags) {
            w.str(name);
            w.u32(target);
        }
    }
    return out;
}

VaultStore VaultCodec::decode(const std::vector<std::uint8_t>& bytes) {
    ByteReader r(bytes);

    r.need(sizeof(MAGIC), "magic");
    if (std::memcmp(bytes.data(), MAGIC, sizeof(MAGIC)) != 0) {
        throw CorruptDataError("bad magic");
    }
    r.skip(sizeof(MAGIC), "magic");

    const std::uint8_t formatVersion = r.u8("format version");
    if (formatVersion != FORMAT_VERSION) {
        throw CorruptDataError("unsupported format version " + std::to_string(formatVersion));
    }

    const std::uint32_t promptCount = r.count("prompt count", MIN_PROMPT_BYTES);
    std::vector<Prompt> prompts;
    prompts.reserve(promptCount);

    for (std::uint32_t i = 0; i < promptCount; ++i) {
        Prompt p;
        p.key = r.str("key");

        const std::uint32_t versionCount = r.count("version count", MIN_VERSION_BYTES);
        p.versions.reserve(versionCount);
        for (std::uint32_t j = 0; j < versionCount; ++j) {
            Version v;
            v.number    = r.u32("version number");
            v.createdAt = r.i64("created_at");
            const std::uint8_t hasMessage = r.u8("has_message");
            if (hasMessage > 1) {
                throw CorruptDataError("has_message flag " + std::to_string(hasMessage));
            }
            if (hasMessage) v.message = r.str("message");
            v.content = r.str("content");
            p.versions.push_back(std::move(v));
        }

        const std::uint32_t tagCount = r.count("tag count", MIN_TAG_BYTES);
        for (std::uint32_t j = 0; j < tagCount; ++j) {
            std::string name = r.str("tag name");
            const std::uint32_t target = r.u32("tag target");
            if (!p.tags.emplace(name, target).second) {
                throw CorruptDataError("duplicate tag '" + name + "' on prompt '" + p.key + "'");
            }
        }
        prompts.push_back(std::move(p));
    }

    if (r.remaining() != 0) {
        throw CorruptDataError(std::to_string(r.remaining()) + " trailing bytes");
    }

    return VaultStore::fromPrompts(std::move(prompts));
}
