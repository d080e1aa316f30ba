#include "CryptoEnvelope.hpp"
#include "EncryptionManager.hpp"
#include "VaultErrors.hpp"

#include <cstring>
#include <iterator>

namespace {
    bool wantsEncryption(const std::optional<std::string>& password) {
        return password.has_value() && !password->empty();
    }
}

std::vector<std::uint8_t> CryptoEnvelope::seal(const std::vector<std::uint8_t>& payload,
                                               const std::optional<std::string>& password) {
    std::vector<std::uint8_t> out(std::begin(MAGIC), std::end(MAGIC));

    if (!wantsEncryption(password)) {
        out.push_back(static_cast<std::uint8_t>(Mode::Plaintext));
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }

    out.push_back(static_cast<std::uint8_t>(Mode::Encrypted));
    // The header is bound as AAD so the mode byte cannot be flipped unnoticed.
    const std::vector<std::uint8_t> aad(out.begin(), out.end());

    const auto salt = EncryptionManager::randomBytes(EncryptionManager::SALT_LEN);
    EncryptionManager enc(*password, salt);
    auto sealed = enc.encrypt(payload, aad);

    out.reserve(out.size() + salt.size() + sealed.nonce.size() + sealed.encAndTag.size());
    out.insert(out.end(), salt.begin(), salt.end());
    out.insert(out.end(), sealed.nonce.begin(), sealed.nonce.end());
    out.insert(out.end(), sealed.encAndTag.begin(), sealed.encAndTag.end());
    return out;
}

CryptoEnvelope::Mode CryptoEnvelope::modeOf(const std::vector<std::uint8_t>& envelope) {
    if (envelope.size() < HEADER_LEN) {
        throw CorruptDataError("envelope shorter than its header");
    }
    if (std::memcmp(envelope.data(), MAGIC, sizeof(MAGIC)) != 0) {
        throw CorruptDataError("bad envelope magic");
    }
    switch (envelope[4]) {
        case static_cast<std::uint8_t>(Mode::Plaintext): return Mode::Plaintext;
        case static_cast<std::uint8_t>(Mode::Encrypted): return Mode::Encrypted;
        default:
            throw CorruptDataError("unknown envelope mode " + std::to_string(envelope[4]));
    }
}

std::vector<std::uint8_t> CryptoEnvelope::open(const std::vector<std::uint8_t>& envelope,
                                               const std::optional<std::string>& password) {
    const Mode mode = modeOf(envelope);
    const auto body = envelope.begin() + HEADER_LEN;

    if (mode == Mode::Plaintext) {
        return std::vector<std::uint8_t>(body, envelope.end());
    }

    if (!wantsEncryption(password)) {
        throw AuthenticationFailedError("vault is encrypted but no password was provided");
    }

    constexpr std::size_t minLen = HEADER_LEN + EncryptionManager::SALT_LEN
                                 + EncryptionManager::NONCE_LEN + EncryptionManager::TAG_LEN;
    if (envelope.size() < minLen) {
        throw AuthenticationFailedError("encrypted envelope is truncated");
    }

    const std::vector<std::uint8_t> aad(envelope.begin(), body);
    const auto saltEnd  = body + EncryptionManager::SALT_LEN;
    const auto nonceEnd = saltEnd + EncryptionManager::NONCE_LEN;
    const std::vector<std::uint8_t> salt(body, saltEnd);
    const std::vector<std::uint8_t> nonce(saltEnd, nonceEnd);
    const std::vector<std::uint8_t> encAndTag(nonceEnd, envelope.end());

    EncryptionManager enc(*password, salt);
    return enc.decrypt(nonce, encAndTag, aad);
}
