#include "EncryptionManager.hpp"
#include "VaultErrors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <argon2.h>
#include <stdexcept>
#include <limits>
#include <memory>
#include <string>

namespace {
    using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

    CipherCtx newCipherCtx() {
        EVP_CIPHER_CTX* raw = EVP_CIPHER_CTX_new();
        if (!raw) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
        return CipherCtx(raw, &EVP_CIPHER_CTX_free);
    }

    // OpenSSL takes int lengths.
    int evpLength(std::size_t n, const char* what) {
        if (n > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            throw std::length_error(std::string(what) + " too large for OpenSSL");
        }
        return static_cast<int>(n);
    }
}

std::vector<std::uint8_t> EncryptionManager::deriveKey(
    const std::string& password,
    const std::vector<std::uint8_t>& salt
) {
    if (salt.size() != SALT_LEN) {
        throw std::invalid_argument("deriveKey: salt must be 16 bytes");
    }
    std::vector<std::uint8_t> key(KEY_LEN);

    int rc = argon2id_hash_raw(
        T_COST,
        M_COST_KiB,
        PARALLELISM,
        password.data(), password.size(),
        salt.data(), salt.size(),
        key.data(), key.size()
    );
    if (rc != ARGON2_OK) {
        throw std::runtime_error(std::string("argon2id_hash_raw failed: ")
                                 + argon2_error_message(rc));
    }
    return key;
}

std::vector<std::uint8_t> EncryptionManager::randomBytes(std::size_t count) {
    const int len = evpLength(count, "random byte request");
    std::vector<std::uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), len) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

EncryptionManager::EncryptionManager(const std::string& password,
                                     const std::vector<std::uint8_t>& salt)
: m_key(deriveKey(password, salt))
{
}

EncryptionManager::EncryptionManager(const std::vector<std::uint8_t>& key)
: m_key(key)
{
    if (m_key.size() != KEY_LEN) {
        throw std::invalid_argument("EncryptionManager: key must be 32 bytes");
    }
}

EncryptionManager::~EncryptionManager() {
    if (!m_key.empty()) OPENSSL_cleanse(m_key.data(), m_key.size());
}

EncryptionManager::Sealed EncryptionManager::encrypt(
    const std::vector<std::uint8_t>& plaintext,
    const std::vector<std::uint8_t>& aad
) const {
    Sealed out;
    out.nonce = randomBytes(NONCE_LEN);
    out.encAndTag.resize(plaintext.size() + TAG_LEN);

    CipherCtx ctx = newCipherCtx();

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("EncryptInit cipher failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_LEN, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), out.nonce.data()) != 1)
        throw std::runtime_error("EncryptInit key/nonce failed");

    int len = 0;
    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), evpLength(aad.size(), "AAD")) != 1)
            throw std::runtime_error("EncryptUpdate AAD failed");
    }

    int outLen1 = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.encAndTag.data(), &outLen1,
                              plaintext.data(), evpLength(plaintext.size(), "plaintext")) != 1)
            throw std::runtime_error("EncryptUpdate data failed");
    }

    int outLen2 = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.encAndTag.data() + outLen1, &outLen2) != 1)
        throw std::runtime_error("EncryptFinal failed");

    const std::size_t cLen = static_cast<std::size_t>(outLen1 + outLen2);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_LEN, out.encAndTag.data() + cLen) != 1)
        throw std::runtime_error("GET_TAG failed");

    out.encAndTag.resize(cLen + TAG_LEN);
    return out;
}

std::vector<std::uint8_t> EncryptionManager::decrypt(
    const std::vector<std::uint8_t>& nonce,
    const std::vector<std::uint8_t>& encAndTag,
    const std::vector<std::uint8_t>& aad
) const {
    if (nonce.size() != NONCE_LEN) {
        throw std::invalid_argument("decrypt: nonce must be 12 bytes");
    }
    if (encAndTag.size() < TAG_LEN) {
        throw AuthenticationFailedError("ciphertext shorter than the authentication tag");
    }

    const std::size_t cLen = encAndTag.size() - TAG_LEN;
    std::vector<std::uint8_t> plaintext(cLen);

    CipherCtx ctx = newCipherCtx();

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("DecryptInit cipher failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_LEN, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), nonce.data()) != 1)
        throw std::runtime_error("DecryptInit key/nonce failed");

    int len = 0;
    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), evpLength(aad.size(), "AAD")) != 1)
            throw std::runtime_error("DecryptUpdate AAD failed");
    }

    int pLen1 = 0;
    if (cLen > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &pLen1, encAndTag.data(), evpLength(cLen, "ciphertext")) != 1)
            throw std::runtime_error("DecryptUpdate data failed");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_LEN,
                            const_cast<std::uint8_t*>(encAndTag.data() + cLen)) != 1)
        throw std::runtime_error("SET_TAG failed");

    int pLen2 = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + pLen1, &pLen2) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw AuthenticationFailedError("GCM tag verification failed");
    }

    plaintext.resize(static_cast<std::size_t>(pLen1 + pLen2));
    return plaintext;
}
