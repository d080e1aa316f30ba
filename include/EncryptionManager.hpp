#pragma once
#include <cstdint>
#include <vector>
#include <string>

// Password-based key derivation (Argon2id) and AES-256-GCM sealing.
// The derived key lives only in this object and is wiped on destruction.
class EncryptionManager {
public:
    // Derive a 32-byte key from a password and a 16-byte salt (Argon2id).
    static std::vector<std::uint8_t> deriveKey(
        const std::string& password,
        const std::vector<std::uint8_t>& salt
    );

    // Cryptographically secure random bytes (salts, nonces, temp names).
    static std::vector<std::uint8_t> randomBytes(std::size_t count);

    // Derives the key from password + salt.
    EncryptionManager(const std::string& password, const std::vector<std::uint8_t>& salt);

    // Construct with an already derived 32-byte key.
    explicit EncryptionManager(const std::vector<std::uint8_t>& key);
    ~EncryptionManager();

    EncryptionManager(const EncryptionManager&) = delete;
    EncryptionManager& operator=(const EncryptionManager&) = delete;

    struct Sealed {
        std::vector<std::uint8_t> nonce;       // 12-byte random nonce
        std::vector<std::uint8_t> encAndTag;   // ciphertext || 16-byte tag
    };

    Sealed encrypt(const std::vector<std::uint8_t>& plaintext,
                   const std::vector<std::uint8_t>& aad = {}) const;

    // Throws AuthenticationFailedError when the tag does not verify; no
    // plaintext is returned in that case.
    std::vector<std::uint8_t> decrypt(const std::vector<std::uint8_t>& nonce,
                                      const std::vector<std::uint8_t>& encAndTag,
                                      const std::vector<std::uint8_t>& aad = {}) const;

    static constexpr std::size_t KEY_LEN   = 32;
    static constexpr std::size_t SALT_LEN  = 16;
    static constexpr std::size_t NONCE_LEN = 12;
    static constexpr std::size_t TAG_LEN   = 16;

private:
    std::vector<std::uint8_t> m_key;

    static constexpr uint32_t T_COST = 3;               // iterations
    static constexpr uint32_t M_COST_KiB = 64 * 1024;   // memory (~64 MiB)
    static constexpr uint32_t PARALLELISM = 1;          // lanes
};
