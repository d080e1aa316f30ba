#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// At-rest wrapper around codec bytes ("PPEV" layout):
//   magic(4) | mode(1) | [salt(16) | nonce(12)] | payload or ciphertext+tag
class CryptoEnvelope {
public:
    enum class Mode : std::uint8_t { Plaintext = 0, Encrypted = 1 };

    // Encrypts iff password is set and non-empty.
    static std::vector<std::uint8_t> seal(const std::vector<std::uint8_t>& payload,
                                          const std::optional<std::string>& password);

    // Throws CorruptDataError for a malformed header and
    // AuthenticationFailedError for a missing/wrong password or tampered body.
    // A password given for a plaintext envelope is ignored.
    static std::vector<std::uint8_t> open(const std::vector<std::uint8_t>& envelope,
                                          const std::optional<std::string>& password);

    // Reads only the header. Throws CorruptDataError.
    static Mode modeOf(const std::vector<std::uint8_t>& envelope);

    static constexpr std::uint8_t MAGIC[4] = {'P', 'P', 'E', 'V'};
    static constexpr std::size_t HEADER_LEN = 5;
};
