#pragma once
#include "VaultStore.hpp"

#include <cstdint>
#include <vector>

// Flat little-endian binary form of a vault ("PPVT" layout). No encryption.
class VaultCodec {
public:
    static std::vector<std::uint8_t> encode(const VaultStore& store);

    // Treats the input as untrusted: every length is bounds-checked before it
    // is read and every store invariant is re-validated.
    // Throws CorruptDataError.
    static VaultStore decode(const std::vector<std::uint8_t>& bytes);

    static constexpr std::uint8_t MAGIC[4] = {'P', 'P', 'V', 'T'};
    static constexpr std::uint8_t FORMAT_VERSION = 1;
};
