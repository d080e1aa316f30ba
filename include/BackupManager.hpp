#pragma once
#include "VaultStore.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Store <-> codec <-> envelope <-> file. Holds no vault state itself; the
// caller supplies a consistent snapshot to dump and swaps in what restore
// returns.
class BackupManager {
public:
    // Encrypted iff password is set and non-empty. The destination is
    // replaced atomically (temp file + fsync + rename). Throws VaultIOError.
    void dump(const VaultStore& snapshot,
              const std::string& path,
              const std::optional<std::string>& password = std::nullopt) const;

    // Throws VaultIOError, CorruptDataError or AuthenticationFailedError.
    VaultStore restore(const std::string& path,
                       const std::optional<std::string>& password = std::nullopt) const;

    // As restore, but a missing file yields an empty store.
    VaultStore restoreOrDefault(const std::string& path,
                                const std::optional<std::string>& password = std::nullopt) const;

    static std::vector<std::uint8_t> readFile(const std::string& path);
    static void writeFileAtomic(const std::string& path, const std::vector<std::uint8_t>& bytes);
};
