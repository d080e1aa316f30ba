#include "BackupManager.hpp"
#include "CryptoEnvelope.hpp"
#include "EncryptionManager.hpp"
#include "Logger.hpp"
#include "VaultCodec.hpp"
#include "VaultErrors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    std::string errnoText(int err) {
        return std::system_category().message(err);
    }

    // <path>.tmp<16 hex chars>, next to the destination so rename() stays on one filesystem.
    fs::path makeTemporaryPath(const fs::path& target) {
        static const char* HEX = "0123456789abcdef";
        std::string name = target.filename().string() + ".tmp";
        for (std::uint8_t b : EncryptionManager::randomBytes(8)) {
            name.push_back(HEX[b >> 4]);
            name.push_back(HEX[b & 0x0F]);
        }
        return target.parent_path() / name;
    }

    void writeAll(int fd, const std::vector<std::uint8_t>& bytes, const fs::path& tmp) {
        std::size_t written = 0;
        while (written < bytes.size()) {
            const ssize_t chunk = ::write(fd, bytes.data() + written, bytes.size() - written);
            if (chunk < 0) {
                const int err = errno;
                if (err == EINTR) continue;
                throw VaultIOError("write to '" + tmp.string() + "' failed: " + errnoText(err));
            }
            written += static_cast<std::size_t>(chunk);
        }
    }

    // Best effort: a failed directory sync does not undo a completed rename.
    void syncDirectory(const fs::path& dir) {
        const int fd = ::open(dir.empty() ? "." : dir.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
        if (fd < 0) return;
        if (::fsync(fd) != 0) {
            Logger::core()->debug("fsync of directory '{}' failed: {}", dir.string(), errnoText(errno));
        }
        ::close(fd);
    }
}

std::vector<std::uint8_t> BackupManager::readFile(const std::string& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw VaultIOError("cannot open '" + path + "' for reading: " + errnoText(errno));
    }

    std::vector<std::uint8_t> bytes;
    try {
        struct stat st {};
        if (::fstat(fd, &st) != 0) {
            throw VaultIOError("cannot stat '" + path + "': " + errnoText(errno));
        }
        if (!S_ISREG(st.st_mode)) {
            throw VaultIOError("'" + path + "' is not a regular file");
        }
        bytes.reserve(static_cast<std::size_t>(st.st_size));

        std::uint8_t buf[64 * 1024];
        for (;;) {
            const ssize_t chunk = ::read(fd, buf, sizeof(buf));
            if (chunk < 0) {
                const int err = errno;
                if (err == EINTR) continue;
                throw VaultIOError("read of '" + path + "' failed: " + errnoText(err));
            }
            if (chunk == 0) break;
            bytes.insert(bytes.end(), buf, buf + chunk);
        }
    } catch (...) {
        ::close(fd);
        throw;
    }
    ::close(fd);
    return bytes;
}

void BackupManager::writeFileAtomic(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    const fs::path target(path);
    const fs::path parent = target.parent_path();

    std::error_code ec;
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw VaultIOError("cannot create directory '" + parent.string() + "': " + ec.message());
        }
    }

    const fs::path tmp = makeTemporaryPath(target);
    const int fd = ::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw VaultIOError("cannot create '" + tmp.string() + "': " + errnoText(errno));
    }

    try {
        writeAll(fd, bytes, tmp);
        if (::fsync(fd) != 0) {
            throw VaultIOError("fsync of '" + tmp.string() + "' failed: " + errnoText(errno));
        }
    } catch (...) {
        ::close(fd);
        fs::remove(tmp, ec);
        throw;
    }

    if (::close(fd) != 0) {
        const int err = errno;
        fs::remove(tmp, ec);
        throw VaultIOError("close of '" + tmp.string() + "' failed: " + errnoText(err));
    }

    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        const int err = errno;
        fs::remove(tmp, ec);
        throw VaultIOError("rename to '" + target.string() + "' failed: " + errnoText(err));
    }

    syncDirectory(parent);
}

void BackupManager::dump(const VaultStore& snapshot,
                         const std::string& path,
                         const std::optional<std::string>& password) const {
    const auto payload  = VaultCodec::encode(snapshot);
    const auto envelope = CryptoEnvelope::seal(payload, password);
    writeFileAtomic(path, envelope);

    const bool encrypted = CryptoEnvelope::modeOf(envelope) == CryptoEnvelope::Mode::Encrypted;
    Logger::core()->info("Dumped {} prompt(s) to '{}' ({})", snapshot.size(), path,
                         encrypted ? "encrypted" : "unencrypted");
}

VaultStore BackupManager::restore(const std::string& path,
                                  const std::optional<std::string>& password) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw VaultIOError("vault file '" + path + "' not found");
    }

    const auto envelope = readFile(path);
    const auto payload  = CryptoEnvelope::open(envelope, password);
    VaultStore store    = VaultCodec::decode(payload);

    Logger::core()->info("Restored {} prompt(s) from '{}'", store.size(), path);
    return store;
}

VaultStore BackupManager::restoreOrDefault(const std::string& path,
                                           const std::optional<std::string>& password) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw VaultIOError("cannot stat '" + path + "': " + ec.message());
        }
        Logger::core()->warn("Vault file '{}' not found, starting with an empty vault", path);
        return VaultStore{};
    }
    return restore(path, password);
}
