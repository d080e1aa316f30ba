#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>

// Throwaway path in the system temp dir; whatever ends up there is removed
// when the object goes out of scope.
class TempPath {
public:
    explicit TempPath(const std::string& stem) {
        static std::atomic<int> counter{0};
        m_path = std::filesystem::temp_directory_path()
               / ("promptpro_test_" + stem + "_" + std::to_string(::getpid())
                  + "_" + std::to_string(counter++));
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    ~TempPath() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

    std::string str() const { return m_path.string(); }
    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline std::vector<std::uint8_t> toBytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}
