/**
 * @file ScopedTempFile.hpp
 * @brief Temporary file that is removed when the owner goes out of scope.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

#include <unistd.h>

namespace audiovault::infrastructure {

class ScopedTempFile {
public:
    /** @brief Reserves a unique path in the system temp directory. Nothing is created yet. */
    explicit ScopedTempFile(const std::string& suffix) {
        static std::atomic<unsigned> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 ("audiovault_" + std::to_string(::getpid()) + "_" + std::to_string(stamp) + "_" +
                  std::to_string(counter++) + suffix);
    }

    ~ScopedTempFile() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string string() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

} // namespace audiovault::infrastructure
