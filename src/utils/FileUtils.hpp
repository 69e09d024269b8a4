// Tapedeck - File Utilities
// File system operations used by the store, the reconciler and the transfer client

#pragma once

#include <cstdint>
#include <string>
#include <filesystem>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace tapedeck::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static uint64_t getDirectorySize(const fs::path& path);

    /**
     * @brief Remove empty directories from start up to (excluding) stopAt
     */
    static void removeEmptyParents(const fs::path& start, const fs::path& stopAt);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool moveFile(const fs::path& source, const fs::path& destination);
    static std::optional<uint64_t> getFileSize(const fs::path& path);

    /**
     * @brief Delete a file
     * @param error Receives the failure reason; a missing file is not an error
     * @return true if the file is gone afterwards
     */
    static bool deleteFile(const fs::path& path, std::error_code& error);

    // Read/Write operations
    static std::optional<std::string> readFile(const fs::path& path);

    /**
     * @brief Write content to path.tmp, then rename it over path
     * @return true if the new content is in place
     */
    static bool writeFileAtomic(const fs::path& path, const std::string& content);
};

/**
 * @brief RAII advisory file lock (flock), held for the lifetime of the object
 */
class FileLock {
public:
    explicit FileLock(const fs::path& path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool isLocked() const { return m_locked; }
    void unlock();

private:
    bool m_locked{false};
    int m_fd{-1};
};

} // namespace tapedeck::utils
