/**
 * FileUtils.cpp
 *
 * File system operations.
 */

#include "FileUtils.hpp"

#include <fstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace tapedeck::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

uint64_t FileUtils::getDirectorySize(const fs::path& path) {
    uint64_t size = 0;
    std::error_code ec;
    if (!fs::exists(path, ec)) return 0;

    for (auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code sizeEc;
        if (it->is_regular_file(sizeEc)) {
            auto fileSize = it->file_size(sizeEc);
            if (!sizeEc) size += fileSize;
        }
    }
    return size;
}

void FileUtils::removeEmptyParents(const fs::path& start, const fs::path& stopAt) {
    std::error_code ec;
    auto stop = fs::weakly_canonical(stopAt, ec);
    auto current = start;

    while (!current.empty()) {
        auto canonical = fs::weakly_canonical(current, ec);
        if (ec || canonical == stop || !fs::is_directory(current, ec) || !fs::is_empty(current, ec)) {
            return;
        }
        if (!fs::remove(current, ec) || ec) {
            return;
        }
        current = current.parent_path();
    }
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    return !ec;
}

std::optional<uint64_t> FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

bool FileUtils::deleteFile(const fs::path& path, std::error_code& error) {
    error.clear();
    fs::remove(path, error);
    if (error == std::errc::no_such_file_or_directory) {
        error.clear();
    }
    return !error;
}

// -- Read/Write --

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool FileUtils::writeFileAtomic(const fs::path& path, const std::string& content) {
    if (path.has_parent_path() && !createDirectories(path.parent_path())) {
        return false;
    }

    fs::path tmpPath = path;
    tmpPath += ".tmp";

    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) return false;
        file << content;
        file.flush();
        if (!file) return false;
    }

    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        fs::remove(tmpPath, ec);
        return false;
    }
    return true;
}

// -- FileLock --

FileLock::FileLock(const fs::path& path) {
    m_fd = open(path.string().c_str(), O_CREAT | O_WRONLY, 0644);
    if (m_fd >= 0) {
        m_locked = flock(m_fd, LOCK_EX | LOCK_NB) == 0;
        if (!m_locked) {
            close(m_fd);
            m_fd = -1;
        }
    }
}

FileLock::~FileLock() { unlock(); }

// The lock file stays behind: unlinking it would let a process holding the
// old inode and one creating a new file both acquire the lock
void FileLock::unlock() {
    if (!m_locked) return;
    if (m_fd >= 0) { flock(m_fd, LOCK_UN); close(m_fd); m_fd = -1; }
    m_locked = false;
}

} // namespace tapedeck::utils
