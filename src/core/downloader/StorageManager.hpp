#pragma once

/**
 * StorageManager.hpp
 *
 * Free-space admission control for the downloads directory.
 */

#include <cstdint>
#include <filesystem>

namespace tapedeck::core::downloader {

/**
 * IStorageAdmission - answers "is there room for N more bytes?"
 *
 * Implementations read live state on every call; nothing is cached.
 */
class IStorageAdmission {
public:
    virtual ~IStorageAdmission() = default;

    virtual uint64_t usedBytes() const = 0;
    virtual uint64_t availableBytes() const = 0;

    /**
     * @return true if availableBytes() >= requiredBytes
     */
    virtual bool validate(uint64_t requiredBytes) const {
        return availableBytes() >= requiredBytes;
    }

    /**
     * Low-space signal, not an error
     * @return true if availableBytes() < thresholdBytes
     */
    virtual bool isBelowThreshold(uint64_t thresholdBytes) const {
        return availableBytes() < thresholdBytes;
    }
};

/**
 * DiskStorageManager - admission control over a real directory
 *
 * Available space is the free space of the volume holding the downloads
 * directory, optionally capped by a quota on the directory size.
 */
class DiskStorageManager : public IStorageAdmission {
public:
    /**
     * @param downloadsDir Root of downloaded files
     * @param quotaBytes Maximum size of downloadsDir (0 = unlimited)
     */
    explicit DiskStorageManager(std::filesystem::path downloadsDir, uint64_t quotaBytes = 0);

    uint64_t usedBytes() const override;
    uint64_t availableBytes() const override;

    const std::filesystem::path& downloadsDir() const { return m_downloadsDir; }
    uint64_t quotaBytes() const { return m_quotaBytes; }

private:
    std::filesystem::path m_downloadsDir;
    uint64_t m_quotaBytes;
};

} // namespace tapedeck::core::downloader
