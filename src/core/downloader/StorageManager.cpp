/**
 * StorageManager.cpp
 */

#include "StorageManager.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <algorithm>

namespace tapedeck::core::downloader {

DiskStorageManager::DiskStorageManager(std::filesystem::path downloadsDir, uint64_t quotaBytes)
    : m_downloadsDir(std::move(downloadsDir))
    , m_quotaBytes(quotaBytes) {
}

uint64_t DiskStorageManager::usedBytes() const {
    return utils::FileUtils::getDirectorySize(m_downloadsDir);
}

uint64_t DiskStorageManager::availableBytes() const {
    // The directory may not exist yet; measure the nearest existing ancestor
    auto probe = m_downloadsDir;
    std::error_code ec;
    while (!probe.empty() && !std::filesystem::exists(probe, ec)) {
        probe = probe.parent_path();
    }

    auto info = std::filesystem::space(probe.empty() ? std::filesystem::path(".") : probe, ec);
    if (ec) {
        Logger::instance().warn("Cannot query free space of {}: {}", m_downloadsDir.string(), ec.message());
        return 0;
    }

    uint64_t available = static_cast<uint64_t>(info.available);
    if (m_quotaBytes > 0) {
        uint64_t used = usedBytes();
        uint64_t quotaLeft = used >= m_quotaBytes ? 0 : m_quotaBytes - used;
        available = std::min(available, quotaLeft);
    }
    return available;
}

} // namespace tapedeck::core::downloader
