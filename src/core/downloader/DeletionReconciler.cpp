/**
 * DeletionReconciler.cpp
 */

#include "DeletionReconciler.hpp"
#include "../EventBus.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <algorithm>

namespace tapedeck::core::downloader {

DeletionReconciler::DeletionReconciler(ITaskStore& store, std::filesystem::path downloadsDir)
    : m_store(store)
    , m_downloadsDir(std::move(downloadsDir)) {
}

bool DeletionReconciler::markForDeletion(const std::string& taskId, TimePoint now) {
    auto task = m_store.get(taskId);
    if (!task) {
        return false;
    }
    bool recordingWasMarked = isRecordingMarked(task->recordingId);

    bool found = m_store.modify(taskId, [now](DownloadTask& t) {
        if (t.isMarkedForDeletion) {
            return false;
        }
        t.isMarkedForDeletion = true;
        t.deletionTimestamp = now;
        return true;
    });

    if (found) {
        Logger::instance().debug("Marked {} for deletion", taskId);
        if (!recordingWasMarked) {
            EventBus::instance().emit(events::RecordingMarkedForDeletion,
                                      {{"recordingId", task->recordingId}});
        }
    }
    return true;
}

size_t DeletionReconciler::markRecordingForDeletion(const std::string& recordingId, TimePoint now) {
    bool wasMarked = isRecordingMarked(recordingId);

    size_t count = 0;
    for (const auto& task : m_store.listByRecording(recordingId)) {
        m_store.modify(task.id, [now](DownloadTask& t) {
            if (t.isMarkedForDeletion) {
                return false;
            }
            t.isMarkedForDeletion = true;
            t.deletionTimestamp = now;
            return true;
        });
        ++count;
    }

    if (count > 0) {
        Logger::instance().info("Marked recording {} for deletion ({} tracks)", recordingId, count);
        if (!wasMarked) {
            EventBus::instance().emit(events::RecordingMarkedForDeletion, {{"recordingId", recordingId}});
        }
    }
    return count;
}

bool DeletionReconciler::restore(const std::string& taskId, TimePoint now) {
    auto task = m_store.get(taskId);
    if (!task) {
        return false;
    }

    m_store.modify(taskId, [now](DownloadTask& t) {
        t.isMarkedForDeletion = false;
        t.deletionTimestamp.reset();
        t.lastAccessTimestamp = std::max(t.lastAccessTimestamp, now);
        return true;
    });

    if (task->isMarkedForDeletion && !isRecordingMarked(task->recordingId)) {
        EventBus::instance().emit(events::RecordingRestored, {{"recordingId", task->recordingId}});
    }
    Logger::instance().debug("Restored {}", taskId);
    return true;
}

size_t DeletionReconciler::restoreRecording(const std::string& recordingId, TimePoint now) {
    bool wasMarked = isRecordingMarked(recordingId);

    size_t count = 0;
    for (const auto& task : m_store.listByRecording(recordingId)) {
        m_store.modify(task.id, [now](DownloadTask& t) {
            t.isMarkedForDeletion = false;
            t.deletionTimestamp.reset();
            t.lastAccessTimestamp = std::max(t.lastAccessTimestamp, now);
            return true;
        });
        ++count;
    }

    if (wasMarked) {
        Logger::instance().info("Restored recording {}", recordingId);
        EventBus::instance().emit(events::RecordingRestored, {{"recordingId", recordingId}});
    }
    return count;
}

CleanupReport DeletionReconciler::cleanup(TimePoint now, Clock::duration gracePeriod) {
    CleanupReport report;

    auto due = [now, gracePeriod](const DownloadTask& t) {
        return t.isMarkedForDeletion && t.deletionTimestamp && now - *t.deletionTimestamp >= gracePeriod &&
               t.status != DownloadStatus::Downloading;
    };

    for (const auto& task : m_store.listMarkedForDeletion()) {
        if (!due(task)) {
            if (task.status == DownloadStatus::Downloading) {
                Logger::instance().debug("Cleanup deferred for in-flight {}", task.id);
            }
            ++report.pending;
            continue;
        }

        // The record leaves the store before any file is touched; a restore
        // that got in first makes the claim fail and nothing is deleted
        std::optional<DownloadTask> claimed;
        try {
            claimed = m_store.removeIf(task.id, due);
        } catch (const PersistenceError& e) {
            Logger::instance().error("Could not remove record {}: {}", task.id, e.what());
            continue;
        }
        if (!claimed) {
            Logger::instance().debug("{} changed before cleanup reached it, kept", task.id);
            continue;
        }
        report.removedIds.push_back(claimed->id);

        uint64_t size = 0;
        if (claimed->localPath) {
            size = utils::FileUtils::getFileSize(*claimed->localPath).value_or(0);
        }

        std::error_code fileError;
        if (!removeFiles(*claimed, fileError)) {
            Logger::instance().warn("Could not delete file of {}: {}", claimed->id, fileError.message());
            report.fileErrors.push_back(claimed->id);
        } else {
            report.freedBytes += size;
        }
    }

    if (!report.removedIds.empty()) {
        Logger::instance().info("Cleanup removed {} tasks, freed {} bytes ({} still in grace period)",
                                report.removedIds.size(), report.freedBytes, report.pending);
    }
    return report;
}

std::vector<DownloadTask> DeletionReconciler::evictionCandidates(uint64_t requiredBytes) const {
    auto completed = m_store.listByStatus(DownloadStatus::Completed);
    completed.erase(std::remove_if(completed.begin(), completed.end(),
                        [](const DownloadTask& t) { return t.isMarkedForDeletion; }),
                    completed.end());

    std::stable_sort(completed.begin(), completed.end(),
        [](const DownloadTask& a, const DownloadTask& b) {
            return a.lastAccessTimestamp < b.lastAccessTimestamp;
        });

    std::vector<DownloadTask> result;
    uint64_t covered = 0;
    for (auto& task : completed) {
        if (covered >= requiredBytes) {
            break;
        }
        covered += task.totalBytes > 0 ? task.totalBytes : task.bytesDownloaded;
        result.push_back(std::move(task));
    }
    return result;
}

bool DeletionReconciler::isRecordingMarked(const std::string& recordingId) const {
    auto tasks = m_store.listByRecording(recordingId);
    return std::any_of(tasks.begin(), tasks.end(),
                       [](const DownloadTask& t) { return t.isMarkedForDeletion; });
}

bool DeletionReconciler::removeFiles(const DownloadTask& task, std::error_code& error) const {
    auto destination = destinationPath(m_downloadsDir, task);

    std::vector<std::filesystem::path> paths{destination, partialPath(destination)};
    if (task.localPath && std::filesystem::path(*task.localPath) != destination) {
        paths.emplace_back(*task.localPath);
    }

    bool ok = true;
    for (const auto& path : paths) {
        std::error_code ec;
        if (!utils::FileUtils::deleteFile(path, ec)) {
            error = ec;
            ok = false;
        }
    }

    utils::FileUtils::removeEmptyParents(destination.parent_path(), m_downloadsDir);
    return ok;
}

} // namespace tapedeck::core::downloader
