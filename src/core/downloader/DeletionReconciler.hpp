#pragma once

/**
 * DeletionReconciler.hpp
 *
 * Soft delete with a grace period. Marking and restoring only touch the
 * two deletion fields of a record; files disappear in cleanup() once the
 * grace period has elapsed.
 */

#include "TaskStore.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace tapedeck::core::downloader {

/**
 * Outcome of a cleanup pass
 */
struct CleanupReport {
    // Records removed from the store
    std::vector<std::string> removedIds;

    // Files that could not be deleted (records were removed anyway)
    std::vector<std::string> fileErrors;

    // Marked records still inside their grace period
    size_t pending{0};

    uint64_t freedBytes{0};
};

class DeletionReconciler {
public:
    /**
     * @param store Task store, must outlive the reconciler
     * @param downloadsDir Root of downloaded files, never removed itself
     */
    DeletionReconciler(ITaskStore& store, std::filesystem::path downloadsDir);

    /**
     * Mark one task. Re-marking keeps the original timestamp.
     * @return false if the task does not exist
     * @throws PersistenceError
     */
    bool markForDeletion(const std::string& taskId, TimePoint now = Clock::now());

    /**
     * Mark every task of a recording
     * @return Number of tasks marked
     * @throws PersistenceError
     */
    size_t markRecordingForDeletion(const std::string& recordingId, TimePoint now = Clock::now());

    /**
     * Clear the mark and refresh lastAccessTimestamp
     * @return false if the task does not exist
     * @throws PersistenceError
     */
    bool restore(const std::string& taskId, TimePoint now = Clock::now());

    size_t restoreRecording(const std::string& recordingId, TimePoint now = Clock::now());

    /**
     * Physically remove every marked task whose grace period has elapsed
     * (now - deletionTimestamp >= gracePeriod). File errors are logged and
     * do not stop the sweep. In-flight transfers are left for a later pass.
     */
    CleanupReport cleanup(TimePoint now, Clock::duration gracePeriod);

    /**
     * Least recently used completed tasks, not yet marked, whose sizes
     * together cover requiredBytes. Suggestions only; nothing is changed.
     */
    std::vector<DownloadTask> evictionCandidates(uint64_t requiredBytes) const;

    /**
     * A recording is marked when any of its tasks is marked
     */
    bool isRecordingMarked(const std::string& recordingId) const;

    /**
     * Delete the final and partial files of a task, then prune empty
     * recording directories below the downloads root.
     * @return false if a file could not be deleted; error holds the reason
     */
    bool removeFiles(const DownloadTask& task, std::error_code& error) const;

private:
    ITaskStore& m_store;
    std::filesystem::path m_downloadsDir;
};

} // namespace tapedeck::core::downloader
