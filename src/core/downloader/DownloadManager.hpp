#pragma once

/**
 * DownloadManager.hpp
 *
 * Public surface of the download engine: enqueue, task and group control,
 * retries, soft delete and queries. Owns the scheduler and the deletion
 * reconciler; the store, the storage admission and the transfer client
 * are passed in by the caller.
 */

#include "Catalog.hpp"
#include "DeletionReconciler.hpp"
#include "DownloadScheduler.hpp"
#include "DownloadTask.hpp"
#include "RetryPolicy.hpp"
#include "StorageManager.hpp"
#include "TaskStore.hpp"
#include "TransferClient.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tapedeck::core::downloader {

struct DownloadManagerOptions {
    size_t maxConcurrent{3};
    int maxRetries{3};

    // Base delay of the linear automatic-retry backoff (0 = immediate)
    std::chrono::milliseconds retryDelay{0};

    std::filesystem::path downloadsDir;
    bool verifyChecksums{true};
    std::chrono::milliseconds safetyInterval{std::chrono::seconds(60)};

    // 0 disables the low-space signal
    uint64_t lowSpaceThresholdBytes{0};

    std::vector<std::string> formatPreferences{"Ogg Vorbis", "VBR MP3", "MP3", "Flac"};

    /**
     * Read the downloads.*, scheduler.* and storage.* keys of Config
     */
    static DownloadManagerOptions fromConfig();
};

/**
 * Aggregate state of a recording, derived from its tasks
 */
enum class RecordingState {
    NotDownloaded,
    Downloading,
    Paused,
    Cancelled,
    Failed,
    Downloaded
};

const char* toString(RecordingState state);

struct RecordingStatus {
    std::string recordingId;
    RecordingState state{RecordingState::NotDownloaded};

    // Average over all tracks, queued tracks count as 0
    float progress{0.0f};

    size_t totalTracks{0};
    size_t completedTracks{0};
    size_t failedTracks{0};

    // First error of a failed recording
    std::optional<std::string> errorMessage;

    // Any track marked for deletion
    bool markedForDeletion{false};
};

struct DownloadStats {
    size_t total{0};
    size_t queued{0};
    size_t downloading{0};
    size_t paused{0};
    size_t completed{0};
    size_t failed{0};
    size_t cancelled{0};
    size_t markedForDeletion{0};

    uint64_t totalBytesDownloaded{0};

    // Completed bytes over time spent transferring them
    double averageBytesPerSecond{0.0};
};

/**
 * DownloadManager - download queue and lifecycle
 *
 * Every operation returns its result instead of throwing. Persistence
 * errors are retried once, then logged and reported as failure (false,
 * nullopt or an empty list). Status transitions that are already in
 * their target state are successful no-ops, so group operations can be
 * repeated after a partial failure.
 */
class DownloadManager {
public:
    DownloadManager(ITaskStore& store, IStorageAdmission& storage,
                    ITransferClient& client, DownloadManagerOptions options);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Catalog and format filter used by enqueueRecording()
     */
    void setCatalog(std::shared_ptr<ICatalogResolver> resolver, std::shared_ptr<IFormatFilter> filter);

    void setNetworkPolicy(NetworkPolicy policy);
    void setCompletionHook(CompletionHook hook);
    void setLowSpaceHandler(LowSpaceHandler handler);

    /**
     * Crash recovery: every DOWNLOADING task goes back to QUEUED, keeping
     * its last progress checkpoint.
     * @return Number of tasks reset
     */
    size_t initialize();

    /**
     * Start the admission loop
     */
    void start();

    /**
     * Stop the admission loop and interrupt running transfers
     */
    void shutdown();

    // -- Enqueue --

    /**
     * Enqueue files of a recording. One record per (recording, file):
     * queued, running, paused and completed tasks are left as they are,
     * a failed task is requeued keeping its retry count, a cancelled one
     * starts fresh, and a completed task marked for deletion is restored.
     * @return Ids of all tasks now tracked for these files
     */
    std::vector<std::string> enqueue(const std::string& recordingId,
                                     const std::vector<TrackFile>& files,
                                     int priority = 0);

    /**
     * Resolve a recording through the catalog, keep the preferred format
     * of each song and enqueue the result
     * @return Task ids, or nullopt if the recording could not be resolved
     */
    std::optional<std::vector<std::string>> enqueueRecording(const std::string& recordingId, int priority = 0);
    std::optional<std::vector<std::string>> enqueueRecording(const std::string& recordingId,
                                                             const std::vector<std::string>& formatPreferences,
                                                             int priority = 0);

    // -- Task control --

    bool pause(const std::string& taskId);
    bool resume(const std::string& taskId);
    bool cancel(const std::string& taskId);

    /**
     * Delete a task that never produced a file (queued, paused, failed or
     * cancelled). Completed tasks go through markForDeletion().
     */
    bool remove(const std::string& taskId);

    /**
     * Administrative delete of any task and its files, bypassing the grace period
     */
    bool deleteNow(const std::string& taskId);

    bool setPriority(const std::string& taskId, int priority);

    /**
     * Move a task to the front: highest priority, then resume or requeue it
     */
    bool forceDownload(const std::string& taskId);

    size_t pauseRecording(const std::string& recordingId);
    size_t resumeRecording(const std::string& recordingId);
    size_t cancelRecording(const std::string& recordingId);

    /**
     * Cancel every queued, running and paused task
     */
    size_t cancelAllActive();

    /**
     * Remove every QUEUED task outright
     */
    size_t clearQueue();

    /**
     * Remove every FAILED task and its partial file
     */
    size_t deleteFailedDownloads();

    /**
     * Give the listed tasks priorities above every other queued task, in
     * list order. Running transfers are not preempted.
     * @return false if an id is unknown (the known ones are still reordered)
     */
    bool reorderQueue(const std::vector<std::string>& taskIds);

    // -- Retry --

    /**
     * Manual retry from FAILED or CANCELLED; not counted against maxRetries
     */
    bool retry(const std::string& taskId);

    /**
     * Manual retry of every FAILED task
     * @return Ids requeued
     */
    std::vector<std::string> retryAll();

    /**
     * Automatic retry of FAILED tasks below the retry budget whose
     * backoff has elapsed
     * @return Ids requeued
     */
    std::vector<std::string> autoRetry(int maxRetries);
    std::vector<std::string> autoRetry();

    // -- Soft delete --

    bool markForDeletion(const std::string& taskId);
    size_t markRecordingForDeletion(const std::string& recordingId);
    bool restore(const std::string& taskId);
    size_t restoreRecording(const std::string& recordingId);

    /**
     * Remove files and records of tasks marked at least gracePeriod ago
     */
    CleanupReport cleanup(TimePoint now, Clock::duration gracePeriod);

    std::vector<DownloadTask> evictionCandidates(uint64_t requiredBytes) const;

    /**
     * Refresh lastAccessTimestamp, e.g. when a track is played
     */
    bool markAccessed(const std::string& taskId);

    // -- Queries --

    std::optional<DownloadTask> task(const std::string& taskId) const;
    std::vector<DownloadTask> tasksForRecording(const std::string& recordingId) const;

    /**
     * Running tasks, then queued tasks in admission order, then paused ones
     */
    std::vector<DownloadTask> queueSnapshot() const;

    std::vector<DownloadTask> activeDownloads() const;
    std::vector<DownloadTask> completedDownloads() const;
    std::vector<DownloadTask> failedDownloads() const;

    RecordingStatus recordingStatus(const std::string& recordingId) const;
    DownloadStats stats() const;

    bool isTrackDownloaded(const std::string& recordingId, const std::string& trackFilename) const;
    std::optional<std::string> localFilePath(const std::string& recordingId, const std::string& trackFilename) const;

    DownloadScheduler& scheduler() { return *m_scheduler; }
    const DownloadManagerOptions& options() const { return m_options; }

private:
    /**
     * Apply a status transition through the state machine.
     * Already being in the target state is a successful no-op.
     * @param previous Receives the status the task left
     */
    bool transition(const std::string& taskId, DownloadStatus to, const char* operation,
                    DownloadStatus* previous = nullptr);

    /**
     * Shared body of retry(), retryAll() and autoRetry()
     */
    bool requeue(const std::string& taskId, RetryKind kind, int maxRetries);

    /**
     * Delete the partial file of a task, logging failures
     */
    void discardPartial(const DownloadTask& task) const;

    template<typename Pred>
    size_t forEachTask(const std::vector<DownloadTask>& tasks, Pred pred) {
        size_t count = 0;
        for (const auto& t : tasks) {
            if (pred(t)) {
                ++count;
            }
        }
        return count;
    }

private:
    ITaskStore& m_store;
    IStorageAdmission& m_storage;
    DownloadManagerOptions m_options;

    std::unique_ptr<DownloadScheduler> m_scheduler;
    std::unique_ptr<DeletionReconciler> m_reconciler;

    std::shared_ptr<ICatalogResolver> m_resolver;
    std::shared_ptr<IFormatFilter> m_formatFilter;
};

} // namespace tapedeck::core::downloader
