#pragma once

/**
 * RetryPolicy.hpp
 *
 * Decisions about requeuing failed and cancelled tasks. Stateless; the
 * DownloadManager applies the results through the task store.
 */

#include "DownloadTask.hpp"

#include <chrono>

namespace tapedeck::core::downloader {

enum class RetryKind {
    Manual,     // user initiated, not counted
    Automatic   // counted against maxRetries
};

class RetryPolicy {
public:
    /**
     * Manual retry is allowed from FAILED or CANCELLED only
     */
    static bool canRetryManually(DownloadStatus status);

    /**
     * Automatic retry is allowed from FAILED while retryCount < maxRetries
     */
    static bool canRetryAutomatically(DownloadStatus status, int retryCount, int maxRetries);

    /**
     * Earliest time an automatic retry may requeue the task.
     * The delay grows linearly with the number of retries already spent.
     * @param retryDelay Base delay (0 = immediately eligible)
     */
    static TimePoint nextAttemptAt(const DownloadTask& task, std::chrono::milliseconds retryDelay);

    static bool isBackoffElapsed(const DownloadTask& task,
                                 std::chrono::milliseconds retryDelay,
                                 TimePoint now);

    /**
     * Requeue a task in place: status QUEUED, progress reset, error cleared.
     * An automatic retry increments retryCount; a manual one leaves it alone.
     * @param sequence New FIFO position
     * @return false if the policy does not allow the retry
     */
    static bool apply(DownloadTask& task, RetryKind kind, int maxRetries, uint64_t sequence);
};

} // namespace tapedeck::core::downloader
