/**
 * RetryPolicy.cpp
 */

#include "RetryPolicy.hpp"

namespace tapedeck::core::downloader {

bool RetryPolicy::canRetryManually(DownloadStatus status) {
    return status == DownloadStatus::Failed || status == DownloadStatus::Cancelled;
}

bool RetryPolicy::canRetryAutomatically(DownloadStatus status, int retryCount, int maxRetries) {
    return status == DownloadStatus::Failed && retryCount < maxRetries;
}

TimePoint RetryPolicy::nextAttemptAt(const DownloadTask& task, std::chrono::milliseconds retryDelay) {
    if (!task.lastFailureAt || retryDelay.count() <= 0) {
        return TimePoint{};
    }
    auto delay = retryDelay * (task.retryCount + 1);
    return *task.lastFailureAt + std::chrono::duration_cast<Clock::duration>(delay);
}

bool RetryPolicy::isBackoffElapsed(const DownloadTask& task,
                                   std::chrono::milliseconds retryDelay,
                                   TimePoint now) {
    return now >= nextAttemptAt(task, retryDelay);
}

bool RetryPolicy::apply(DownloadTask& task, RetryKind kind, int maxRetries, uint64_t sequence) {
    if (kind == RetryKind::Manual) {
        if (!canRetryManually(task.status)) {
            return false;
        }
    } else {
        if (!canRetryAutomatically(task.status, task.retryCount, maxRetries)) {
            return false;
        }
        ++task.retryCount;
    }

    task.status = DownloadStatus::Queued;
    task.errorMessage.reset();
    task.startedAt.reset();
    task.completedAt.reset();
    task.resetProgress();
    task.enqueueSequence = sequence;
    return true;
}

} // namespace tapedeck::core::downloader
