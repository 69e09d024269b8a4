#pragma once

/**
 * DownloadTask.hpp
 *
 * Persisted download task record and the status state machine.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tapedeck::core::downloader {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * Download task status
 *
 * QUEUED      -> DOWNLOADING, PAUSED, CANCELLED
 * DOWNLOADING -> COMPLETED, FAILED, PAUSED, CANCELLED
 * PAUSED      -> QUEUED, CANCELLED
 * FAILED      -> QUEUED
 * CANCELLED   -> QUEUED
 * COMPLETED is terminal.
 */
enum class DownloadStatus {
    Queued,
    Downloading,
    Paused,
    Completed,
    Failed,
    Cancelled
};

NLOHMANN_JSON_SERIALIZE_ENUM(DownloadStatus, {
    {DownloadStatus::Queued, "QUEUED"},
    {DownloadStatus::Downloading, "DOWNLOADING"},
    {DownloadStatus::Paused, "PAUSED"},
    {DownloadStatus::Completed, "COMPLETED"},
    {DownloadStatus::Failed, "FAILED"},
    {DownloadStatus::Cancelled, "CANCELLED"},
})

/**
 * Status name as persisted ("QUEUED", ...)
 */
const char* toString(DownloadStatus status);

/**
 * Parse a persisted status name
 * @return Status, or nullopt for an unknown name
 */
std::optional<DownloadStatus> parseStatus(const std::string& name);

/**
 * Check a transition against the state machine.
 * Same-state "transitions" are not valid transitions; callers treat them as no-ops.
 */
bool isValidTransition(DownloadStatus from, DownloadStatus to);

/**
 * Candidate file of a recording, as returned by the catalog
 */
struct TrackFile {
    std::string filename;
    std::string format;

    // Size in bytes (0 = unknown)
    uint64_t sizeBytes{0};

    std::string url;

    // Expected SHA1 hash (optional)
    std::string sha1;
};

/**
 * DownloadTask - one file of one recording
 */
struct DownloadTask {
    // Deterministic id, see makeTaskId()
    std::string id;

    std::string recordingId;
    std::string trackFilename;
    std::string sourceUrl;
    std::string format;

    // Expected SHA1 hash (optional)
    std::string sha1;

    DownloadStatus status{DownloadStatus::Queued};

    // Higher runs first
    int priority{0};

    // FIFO tie-break among equal priorities, assigned by the store
    uint64_t enqueueSequence{0};

    // 0.0 - 1.0, nullopt while the size is unknown
    std::optional<float> progressFraction{0.0f};

    uint64_t bytesDownloaded{0};

    // 0 = unknown
    uint64_t totalBytes{0};

    int retryCount{0};

    std::optional<std::string> errorMessage;

    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    std::optional<TimePoint> lastFailureAt;

    std::optional<std::string> localPath;

    // Soft delete, independent of status
    bool isMarkedForDeletion{false};
    std::optional<TimePoint> deletionTimestamp;

    TimePoint lastAccessTimestamp{Clock::now()};

    bool hasKnownSize() const { return totalBytes > 0; }

    /**
     * Queued, downloading or paused
     */
    bool isActive() const {
        return status == DownloadStatus::Queued ||
               status == DownloadStatus::Downloading ||
               status == DownloadStatus::Paused;
    }

    bool isCompleted() const { return status == DownloadStatus::Completed; }

    /**
     * Reset transfer progress, keeping the known total size
     */
    void resetProgress() {
        bytesDownloaded = 0;
        progressFraction = hasKnownSize() ? std::optional<float>(0.0f) : std::nullopt;
    }
};

/**
 * Build the task id for a (recording, file) pair.
 * The same pair always yields the same id, which makes enqueue an upsert.
 */
std::string makeTaskId(const std::string& recordingId, const std::string& trackFilename);

/**
 * Final location of a task's file: <root>/<recordingId>/<trackFilename>,
 * both components sanitized
 */
std::filesystem::path destinationPath(const std::filesystem::path& root, const DownloadTask& task);

/**
 * In-flight location of a transfer: destination + ".part"
 */
std::filesystem::path partialPath(const std::filesystem::path& destination);

int64_t toEpochMillis(TimePoint tp);
TimePoint fromEpochMillis(int64_t millis);

void to_json(json& j, const DownloadTask& task);
void from_json(const json& j, DownloadTask& task);

} // namespace tapedeck::core::downloader
