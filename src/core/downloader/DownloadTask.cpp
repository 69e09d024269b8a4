/**
 * DownloadTask.cpp
 *
 * Status state machine and JSON mapping of the task record.
 */

#include "DownloadTask.hpp"
#include "../../utils/StringUtils.hpp"

namespace tapedeck::core::downloader {

namespace {

template<typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

void putTime(json& j, const char* key, const std::optional<TimePoint>& value) {
    if (value) {
        j[key] = toEpochMillis(*value);
    } else {
        j[key] = nullptr;
    }
}

std::optional<TimePoint> readTime(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return fromEpochMillis(it->get<int64_t>());
}

std::optional<std::string> readString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

const char* toString(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Queued:      return "QUEUED";
        case DownloadStatus::Downloading: return "DOWNLOADING";
        case DownloadStatus::Paused:      return "PAUSED";
        case DownloadStatus::Completed:   return "COMPLETED";
        case DownloadStatus::Failed:      return "FAILED";
        case DownloadStatus::Cancelled:   return "CANCELLED";
    }
    return "UNKNOWN";
}

std::optional<DownloadStatus> parseStatus(const std::string& name) {
    static const DownloadStatus all[] = {
        DownloadStatus::Queued, DownloadStatus::Downloading, DownloadStatus::Paused,
        DownloadStatus::Completed, DownloadStatus::Failed, DownloadStatus::Cancelled
    };
    for (auto status : all) {
        if (name == toString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

bool isValidTransition(DownloadStatus from, DownloadStatus to) {
    switch (from) {
        case DownloadStatus::Queued:
            return to == DownloadStatus::Downloading ||
                   to == DownloadStatus::Paused ||
                   to == DownloadStatus::Cancelled;
        case DownloadStatus::Downloading:
            return to == DownloadStatus::Completed ||
                   to == DownloadStatus::Failed ||
                   to == DownloadStatus::Paused ||
                   to == DownloadStatus::Cancelled;
        case DownloadStatus::Paused:
            return to == DownloadStatus::Queued ||
                   to == DownloadStatus::Cancelled;
        case DownloadStatus::Failed:
        case DownloadStatus::Cancelled:
            return to == DownloadStatus::Queued;
        case DownloadStatus::Completed:
            return false;
    }
    return false;
}

std::string makeTaskId(const std::string& recordingId, const std::string& trackFilename) {
    // '%' and '_' are escaped in the recording part, so the first '_' always
    // separates the two and distinct pairs never share an id
    std::string id;
    id.reserve(recordingId.size() + trackFilename.size() + 1);
    for (char c : recordingId) {
        if (c == '%') {
            id += "%25";
        } else if (c == '_') {
            id += "%5F";
        } else {
            id += c;
        }
    }
    id += '_';
    id += trackFilename;
    return id;
}

std::filesystem::path destinationPath(const std::filesystem::path& root, const DownloadTask& task) {
    return root / utils::StringUtils::sanitizeFileName(task.recordingId)
                / utils::StringUtils::sanitizeFileName(task.trackFilename);
}

std::filesystem::path partialPath(const std::filesystem::path& destination) {
    auto part = destination;
    part += ".part";
    return part;
}

int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

void to_json(json& j, const DownloadTask& task) {
    j = json{
        {"id", task.id},
        {"recordingId", task.recordingId},
        {"trackFilename", task.trackFilename},
        {"sourceUrl", task.sourceUrl},
        {"format", task.format},
        {"sha1", task.sha1},
        {"status", task.status},
        {"priority", task.priority},
        {"enqueueSequence", task.enqueueSequence},
        {"bytesDownloaded", task.bytesDownloaded},
        {"totalBytes", task.totalBytes},
        {"retryCount", task.retryCount},
        {"isMarkedForDeletion", task.isMarkedForDeletion},
        {"lastAccessTimestamp", toEpochMillis(task.lastAccessTimestamp)}
    };
    putOptional(j, "progressFraction", task.progressFraction);
    putOptional(j, "errorMessage", task.errorMessage);
    putOptional(j, "localPath", task.localPath);
    putTime(j, "startedAt", task.startedAt);
    putTime(j, "completedAt", task.completedAt);
    putTime(j, "lastFailureAt", task.lastFailureAt);
    putTime(j, "deletionTimestamp", task.deletionTimestamp);
}

void from_json(const json& j, DownloadTask& task) {
    j.at("id").get_to(task.id);
    j.at("recordingId").get_to(task.recordingId);
    j.at("trackFilename").get_to(task.trackFilename);
    task.sourceUrl = j.value("sourceUrl", "");
    task.format = j.value("format", "");
    task.sha1 = j.value("sha1", "");
    j.at("status").get_to(task.status);
    task.priority = j.value("priority", 0);
    task.enqueueSequence = j.value("enqueueSequence", uint64_t(0));
    task.bytesDownloaded = j.value("bytesDownloaded", uint64_t(0));
    task.totalBytes = j.value("totalBytes", uint64_t(0));
    task.retryCount = j.value("retryCount", 0);
    task.isMarkedForDeletion = j.value("isMarkedForDeletion", false);
    task.lastAccessTimestamp = fromEpochMillis(j.value("lastAccessTimestamp", int64_t(0)));

    auto progress = j.find("progressFraction");
    if (progress == j.end() || progress->is_null()) {
        task.progressFraction = std::nullopt;
    } else {
        task.progressFraction = progress->get<float>();
    }
    task.errorMessage = readString(j, "errorMessage");
    task.localPath = readString(j, "localPath");
    task.startedAt = readTime(j, "startedAt");
    task.completedAt = readTime(j, "completedAt");
    task.lastFailureAt = readTime(j, "lastFailureAt");
    task.deletionTimestamp = readTime(j, "deletionTimestamp");

    // A marked record without a timestamp would never become eligible for cleanup
    if (task.isMarkedForDeletion && !task.deletionTimestamp) {
        task.deletionTimestamp = task.lastAccessTimestamp;
    }
}

} // namespace tapedeck::core::downloader
