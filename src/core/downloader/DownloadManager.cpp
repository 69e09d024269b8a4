/**
 * DownloadManager.cpp
 *
 * Queue operations on top of the task store. Admission itself belongs to
 * the DownloadScheduler; every change that may free a slot or add a
 * candidate asks it for a pass.
 */

#include "DownloadManager.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/PathUtils.hpp"

#include <algorithm>
#include <climits>

namespace tapedeck::core::downloader {

namespace {

bool queueOrder(const DownloadTask& a, const DownloadTask& b) {
    if (a.priority != b.priority) {
        return a.priority > b.priority;
    }
    return a.enqueueSequence < b.enqueueSequence;
}

void applyTrackFile(DownloadTask& task, const TrackFile& file) {
    task.sourceUrl = file.url;
    task.format = file.format;
    task.sha1 = file.sha1;
    if (file.sizeBytes > 0) {
        task.totalBytes = file.sizeBytes;
    }
}

} // namespace

const char* toString(RecordingState state) {
    switch (state) {
        case RecordingState::NotDownloaded: return "NOT_DOWNLOADED";
        case RecordingState::Downloading:   return "DOWNLOADING";
        case RecordingState::Paused:        return "PAUSED";
        case RecordingState::Cancelled:     return "CANCELLED";
        case RecordingState::Failed:        return "FAILED";
        case RecordingState::Downloaded:    return "DOWNLOADED";
    }
    return "UNKNOWN";
}

DownloadManagerOptions DownloadManagerOptions::fromConfig() {
    auto& config = Config::instance();
    DownloadManagerOptions options;

    options.maxConcurrent = static_cast<size_t>(config.getAtLeast("downloads.maxConcurrent", 3, 1));
    options.maxRetries = config.getAtLeast("downloads.maxRetries", 3, 0);
    options.retryDelay = std::chrono::milliseconds(config.getAtLeast<int64_t>("downloads.retryDelay", 0, 0));
    options.verifyChecksums = config.get<bool>("downloads.verifyChecksums", true);
    options.formatPreferences = config.get<std::vector<std::string>>("downloads.formatPreferences",
                                                                     options.formatPreferences);

    auto directory = config.get<std::string>("downloads.directory", "");
    options.downloadsDir = directory.empty() ? utils::PathUtils::getDownloadsPath()
                                             : std::filesystem::path(directory);

    options.safetyInterval = std::chrono::seconds(config.getAtLeast<int64_t>("scheduler.safetyInterval", 60, 1));

    auto thresholdMB = config.getAtLeast<int64_t>("storage.lowSpaceThresholdMB", 500, 0);
    options.lowSpaceThresholdBytes = static_cast<uint64_t>(thresholdMB) * 1024 * 1024;

    return options;
}

DownloadManager::DownloadManager(ITaskStore& store, IStorageAdmission& storage,
                                 ITransferClient& client, DownloadManagerOptions options)
    : m_store(store)
    , m_storage(storage)
    , m_options(std::move(options)) {

    SchedulerOptions schedulerOptions;
    schedulerOptions.maxConcurrent = m_options.maxConcurrent;
    schedulerOptions.downloadsDir = m_options.downloadsDir;
    schedulerOptions.verifyChecksums = m_options.verifyChecksums;
    schedulerOptions.safetyInterval = m_options.safetyInterval;
    schedulerOptions.lowSpaceThresholdBytes = m_options.lowSpaceThresholdBytes;

    m_scheduler = std::make_unique<DownloadScheduler>(m_store, m_storage, client, schedulerOptions);
    m_reconciler = std::make_unique<DeletionReconciler>(m_store, m_options.downloadsDir);
}

DownloadManager::~DownloadManager() {
    shutdown();
}

void DownloadManager::setCatalog(std::shared_ptr<ICatalogResolver> resolver, std::shared_ptr<IFormatFilter> filter) {
    m_resolver = std::move(resolver);
    m_formatFilter = std::move(filter);
}

void DownloadManager::setNetworkPolicy(NetworkPolicy policy) {
    m_scheduler->setNetworkPolicy(std::move(policy));
}

void DownloadManager::setCompletionHook(CompletionHook hook) {
    m_scheduler->setCompletionHook(std::move(hook));
}

void DownloadManager::setLowSpaceHandler(LowSpaceHandler handler) {
    m_scheduler->setLowSpaceHandler(std::move(handler));
}

size_t DownloadManager::initialize() {
    if (!utils::FileUtils::createDirectories(m_options.downloadsDir)) {
        Logger::instance().error("Cannot create downloads directory {}", m_options.downloadsDir.string());
    }

    // Nothing can be running yet: a DOWNLOADING record is a leftover of a crash
    size_t reset = 0;
    for (const auto& task : m_store.listByStatus(DownloadStatus::Downloading)) {
        auto requeued = withPersistenceRetry("recover", [&] {
            return m_store.compareAndSetStatus(task.id, DownloadStatus::Downloading, DownloadStatus::Queued);
        });
        if (requeued.value_or(false)) {
            Logger::instance().debug("Recovered {} at {} bytes", task.id, task.bytesDownloaded);
            ++reset;
        }
    }

    if (reset > 0) {
        Logger::instance().info("Requeued {} interrupted downloads", reset);
    }
    return reset;
}

void DownloadManager::start() {
    m_scheduler->start();
}

void DownloadManager::shutdown() {
    m_scheduler->stop();
}

// -- Enqueue --

std::vector<std::string> DownloadManager::enqueue(const std::string& recordingId,
                                                  const std::vector<TrackFile>& files,
                                                  int priority) {
    std::vector<std::string> ids;
    bool queued = false;

    for (const auto& file : files) {
        auto id = makeTaskId(recordingId, file.filename);
        auto existing = m_store.get(id);

        if (!existing) {
            DownloadTask task;
            task.id = id;
            task.recordingId = recordingId;
            task.trackFilename = file.filename;
            task.priority = priority;
            task.lastAccessTimestamp = Clock::now();
            applyTrackFile(task, file);
            task.resetProgress();

            auto inserted = withPersistenceRetry("enqueue", [&] {
                m_store.upsert(task);
                return true;
            });
            if (!inserted) {
                continue;
            }

            Logger::instance().debug("Enqueued {} (priority {})", id, priority);
            publishStatus(id, recordingId, DownloadStatus::Queued);
            ids.push_back(id);
            queued = true;
            continue;
        }

        switch (existing->status) {
            case DownloadStatus::Failed:
            case DownloadStatus::Cancelled: {
                bool freshStart = existing->status == DownloadStatus::Cancelled;
                auto requeued = withPersistenceRetry("enqueue", [&] {
                    uint64_t sequence = m_store.allocateSequence();
                    return m_store.modify(id, [&](DownloadTask& t) {
                        if (!RetryPolicy::apply(t, RetryKind::Manual, m_options.maxRetries, sequence)) {
                            return false;
                        }
                        if (freshStart) {
                            t.retryCount = 0;
                        }
                        t.priority = priority;
                        applyTrackFile(t, file);
                        t.resetProgress();
                        return true;
                    });
                });
                if (!requeued) {
                    continue;
                }
                if (*requeued) {
                    Logger::instance().debug("Re-enqueued {} ({})", id, freshStart ? "fresh start" : "retry");
                    publishStatus(id, recordingId, DownloadStatus::Queued);
                    queued = true;
                }
                break;
            }

            case DownloadStatus::Completed:
                if (existing->isMarkedForDeletion && !restore(id)) {
                    continue;
                }
                break;

            default:
                // Queued, running or paused: keep the progress
                break;
        }
        ids.push_back(id);
    }

    if (queued) {
        Logger::instance().info("Enqueued recording {} ({} files)", recordingId, ids.size());
        m_scheduler->requestPass();
    }
    return ids;
}

std::optional<std::vector<std::string>> DownloadManager::enqueueRecording(const std::string& recordingId, int priority) {
    return enqueueRecording(recordingId, m_options.formatPreferences, priority);
}

std::optional<std::vector<std::string>> DownloadManager::enqueueRecording(const std::string& recordingId,
                                                                          const std::vector<std::string>& formatPreferences,
                                                                          int priority) {
    if (!m_resolver) {
        Logger::instance().error("No catalog configured, cannot resolve {}", recordingId);
        return std::nullopt;
    }

    auto files = m_resolver->resolve(recordingId);
    if (!files) {
        Logger::instance().warn("Recording {} not found in catalog", recordingId);
        return std::nullopt;
    }

    auto selected = m_formatFilter ? m_formatFilter->filter(*files, formatPreferences) : *files;
    if (selected.empty()) {
        Logger::instance().warn("No downloadable files for {} (preferences: {})",
                                recordingId, formatPreferences.size());
    }
    return enqueue(recordingId, selected, priority);
}

// -- Task control --

bool DownloadManager::transition(const std::string& taskId, DownloadStatus to, const char* operation,
                                 DownloadStatus* previous) {
    auto current = m_store.get(taskId);
    if (!current) {
        return false;
    }
    if (current->status == to) {
        if (previous) {
            *previous = to;
        }
        return true;
    }

    DownloadStatus from = current->status;
    auto committed = withPersistenceRetry(operation, [&] {
        return m_store.modify(taskId, [&](DownloadTask& t) {
            if (!isValidTransition(t.status, to)) {
                return false;
            }
            from = t.status;
            t.status = to;
            if (to == DownloadStatus::Cancelled) {
                t.resetProgress();
                t.errorMessage.reset();
            }
            return true;
        });
    });

    if (!committed.value_or(false)) {
        Logger::instance().debug("{} rejected for {} ({} -> {})", operation, taskId, toString(from), toString(to));
        return false;
    }

    if (previous) {
        *previous = from;
    }
    Logger::instance().debug("{}: {} -> {}", taskId, toString(from), toString(to));
    publishStatus(taskId, current->recordingId, to);
    return true;
}

bool DownloadManager::pause(const std::string& taskId) {
    DownloadStatus previous = DownloadStatus::Paused;
    if (!transition(taskId, DownloadStatus::Paused, "pause", &previous)) {
        return false;
    }

    // The partial file stays for the resume
    if (previous == DownloadStatus::Downloading) {
        m_scheduler->cancelTransfer(taskId);
        m_scheduler->requestPass();
    }
    return true;
}

bool DownloadManager::resume(const std::string& taskId) {
    auto task = m_store.get(taskId);
    if (!task) {
        return false;
    }
    if (task->status != DownloadStatus::Paused) {
        return task->status == DownloadStatus::Queued || task->status == DownloadStatus::Downloading;
    }

    if (!transition(taskId, DownloadStatus::Queued, "resume")) {
        return false;
    }
    m_scheduler->requestPass();
    return true;
}

bool DownloadManager::cancel(const std::string& taskId) {
    DownloadStatus previous = DownloadStatus::Cancelled;
    if (!transition(taskId, DownloadStatus::Cancelled, "cancel", &previous)) {
        return false;
    }
    if (previous == DownloadStatus::Cancelled) {
        return true;
    }

    if (previous == DownloadStatus::Downloading) {
        m_scheduler->cancelTransfer(taskId);
        m_scheduler->requestPass();
    }
    if (auto task = m_store.get(taskId)) {
        discardPartial(*task);
    }
    return true;
}

bool DownloadManager::remove(const std::string& taskId) {
    auto task = m_store.get(taskId);
    if (!task) {
        return false;
    }
    if (task->isCompleted()) {
        Logger::instance().warn("Refusing to remove completed download {}, mark it for deletion instead", taskId);
        return false;
    }

    auto removed = withPersistenceRetry("remove", [&] { return m_store.remove(taskId); });
    if (!removed.value_or(false)) {
        return false;
    }

    // A transfer admitted meanwhile finds no record and stops
    if (m_scheduler->cancelTransfer(taskId)) {
        m_scheduler->requestPass();
    }
    discardPartial(*task);

    Logger::instance().info("Removed download {}", taskId);
    return true;
}

bool DownloadManager::deleteNow(const std::string& taskId) {
    auto task = m_store.get(taskId);
    if (!task) {
        return false;
    }

    auto removed = withPersistenceRetry("deleteNow", [&] { return m_store.remove(taskId); });
    if (!removed.value_or(false)) {
        return false;
    }

    if (m_scheduler->cancelTransfer(taskId)) {
        m_scheduler->requestPass();
    }

    std::error_code ec;
    if (!m_reconciler->removeFiles(*task, ec)) {
        Logger::instance().warn("Could not delete files of {}: {}", taskId, ec.message());
    }

    Logger::instance().info("Deleted download {} without grace period", taskId);
    return true;
}

bool DownloadManager::setPriority(const std::string& taskId, int priority) {
    auto updated = withPersistenceRetry("setPriority", [&] {
        return m_store.modify(taskId, [priority](DownloadTask& t) {
            t.priority = priority;
            return true;
        });
    });
    if (!updated.value_or(false)) {
        return false;
    }

    Logger::instance().debug("Priority of {} set to {}", taskId, priority);
    m_scheduler->requestPass();
    return true;
}

bool DownloadManager::forceDownload(const std::string& taskId) {
    auto task = m_store.get(taskId);
    if (!task || task->isCompleted()) {
        return false;
    }

    if (!setPriority(taskId, INT_MAX)) {
        return false;
    }

    switch (task->status) {
        case DownloadStatus::Paused:
            return resume(taskId);
        case DownloadStatus::Failed:
        case DownloadStatus::Cancelled:
            return retry(taskId);
        default:
            return true;
    }
}

size_t DownloadManager::pauseRecording(const std::string& recordingId) {
    size_t count = forEachTask(m_store.listByRecording(recordingId), [this](const DownloadTask& t) {
        return (t.status == DownloadStatus::Queued || t.status == DownloadStatus::Downloading) && pause(t.id);
    });
    Logger::instance().info("Paused {} downloads of {}", count, recordingId);
    return count;
}

size_t DownloadManager::resumeRecording(const std::string& recordingId) {
    size_t count = forEachTask(m_store.listByRecording(recordingId), [this](const DownloadTask& t) {
        return t.status == DownloadStatus::Paused && resume(t.id);
    });
    Logger::instance().info("Resumed {} downloads of {}", count, recordingId);
    return count;
}

size_t DownloadManager::cancelRecording(const std::string& recordingId) {
    size_t count = forEachTask(m_store.listByRecording(recordingId), [this](const DownloadTask& t) {
        return t.isActive() && cancel(t.id);
    });
    Logger::instance().info("Cancelled {} downloads of {}", count, recordingId);
    return count;
}

size_t DownloadManager::cancelAllActive() {
    size_t count = forEachTask(m_store.listAll(), [this](const DownloadTask& t) {
        return t.isActive() && cancel(t.id);
    });
    Logger::instance().info("Cancelled {} active downloads", count);
    return count;
}

size_t DownloadManager::clearQueue() {
    size_t count = forEachTask(m_store.listByStatus(DownloadStatus::Queued), [this](const DownloadTask& t) {
        auto removed = withPersistenceRetry("clearQueue", [&] { return m_store.remove(t.id); });
        if (!removed.value_or(false)) {
            return false;
        }
        m_scheduler->cancelTransfer(t.id);
        discardPartial(t);
        return true;
    });

    Logger::instance().info("Cleared {} queued downloads", count);
    m_scheduler->requestPass();
    return count;
}

size_t DownloadManager::deleteFailedDownloads() {
    size_t count = forEachTask(m_store.listByStatus(DownloadStatus::Failed), [this](const DownloadTask& t) {
        auto removed = withPersistenceRetry("deleteFailed", [&] { return m_store.remove(t.id); });
        if (!removed.value_or(false)) {
            return false;
        }
        discardPartial(t);
        return true;
    });

    Logger::instance().info("Deleted {} failed downloads", count);
    return count;
}

bool DownloadManager::reorderQueue(const std::vector<std::string>& taskIds) {
    // Highest priority among queued tasks that are not being reordered
    int64_t highest = 0;
    for (const auto& t : m_store.listByStatus(DownloadStatus::Queued)) {
        if (std::find(taskIds.begin(), taskIds.end(), t.id) == taskIds.end()) {
            highest = std::max<int64_t>(highest, t.priority);
        }
    }

    auto count = static_cast<int64_t>(taskIds.size());
    int64_t top = std::min<int64_t>(highest + count, INT_MAX);

    bool allKnown = true;
    for (int64_t i = 0; i < count; ++i) {
        int priority = static_cast<int>(top - i);
        auto updated = withPersistenceRetry("reorderQueue", [&] {
            return m_store.modify(taskIds[static_cast<size_t>(i)], [priority](DownloadTask& t) {
                t.priority = priority;
                return true;
            });
        });
        if (!updated.value_or(false)) {
            allKnown = false;
        }
    }

    Logger::instance().debug("Reordered {} queued downloads", taskIds.size());
    m_scheduler->requestPass();
    return allKnown;
}

// -- Retry --

bool DownloadManager::requeue(const std::string& taskId, RetryKind kind, int maxRetries) {
    auto requeued = withPersistenceRetry("retry", [&] {
        uint64_t sequence = m_store.allocateSequence();
        return m_store.modify(taskId, [&](DownloadTask& t) {
            return RetryPolicy::apply(t, kind, maxRetries, sequence);
        });
    });
    if (!requeued.value_or(false)) {
        return false;
    }

    auto task = m_store.get(taskId);
    if (task) {
        Logger::instance().info("Requeued {} ({} retry, {} counted)", taskId,
                                kind == RetryKind::Manual ? "manual" : "automatic", task->retryCount);
        publishStatus(taskId, task->recordingId, DownloadStatus::Queued);
    }
    return true;
}

bool DownloadManager::retry(const std::string& taskId) {
    if (!requeue(taskId, RetryKind::Manual, m_options.maxRetries)) {
        return false;
    }
    m_scheduler->requestPass();
    return true;
}

std::vector<std::string> DownloadManager::retryAll() {
    std::vector<std::string> ids;
    for (const auto& task : m_store.listByStatus(DownloadStatus::Failed)) {
        if (requeue(task.id, RetryKind::Manual, m_options.maxRetries)) {
            ids.push_back(task.id);
        }
    }

    if (!ids.empty()) {
        m_scheduler->requestPass();
    }
    return ids;
}

std::vector<std::string> DownloadManager::autoRetry(int maxRetries) {
    auto now = Clock::now();
    std::vector<std::string> ids;

    for (const auto& task : m_store.listByStatus(DownloadStatus::Failed)) {
        if (!RetryPolicy::canRetryAutomatically(task.status, task.retryCount, maxRetries)) {
            continue;
        }
        if (!RetryPolicy::isBackoffElapsed(task, m_options.retryDelay, now)) {
            continue;
        }
        if (requeue(task.id, RetryKind::Automatic, maxRetries)) {
            ids.push_back(task.id);
        }
    }

    if (!ids.empty()) {
        Logger::instance().info("Automatic retry requeued {} downloads", ids.size());
        m_scheduler->requestPass();
    }
    return ids;
}

std::vector<std::string> DownloadManager::autoRetry() {
    return autoRetry(m_options.maxRetries);
}

// -- Soft delete --

bool DownloadManager::markForDeletion(const std::string& taskId) {
    auto marked = withPersistenceRetry("markForDeletion", [&] {
        return m_reconciler->markForDeletion(taskId);
    });
    return marked.value_or(false);
}

size_t DownloadManager::markRecordingForDeletion(const std::string& recordingId) {
    auto marked = withPersistenceRetry("markRecordingForDeletion", [&] {
        return m_reconciler->markRecordingForDeletion(recordingId);
    });
    return marked.value_or(0);
}

bool DownloadManager::restore(const std::string& taskId) {
    auto restored = withPersistenceRetry("restore", [&] {
        return m_reconciler->restore(taskId);
    });
    if (!restored.value_or(false)) {
        return false;
    }

    // A restored queued task is a candidate again
    m_scheduler->requestPass();
    return true;
}

size_t DownloadManager::restoreRecording(const std::string& recordingId) {
    auto restored = withPersistenceRetry("restoreRecording", [&] {
        return m_reconciler->restoreRecording(recordingId);
    });
    if (restored.value_or(0) > 0) {
        m_scheduler->requestPass();
    }
    return restored.value_or(0);
}

CleanupReport DownloadManager::cleanup(TimePoint now, Clock::duration gracePeriod) {
    return m_reconciler->cleanup(now, gracePeriod);
}

std::vector<DownloadTask> DownloadManager::evictionCandidates(uint64_t requiredBytes) const {
    return m_reconciler->evictionCandidates(requiredBytes);
}

bool DownloadManager::markAccessed(const std::string& taskId) {
    auto now = Clock::now();
    auto updated = withPersistenceRetry("markAccessed", [&] {
        return m_store.modify(taskId, [now](DownloadTask& t) {
            t.lastAccessTimestamp = std::max(t.lastAccessTimestamp, now);
            return true;
        });
    });
    return updated.value_or(false);
}

void DownloadManager::discardPartial(const DownloadTask& task) const {
    auto partial = partialPath(destinationPath(m_options.downloadsDir, task));
    std::error_code ec;
    if (!utils::FileUtils::deleteFile(partial, ec)) {
        Logger::instance().warn("Could not delete partial file {}: {}", partial.string(), ec.message());
    }
}

// -- Queries --

std::optional<DownloadTask> DownloadManager::task(const std::string& taskId) const {
    return m_store.get(taskId);
}

std::vector<DownloadTask> DownloadManager::tasksForRecording(const std::string& recordingId) const {
    auto tasks = m_store.listByRecording(recordingId);
    std::sort(tasks.begin(), tasks.end(), [](const DownloadTask& a, const DownloadTask& b) {
        return a.trackFilename < b.trackFilename;
    });
    return tasks;
}

std::vector<DownloadTask> DownloadManager::queueSnapshot() const {
    auto running = m_store.listByStatus(DownloadStatus::Downloading);
    std::sort(running.begin(), running.end(), [](const DownloadTask& a, const DownloadTask& b) {
        return a.startedAt < b.startedAt;
    });

    auto queued = m_store.listByStatus(DownloadStatus::Queued);
    std::stable_sort(queued.begin(), queued.end(), queueOrder);

    auto paused = m_store.listByStatus(DownloadStatus::Paused);
    std::stable_sort(paused.begin(), paused.end(), queueOrder);

    std::vector<DownloadTask> snapshot;
    snapshot.reserve(running.size() + queued.size() + paused.size());
    snapshot.insert(snapshot.end(), running.begin(), running.end());
    snapshot.insert(snapshot.end(), queued.begin(), queued.end());
    snapshot.insert(snapshot.end(), paused.begin(), paused.end());
    return snapshot;
}

std::vector<DownloadTask> DownloadManager::activeDownloads() const {
    return m_store.listByStatus(DownloadStatus::Downloading);
}

std::vector<DownloadTask> DownloadManager::completedDownloads() const {
    auto completed = m_store.listByStatus(DownloadStatus::Completed);
    std::sort(completed.begin(), completed.end(), [](const DownloadTask& a, const DownloadTask& b) {
        return a.completedAt > b.completedAt;
    });
    return completed;
}

std::vector<DownloadTask> DownloadManager::failedDownloads() const {
    return m_store.listByStatus(DownloadStatus::Failed);
}

RecordingStatus DownloadManager::recordingStatus(const std::string& recordingId) const {
    RecordingStatus status;
    status.recordingId = recordingId;

    auto tasks = tasksForRecording(recordingId);
    if (tasks.empty()) {
        return status;
    }

    size_t active = 0;
    size_t paused = 0;
    size_t cancelled = 0;
    float progressSum = 0.0f;

    for (const auto& t : tasks) {
        switch (t.status) {
            case DownloadStatus::Completed:
                ++status.completedTracks;
                progressSum += 1.0f;
                break;
            case DownloadStatus::Failed:
                ++status.failedTracks;
                if (!status.errorMessage && t.errorMessage) {
                    status.errorMessage = t.errorMessage;
                }
                break;
            case DownloadStatus::Queued:
            case DownloadStatus::Downloading:
                ++active;
                progressSum += t.progressFraction.value_or(0.0f);
                break;
            case DownloadStatus::Paused:
                ++paused;
                progressSum += t.progressFraction.value_or(0.0f);
                break;
            case DownloadStatus::Cancelled:
                ++cancelled;
                break;
        }
        status.markedForDeletion = status.markedForDeletion || t.isMarkedForDeletion;
    }

    status.totalTracks = tasks.size();
    status.progress = progressSum / static_cast<float>(tasks.size());

    if (status.completedTracks == tasks.size()) {
        status.state = RecordingState::Downloaded;
    } else if (status.failedTracks > 0 && active == 0 && paused == 0 && cancelled == 0) {
        status.state = RecordingState::Failed;
    } else if (active > 0) {
        status.state = RecordingState::Downloading;
    } else if (paused > 0) {
        status.state = RecordingState::Paused;
    } else {
        status.state = RecordingState::Cancelled;
    }

    if (status.state != RecordingState::Failed) {
        status.errorMessage.reset();
    }
    return status;
}

DownloadStats DownloadManager::stats() const {
    DownloadStats stats;
    double transferSeconds = 0.0;
    uint64_t transferBytes = 0;

    for (const auto& t : m_store.listAll()) {
        ++stats.total;
        switch (t.status) {
            case DownloadStatus::Queued:      ++stats.queued; break;
            case DownloadStatus::Downloading: ++stats.downloading; break;
            case DownloadStatus::Paused:      ++stats.paused; break;
            case DownloadStatus::Completed:   ++stats.completed; break;
            case DownloadStatus::Failed:      ++stats.failed; break;
            case DownloadStatus::Cancelled:   ++stats.cancelled; break;
        }
        if (t.isMarkedForDeletion) {
            ++stats.markedForDeletion;
        }
        if (t.isCompleted() && t.startedAt && t.completedAt && *t.completedAt > *t.startedAt) {
            transferSeconds += std::chrono::duration<double>(*t.completedAt - *t.startedAt).count();
            transferBytes += t.bytesDownloaded;
        }
    }

    stats.totalBytesDownloaded = m_store.totalBytesDownloaded();
    if (transferSeconds > 0.0) {
        stats.averageBytesPerSecond = static_cast<double>(transferBytes) / transferSeconds;
    }
    return stats;
}

bool DownloadManager::isTrackDownloaded(const std::string& recordingId, const std::string& trackFilename) const {
    return localFilePath(recordingId, trackFilename).has_value();
}

std::optional<std::string> DownloadManager::localFilePath(const std::string& recordingId,
                                                          const std::string& trackFilename) const {
    auto task = m_store.get(makeTaskId(recordingId, trackFilename));
    if (!task || !task->isCompleted() || task->isMarkedForDeletion || !task->localPath) {
        return std::nullopt;
    }
    if (!utils::FileUtils::fileExists(*task->localPath)) {
        return std::nullopt;
    }
    return task->localPath;
}

} // namespace tapedeck::core::downloader
