/**
 * DownloadScheduler.cpp
 *
 * Admission passes, transfer execution and terminal transitions.
 */

#include "DownloadScheduler.hpp"
#include "../EventBus.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/HashUtils.hpp"

#include <algorithm>

namespace tapedeck::core::downloader {

namespace {

// Minimum time between two download.progress events of one transfer
constexpr auto kProgressEventInterval = std::chrono::milliseconds(250);

bool admissionOrder(const DownloadTask& a, const DownloadTask& b) {
    if (a.priority != b.priority) {
        return a.priority > b.priority;
    }
    return a.enqueueSequence < b.enqueueSequence;
}

} // namespace

void publishStatus(const std::string& taskId, const std::string& recordingId,
                   DownloadStatus status, const std::optional<std::string>& error) {
    json data = {
        {"id", taskId},
        {"recordingId", recordingId},
        {"status", status},
        {"error", error ? json(*error) : json(nullptr)}
    };
    EventBus::instance().emit(events::DownloadStatus, data);
}

DownloadScheduler::DownloadScheduler(ITaskStore& store, IStorageAdmission& storage,
                                     ITransferClient& client, SchedulerOptions options)
    : m_store(store)
    , m_storage(storage)
    , m_client(client)
    , m_options(std::move(options))
    , m_maxConcurrent(std::max<size_t>(1, m_options.maxConcurrent)) {

    // Room for transfers still winding down after a cancel
    m_pool = std::make_unique<ThreadPool>(m_maxConcurrent.load() * 2);
}

DownloadScheduler::~DownloadScheduler() {
    stop();
}

void DownloadScheduler::setNetworkPolicy(NetworkPolicy policy) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_networkPolicy = std::move(policy);
}

void DownloadScheduler::setCompletionHook(CompletionHook hook) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_completionHook = std::move(hook);
}

void DownloadScheduler::setLowSpaceHandler(LowSpaceHandler handler) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_lowSpaceHandler = std::move(handler);
}

void DownloadScheduler::start() {
    if (m_running.exchange(true)) {
        return;
    }

    m_stopping = false;
    {
        std::lock_guard<std::mutex> lock(m_loopMutex);
        m_passRequested = true;
    }
    m_loopThread = std::thread([this] { loop(); });

    Logger::instance().info("Scheduler started (max concurrent: {})", m_maxConcurrent.load());
}

void DownloadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_loopMutex);
        m_stopping = true;
    }
    m_wakeup.notify_all();

    if (m_loopThread.joinable()) {
        m_loopThread.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        for (auto& [id, token] : m_transfers) {
            token.cancel();
        }
    }

    if (m_pool->activeCount() + m_pool->pendingCount() > 0) {
        Logger::instance().info("Waiting for {} running and {} pending transfers to wind down",
                                m_pool->activeCount(), m_pool->pendingCount());
    }
    m_pool->waitIdle();

    try {
        m_store.flush();
    } catch (const PersistenceError& e) {
        Logger::instance().error("Final progress checkpoint failed: {}", e.what());
    }

    if (m_running.exchange(false)) {
        Logger::instance().info("Scheduler stopped");
    }
}

void DownloadScheduler::requestPass() {
    {
        std::lock_guard<std::mutex> lock(m_loopMutex);
        m_passRequested = true;
    }
    m_wakeup.notify_one();
}

void DownloadScheduler::loop() {
    std::unique_lock<std::mutex> lock(m_loopMutex);

    while (!m_stopping) {
        m_wakeup.wait_for(lock, m_options.safetyInterval, [this] {
            return m_passRequested || m_stopping;
        });
        if (m_stopping) {
            break;
        }
        m_passRequested = false;

        lock.unlock();
        try {
            runPass();
        } catch (const std::exception& e) {
            Logger::instance().error("Admission pass failed: {}", e.what());
        }
        lock.lock();
    }
}

size_t DownloadScheduler::runPass() {
    std::lock_guard<std::mutex> passLock(m_passMutex);

    if (m_stopping) {
        return 0;
    }

    settleStranded();

    NetworkPolicy policy;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        policy = m_networkPolicy;
    }
    if (policy && !policy()) {
        Logger::instance().debug("Network policy forbids transfers, pass skipped");
        return 0;
    }

    size_t limit = m_maxConcurrent.load();
    size_t active = occupiedSlots();
    size_t admitted = 0;

    if (active < limit) {
        auto candidates = m_store.listByStatus(DownloadStatus::Queued);
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                             [](const DownloadTask& t) { return t.isMarkedForDeletion; }),
                         candidates.end());
        std::stable_sort(candidates.begin(), candidates.end(), admissionOrder);

        for (const auto& candidate : candidates) {
            if (active >= limit) {
                break;
            }

            try {
                if (candidate.hasKnownSize()) {
                    uint64_t required = candidate.totalBytes - std::min(candidate.bytesDownloaded, candidate.totalBytes);
                    if (!m_storage.validate(required)) {
                        uint64_t available = m_storage.availableBytes();
                        Logger::instance().warn("Not enough space for {} ({} bytes needed, {} available)",
                                                candidate.id, required, available);
                        EventBus::instance().emit(events::StorageInsufficient, {
                            {"id", candidate.id},
                            {"requiredBytes", required},
                            {"availableBytes", available}
                        });
                        continue;
                    }
                }

                if (admit(candidate)) {
                    ++active;
                    ++admitted;
                }
            } catch (const std::exception& e) {
                Logger::instance().error("Admission of {} failed: {}", candidate.id, e.what());
                failCandidate(candidate, e.what());
            }
        }
    }

    checkLowSpace();
    return admitted;
}

bool DownloadScheduler::admit(const DownloadTask& task) {
    // Registered before the commit so a cancel racing the admission is seen
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        m_transfers[task.id] = token;
    }
    auto release = [&] {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(task.id);
        if (it != m_transfers.end() && it->second.sameAs(token)) {
            m_transfers.erase(it);
        }
    };

    auto now = Clock::now();
    DownloadTask admitted;
    try {
        auto committed = withPersistenceRetry("admit", [&] {
            return m_store.modify(task.id, [now](DownloadTask& t) {
                if (t.status != DownloadStatus::Queued || t.isMarkedForDeletion) {
                    return false;
                }
                t.status = DownloadStatus::Downloading;
                t.startedAt = now;
                t.errorMessage.reset();
                return true;
            });
        });
        if (!committed.value_or(false)) {
            release();
            return false;
        }
        admitted = m_store.get(task.id).value_or(task);
    } catch (const std::exception&) {
        release();
        throw;
    }

    Logger::instance().debug("Admitted {} (priority {})", task.id, task.priority);
    publishStatus(task.id, task.recordingId, DownloadStatus::Downloading);

    if (!m_pool->post(task.id, [this, admitted, token] { runTransfer(admitted, token); })) {
        Logger::instance().error("Cannot start transfer of {}: worker pool is shutting down", task.id);
        release();
        // If this write fails too, the next pass requeues the unowned record
        withPersistenceRetry("requeue", [&] {
            return m_store.compareAndSetStatus(task.id, DownloadStatus::Downloading, DownloadStatus::Queued);
        });
        return false;
    }
    return true;
}

void DownloadScheduler::runTransfer(DownloadTask task, CancellationToken token) {
    TransferRequest request;
    request.taskId = task.id;
    request.url = task.sourceUrl;
    request.destination = destinationPath(m_options.downloadsDir, task);
    request.expectedBytes = task.totalBytes;
    request.resume = task.bytesDownloaded > 0;

    bool sizeKnown = task.hasKnownSize();
    bool insufficientStorage = false;
    auto lastEvent = std::chrono::steady_clock::time_point{};

    auto onProgress = [&](uint64_t bytes, uint64_t total) -> bool {
        if (token.isCancelled()) {
            return false;
        }

        // Admitted without a size: check the estimate as soon as it shows up
        if (total > 0 && !sizeKnown) {
            sizeKnown = true;
            uint64_t remaining = total > bytes ? total - bytes : 0;
            if (!m_storage.validate(remaining)) {
                insufficientStorage = true;
                return false;
            }
        }

        std::optional<float> fraction;
        if (total > 0) {
            fraction = static_cast<float>(static_cast<double>(std::min(bytes, total)) / static_cast<double>(total));
        }

        try {
            m_store.updateProgress(task.id, fraction, bytes, total);
        } catch (const PersistenceError& e) {
            Logger::instance().warn("Progress of {} not saved: {}", task.id, e.what());
        }

        auto now = std::chrono::steady_clock::now();
        if (now - lastEvent >= kProgressEventInterval) {
            lastEvent = now;
            EventBus::instance().emit(events::DownloadProgress, {
                {"id", task.id},
                {"bytesDownloaded", bytes},
                {"totalBytes", total},
                {"progress", fraction ? json(*fraction) : json(nullptr)}
            });
        }
        return true;
    };

    TransferOutcome outcome;
    try {
        outcome = token.isCancelled() ? TransferOutcome::cancelled()
                                      : m_client.start(request, onProgress, token);
    } catch (const std::exception& e) {
        Logger::instance().warn("Transfer of {} threw: {}", task.id, e.what());
        outcome = TransferOutcome::failure(e.what());
    } catch (...) {
        Logger::instance().warn("Transfer of {} threw a non-standard exception", task.id);
        outcome = TransferOutcome::failure("unknown transfer error");
    }

    finishTransfer(task, token, outcome, insufficientStorage);
}

void DownloadScheduler::finishTransfer(const DownloadTask& task, const CancellationToken& token,
                                       const TransferOutcome& outcome, bool insufficientStorage) {
    std::optional<Settlement> pending;
    if (token.isCancelled()) {
        if (m_stopping) {
            // Interrupted by shutdown, resume from the checkpoint next time
            std::string id = task.id;
            pending = settle({"requeue", [this, id] {
                return m_store.compareAndSetStatus(id, DownloadStatus::Downloading, DownloadStatus::Queued);
            }, nullptr});
        } else {
            // Whoever cancelled already moved the record
            Logger::instance().debug("Transfer of {} stopped after cancel", task.id);
        }
    } else if (insufficientStorage) {
        pending = failTransfer(task, "insufficient storage");
    } else if (outcome.result == TransferResult::Success) {
        pending = completeTransfer(task, outcome);
    } else if (outcome.result == TransferResult::Cancelled) {
        pending = failTransfer(task, "transfer cancelled");
    } else {
        pending = failTransfer(task, outcome.error.empty() ? "transfer failed" : outcome.error);
    }

    {
        // The entry stays until the outcome is written or parked, so a pass
        // never mistakes this record for an unowned one. A resumed task may
        // already run again under a new token.
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        auto it = m_transfers.find(task.id);
        if (it != m_transfers.end() && it->second.sameAs(token)) {
            m_transfers.erase(it);
        }
        if (pending) {
            m_unsettled.insert_or_assign(task.id, std::move(*pending));
        }
    }
    if (pending) {
        Logger::instance().warn("Outcome of {} not persisted, retrying on the next pass", task.id);
    }

    requestPass();
}

std::optional<DownloadScheduler::Settlement> DownloadScheduler::settle(Settlement settlement) {
    auto committed = withPersistenceRetry(settlement.operation, settlement.commit);
    if (!committed) {
        return settlement;
    }
    if (*committed && settlement.onCommitted) {
        settlement.onCommitted();
    }
    return std::nullopt;
}

void DownloadScheduler::settleStranded() {
    std::unordered_map<std::string, Settlement> deferred;
    {
        std::lock_guard<std::mutex> lock(m_transfersMutex);
        deferred.swap(m_unsettled);
    }

    for (auto& [id, settlement] : deferred) {
        std::optional<Settlement> still;
        {
            std::lock_guard<std::mutex> lock(m_completionMutex);
            still = settle(std::move(settlement));
        }
        if (still) {
            std::lock_guard<std::mutex> lock(m_transfersMutex);
            m_unsettled.emplace(id, std::move(*still));
        } else {
            Logger::instance().info("Recorded deferred outcome of {}", id);
        }
    }

    for (const auto& task : m_store.listByStatus(DownloadStatus::Downloading)) {
        {
            std::lock_guard<std::mutex> lock(m_transfersMutex);
            if (m_transfers.count(task.id) > 0 || m_unsettled.count(task.id) > 0) {
                continue;
            }
        }
        Logger::instance().warn("{} is DOWNLOADING without a transfer, requeueing", task.id);
        withPersistenceRetry("requeue", [&] {
            return m_store.compareAndSetStatus(task.id, DownloadStatus::Downloading, DownloadStatus::Queued);
        });
    }
}

size_t DownloadScheduler::occupiedSlots() const {
    auto downloading = m_store.listByStatus(DownloadStatus::Downloading);
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    return static_cast<size_t>(std::count_if(downloading.begin(), downloading.end(),
        [this](const DownloadTask& t) { return m_unsettled.count(t.id) == 0; }));
}

void DownloadScheduler::failCandidate(const DownloadTask& task, const std::string& error) {
    try {
        auto now = Clock::now();
        auto failed = withPersistenceRetry("fail", [&] {
            return m_store.modify(task.id, [&](DownloadTask& t) {
                if (t.status != DownloadStatus::Queued && t.status != DownloadStatus::Downloading) {
                    return false;
                }
                t.status = DownloadStatus::Failed;
                t.errorMessage = error;
                t.lastFailureAt = now;
                return true;
            });
        });
        if (failed.value_or(false)) {
            publishStatus(task.id, task.recordingId, DownloadStatus::Failed, error);
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Cannot mark {} failed: {}", task.id, e.what());
    }
}

std::optional<DownloadScheduler::Settlement> DownloadScheduler::failTransfer(const DownloadTask& task,
                                                                            const std::string& error) {
    std::string id = task.id;
    std::string recordingId = task.recordingId;

    return settle({"fail", [this, id, error] {
        if (m_store.compareAndSetStatus(id, DownloadStatus::Downloading, DownloadStatus::Failed, error)) {
            return true;
        }
        Logger::instance().debug("Ignoring late failure of {}: {}", id, error);
        return false;
    }, [id, recordingId, error] {
        Logger::instance().warn("Download {} failed: {}", id, error);
        publishStatus(id, recordingId, DownloadStatus::Failed, error);
    }});
}

std::optional<DownloadScheduler::Settlement> DownloadScheduler::completeTransfer(const DownloadTask& task,
                                                                                const TransferOutcome& outcome) {
    std::lock_guard<std::mutex> lock(m_completionMutex);

    auto current = m_store.get(task.id);
    if (!current || current->status != DownloadStatus::Downloading) {
        Logger::instance().debug("Ignoring late completion of {}", task.id);
        return std::nullopt;
    }

    auto path = outcome.localPath.empty() ? destinationPath(m_options.downloadsDir, task) : outcome.localPath;
    auto size = utils::FileUtils::getFileSize(path);

    std::optional<std::string> error;
    if (!size) {
        error = "downloaded file missing";
    } else if (current->hasKnownSize() && *size != current->totalBytes) {
        error = "size mismatch: expected " + std::to_string(current->totalBytes) +
                " bytes, got " + std::to_string(*size);
    } else if (m_options.verifyChecksums && !current->sha1.empty() &&
               !utils::HashUtils::matchesSha1(path.string(), current->sha1)) {
        error = "checksum mismatch";
    }

    if (error) {
        std::error_code ec;
        if (!utils::FileUtils::deleteFile(path, ec)) {
            Logger::instance().warn("Could not delete rejected file {}: {}", path.string(), ec.message());
        }
        return failTransfer(*current, *error);
    }

    auto now = Clock::now();
    uint64_t fileSize = *size;
    std::string id = task.id;
    std::string recordingId = task.recordingId;
    std::string localPath = path.string();

    return settle({"complete", [this, id, now, fileSize, localPath] {
        return m_store.modify(id, [&](DownloadTask& t) {
            if (t.status != DownloadStatus::Downloading) {
                return false;
            }
            t.status = DownloadStatus::Completed;
            t.completedAt = now;
            t.localPath = localPath;
            t.totalBytes = fileSize;
            t.bytesDownloaded = fileSize;
            t.progressFraction = 1.0f;
            t.errorMessage.reset();
            t.lastAccessTimestamp = std::max(t.lastAccessTimestamp, now);
            return true;
        });
    }, [this, id, recordingId, fileSize] {
        Logger::instance().info("Downloaded {} ({} bytes)", id, fileSize);
        publishStatus(id, recordingId, DownloadStatus::Completed);
        checkRecordingComplete(recordingId);
    }});
}

void DownloadScheduler::checkRecordingComplete(const std::string& recordingId) {
    auto tasks = m_store.listByRecording(recordingId);
    bool allComplete = !tasks.empty() &&
        std::all_of(tasks.begin(), tasks.end(), [](const DownloadTask& t) { return t.isCompleted(); });
    if (!allComplete) {
        return;
    }

    Logger::instance().info("Recording {} fully downloaded ({} tracks)", recordingId, tasks.size());

    CompletionHook hook;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        hook = m_completionHook;
    }
    if (hook) {
        try {
            hook(recordingId);
        } catch (const std::exception& e) {
            Logger::instance().error("Completion hook for {} threw: {}", recordingId, e.what());
        }
    }

    EventBus::instance().emit(events::RecordingCompleted, {
        {"recordingId", recordingId},
        {"trackCount", tasks.size()}
    });
}

void DownloadScheduler::checkLowSpace() {
    if (m_options.lowSpaceThresholdBytes == 0) {
        return;
    }

    bool low = m_storage.isBelowThreshold(m_options.lowSpaceThresholdBytes);
    bool entered = low && !m_lowSpace;
    m_lowSpace = low;
    if (!entered) {
        return;
    }

    uint64_t available = m_storage.availableBytes();
    Logger::instance().warn("Storage low: {} bytes available, threshold {}",
                            available, m_options.lowSpaceThresholdBytes);
    EventBus::instance().emit(events::StorageLow, {
        {"availableBytes", available},
        {"thresholdBytes", m_options.lowSpaceThresholdBytes}
    });

    LowSpaceHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        handler = m_lowSpaceHandler;
    }
    if (handler) {
        try {
            handler(available);
        } catch (const std::exception& e) {
            Logger::instance().error("Low-space handler threw: {}", e.what());
        }
    }
}

bool DownloadScheduler::cancelTransfer(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    auto it = m_transfers.find(taskId);
    if (it == m_transfers.end()) {
        return false;
    }
    it->second.cancel();
    return true;
}

size_t DownloadScheduler::inFlightCount() const {
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    return m_transfers.size();
}

size_t DownloadScheduler::unsettledCount() const {
    std::lock_guard<std::mutex> lock(m_transfersMutex);
    return m_unsettled.size();
}

void DownloadScheduler::setMaxConcurrent(size_t maxConcurrent) {
    maxConcurrent = std::max<size_t>(1, maxConcurrent);
    m_maxConcurrent = maxConcurrent;
    m_pool->ensureThreads(maxConcurrent * 2);
    Logger::instance().info("Max concurrent downloads set to {}", maxConcurrent);
    requestPass();
}

void DownloadScheduler::waitIdle() {
    m_pool->waitIdle();
}

} // namespace tapedeck::core::downloader
