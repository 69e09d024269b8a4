#pragma once

/**
 * DownloadScheduler.hpp
 *
 * Admission loop and worker pool. Decides which queued task runs next
 * and drives admitted transfers to a terminal state.
 */

#include "StorageManager.hpp"
#include "TaskStore.hpp"
#include "TransferClient.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace tapedeck::core::downloader {

// Network policy predicate, evaluated once per admission pass
using NetworkPolicy = std::function<bool()>;

// Invoked once when every task of a recording is COMPLETED
using CompletionHook = std::function<void(const std::string& recordingId)>;

// Invoked when available space drops below the low-space threshold
using LowSpaceHandler = std::function<void(uint64_t availableBytes)>;

struct SchedulerOptions {
    size_t maxConcurrent{3};
    std::filesystem::path downloadsDir;
    bool verifyChecksums{true};

    // Safety-net pass interval of the loop thread
    std::chrono::milliseconds safetyInterval{std::chrono::seconds(60)};

    // 0 disables the low-space signal
    uint64_t lowSpaceThresholdBytes{0};
};

/**
 * Publish a download.status event for a task
 */
void publishStatus(const std::string& taskId, const std::string& recordingId,
                   DownloadStatus status, const std::optional<std::string>& error = std::nullopt);

/**
 * DownloadScheduler - single owner of admission decisions
 *
 * The number of running transfers is derived from the DOWNLOADING records
 * in the store, never tracked separately. A record whose transfer ended
 * but whose terminal write could not be persisted stays DOWNLOADING until
 * a later pass records the outcome; it no longer holds a slot. Admission
 * and terminal transitions go through compare-and-set on the record, so a
 * late callback from a transfer that was cancelled or paused meanwhile
 * changes nothing.
 */
class DownloadScheduler {
public:
    /**
     * @param store Task store, must outlive the scheduler
     * @param storage Admission control, must outlive the scheduler
     * @param client Transfer client, must outlive the scheduler
     */
    DownloadScheduler(ITaskStore& store, IStorageAdmission& storage,
                      ITransferClient& client, SchedulerOptions options);
    ~DownloadScheduler();

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;

    void setNetworkPolicy(NetworkPolicy policy);
    void setCompletionHook(CompletionHook hook);
    void setLowSpaceHandler(LowSpaceHandler handler);

    /**
     * Start the loop thread. The first pass runs immediately.
     */
    void start();

    /**
     * Stop the loop, signal every running transfer and wait for the
     * workers. Interrupted transfers go back to QUEUED with their
     * progress checkpoint.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * Ask the loop thread for an admission pass. Never blocks.
     */
    void requestPass();

    /**
     * Run one admission pass on the calling thread
     * @return Number of tasks admitted
     */
    size_t runPass();

    /**
     * Signal the transfer of a task to stop. The caller has already moved
     * the record out of DOWNLOADING; the slot is free from that moment.
     * @return true if a transfer was in flight
     */
    bool cancelTransfer(const std::string& taskId);

    size_t inFlightCount() const;

    /**
     * Ended transfers whose outcome is waiting to be persisted
     */
    size_t unsettledCount() const;

    void setMaxConcurrent(size_t maxConcurrent);
    size_t maxConcurrent() const { return m_maxConcurrent.load(); }

    /**
     * Block until no transfer is running or waiting for a worker
     */
    void waitIdle();

    const SchedulerOptions& options() const { return m_options; }

private:
    void loop();

    /**
     * A terminal write for a task whose transfer has ended
     */
    struct Settlement {
        const char* operation;
        std::function<bool()> commit;       // true if the record changed
        std::function<void()> onCommitted;
    };

    /**
     * Move a QUEUED task to DOWNLOADING and hand it to a worker
     */
    bool admit(const DownloadTask& task);

    /**
     * Mark a candidate FAILED after admission threw for it
     */
    void failCandidate(const DownloadTask& task, const std::string& error);

    /**
     * Run a settlement's write with one retry
     * @return The settlement back if it still could not be persisted
     */
    std::optional<Settlement> settle(Settlement settlement);

    /**
     * Retry deferred settlements and requeue DOWNLOADING records that no
     * transfer owns
     */
    void settleStranded();

    /**
     * DOWNLOADING records that still occupy a concurrency slot
     */
    size_t occupiedSlots() const;

    /**
     * Worker body: run the transfer and record its outcome
     */
    void runTransfer(DownloadTask task, CancellationToken token);

    void finishTransfer(const DownloadTask& task, const CancellationToken& token,
                        const TransferOutcome& outcome, bool insufficientStorage);

    /**
     * Verify the file and commit COMPLETED. Serialized so the group
     * completion check sees each completion exactly once.
     */
    std::optional<Settlement> completeTransfer(const DownloadTask& task, const TransferOutcome& outcome);

    std::optional<Settlement> failTransfer(const DownloadTask& task, const std::string& error);

    void checkRecordingComplete(const std::string& recordingId);

    void checkLowSpace();

private:
    ITaskStore& m_store;
    IStorageAdmission& m_storage;
    ITransferClient& m_client;
    SchedulerOptions m_options;

    std::atomic<size_t> m_maxConcurrent;

    NetworkPolicy m_networkPolicy;
    CompletionHook m_completionHook;
    LowSpaceHandler m_lowSpaceHandler;
    std::mutex m_callbackMutex;

    std::unique_ptr<ThreadPool> m_pool;

    // Both guarded by m_transfersMutex
    std::unordered_map<std::string, CancellationToken> m_transfers;
    std::unordered_map<std::string, Settlement> m_unsettled;
    mutable std::mutex m_transfersMutex;

    std::mutex m_passMutex;
    std::mutex m_completionMutex;

    std::thread m_loopThread;
    std::mutex m_loopMutex;
    std::condition_variable m_wakeup;
    bool m_passRequested{false};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};

    bool m_lowSpace{false};
};

} // namespace tapedeck::core::downloader
