#pragma once

/**
 * Test doubles for the collaborators of the download engine.
 */

#include "core/downloader/Catalog.hpp"
#include "core/downloader/StorageManager.hpp"
#include "core/downloader/TaskStore.hpp"
#include "core/downloader/TransferClient.hpp"
#include "utils/test_helpers.hpp"

#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace tapedeck::test {

using namespace core::downloader;

/**
 * Mock implementation of ITaskStore
 */
class MockTaskStore : public ITaskStore {
public:
    MOCK_METHOD(void, upsert, (const DownloadTask& task), (override));
    MOCK_METHOD(std::optional<DownloadTask>, get, (const std::string& id), (const, override));
    MOCK_METHOD(std::vector<DownloadTask>, listAll, (), (const, override));
    MOCK_METHOD(std::vector<DownloadTask>, listByStatus, (DownloadStatus status), (const, override));
    MOCK_METHOD(std::vector<DownloadTask>, listByRecording, (const std::string& recordingId), (const, override));
    MOCK_METHOD(std::vector<DownloadTask>, listMarkedForDeletion, (), (const, override));
    MOCK_METHOD(bool, updateProgress,
                (const std::string& id, std::optional<float> fraction, uint64_t bytesDownloaded, uint64_t totalBytes),
                (override));
    MOCK_METHOD(bool, updateStatus,
                (const std::string& id, DownloadStatus status, const std::optional<std::string>& errorMessage),
                (override));
    MOCK_METHOD(bool, compareAndSetStatus,
                (const std::string& id, DownloadStatus expected, DownloadStatus desired,
                 const std::optional<std::string>& errorMessage),
                (override));
    MOCK_METHOD(bool, modify, (const std::string& id, const Mutator& mutator), (override));
    MOCK_METHOD(bool, remove, (const std::string& id), (override));
    MOCK_METHOD(std::optional<DownloadTask>, removeIf, (const std::string& id, const Predicate& predicate),
                (override));
    MOCK_METHOD(size_t, countByStatus, (DownloadStatus status), (const, override));
    MOCK_METHOD(uint64_t, totalBytesDownloaded, (), (const, override));
    MOCK_METHOD(uint64_t, allocateSequence, (), (override));
    MOCK_METHOD(void, flush, (), (override));

    /**
     * Forward every call to a real store; individual expectations can
     * then inject failures on top
     */
    void delegateTo(ITaskStore& real) {
        using ::testing::_;
        using ::testing::Invoke;

        ON_CALL(*this, upsert(_)).WillByDefault(Invoke(&real, &ITaskStore::upsert));
        ON_CALL(*this, get(_)).WillByDefault(Invoke(&real, &ITaskStore::get));
        ON_CALL(*this, listAll()).WillByDefault(Invoke(&real, &ITaskStore::listAll));
        ON_CALL(*this, listByStatus(_)).WillByDefault(Invoke(&real, &ITaskStore::listByStatus));
        ON_CALL(*this, listByRecording(_)).WillByDefault(Invoke(&real, &ITaskStore::listByRecording));
        ON_CALL(*this, listMarkedForDeletion()).WillByDefault(Invoke(&real, &ITaskStore::listMarkedForDeletion));
        ON_CALL(*this, updateProgress(_, _, _, _)).WillByDefault(Invoke(&real, &ITaskStore::updateProgress));
        ON_CALL(*this, updateStatus(_, _, _)).WillByDefault(Invoke(&real, &ITaskStore::updateStatus));
        ON_CALL(*this, compareAndSetStatus(_, _, _, _)).WillByDefault(Invoke(&real, &ITaskStore::compareAndSetStatus));
        ON_CALL(*this, modify(_, _)).WillByDefault(Invoke(&real, &ITaskStore::modify));
        ON_CALL(*this, remove(_)).WillByDefault(Invoke(&real, &ITaskStore::remove));
        ON_CALL(*this, removeIf(_, _)).WillByDefault(Invoke(&real, &ITaskStore::removeIf));
        ON_CALL(*this, countByStatus(_)).WillByDefault(Invoke(&real, &ITaskStore::countByStatus));
        ON_CALL(*this, totalBytesDownloaded()).WillByDefault(Invoke(&real, &ITaskStore::totalBytesDownloaded));
        ON_CALL(*this, allocateSequence()).WillByDefault(Invoke(&real, &ITaskStore::allocateSequence));
        ON_CALL(*this, flush()).WillByDefault(Invoke(&real, &ITaskStore::flush));
    }
};

/**
 * Mock implementation of IStorageAdmission
 */
class MockStorageAdmission : public IStorageAdmission {
public:
    MOCK_METHOD(uint64_t, usedBytes, (), (const, override));
    MOCK_METHOD(uint64_t, availableBytes, (), (const, override));
};

/**
 * Storage admission with a settable amount of free space
 */
class FakeStorage : public IStorageAdmission {
public:
    explicit FakeStorage(uint64_t available = 1ULL << 40) : m_available(available) {}

    void setAvailable(uint64_t bytes) { m_available = bytes; }

    uint64_t usedBytes() const override { return 0; }
    uint64_t availableBytes() const override { return m_available.load(); }

private:
    std::atomic<uint64_t> m_available;
};

class MockCatalogResolver : public ICatalogResolver {
public:
    MOCK_METHOD(std::optional<std::vector<TrackFile>>, resolve, (const std::string& recordingId), (override));
};

/**
 * Scripted transfer client
 *
 * Each task follows its Behavior (the default one unless set per task).
 * Held transfers block their worker until released or cancelled, which
 * lets tests observe the DOWNLOADING state.
 */
class FakeTransferClient : public ITransferClient {
public:
    enum class Mode {
        Succeed,
        Fail,
        Throw,
        Hold    // block until released, then succeed
    };

    struct Behavior {
        Mode mode{Mode::Succeed};
        std::string error{"connection reset"};

        // Bytes written to disk (0 = the expected size, or 100 if unknown)
        uint64_t bytes{0};

        // Total reported to the progress callback (0 = bytes)
        uint64_t reportedTotal{0};
    };

    void setDefault(Behavior behavior) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_default = behavior;
    }

    void setBehavior(const std::string& taskId, Behavior behavior) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_behaviors[taskId] = behavior;
    }

    void release(const std::string& taskId) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_released.insert(taskId);
        }
        m_cv.notify_all();
    }

    void releaseAll() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_releaseAll = true;
        }
        m_cv.notify_all();
    }

    /**
     * Called on the worker thread before the transfer does anything
     */
    void onStart(std::function<void(const TransferRequest&)> callback) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_onStart = std::move(callback);
    }

    std::vector<std::string> startOrder() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_started;
    }

    std::vector<TransferRequest> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    size_t running() const { return m_running.load(); }
    size_t maxObserved() const { return m_maxObserved.load(); }

    TransferOutcome start(const TransferRequest& request,
                          const TransferProgressCallback& onProgress,
                          const CancellationToken& cancel) override {
        Behavior behavior;
        std::function<void(const TransferRequest&)> startCallback;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_started.push_back(request.taskId);
            m_requests.push_back(request);
            auto it = m_behaviors.find(request.taskId);
            behavior = it != m_behaviors.end() ? it->second : m_default;
            startCallback = m_onStart;
        }

        size_t now = ++m_running;
        size_t seen = m_maxObserved.load();
        while (now > seen && !m_maxObserved.compare_exchange_weak(seen, now)) {
        }

        struct RunningGuard {
            std::atomic<size_t>& counter;
            ~RunningGuard() { --counter; }
        } guard{m_running};

        if (startCallback) {
            startCallback(request);
        }

        if (behavior.mode == Mode::Hold) {
            std::unique_lock<std::mutex> lock(m_mutex);
            while (!m_releaseAll && m_released.count(request.taskId) == 0) {
                if (cancel.isCancelled()) {
                    return TransferOutcome::cancelled();
                }
                m_cv.wait_for(lock, std::chrono::milliseconds(5));
            }
        }

        switch (behavior.mode) {
            case Mode::Throw:
                throw std::runtime_error(behavior.error);
            case Mode::Fail:
                return TransferOutcome::failure(behavior.error);
            default:
                break;
        }

        uint64_t bytes = behavior.bytes ? behavior.bytes : (request.expectedBytes ? request.expectedBytes : 100);
        uint64_t total = behavior.reportedTotal ? behavior.reportedTotal : bytes;

        for (uint64_t reported : {bytes / 2, bytes}) {
            if (!onProgress(reported, total)) {
                return cancel.isCancelled() ? TransferOutcome::cancelled()
                                            : TransferOutcome::failure("transfer aborted");
            }
        }

        writeFile(request.destination, static_cast<size_t>(bytes));
        return TransferOutcome::success(request.destination, bytes);
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    Behavior m_default;
    std::map<std::string, Behavior> m_behaviors;
    std::set<std::string> m_released;
    bool m_releaseAll{false};
    std::function<void(const TransferRequest&)> m_onStart;

    std::vector<std::string> m_started;
    std::vector<TransferRequest> m_requests;
    std::atomic<size_t> m_running{0};
    std::atomic<size_t> m_maxObserved{0};
};

} // namespace tapedeck::test
