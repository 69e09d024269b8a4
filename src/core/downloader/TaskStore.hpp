#pragma once

/**
 * TaskStore.hpp
 *
 * Durable storage of download task records.
 * The store holds no business logic: transition rules live in the
 * DownloadManager and the RetryPolicy.
 */

#include "DownloadTask.hpp"
#include "../Logger.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace tapedeck::core::downloader {

/**
 * Raised when a mutation could not be made durable.
 * The in-memory state is rolled back before the exception leaves the store.
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Run a store operation, retrying it once on PersistenceError.
 * The operation must be idempotent.
 * @return Result of the operation, or nullopt if the retry failed too
 */
template<typename Op>
auto withPersistenceRetry(const char* operation, Op&& op) -> std::optional<std::invoke_result_t<Op&>> {
    try {
        return op();
    } catch (const PersistenceError& e) {
        Logger::instance().warn("{} failed, retrying: {}", operation, e.what());
    }
    try {
        return op();
    } catch (const PersistenceError& e) {
        Logger::instance().error("{} failed: {}", operation, e.what());
    }
    return std::nullopt;
}

/**
 * ITaskStore - task record storage contract
 *
 * Every operation is atomic for a single record. Mutators return false when
 * the id does not exist and throw PersistenceError when the change could not
 * be persisted.
 */
class ITaskStore {
public:
    using Mutator = std::function<bool(DownloadTask&)>;
    using Predicate = std::function<bool(const DownloadTask&)>;

    virtual ~ITaskStore() = default;

    /**
     * Insert or replace a record by id. New records without a sequence
     * number receive the next one.
     */
    virtual void upsert(const DownloadTask& task) = 0;

    virtual std::optional<DownloadTask> get(const std::string& id) const = 0;
    virtual std::vector<DownloadTask> listAll() const = 0;
    virtual std::vector<DownloadTask> listByStatus(DownloadStatus status) const = 0;
    virtual std::vector<DownloadTask> listByRecording(const std::string& recordingId) const = 0;
    virtual std::vector<DownloadTask> listMarkedForDeletion() const = 0;

    /**
     * Record transfer progress. Progress is checkpointed, not flushed on
     * every call; a crash may lose the most recent updates. Only applies
     * to DOWNLOADING records.
     * @param totalBytes New total size, 0 keeps the current value
     * @return false if the record is missing or not DOWNLOADING
     */
    virtual bool updateProgress(const std::string& id,
                                std::optional<float> fraction,
                                uint64_t bytesDownloaded,
                                uint64_t totalBytes = 0) = 0;

    /**
     * Set status and error message unconditionally
     */
    virtual bool updateStatus(const std::string& id,
                              DownloadStatus status,
                              const std::optional<std::string>& errorMessage = std::nullopt) = 0;

    /**
     * Set status only if the record currently has the expected status.
     * Used to make admission and terminal callbacks linearizable per record.
     */
    virtual bool compareAndSetStatus(const std::string& id,
                                     DownloadStatus expected,
                                     DownloadStatus desired,
                                     const std::optional<std::string>& errorMessage = std::nullopt) = 0;

    /**
     * Atomic read-modify-write. The mutator returns false to abort without
     * persisting anything.
     * @return true if the record existed and the mutator committed
     */
    virtual bool modify(const std::string& id, const Mutator& mutator) = 0;

    virtual bool remove(const std::string& id) = 0;

    /**
     * Remove a record only if predicate holds for its current state; the
     * check and the removal are one atomic step.
     * @return The removed record, nullopt if absent or predicate refused
     */
    virtual std::optional<DownloadTask> removeIf(const std::string& id, const Predicate& predicate) = 0;

    virtual size_t countByStatus(DownloadStatus status) const = 0;
    virtual uint64_t totalBytesDownloaded() const = 0;

    /**
     * Next FIFO sequence number for a task (re)entering the queue
     */
    virtual uint64_t allocateSequence() = 0;

    /**
     * Persist pending progress checkpoints
     */
    virtual void flush() = 0;
};

/**
 * JsonTaskStore - ITaskStore persisted as one JSON document
 *
 * The whole document is rewritten through a temp file and a rename, so a
 * crash leaves either the previous or the new state on disk.
 */
class JsonTaskStore : public ITaskStore {
public:
    /**
     * @param path Path of the JSON document (e.g. state/downloads.json)
     * @param progressFlushInterval Minimum time between progress checkpoints
     */
    explicit JsonTaskStore(std::filesystem::path path,
                           std::chrono::milliseconds progressFlushInterval = std::chrono::milliseconds(2000));
    ~JsonTaskStore() override;

    JsonTaskStore(const JsonTaskStore&) = delete;
    JsonTaskStore& operator=(const JsonTaskStore&) = delete;

    /**
     * Load the document from disk. A missing file is an empty store; an
     * unreadable one is moved aside to <path>.corrupt and the store starts empty.
     * @return false if the file existed but could not be parsed
     */
    bool load();

    const std::filesystem::path& path() const { return m_path; }

    void upsert(const DownloadTask& task) override;
    std::optional<DownloadTask> get(const std::string& id) const override;
    std::vector<DownloadTask> listAll() const override;
    std::vector<DownloadTask> listByStatus(DownloadStatus status) const override;
    std::vector<DownloadTask> listByRecording(const std::string& recordingId) const override;
    std::vector<DownloadTask> listMarkedForDeletion() const override;
    bool updateProgress(const std::string& id, std::optional<float> fraction,
                        uint64_t bytesDownloaded, uint64_t totalBytes = 0) override;
    bool updateStatus(const std::string& id, DownloadStatus status,
                      const std::optional<std::string>& errorMessage = std::nullopt) override;
    bool compareAndSetStatus(const std::string& id, DownloadStatus expected, DownloadStatus desired,
                             const std::optional<std::string>& errorMessage = std::nullopt) override;
    bool modify(const std::string& id, const Mutator& mutator) override;
    bool remove(const std::string& id) override;
    std::optional<DownloadTask> removeIf(const std::string& id, const Predicate& predicate) override;
    size_t countByStatus(DownloadStatus status) const override;
    uint64_t totalBytesDownloaded() const override;
    uint64_t allocateSequence() override;
    void flush() override;

private:
    /**
     * Apply a mutation and persist it; restores the previous record and
     * rethrows if persisting fails. Caller holds m_mutex.
     */
    bool commitLocked(const std::string& id, const Mutator& mutator);

    /**
     * Write the full document. Caller holds m_mutex.
     * @throws PersistenceError
     */
    void persistLocked();

    template<typename Pred>
    std::vector<DownloadTask> selectLocked(Pred pred) const {
        std::vector<DownloadTask> result;
        for (const auto& [id, task] : m_tasks) {
            if (pred(task)) {
                result.push_back(task);
            }
        }
        return result;
    }

    static void applyStatus(DownloadTask& task, DownloadStatus status,
                            const std::optional<std::string>& errorMessage);

private:
    std::filesystem::path m_path;
    std::chrono::milliseconds m_progressFlushInterval;

    std::map<std::string, DownloadTask> m_tasks;
    uint64_t m_nextSequence{1};

    bool m_progressDirty{false};
    std::chrono::steady_clock::time_point m_lastFlush;

    mutable std::mutex m_mutex;
};

} // namespace tapedeck::core::downloader
