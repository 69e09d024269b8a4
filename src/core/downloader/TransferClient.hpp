#pragma once

/**
 * TransferClient.hpp
 *
 * Contract between the scheduler and the component that moves bytes.
 */

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace tapedeck::core::downloader {

/**
 * Cooperative cancellation flag shared between the scheduler and a transfer
 */
class CancellationToken {
public:
    CancellationToken() : m_cancelled(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_cancelled->store(true); }
    bool isCancelled() const { return m_cancelled->load(); }

    // Copies of one token share the flag
    bool sameAs(const CancellationToken& other) const { return m_cancelled == other.m_cancelled; }

private:
    std::shared_ptr<std::atomic<bool>> m_cancelled;
};

struct TransferRequest {
    std::string taskId;
    std::string url;
    std::filesystem::path destination;

    // Size announced by the catalog (0 = unknown)
    uint64_t expectedBytes{0};

    // Continue an existing partial file instead of starting over
    bool resume{false};
};

/**
 * Progress report. totalBytes is 0 while the size is unknown.
 * Returning false from the callback aborts the transfer.
 */
using TransferProgressCallback = std::function<bool(uint64_t bytesDownloaded, uint64_t totalBytes)>;

enum class TransferResult {
    Success,
    Failure,
    Cancelled
};

struct TransferOutcome {
    TransferResult result{TransferResult::Failure};

    // Final file location on Success
    std::filesystem::path localPath;

    // Failure reason
    std::string error;

    uint64_t bytesTransferred{0};

    static TransferOutcome success(std::filesystem::path path, uint64_t bytes) {
        TransferOutcome outcome;
        outcome.result = TransferResult::Success;
        outcome.localPath = std::move(path);
        outcome.bytesTransferred = bytes;
        return outcome;
    }

    static TransferOutcome failure(std::string error) {
        TransferOutcome outcome;
        outcome.result = TransferResult::Failure;
        outcome.error = std::move(error);
        return outcome;
    }

    static TransferOutcome cancelled() {
        TransferOutcome outcome;
        outcome.result = TransferResult::Cancelled;
        return outcome;
    }
};

/**
 * ITransferClient - moves one file from a URL to local storage
 *
 * start() blocks on the calling worker thread until the transfer ends and
 * may throw; the scheduler turns exceptions into FAILED tasks.
 */
class ITransferClient {
public:
    virtual ~ITransferClient() = default;

    virtual TransferOutcome start(const TransferRequest& request,
                                  const TransferProgressCallback& onProgress,
                                  const CancellationToken& cancel) = 0;
};

} // namespace tapedeck::core::downloader
