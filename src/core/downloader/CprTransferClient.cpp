/**
 * CprTransferClient.cpp
 */

#include "CprTransferClient.hpp"
#include "DownloadTask.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <cpr/cpr.h>

#include <fstream>

namespace tapedeck::core::downloader {

namespace {

/**
 * Status code of an "HTTP/1.1 206 Partial Content" line, 0 for other header lines
 */
long parseStatusLine(const std::string& line) {
    if (line.rfind("HTTP/", 0) != 0) {
        return 0;
    }
    auto space = line.find(' ');
    if (space == std::string::npos) {
        return 0;
    }
    try {
        return std::stol(line.substr(space + 1, 3));
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

CprTransferClient::CprTransferClient(HttpTransferOptions options)
    : m_options(std::move(options)) {
}

TransferOutcome CprTransferClient::start(const TransferRequest& request,
                                         const TransferProgressCallback& onProgress,
                                         const CancellationToken& cancel) {
    auto part = partialPath(request.destination);
    if (!utils::FileUtils::createDirectories(request.destination.parent_path())) {
        return TransferOutcome::failure("cannot create " + request.destination.parent_path().string());
    }

    uint64_t offset = 0;
    if (request.resume) {
        offset = utils::FileUtils::getFileSize(part).value_or(0);
    }

    long statusCode = 0;
    uint64_t base = 0;
    bool bodyStarted = false;
    bool abortedByCaller = false;
    std::ofstream file;

    cpr::Session session;
    session.SetUrl(cpr::Url{request.url});
    session.SetTimeout(cpr::Timeout{m_options.timeout});
    session.SetConnectTimeout(cpr::ConnectTimeout{m_options.connectTimeout});
    session.SetUserAgent(cpr::UserAgent{m_options.userAgent});
    if (offset > 0) {
        session.SetHeader(cpr::Header{{"Range", "bytes=" + std::to_string(offset) + "-"}});
    }

    // Redirects produce several status lines; the last one wins
    session.SetHeaderCallback(cpr::HeaderCallback{[&](const auto& header, intptr_t) -> bool {
        std::string line(header);
        long code = parseStatusLine(line);
        if (code != 0) {
            statusCode = code;
        }
        return true;
    }});

    session.SetWriteCallback(cpr::WriteCallback{[&](const auto& data, intptr_t) -> bool {
        if (statusCode < 200 || statusCode >= 300) {
            // Error page body, not file content
            return true;
        }
        if (!bodyStarted) {
            bodyStarted = true;
            bool append = offset > 0 && statusCode == 206;
            base = append ? offset : 0;
            file.open(part, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
            if (!file.is_open()) {
                return false;
            }
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        return static_cast<bool>(file);
    }});

    session.SetProgressCallback(cpr::ProgressCallback{
        [&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
            cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) -> bool {
            if (cancel.isCancelled()) {
                return false;
            }
            if (!bodyStarted && downloadNow == 0) {
                return true;
            }

            uint64_t now = base + static_cast<uint64_t>(downloadNow);
            uint64_t total = downloadTotal > 0
                ? base + static_cast<uint64_t>(downloadTotal)
                : request.expectedBytes;

            if (onProgress && !onProgress(now, total)) {
                abortedByCaller = true;
                return false;
            }
            return true;
        }});

    Logger::instance().debug("GET {} -> {} (offset {})", request.url, part.string(), offset);
    cpr::Response response = session.Get();

    if (file.is_open()) {
        file.close();
    }

    if (cancel.isCancelled()) {
        return TransferOutcome::cancelled();
    }
    if (abortedByCaller) {
        return TransferOutcome::failure("transfer aborted");
    }
    if (response.error.code != cpr::ErrorCode::OK) {
        return TransferOutcome::failure(response.error.message);
    }
    if (statusCode == 0) {
        statusCode = response.status_code;
    }
    if (statusCode < 200 || statusCode >= 300) {
        return TransferOutcome::failure("HTTP " + std::to_string(statusCode),
                                        statusCode >= 500 || statusCode == 429);
    }

    // Empty bodies never reach the write callback
    if (!bodyStarted) {
        std::ofstream empty(part, std::ios::binary | std::ios::trunc);
        if (!empty.is_open()) {
            return TransferOutcome::failure("cannot write " + part.string());
        }
    }

    if (!utils::FileUtils::moveFile(part, request.destination)) {
        return TransferOutcome::failure("cannot move " + part.string() + " into place");
    }

    uint64_t size = utils::FileUtils::getFileSize(request.destination).value_or(0);
    return TransferOutcome::success(request.destination, size);
}

} // namespace tapedeck::core::downloader
