#pragma once

/**
 * CprTransferClient.hpp
 *
 * HTTP implementation of the transfer client using cpr.
 */

#include "TransferClient.hpp"

#include <chrono>
#include <string>

namespace tapedeck::core::downloader {

struct HttpTransferOptions {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connectTimeout{10000};
    std::string userAgent{"Tapedeck/1.0"};
};

/**
 * CprTransferClient - streams a URL into <destination>.part
 *
 * An existing partial file is continued with a Range request when the
 * request asks for it; the server may ignore the range (200 instead of 206),
 * in which case the file is rewritten from the start. The partial file is
 * renamed to the destination once the body is complete.
 */
class CprTransferClient : public ITransferClient {
public:
    explicit CprTransferClient(HttpTransferOptions options = {});

    TransferOutcome start(const TransferRequest& request,
                          const TransferProgressCallback& onProgress,
                          const CancellationToken& cancel) override;

private:
    HttpTransferOptions m_options;
};

} // namespace tapedeck::core::downloader
