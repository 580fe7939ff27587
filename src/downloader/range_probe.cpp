/*
 * segdl/src/downloader/range_probe.cpp
 *
 * Capability probe: asks the transport for a zero-body response and derives
 * the resource length and byte-range support from it.
 *
 * No retries at this layer; the engine treats any failure as fatal for the attempt.
 */

#include <segdl/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace segdl::downloader {

std::string_view toString(TransferState state) noexcept {
    switch (state) {
        case TransferState::Idle:
            return "idle";
        case TransferState::Preparing:
            return "preparing";
        case TransferState::Downloading:
            return "downloading";
        case TransferState::Paused:
            return "paused";
        case TransferState::Completed:
            return "completed";
        case TransferState::Failed:
            return "failed";
    }
    return "unknown";
}

std::string_view toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::InvalidArgument:
            return "invalid_argument";
        case ErrorCode::ConnectivityError:
            return "connectivity_error";
        case ErrorCode::ChunkTransferError:
            return "chunk_transfer_error";
        case ErrorCode::AlreadyRunning:
            return "already_running";
        case ErrorCode::NetworkError:
            return "network_error";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::TlsVerificationFailed:
            return "tls_verification_failed";
        case ErrorCode::IoError:
            return "io_error";
        case ErrorCode::PauseInterrupt:
            return "pause_interrupt";
        case ErrorCode::Unknown:
            return "unknown";
    }
    return "unknown";
}

Expected<ProbeResult> probeRange(IHttpAdapter& http, std::string_view url,
                                 const std::vector<Header>& headers, const HttpOptions& options) {
    auto pr = http.probe(url, headers, options);
    if (!pr.ok()) {
        Error err = pr.error();
        err.message = "Failed to connect: " + err.message;
        err.code = ErrorCode::ConnectivityError;
        return err;
    }

    const ResponseHead& head = pr.value();
    if (head.status < 200 || head.status > 299) {
        return Error{ErrorCode::ConnectivityError,
                     "Failed to connect: HTTP " + std::to_string(head.status), std::nullopt,
                     head.status};
    }

    ProbeResult out;
    out.status = head.status;
    out.supportsRanges = head.acceptRangesBytes;

    // A 206 answer to the fallback "bytes=0-0" probe carries the full size in Content-Range
    std::optional<std::uint64_t> length =
        head.status == 206 ? head.contentRangeTotal : head.contentLength;
    if (length && *length > 0) {
        out.totalLength = length;
    }

    spdlog::debug("Probe {}: status={} length={} ranges={}", url, head.status,
                  out.totalLength ? std::to_string(*out.totalLength) : std::string{"unknown"},
                  out.supportsRanges);
    return out;
}

} // namespace segdl::downloader
