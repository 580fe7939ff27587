#pragma once

/*
 * segdl Downloader - Public Types and Engine Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * segmented transfer engine. It intentionally contains no implementation details.
 *
 * Design principles:
 * - The remote resource is split into byte ranges downloaded concurrently and
 *   reassembled through positional writes into a pre-sized destination file
 * - Pause is cooperative: workers poll a cancel predicate after every buffer
 * - Resume state lives in memory for the lifetime of one engine instance
 * - Clear separation of concerns (HTTP adapter, file store, rate limit, engine)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace segdl::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Lifecycle of a transfer owned by a TransferEngine.
 */
enum class TransferState { Idle, Preparing, Downloading, Paused, Completed, Failed };

/**
 * Canonical error codes for downloader operations.
 * Note: Not a std::error_code category to keep this header implementation-free.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    ConnectivityError,  // probe failed (non-2xx or transport failure)
    ChunkTransferError, // a chunk GET failed after it started
    AlreadyRunning,     // start/resume while an attempt is in flight
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    IoError,
    PauseInterrupt, // internal: a worker stopped because pause was observed
    Unknown
};

/**
 * Open mode for destination files.
 */
enum class OpenMode {
    Truncate, // create parent dirs, create or truncate to zero length
    Existing  // open read/write without truncation (created if missing)
};

[[nodiscard]] std::string_view toString(TransferState state) noexcept;
[[nodiscard]] std::string_view toString(ErrorCode code) noexcept;

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Retry/backoff policy for transient transport failures inside a chunk worker.
 * The number of extra attempts comes from TransferRequest::retryCount.
 */
struct RetryPolicy {
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
};

/**
 * Transport options shared by every request an engine issues.
 */
struct HttpOptions {
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds connectTimeout{30000};
    bool followRedirects{true};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent;
    std::size_t bufferSize{16 * 1024};
};

/**
 * Downloader default configuration.
 */
struct DownloaderConfig {
    int defaultConcurrency{4};
    int retryCount{3};
    HttpOptions http{};
    RetryPolicy retry{};
    std::uint64_t rateLimitBps{0}; // 0 = unlimited
};

/**
 * A single transfer request. Immutable once handed to the engine.
 */
struct TransferRequest {
    std::string url;
    std::filesystem::path destination;
    int concurrency{4};
    int retryCount{3};
    std::vector<Header> headers;
};

/**
 * Inclusive byte range [first, last]; an absent last means "to the end".
 */
struct ByteRange {
    std::uint64_t first{0};
    std::optional<std::uint64_t> last{};
};

/**
 * One planned chunk: [start, end] inclusive. An empty chunk has end == start - 1.
 */
struct ChunkRange {
    int index{0};
    std::int64_t start{0};
    std::int64_t end{-1};
};

using ChunkPlan = std::vector<ChunkRange>;

/**
 * Response metadata reported by the transport. For redirected requests this
 * describes the final response.
 */
struct ResponseHead {
    int status{0};
    std::optional<std::uint64_t> contentLength{};
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentRangeTotal{}; // from "Content-Range: bytes a-b/total"
};

/**
 * Outcome of a capability probe.
 */
struct ProbeResult {
    std::optional<std::uint64_t> totalLength{};
    bool supportsRanges{false};
    int status{0};
};

/**
 * Streaming progress event. Percent and total are absent when the length is unknown.
 */
struct ProgressEvent {
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    std::optional<int> percent{}; // floor(downloaded * 100 / total)
    std::optional<int> chunkIndex{};
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<int> chunkIndex{};
    std::optional<int> httpStatus{};
};

/**
 * Point-in-time view of an engine.
 */
struct TransferSnapshot {
    TransferState state{TransferState::Idle};
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    bool supportsRanges{false};
    std::size_t chunkCount{0};
    std::vector<std::pair<int, std::uint64_t>> chunkProgress; // sorted by chunk index
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to stop at the next buffer boundary
using HeadHandler = std::function<Expected<void>(const ResponseHead&)>;
using BodySink = std::function<Expected<void>(std::span<const std::byte>)>;

/**
 * Caller-facing callbacks. Every member is optional. Progress, completion and
 * error callbacks run on engine worker threads.
 */
struct TransferCallbacks {
    std::function<void()> onStart;
    ProgressCallback onProgress;
    std::function<void(const std::filesystem::path&)> onComplete;
    std::function<void(const Error&)> onError;
};

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation will satisfy this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Zero-body capability request (HEAD preferred). Returns the response head
     * whatever its status; only transport failures are errors.
     */
    virtual Expected<ResponseHead> probe(std::string_view url, const std::vector<Header>& headers,
                                         const HttpOptions& options) = 0;

    /**
     * GET the resource, optionally restricted to a byte range.
     * - onHead is called once with the final response head before any body bytes;
     *   an error from it aborts the transfer.
     * - sink receives body buffers in order on the calling thread; an error from it
     *   aborts the transfer.
     * Errors returned by onHead or sink are returned unchanged.
     */
    virtual Expected<ResponseHead> fetch(std::string_view url, const std::optional<ByteRange>& range,
                                         const std::vector<Header>& headers,
                                         const HttpOptions& options, const HeadHandler& onHead,
                                         const BodySink& sink, const ShouldCancel& shouldCancel) = 0;
};

/**
 * Random access file handle. Not shared between threads.
 */
class IRandomAccessFile {
public:
    virtual ~IRandomAccessFile() = default;

    virtual Expected<void> seek(std::uint64_t offset) = 0;
    virtual Expected<void> write(std::span<const std::byte> data) = 0;
    virtual Expected<void> setLength(std::uint64_t length) = 0;
    virtual Expected<void> close() = 0;
    [[nodiscard]] virtual std::uint64_t position() const noexcept = 0;
};

/**
 * Opens destination files for positional writes.
 */
class IFileStore {
public:
    virtual ~IFileStore() = default;

    virtual Expected<std::unique_ptr<IRandomAccessFile>> open(const std::filesystem::path& path,
                                                              OpenMode mode) = 0;
};

/**
 * Token-bucket style limiter interface.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * Blocks until 'bytes' tokens are available. Returns early when shouldCancel() is true.
     */
    virtual void acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) = 0;

    /**
     * Set runtime limit in bytes per second (0 = unlimited).
     */
    virtual void setLimit(std::uint64_t bytesPerSecond) = 0;
};

/**
 * Segmented transfer engine: owns the pause/resume state machine and the
 * per-chunk progress that survives a pause.
 */
class ITransferEngine {
public:
    virtual ~ITransferEngine() = default;

    /**
     * Run a fresh transfer on the calling thread until it completes, fails or
     * pauses. Returns the state the attempt ended in; errors only for rejected
     * calls (AlreadyRunning, InvalidArgument). Attempt failures go to onError.
     */
    virtual Expected<TransferState> start(const TransferRequest& request,
                                          TransferCallbacks callbacks) = 0;

    /**
     * Same as start() but runs the attempt on a background thread.
     */
    virtual Expected<void> startAsync(const TransferRequest& request,
                                      TransferCallbacks callbacks) = 0;

    /**
     * Request a cooperative pause. No-op unless Preparing or Downloading.
     */
    virtual void pause() = 0;

    /**
     * Continue a paused transfer on the calling thread. No-op unless Paused.
     */
    virtual Expected<TransferState> resume() = 0;

    /**
     * Continue a paused transfer on a background thread. No-op unless Paused.
     */
    virtual Expected<void> resumeAsync() = 0;

    /**
     * Join the background attempt (if any) and return the resulting state.
     */
    virtual TransferState wait() = 0;

    [[nodiscard]] virtual TransferState state() const noexcept = 0;
    [[nodiscard]] virtual TransferSnapshot snapshot() const = 0;
};

// ======================
// Core functions
// ======================

/**
 * Partition [0, totalLength) into `concurrency` contiguous inclusive ranges.
 * The last chunk absorbs the division remainder. concurrency <= 1 yields one chunk;
 * totalLength <= 0 yields an empty plan.
 */
[[nodiscard]] ChunkPlan planChunks(std::int64_t totalLength, int concurrency);

/**
 * Number of bytes covered by a chunk (0 for an empty chunk).
 */
[[nodiscard]] inline std::uint64_t chunkLength(const ChunkRange& chunk) noexcept {
    return chunk.end >= chunk.start ? static_cast<std::uint64_t>(chunk.end - chunk.start + 1) : 0;
}

/**
 * Capability probe: total length (when reported and positive) and range support.
 * Non-2xx status and transport failures map to ErrorCode::ConnectivityError.
 */
Expected<ProbeResult> probeRange(IHttpAdapter& http, std::string_view url,
                                 const std::vector<Header>& headers, const HttpOptions& options);

// ======================
// Factories
// ======================

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IFileStore> makePosixFileStore();
std::unique_ptr<IRateLimiter> makeRateLimiter();

/**
 * Create a transfer engine. Null collaborators are replaced by the defaults
 * (curl adapter, POSIX file store, token-bucket limiter).
 */
std::unique_ptr<ITransferEngine> makeTransferEngine(const DownloaderConfig& cfg,
                                                    std::unique_ptr<IHttpAdapter> http = nullptr,
                                                    std::unique_ptr<IFileStore> files = nullptr,
                                                    std::unique_ptr<IRateLimiter> limiter = nullptr);

} // namespace segdl::downloader
