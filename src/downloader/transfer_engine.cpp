/*
 * segdl/src/downloader/transfer_engine.cpp
 *
 * TransferEngine:
 * - Probe the resource once per fresh transfer (length + Range support)
 * - Pre-size the destination and split it into chunks, one worker thread each
 * - Workers stream ranged GETs into their own file handle with positional writes
 * - Per-chunk progress survives a pause; resume restarts each worker at
 *   chunk.start + progress and skips finished chunks without any request
 * - Single-stream fallback when the length is unknown, Range is unsupported or
 *   concurrency <= 1
 *
 * State changes are compare-and-swap transitions on one atomic, so a pause that
 * lands while an attempt is finishing always wins over Completed/Failed.
 */

#include <segdl/downloader/chunk_progress.hpp>
#include <segdl/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace segdl::downloader {

namespace {

bool isTransient(ErrorCode code) {
    return code == ErrorCode::NetworkError || code == ErrorCode::Timeout;
}

bool isSuccess(int status) {
    return status >= 200 && status <= 299;
}

std::optional<int> percentOf(std::uint64_t done, std::optional<std::uint64_t> total) {
    if (!total || *total == 0)
        return std::nullopt;
    return static_cast<int>(std::min<std::uint64_t>(100, (done * 100) / *total));
}

// Caller callbacks never unwind into the engine or a worker thread.
template <typename Fn, typename... Args>
void invokeCallback(const char* name, const Fn& fn, Args&&... args) {
    if (!fn)
        return;
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& ex) {
        spdlog::error("{} callback threw: {}", name, ex.what());
    } catch (...) {
        spdlog::error("{} callback threw a non-standard exception", name);
    }
}

Error pauseInterrupt() {
    return Error{ErrorCode::PauseInterrupt, "Transfer interrupted by pause"};
}

// Worker failures surface as ChunkTransferError; file errors keep their own code.
Error asChunkError(Error err, int chunkIndex) {
    if (err.code != ErrorCode::IoError && err.code != ErrorCode::ChunkTransferError) {
        err.message = "Chunk " + std::to_string(chunkIndex) + " failed: " + err.message;
        err.code = ErrorCode::ChunkTransferError;
    }
    if (!err.chunkIndex)
        err.chunkIndex = chunkIndex;
    return err;
}

class TransferEngine final : public ITransferEngine {
public:
    TransferEngine(DownloaderConfig cfg, std::unique_ptr<IHttpAdapter> http,
                   std::unique_ptr<IFileStore> files, std::unique_ptr<IRateLimiter> limiter)
        : config_(std::move(cfg)), http_(std::move(http)), files_(std::move(files)),
          limiter_(std::move(limiter)) {
        if (!http_)
            http_ = makeCurlHttpAdapter();
        if (!files_)
            files_ = makePosixFileStore();
        if (!limiter_)
            limiter_ = makeRateLimiter();
        limiter_->setLimit(config_.rateLimitBps);
    }

    ~TransferEngine() override {
        pause();
        (void)wait();
    }

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    Expected<TransferState> start(const TransferRequest& request,
                                  TransferCallbacks callbacks) override {
        auto v = validate(request);
        if (!v.ok())
            return v.error();

        auto begun = beginFresh(request, std::move(callbacks));
        if (!begun.ok())
            return begun.error();

        runAttempt(/*resuming=*/false);
        return state();
    }

    Expected<void> startAsync(const TransferRequest& request,
                              TransferCallbacks callbacks) override {
        auto v = validate(request);
        if (!v.ok())
            return v.error();

        std::lock_guard<std::mutex> tl(threadMutex_);
        auto begun = beginFresh(request, std::move(callbacks));
        if (!begun.ok())
            return begun.error();

        // The previous background attempt has already finished (running_ was false)
        if (background_.joinable())
            background_.join();
        background_ = std::thread([this] { runAttempt(/*resuming=*/false); });
        return Expected<void>{};
    }

    void pause() override {
        auto cur = state_.load();
        while (cur == TransferState::Preparing || cur == TransferState::Downloading) {
            if (state_.compare_exchange_weak(cur, TransferState::Paused)) {
                spdlog::info("Pause requested ({} was {})", url(), toString(cur));
                return;
            }
        }
    }

    Expected<TransferState> resume() override {
        if (!beginResume())
            return state();
        runAttempt(/*resuming=*/true);
        return state();
    }

    Expected<void> resumeAsync() override {
        std::lock_guard<std::mutex> tl(threadMutex_);
        if (state() != TransferState::Paused)
            return Expected<void>{};

        // Let a paused background attempt drain before reusing its progress
        if (background_.joinable())
            background_.join();
        if (!beginResume())
            return Expected<void>{};
        background_ = std::thread([this] { runAttempt(/*resuming=*/true); });
        return Expected<void>{};
    }

    TransferState wait() override {
        std::thread t;
        {
            std::lock_guard<std::mutex> tl(threadMutex_);
            t = std::move(background_);
        }
        if (t.joinable())
            t.join();
        return state();
    }

    [[nodiscard]] TransferState state() const noexcept override { return state_.load(); }

    [[nodiscard]] TransferSnapshot snapshot() const override {
        TransferSnapshot snap;
        snap.state = state_.load();
        snap.downloadedBytes = aggregate_.load();
        snap.chunkProgress = progress_.snapshot();
        std::lock_guard<std::mutex> lk(mutex_);
        if (probe_) {
            snap.totalBytes = probe_->totalLength;
            snap.supportsRanges = probe_->supportsRanges;
        }
        snap.chunkCount = plan_.size();
        return snap;
    }

private:
    // ---- attempt bookkeeping ----

    static Expected<void> validate(const TransferRequest& request) {
        if (request.url.empty())
            return Error{ErrorCode::InvalidArgument, "Empty URL"};
        if (request.destination.empty())
            return Error{ErrorCode::InvalidArgument, "Empty destination path"};
        return Expected<void>{};
    }

    Expected<void> beginFresh(const TransferRequest& request, TransferCallbacks callbacks) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (running_) {
            return Error{ErrorCode::AlreadyRunning,
                         "A transfer is already in progress for " + request_.url};
        }
        request_ = request;
        request_.concurrency = std::max(1, request_.concurrency);
        request_.retryCount = std::max(0, request_.retryCount);
        callbacks_ = std::move(callbacks);
        probe_.reset();
        plan_.clear();
        fileReady_ = false;
        progress_.clear();
        aggregate_.store(0);
        running_ = true;
        state_.store(TransferState::Preparing);
        return Expected<void>{};
    }

    bool beginResume() {
        std::unique_lock<std::mutex> lk(mutex_);
        if (state_.load() != TransferState::Paused)
            return false;
        // Workers of the paused attempt may still be flushing their last buffer
        idle_.wait(lk, [this] { return !running_; });
        if (state_.load() != TransferState::Paused)
            return false;
        running_ = true;
        state_.store(TransferState::Preparing);
        return true;
    }

    void finishAttempt() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            running_ = false;
        }
        idle_.notify_all();
    }

    bool transition(TransferState from, TransferState to) {
        return state_.compare_exchange_strong(from, to);
    }

    bool stopRequested() const noexcept {
        return state_.load() == TransferState::Paused || abortWorkers_.load();
    }

    std::string url() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return request_.url;
    }

    // ---- attempt orchestration ----

    void runAttempt(bool resuming) {
        TransferRequest request;
        TransferCallbacks callbacks;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            request = request_;
            callbacks = callbacks_;
        }
        abortWorkers_.store(false);

        // Clears the in-flight flag on every exit path
        struct AttemptGuard {
            TransferEngine* engine;
            ~AttemptGuard() { engine->finishAttempt(); }
        } guard{this};

        try {
            runAttemptSteps(request, callbacks, resuming);
        } catch (const std::exception& ex) {
            fail(callbacks, Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()});
        } catch (...) {
            fail(callbacks, Error{ErrorCode::Unknown, "Unknown exception"});
        }
    }

    void runAttemptSteps(const TransferRequest& request, const TransferCallbacks& callbacks,
                         bool resuming) {
        invokeCallback("onStart", callbacks.onStart);
        spdlog::info("{} {} -> {}", resuming ? "Resuming" : "Starting", request.url,
                     request.destination.string());

        // Probe (skipped on resume once a result is recorded)
        std::optional<ProbeResult> probe;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            probe = probe_;
        }
        if (!probe) {
            auto pr = probeRange(*http_, request.url, request.headers, config_.http);
            if (!pr.ok()) {
                fail(callbacks, pr.error());
                return;
            }
            probe = pr.value();
            std::lock_guard<std::mutex> lk(mutex_);
            probe_ = probe;
        }

        if (state() == TransferState::Paused) {
            spdlog::debug("Paused during probe of {}", request.url);
            return;
        }

        auto prepared = prepareDestination(request, probe->totalLength);
        if (!prepared.ok()) {
            fail(callbacks, prepared.error());
            return;
        }

        if (!transition(TransferState::Preparing, TransferState::Downloading)) {
            spdlog::debug("Paused before download of {}", request.url);
            return;
        }

        Expected<void> result;
        if (!probe->totalLength || !probe->supportsRanges || request.concurrency <= 1) {
            spdlog::debug("Single-stream transfer for {} (length {}, ranges {})", request.url,
                          probe->totalLength ? std::to_string(*probe->totalLength) : "unknown",
                          probe->supportsRanges);
            result = runSingleStream(request, callbacks, probe->totalLength);
        } else {
            result = runChunks(request, callbacks, *probe->totalLength);
        }

        if (!result.ok()) {
            fail(callbacks, result.error());
            return;
        }

        if (transition(TransferState::Downloading, TransferState::Completed)) {
            spdlog::info("Completed {} ({} bytes)", request.destination.string(),
                         aggregate_.load());
            invokeCallback("onComplete", callbacks.onComplete, request.destination);
        } else {
            spdlog::debug("Attempt for {} stopped by pause", request.url);
        }
    }

    // Create/truncate (and pre-size when the length is known) once per transfer.
    Expected<void> prepareDestination(const TransferRequest& request,
                                      std::optional<std::uint64_t> totalLength) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (fileReady_)
                return Expected<void>{};
        }

        auto fr = files_->open(request.destination, OpenMode::Truncate);
        if (!fr.ok())
            return fr.error();
        auto& file = *fr.value();
        if (totalLength) {
            auto sr = file.setLength(*totalLength);
            if (!sr.ok())
                return sr.error();
        }
        auto cr = file.close();
        if (!cr.ok())
            return cr.error();

        progress_.clear();
        aggregate_.store(0);
        std::lock_guard<std::mutex> lk(mutex_);
        fileReady_ = true;
        return Expected<void>{};
    }

    // Only an active attempt can fail; Paused, Completed and Failed are left alone.
    void fail(const TransferCallbacks& callbacks, const Error& err) {
        auto cur = state_.load();
        while (cur == TransferState::Preparing || cur == TransferState::Downloading) {
            if (state_.compare_exchange_weak(cur, TransferState::Failed)) {
                spdlog::error("Transfer failed ({}): {}", toString(err.code), err.message);
                invokeCallback("onError", callbacks.onError, err);
                return;
            }
        }
        spdlog::debug("Suppressed error in state {}: {}", toString(cur), err.message);
    }

    // ---- progress ----

    // Serialized so delivered values never go backwards.
    void addProgress(const TransferCallbacks& callbacks, int chunkIndex, std::uint64_t bytes,
                     std::uint64_t total) {
        std::lock_guard<std::mutex> lk(progressMutex_);
        const auto aggregate = std::min(aggregate_.fetch_add(bytes) + bytes, total);
        invokeCallback("onProgress", callbacks.onProgress,
                       ProgressEvent{aggregate, total, percentOf(aggregate, total), chunkIndex});
    }

    void setProgress(const TransferCallbacks& callbacks, std::uint64_t downloaded,
                     std::optional<std::uint64_t> total) {
        std::lock_guard<std::mutex> lk(progressMutex_);
        aggregate_.store(downloaded);
        invokeCallback("onProgress", callbacks.onProgress,
                       ProgressEvent{downloaded, total, percentOf(downloaded, total), 0});
    }

    // ---- retries ----

    void sleepUnlessStopped(std::chrono::milliseconds d) const {
        const auto deadline = std::chrono::steady_clock::now() + d;
        while (!stopRequested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(
                std::chrono::milliseconds(50),
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now()) +
                    std::chrono::milliseconds(1)));
        }
    }

    template <typename Fn> Expected<void> withRetries(int chunkIndex, int retryCount, Fn&& once) {
        auto backoff = config_.retry.initialBackoff;
        for (int attempt = 0;; ++attempt) {
            if (stopRequested())
                return Expected<void>{};

            auto r = once();
            if (r.ok())
                return r;
            if (r.error().code == ErrorCode::PauseInterrupt)
                return Expected<void>{};
            if (!isTransient(r.error().code) || attempt >= retryCount)
                return asChunkError(r.error(), chunkIndex);

            spdlog::warn("Chunk {}: {} (retry {}/{} in {} ms)", chunkIndex, r.error().message,
                         attempt + 1, retryCount, backoff.count());
            sleepUnlessStopped(backoff);
            backoff = std::min(config_.retry.maxBackoff,
                               std::chrono::milliseconds(static_cast<std::int64_t>(
                                   static_cast<double>(backoff.count()) * config_.retry.multiplier)));
        }
    }

    // ---- single stream ----

    Expected<void> runSingleStream(const TransferRequest& request,
                                   const TransferCallbacks& callbacks,
                                   std::optional<std::uint64_t> knownTotal) {
        return withRetries(0, request.retryCount,
                           [&] { return singleStreamOnce(request, callbacks, knownTotal); });
    }

    Expected<void> singleStreamOnce(const TransferRequest& request,
                                    const TransferCallbacks& callbacks,
                                    std::optional<std::uint64_t> knownTotal) {
        std::uint64_t offset = progress_.get(0);
        if (knownTotal && offset >= *knownTotal)
            return Expected<void>{};
        if (stopRequested())
            return Expected<void>{};

        auto fr = files_->open(request.destination, OpenMode::Existing);
        if (!fr.ok())
            return fr.error();
        auto file = std::move(fr.value());

        const std::uint64_t startOffset = offset;
        std::uint64_t skip = 0;
        std::optional<std::uint64_t> total = knownTotal;
        std::optional<ByteRange> range;
        if (startOffset > 0)
            range = ByteRange{startOffset, std::nullopt};

        const ShouldCancel cancel = [this] { return stopRequested(); };

        HeadHandler onHead = [&](const ResponseHead& head) -> Expected<void> {
            if (!isSuccess(head.status)) {
                return Error{ErrorCode::ChunkTransferError,
                             "Failed to download: HTTP " + std::to_string(head.status), 0,
                             head.status};
            }
            const bool partial = head.status == 206;
            if (startOffset > 0 && !partial) {
                // Server ignored Range: drop the prefix that is already on disk
                spdlog::warn("Server ignored Range for {}; skipping {} bytes", request.url,
                             startOffset);
                skip = startOffset;
            }
            if (!total && head.contentLength) {
                total = (partial ? startOffset : 0) + *head.contentLength;
            }
            return file->seek(startOffset);
        };

        BodySink sink = [&](std::span<const std::byte> data) -> Expected<void> {
            if (skip > 0) {
                if (data.size() <= skip) {
                    skip -= data.size();
                    return Expected<void>{};
                }
                data = data.subspan(static_cast<std::size_t>(skip));
                skip = 0;
            }
            if (knownTotal && offset + data.size() > *knownTotal) {
                return Error{ErrorCode::ChunkTransferError,
                             "Received more data than the advertised length (" +
                                 std::to_string(*knownTotal) + " bytes)",
                             0};
            }
            limiter_->acquire(data.size(), cancel);
            auto wr = file->write(data);
            if (!wr.ok())
                return wr.error();

            offset += data.size();
            progress_.set(0, offset);
            setProgress(callbacks, offset, total);

            if (stopRequested())
                return pauseInterrupt();
            return Expected<void>{};
        };

        auto res = http_->fetch(request.url, range, request.headers, config_.http, onHead, sink,
                                cancel);
        auto closed = file->close();
        if (!res.ok())
            return res.error();
        if (!closed.ok())
            return closed.error();

        if (!stopRequested() && knownTotal && offset < *knownTotal) {
            return Error{ErrorCode::NetworkError, "Stream ended early (" + std::to_string(offset) +
                                                      " of " + std::to_string(*knownTotal) +
                                                      " bytes)"};
        }
        return Expected<void>{};
    }

    // ---- chunked ----

    Expected<void> runChunks(const TransferRequest& request, const TransferCallbacks& callbacks,
                             std::uint64_t total) {
        ChunkPlan plan;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (plan_.empty()) {
                plan_ = planChunks(static_cast<std::int64_t>(total), request.concurrency);
                spdlog::debug("Planned {} chunks for {} bytes", plan_.size(), total);
            }
            plan = plan_;
        }
        aggregate_.store(progress_.total());

        std::mutex errorMutex;
        std::optional<Error> firstError;

        std::vector<std::thread> workers;
        workers.reserve(plan.size());
        for (const auto& chunk : plan) {
            workers.emplace_back([&, chunk] {
                Expected<void> r;
                try {
                    r = withRetries(chunk.index, request.retryCount, [&] {
                        return chunkOnce(request, callbacks, chunk, total);
                    });
                } catch (const std::exception& ex) {
                    r = Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what(),
                              chunk.index};
                } catch (...) {
                    r = Error{ErrorCode::Unknown, "Unknown exception", chunk.index};
                }
                if (r.ok())
                    return;

                std::lock_guard<std::mutex> lk(errorMutex);
                if (!firstError) {
                    firstError = r.error();
                    abortWorkers_.store(true);
                } else {
                    spdlog::debug("Discarding secondary failure of chunk {}: {}", chunk.index,
                                  r.error().message);
                }
            });
        }
        for (auto& w : workers) {
            w.join();
        }

        if (firstError)
            return *firstError;
        return Expected<void>{};
    }

    Expected<void> chunkOnce(const TransferRequest& request, const TransferCallbacks& callbacks,
                             const ChunkRange& chunk, std::uint64_t total) {
        const std::uint64_t length = chunkLength(chunk);
        const std::uint64_t resumed = progress_.get(chunk.index);
        if (resumed >= length)
            return Expected<void>{}; // already complete: no request
        if (stopRequested())
            return Expected<void>{};

        const std::uint64_t from = static_cast<std::uint64_t>(chunk.start) + resumed;
        const std::uint64_t last = static_cast<std::uint64_t>(chunk.end);
        const std::uint64_t remaining = length - resumed;
        const bool wholeResource = from == 0 && last + 1 == total;

        auto fr = files_->open(request.destination, OpenMode::Existing);
        if (!fr.ok())
            return fr.error();
        auto file = std::move(fr.value());

        std::uint64_t written = 0;
        const ShouldCancel cancel = [this] { return stopRequested(); };

        HeadHandler onHead = [&](const ResponseHead& head) -> Expected<void> {
            if (!isSuccess(head.status)) {
                return Error{ErrorCode::ChunkTransferError,
                             "Chunk download failed: HTTP " + std::to_string(head.status),
                             chunk.index, head.status};
            }
            if (head.status != 206 && !wholeResource) {
                return Error{ErrorCode::ChunkTransferError,
                             "Server ignored Range for chunk " + std::to_string(chunk.index),
                             chunk.index, head.status};
            }
            return file->seek(from);
        };

        BodySink sink = [&](std::span<const std::byte> data) -> Expected<void> {
            if (data.size() > remaining - written) {
                return Error{ErrorCode::ChunkTransferError,
                             "Chunk " + std::to_string(chunk.index) +
                                 " received more data than requested",
                             chunk.index};
            }
            limiter_->acquire(data.size(), cancel);
            auto wr = file->write(data);
            if (!wr.ok())
                return wr.error();

            written += data.size();
            progress_.add(chunk.index, data.size());
            addProgress(callbacks, chunk.index, data.size(), total);

            if (stopRequested())
                return pauseInterrupt();
            return Expected<void>{};
        };

        auto res = http_->fetch(request.url, ByteRange{from, last}, request.headers, config_.http,
                                onHead, sink, cancel);
        auto closed = file->close();
        if (!res.ok())
            return res.error();
        if (!closed.ok())
            return closed.error();

        if (!stopRequested() && written < remaining) {
            return Error{ErrorCode::NetworkError,
                         "Chunk " + std::to_string(chunk.index) + " ended early (" +
                             std::to_string(written) + " of " + std::to_string(remaining) +
                             " bytes)"};
        }
        return Expected<void>{};
    }

private:
    DownloaderConfig config_;
    std::unique_ptr<IHttpAdapter> http_;
    std::unique_ptr<IFileStore> files_;
    std::unique_ptr<IRateLimiter> limiter_;

    std::atomic<TransferState> state_{TransferState::Idle};
    std::atomic<std::uint64_t> aggregate_{0};
    std::atomic<bool> abortWorkers_{false};
    ChunkProgressMap progress_;

    // Guards request/callbacks/probe/plan and the in-flight flag
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    bool running_{false};
    bool fileReady_{false};
    TransferRequest request_;
    TransferCallbacks callbacks_;
    std::optional<ProbeResult> probe_;
    ChunkPlan plan_;

    std::mutex progressMutex_;

    std::mutex threadMutex_;
    std::thread background_;
};

} // namespace

std::unique_ptr<ITransferEngine> makeTransferEngine(const DownloaderConfig& cfg,
                                                    std::unique_ptr<IHttpAdapter> http,
                                                    std::unique_ptr<IFileStore> files,
                                                    std::unique_ptr<IRateLimiter> limiter) {
    return std::make_unique<TransferEngine>(cfg, std::move(http), std::move(files),
                                            std::move(limiter));
}

} // namespace segdl::downloader
