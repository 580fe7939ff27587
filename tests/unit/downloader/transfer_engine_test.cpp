#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "../../common/fake_http_adapter.h"
#include "../../common/test_helpers_catch2.h"

#include <segdl/downloader/downloader.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;
using namespace segdl::downloader;
using segdl::test::FakeHttpAdapter;
using segdl::test::make_payload;
using segdl::test::read_bytes;
using Catch::Matchers::ContainsSubstring;

namespace {

constexpr const char* kUrl = "http://example.test/data.bin";

DownloaderConfig fastRetryConfig() {
    DownloaderConfig cfg;
    cfg.retry.initialBackoff = std::chrono::milliseconds(1);
    cfg.retry.maxBackoff = std::chrono::milliseconds(5);
    return cfg;
}

// Engine wired to a fake adapter; the fake stays observable through a raw pointer.
struct Harness {
    explicit Harness(std::vector<std::byte> payload, DownloaderConfig cfg = fastRetryConfig()) {
        auto http = std::make_unique<FakeHttpAdapter>(std::move(payload));
        fake = http.get();
        engine = makeTransferEngine(cfg, std::move(http));
        dir = segdl::test::make_temp_dir("segdl_engine_");
    }

    ~Harness() {
        engine.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    TransferRequest request(int concurrency = 4, int retryCount = 3) const {
        TransferRequest req;
        req.url = kUrl;
        req.destination = dir / "out.bin";
        req.concurrency = concurrency;
        req.retryCount = retryCount;
        return req;
    }

    FakeHttpAdapter* fake{nullptr};
    std::unique_ptr<ITransferEngine> engine;
    fs::path dir;
};

// Records every callback invocation.
struct Recorder {
    std::mutex mutex;
    std::vector<ProgressEvent> events;
    std::vector<Error> errors;
    std::vector<fs::path> completed;
    std::atomic<int> starts{0};

    TransferCallbacks callbacks(std::function<void(const ProgressEvent&)> extra = {}) {
        TransferCallbacks cb;
        cb.onStart = [this] { ++starts; };
        cb.onProgress = [this, extra](const ProgressEvent& ev) {
            {
                std::lock_guard<std::mutex> lk(mutex);
                events.push_back(ev);
            }
            if (extra)
                extra(ev);
        };
        cb.onError = [this](const Error& e) {
            std::lock_guard<std::mutex> lk(mutex);
            errors.push_back(e);
        };
        cb.onComplete = [this](const fs::path& p) {
            std::lock_guard<std::mutex> lk(mutex);
            completed.push_back(p);
        };
        return cb;
    }
};

bool hasRange(const std::vector<std::optional<ByteRange>>& reqs, std::uint64_t first,
              std::optional<std::uint64_t> last) {
    return std::any_of(reqs.begin(), reqs.end(), [&](const auto& r) {
        return r && r->first == first && r->last == last;
    });
}

} // namespace

TEST_CASE("TransferEngine: Chunked download reproduces the resource", "[downloader][engine]") {
    const auto payload = make_payload(1'000'003);
    Harness h(payload);
    Recorder rec;

    auto r = h.engine->start(h.request(4), rec.callbacks());
    REQUIRE(r.ok());
    CHECK(r.value() == TransferState::Completed);
    CHECK(h.engine->state() == TransferState::Completed);
    CHECK(read_bytes(h.dir / "out.bin") == payload);

    SECTION("One probe and one ranged GET per chunk") {
        CHECK(h.fake->probeCalls == 1);
        auto reqs = h.fake->requests();
        REQUIRE(reqs.size() == 4);
        CHECK(hasRange(reqs, 0, 249'999));
        CHECK(hasRange(reqs, 250'000, 499'999));
        CHECK(hasRange(reqs, 500'000, 749'999));
        CHECK(hasRange(reqs, 750'000, 1'000'002));
    }

    SECTION("Callbacks") {
        CHECK(rec.starts == 1);
        CHECK(rec.errors.empty());
        REQUIRE(rec.completed.size() == 1);
        CHECK(rec.completed.front() == h.dir / "out.bin");
    }

    SECTION("Progress is monotonic and ends at 100%") {
        REQUIRE_FALSE(rec.events.empty());
        for (std::size_t i = 1; i < rec.events.size(); ++i) {
            CHECK(rec.events[i].downloadedBytes >= rec.events[i - 1].downloadedBytes);
        }
        const auto& last = rec.events.back();
        CHECK(last.downloadedBytes == payload.size());
        CHECK(last.totalBytes == std::optional<std::uint64_t>{payload.size()});
        CHECK(last.percent == std::optional<int>{100});
        CHECK(last.chunkIndex.has_value());
    }

    SECTION("Snapshot") {
        auto snap = h.engine->snapshot();
        CHECK(snap.downloadedBytes == payload.size());
        CHECK(snap.chunkCount == 4);
        CHECK(snap.supportsRanges);
        REQUIRE(snap.chunkProgress.size() == 4);
        CHECK(snap.chunkProgress[3].second == 250'003);
    }
}

TEST_CASE("TransferEngine: Pause and resume a chunk mid-flight", "[downloader][engine][resume]") {
    const auto payload = make_payload(1'000'000);
    Harness h(payload);
    h.fake->bufferSize = 1000;
    Recorder rec;

    ITransferEngine* engine = h.engine.get();
    auto cb = rec.callbacks([engine](const ProgressEvent& ev) {
        if (ev.chunkIndex == std::optional<int>{2}) {
            for (const auto& [index, bytes] : engine->snapshot().chunkProgress) {
                if (index == 2 && bytes >= 10'000)
                    engine->pause();
            }
        }
    });

    auto first = h.engine->start(h.request(4), cb);
    REQUIRE(first.ok());
    REQUIRE(first.value() == TransferState::Paused);
    CHECK(rec.errors.empty());
    CHECK(rec.completed.empty());

    auto paused = h.engine->snapshot();
    auto chunk2 = std::find_if(paused.chunkProgress.begin(), paused.chunkProgress.end(),
                               [](const auto& e) { return e.first == 2; });
    REQUIRE(chunk2 != paused.chunkProgress.end());
    CHECK(chunk2->second == 10'000);

    h.fake->clearRequests();
    const int probesBefore = h.fake->probeCalls;

    auto resumed = h.engine->resume();
    REQUIRE(resumed.ok());
    CHECK(resumed.value() == TransferState::Completed);
    CHECK(h.fake->probeCalls == probesBefore);

    auto reqs = h.fake->requests();
    CHECK(hasRange(reqs, 510'000, 749'999));
    CHECK_FALSE(hasRange(reqs, 500'000, 749'999));
    CHECK(read_bytes(h.dir / "out.bin") == payload);
    CHECK(rec.starts == 2);
    CHECK(rec.completed.size() == 1);
}

TEST_CASE("TransferEngine: Resume with every chunk complete issues no requests",
          "[downloader][engine][resume]") {
    const auto payload = make_payload(40'000);
    Harness h(payload);
    h.fake->bufferSize = 1000;
    Recorder rec;

    ITransferEngine* engine = h.engine.get();
    auto cb = rec.callbacks([engine, total = payload.size()](const ProgressEvent& ev) {
        if (ev.downloadedBytes == total)
            engine->pause();
    });

    auto first = h.engine->start(h.request(4), cb);
    REQUIRE(first.ok());
    REQUIRE(first.value() == TransferState::Paused);

    const int fetchesBefore = h.fake->fetchCalls;
    const int probesBefore = h.fake->probeCalls;

    auto resumed = h.engine->resume();
    REQUIRE(resumed.ok());
    CHECK(resumed.value() == TransferState::Completed);
    CHECK(h.fake->fetchCalls == fetchesBefore);
    CHECK(h.fake->probeCalls == probesBefore);
    CHECK(read_bytes(h.dir / "out.bin") == payload);
}

TEST_CASE("TransferEngine: Single stream fallbacks", "[downloader][engine][single]") {
    const auto payload = make_payload(50'000);
    Harness h(payload);
    Recorder rec;

    SECTION("Unknown length") {
        h.fake->reportLength = false;
        h.fake->advertiseRanges = false;

        auto r = h.engine->start(h.request(4), rec.callbacks());
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);

        auto reqs = h.fake->requests();
        REQUIRE(reqs.size() == 1);
        CHECK_FALSE(reqs.front().has_value());
        CHECK(read_bytes(h.dir / "out.bin") == payload);

        REQUIRE_FALSE(rec.events.empty());
        for (const auto& ev : rec.events) {
            CHECK_FALSE(ev.totalBytes.has_value());
            CHECK_FALSE(ev.percent.has_value());
        }
        CHECK(rec.events.back().downloadedBytes == payload.size());
    }

    SECTION("No range support") {
        h.fake->advertiseRanges = false;

        auto r = h.engine->start(h.request(4), rec.callbacks());
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);
        REQUIRE(h.fake->requests().size() == 1);
        CHECK(rec.events.back().percent == std::optional<int>{100});
        CHECK(read_bytes(h.dir / "out.bin") == payload);
    }

    SECTION("Concurrency of one") {
        auto r = h.engine->start(h.request(1), rec.callbacks());
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);
        REQUIRE(h.fake->requests().size() == 1);
        CHECK(read_bytes(h.dir / "out.bin") == payload);
    }
}

TEST_CASE("TransferEngine: Single stream resume", "[downloader][engine][single][resume]") {
    const auto payload = make_payload(10'000);
    Harness h(payload);
    h.fake->advertiseRanges = false;
    h.fake->bufferSize = 1000;
    Recorder rec;

    ITransferEngine* engine = h.engine.get();
    auto cb = rec.callbacks([engine](const ProgressEvent& ev) {
        if (ev.downloadedBytes == 3000)
            engine->pause();
    });

    auto first = h.engine->start(h.request(4), cb);
    REQUIRE(first.ok());
    REQUIRE(first.value() == TransferState::Paused);
    CHECK(h.engine->snapshot().downloadedBytes == 3000);

    h.fake->clearRequests();

    SECTION("Server honours the open range") {
        auto r = h.engine->resume();
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);
        auto reqs = h.fake->requests();
        REQUIRE(reqs.size() == 1);
        CHECK(hasRange(reqs, 3000, std::nullopt));
    }

    SECTION("Server ignores the range and resends everything") {
        h.fake->ignoreRanges = true;
        auto r = h.engine->resume();
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);
    }

    CHECK(read_bytes(h.dir / "out.bin") == payload);
}

TEST_CASE("TransferEngine: Failures", "[downloader][engine][errors]") {
    const auto payload = make_payload(100'000);
    Harness h(payload);
    Recorder rec;

    SECTION("Probe status") {
        h.fake->probeStatus = 404;
        auto r = h.engine->start(h.request(4), rec.callbacks());
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Failed);
        REQUIRE(rec.errors.size() == 1);
        CHECK(rec.errors[0].code == ErrorCode::ConnectivityError);
        CHECK_THAT(rec.errors[0].message, ContainsSubstring("Failed to connect"));
        CHECK(h.fake->fetchCalls == 0);
        CHECK(rec.completed.empty());
    }

    SECTION("Probe transport error") {
        h.fake->probeError = Error{ErrorCode::Timeout, "Operation timed out"};
        auto r = h.engine->start(h.request(4), rec.callbacks());
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Failed);
        REQUIRE(rec.errors.size() == 1);
        CHECK(rec.errors[0].code == ErrorCode::ConnectivityError);
    }

    SECTION("Chunk status error is reported once and not retried") {
        h.fake->failRangeStart = 25'000; // chunk 1
        auto r = h.engine->start(h.request(4), rec.callbacks());
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Failed);
        REQUIRE(rec.errors.size() == 1);
        CHECK(rec.errors[0].code == ErrorCode::ChunkTransferError);
        CHECK(rec.errors[0].chunkIndex == std::optional<int>{1});
        CHECK(rec.errors[0].httpStatus == std::optional<int>{500});

        auto reqs = h.fake->requests();
        CHECK(std::count_if(reqs.begin(), reqs.end(), [](const auto& q) {
                  return q && q->first == 25'000;
              }) == 1);
        CHECK(rec.completed.empty());
    }

    SECTION("Server ignoring ranges breaks a chunked transfer") {
        h.fake->ignoreRanges = true;
        auto r = h.engine->start(h.request(4), rec.callbacks());
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Failed);
        REQUIRE(rec.errors.size() == 1);
        CHECK(rec.errors[0].code == ErrorCode::ChunkTransferError);
    }

    SECTION("Resume after failure is a no-op") {
        h.fake->probeStatus = 500;
        REQUIRE(h.engine->start(h.request(4), rec.callbacks()).ok());
        REQUIRE(h.engine->state() == TransferState::Failed);
        auto r = h.engine->resume();
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Failed);
        CHECK(h.fake->probeCalls == 1);
    }
}

TEST_CASE("TransferEngine: Retries transient network errors", "[downloader][engine][retry]") {
    const auto payload = make_payload(80'000);
    Harness h(payload);
    Recorder rec;

    SECTION("Failures before the body") {
        h.fake->transientFailures = 3;
        auto r = h.engine->start(h.request(4, 3), rec.callbacks());
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);
        CHECK(h.fake->fetchCalls == 7);
        CHECK(rec.errors.empty());
        CHECK(read_bytes(h.dir / "out.bin") == payload);
    }

    SECTION("Truncated bodies continue from written progress") {
        h.fake->truncatedBodies = 1;
        auto r = h.engine->start(h.request(1, 2), rec.callbacks());
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);
        auto reqs = h.fake->requests();
        REQUIRE(reqs.size() == 2);
        CHECK(hasRange(reqs, 40'000, std::nullopt));
        CHECK(read_bytes(h.dir / "out.bin") == payload);
    }

    SECTION("Exhausted retries fail the transfer") {
        h.fake->transientFailures = 100;
        auto r = h.engine->start(h.request(2, 1), rec.callbacks());
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Failed);
        REQUIRE(rec.errors.size() == 1);
        CHECK(rec.errors[0].code == ErrorCode::ChunkTransferError);
        CHECK(rec.errors[0].chunkIndex.has_value());
    }
}

TEST_CASE("TransferEngine: Asynchronous control", "[downloader][engine][async]") {
    const auto payload = make_payload(64'000);
    Harness h(payload);
    h.fake->holdBody = true;
    Recorder rec;

    REQUIRE(h.engine->startAsync(h.request(4), rec.callbacks()).ok());
    REQUIRE(segdl::test::wait_for([&] { return h.fake->fetchCalls.load() > 0; }));
    CHECK(h.engine->state() == TransferState::Downloading);

    SECTION("A second start is rejected while running") {
        auto again = h.engine->start(h.request(4), rec.callbacks());
        REQUIRE_FALSE(again.ok());
        CHECK(again.error().code == ErrorCode::AlreadyRunning);

        auto againAsync = h.engine->startAsync(h.request(4), rec.callbacks());
        REQUIRE_FALSE(againAsync.ok());
        CHECK(againAsync.error().code == ErrorCode::AlreadyRunning);

        h.fake->holdBody = false;
        CHECK(h.engine->wait() == TransferState::Completed);
    }

    SECTION("Pause stalls workers and resumeAsync finishes the job") {
        h.engine->pause();
        CHECK(h.engine->state() == TransferState::Paused);
        CHECK(h.engine->wait() == TransferState::Paused);

        h.engine->pause(); // no-op while paused
        CHECK(h.engine->state() == TransferState::Paused);

        h.fake->holdBody = false;
        REQUIRE(h.engine->resumeAsync().ok());
        CHECK(h.engine->wait() == TransferState::Completed);
        CHECK(read_bytes(h.dir / "out.bin") == payload);
        CHECK(rec.errors.empty());
    }
}

TEST_CASE("TransferEngine: Edge cases", "[downloader][engine]") {
    SECTION("Fewer bytes than workers") {
        const auto payload = make_payload(3);
        Harness h(payload);
        auto r = h.engine->start(h.request(4), {});
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);
        CHECK(h.fake->requests().size() == 1);
        CHECK(read_bytes(h.dir / "out.bin") == payload);
    }

    SECTION("Empty resource") {
        Harness h(std::vector<std::byte>{});
        auto r = h.engine->start(h.request(4), {});
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);
        CHECK(fs::exists(h.dir / "out.bin"));
        CHECK(fs::file_size(h.dir / "out.bin") == 0);
    }

    SECTION("Fresh start truncates an existing destination") {
        const auto payload = make_payload(1000);
        Harness h(payload);
        segdl::test::write_file(h.dir / "out.bin", std::string(5000, 'x'));
        auto r = h.engine->start(h.request(4), {});
        REQUIRE(r.ok());
        CHECK(read_bytes(h.dir / "out.bin") == payload);
    }

    SECTION("Invalid request") {
        Harness h(make_payload(10));
        TransferRequest req = h.request();
        req.url.clear();
        auto r = h.engine->start(req, {});
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
        CHECK(h.engine->state() == TransferState::Idle);
    }

    SECTION("Pause and resume before any start are no-ops") {
        Harness h(make_payload(10));
        h.engine->pause();
        CHECK(h.engine->state() == TransferState::Idle);
        auto r = h.engine->resume();
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Idle);
        CHECK(h.fake->probeCalls == 0);
    }

    SECTION("Restart after completion downloads again") {
        const auto payload = make_payload(4000);
        Harness h(payload);
        REQUIRE(h.engine->start(h.request(2), {}).ok());
        REQUIRE(h.engine->start(h.request(2), {}).ok());
        CHECK(h.engine->state() == TransferState::Completed);
        CHECK(h.fake->probeCalls == 2);
        CHECK(h.fake->fetchCalls == 4);
    }
}

TEST_CASE("TransferEngine: Pause while preparing", "[downloader][engine][resume]") {
    const auto payload = make_payload(50'000);
    Harness h(payload);
    Recorder rec;
    h.fake->onProbe = [&h] { h.engine->pause(); };

    auto r = h.engine->start(h.request(4), rec.callbacks());
    REQUIRE(r.ok());
    CHECK(r.value() == TransferState::Paused);
    CHECK(h.fake->probeCalls == 1);
    CHECK(h.fake->fetchCalls == 0);
    CHECK(rec.errors.empty());
    CHECK(rec.completed.empty());

    h.fake->onProbe = {};
    auto resumed = h.engine->resume();
    REQUIRE(resumed.ok());
    CHECK(resumed.value() == TransferState::Completed);
    CHECK(h.fake->probeCalls == 1);
    CHECK(h.fake->fetchCalls == 4);
    CHECK(rec.errors.empty());
    CHECK(rec.completed.size() == 1);
    CHECK(read_bytes(h.dir / "out.bin") == payload);
}

TEST_CASE("TransferEngine: Single stream longer than the advertised length",
          "[downloader][engine][single][errors]") {
    Harness h(make_payload(8000));
    h.fake->probeLength = 4000;
    h.fake->advertiseRanges = false;
    h.fake->bufferSize = 1000;
    Recorder rec;

    auto r = h.engine->start(h.request(4), rec.callbacks());
    REQUIRE(r.ok());
    CHECK(r.value() == TransferState::Failed);
    REQUIRE(rec.errors.size() == 1);
    CHECK(rec.errors[0].code == ErrorCode::ChunkTransferError);
    CHECK(rec.completed.empty());
    CHECK(h.fake->fetchCalls == 1);

    for (const auto& ev : rec.events) {
        CHECK(ev.downloadedBytes <= 4000);
        CHECK(ev.totalBytes == std::optional<std::uint64_t>{4000});
    }
    CHECK(h.engine->snapshot().downloadedBytes <= 4000);
    CHECK(fs::file_size(h.dir / "out.bin") == 4000);
}

TEST_CASE("TransferEngine: Throwing callbacks", "[downloader][engine][errors]") {
    const auto payload = make_payload(20'000);
    Harness h(payload);
    std::atomic<int> completes{0};
    std::atomic<int> errors{0};

    TransferCallbacks cb;
    cb.onComplete = [&](const fs::path&) { ++completes; };
    cb.onError = [&](const Error&) { ++errors; };

    SECTION("onComplete throwing leaves the transfer completed") {
        cb.onComplete = [&](const fs::path&) {
            ++completes;
            throw std::runtime_error("complete handler failed");
        };
        auto r = h.engine->start(h.request(1), cb);
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);
        CHECK(completes == 1);
        CHECK(errors == 0);
        CHECK(read_bytes(h.dir / "out.bin") == payload);
    }

    SECTION("onError throwing is reported once and frees the engine") {
        cb.onError = [&](const Error&) {
            ++errors;
            throw std::runtime_error("error handler failed");
        };
        h.fake->probeStatus = 503;
        auto r = h.engine->start(h.request(4), cb);
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Failed);
        CHECK(errors == 1);

        h.fake->probeStatus = 200;
        auto again = h.engine->start(h.request(4), cb);
        REQUIRE(again.ok());
        CHECK(again.value() == TransferState::Completed);
        CHECK(completes == 1);
        CHECK(errors == 1);
    }

    SECTION("onError throwing on a background attempt") {
        cb.onError = [&](const Error&) {
            ++errors;
            throw std::runtime_error("error handler failed");
        };
        h.fake->probeStatus = 503;
        REQUIRE(h.engine->startAsync(h.request(4), cb).ok());
        CHECK(h.engine->wait() == TransferState::Failed);
        CHECK(errors == 1);

        h.fake->probeStatus = 200;
        REQUIRE(h.engine->startAsync(h.request(4), cb).ok());
        CHECK(h.engine->wait() == TransferState::Completed);
        CHECK(completes == 1);
    }

    SECTION("onProgress throwing does not stop the workers") {
        cb.onProgress = [](const ProgressEvent&) {
            throw std::runtime_error("progress handler failed");
        };
        auto r = h.engine->start(h.request(4), cb);
        REQUIRE(r.ok());
        CHECK(r.value() == TransferState::Completed);
        CHECK(completes == 1);
        CHECK(errors == 0);
        CHECK(read_bytes(h.dir / "out.bin") == payload);
    }
}
