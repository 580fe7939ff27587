// In-memory IHttpAdapter for engine tests.
// Serves a fixed payload, honours byte ranges and records every request.
// Knobs are plain members set before the engine starts; counters are atomic
// because chunk workers call fetch() concurrently.

#pragma once

#include <segdl/downloader/downloader.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace segdl::test {

class FakeHttpAdapter final : public downloader::IHttpAdapter {
public:
    explicit FakeHttpAdapter(std::vector<std::byte> body) : payload(std::move(body)) {}

    // ---- behaviour ----
    std::vector<std::byte> payload;
    bool advertiseRanges{true};    // Accept-Ranges: bytes on probe
    bool reportLength{true};       // Content-Length / Content-Range totals
    bool ignoreRanges{false};      // answer ranged GETs with 200 + whole body
    int probeStatus{200};
    std::optional<downloader::Error> probeError; // transport failure on probe
    std::optional<std::uint64_t> failRangeStart; // 500 for a GET starting here
    std::optional<std::uint64_t> probeLength;    // advertise this length instead of the payload size
    std::function<void()> onProbe;               // runs inside probe(), before it answers
    std::size_t bufferSize{4096};

    std::atomic<int> transientFailures{0}; // next N fetches fail before any body
    std::atomic<int> truncatedBodies{0};   // next N fetches stop halfway with a network error
    std::atomic<bool> holdBody{false};     // stall before each buffer until released or cancelled

    // ---- observations ----
    std::atomic<int> probeCalls{0};
    std::atomic<int> fetchCalls{0};

    std::vector<std::optional<downloader::ByteRange>> requests() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return requests_;
    }

    void clearRequests() {
        std::lock_guard<std::mutex> lk(mutex_);
        requests_.clear();
    }

    downloader::Expected<downloader::ResponseHead>
    probe(std::string_view, const std::vector<downloader::Header>&,
          const downloader::HttpOptions&) override {
        ++probeCalls;
        if (onProbe)
            onProbe();
        if (probeError)
            return *probeError;
        downloader::ResponseHead head;
        head.status = probeStatus;
        head.acceptRangesBytes = advertiseRanges;
        if (reportLength)
            head.contentLength = probeLength.value_or(payload.size());
        return head;
    }

    downloader::Expected<downloader::ResponseHead>
    fetch(std::string_view, const std::optional<downloader::ByteRange>& range,
          const std::vector<downloader::Header>&, const downloader::HttpOptions&,
          const downloader::HeadHandler& onHead, const downloader::BodySink& sink,
          const downloader::ShouldCancel& shouldCancel) override {
        using downloader::Error;
        using downloader::ErrorCode;

        ++fetchCalls;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            requests_.push_back(range);
        }

        if (shouldCancel && shouldCancel())
            return Error{ErrorCode::PauseInterrupt, "cancelled before request"};

        if (takeOne(transientFailures))
            return Error{ErrorCode::NetworkError, "simulated connection reset"};

        const std::uint64_t size = payload.size();
        downloader::ResponseHead head;
        std::uint64_t first = 0;
        std::uint64_t last = size == 0 ? 0 : size - 1;

        if (range && !ignoreRanges) {
            if (range->first >= size) {
                head.status = 416;
                auto hr = onHead ? onHead(head) : downloader::Expected<void>{};
                if (!hr.ok())
                    return hr.error();
                return head;
            }
            first = range->first;
            last = std::min<std::uint64_t>(range->last.value_or(size - 1), size - 1);
            head.status = 206;
            head.contentLength = last - first + 1;
            if (reportLength)
                head.contentRangeTotal = size;
        } else {
            head.status = 200;
            if (reportLength)
                head.contentLength = size;
        }

        if (failRangeStart && range && range->first == *failRangeStart) {
            head = downloader::ResponseHead{};
            head.status = 500;
        }

        if (onHead) {
            auto hr = onHead(head);
            if (!hr.ok())
                return hr.error();
        }
        if (head.status < 200 || head.status > 299 || size == 0)
            return head;

        const bool truncate = takeOne(truncatedBodies);
        const std::uint64_t stopAt = truncate ? first + (last - first + 1) / 2 : last + 1;

        for (std::uint64_t pos = first; pos <= last;) {
            while (holdBody.load()) {
                if (shouldCancel && shouldCancel())
                    return Error{ErrorCode::PauseInterrupt, "cancelled while stalled"};
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            if (shouldCancel && shouldCancel())
                return Error{ErrorCode::PauseInterrupt, "cancelled"};
            if (pos >= stopAt)
                return Error{ErrorCode::NetworkError, "simulated truncated body"};

            const auto n = std::min<std::uint64_t>({bufferSize, last - pos + 1, stopAt - pos});
            auto r = sink(std::span<const std::byte>(payload.data() + pos, n));
            if (!r.ok())
                return r.error();
            pos += n;
        }
        return head;
    }

private:
    static bool takeOne(std::atomic<int>& counter) {
        int v = counter.load();
        while (v > 0) {
            if (counter.compare_exchange_weak(v, v - 1))
                return true;
        }
        return false;
    }

    mutable std::mutex mutex_;
    std::vector<std::optional<downloader::ByteRange>> requests_;
};

} // namespace segdl::test
