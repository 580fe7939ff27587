/*
 * segdl/src/downloader/rate_limiter.cpp
 *
 * Token-bucket RateLimiter shared by every worker of one engine
 * - No-ops when the limit is zero (unlimited)
 * - Capacity = rate (burst <= 1 second of allowance)
 * - Tokens are doubles to allow partial-byte accumulation between sleeps
 * - Cooperative cancellation via ShouldCancel so a pause is never held up by throttling
 * - Thread-safe for concurrent acquire() calls
 */

#include <segdl/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>

namespace segdl::downloader {

namespace {

using clock_t = std::chrono::steady_clock;

struct Bucket {
    // rate in bytes per second (0 => unlimited)
    double rate_bps{0.0};
    double capacity{0.0};
    double tokens{0.0};
    clock_t::time_point last_refill{clock_t::now()};
};

class TokenBucketLimiter final : public IRateLimiter {
public:
    TokenBucketLimiter() = default;
    ~TokenBucketLimiter() override = default;

    void setLimit(std::uint64_t bytesPerSecond) override {
        std::lock_guard<std::mutex> lk(mutex_);
        initBucket(bucket_, static_cast<double>(bytesPerSecond), clock_t::now());
    }

    void acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) override {
        if (bytes == 0)
            return;

        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (bucket_.rate_bps <= 0.0) {
                return;
            }
        }

        while (true) {
            if (shouldCancel && shouldCancel()) {
                return; // cooperative cancel
            }

            double wait_seconds = 0.0;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                if (bucket_.rate_bps <= 0.0) {
                    return; // limit lifted while waiting
                }
                const auto now = clock_t::now();
                refill(bucket_, now);

                // A request larger than the burst is granted once the bucket is full
                const double want = std::min(static_cast<double>(bytes), bucket_.capacity);
                if (bucket_.tokens >= want) {
                    bucket_.tokens = std::max(0.0, bucket_.tokens - static_cast<double>(bytes));
                    return;
                }
                wait_seconds = (want - bucket_.tokens) / bucket_.rate_bps;
            }

            // Sleep in small increments to allow cancel checks
            constexpr auto max_slice = std::chrono::milliseconds(50);
            auto sleep_for = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::duration<double>(wait_seconds));
            if (sleep_for.count() <= 0) {
                std::this_thread::yield();
            } else {
                std::this_thread::sleep_for(std::min(sleep_for, std::chrono::milliseconds(max_slice)));
            }
        }
    }

private:
    static void initBucket(Bucket& b, double rate_bps, clock_t::time_point now) {
        b.rate_bps = rate_bps;
        if (b.rate_bps > 0.0) {
            b.capacity = b.rate_bps; // 1 second burst
            b.tokens = b.capacity;
        } else {
            b.capacity = 0.0;
            b.tokens = 0.0;
        }
        b.last_refill = now;
    }

    static void refill(Bucket& b, clock_t::time_point now) {
        const auto dt = std::chrono::duration<double>(now - b.last_refill).count();
        if (dt <= 0.0)
            return;
        b.tokens = std::min(b.capacity, b.tokens + b.rate_bps * dt);
        b.last_refill = now;
    }

    std::mutex mutex_;
    Bucket bucket_{};
};

} // namespace

std::unique_ptr<IRateLimiter> makeRateLimiter() {
    return std::make_unique<TokenBucketLimiter>();
}

} // namespace segdl::downloader
