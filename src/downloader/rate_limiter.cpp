/*
 * mediadl/src/downloader/rate_limiter.cpp
 *
 * Global token-bucket RateLimiter shared by every transfer of one queue.
 * - No-op when globalBps == 0 (unlimited)
 * - Capacity = rate (burst <= 1 second of allowance)
 * - A request larger than the capacity is admitted once the bucket is full and leaves the
 *   bucket in debt, so large chunks are throttled instead of blocking forever
 * - Cooperative cancellation via ShouldCancel, checked at least every 50 ms
 * - Thread-safe for concurrent acquire() calls
 */

#include <mediadl/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>

namespace mediadl::downloader {

namespace {

using clock_t = std::chrono::steady_clock;

class TokenBucketLimiter final : public IRateLimiter {
public:
    void setLimits(const RateLimit& limit) override {
        std::lock_guard<std::mutex> lk(mutex_);
        rate_bps_ = static_cast<double>(limit.globalBps);
        capacity_ = rate_bps_;
        tokens_ = capacity_;
        last_refill_ = clock_t::now();
    }

    void acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) override {
        if (bytes == 0)
            return;

        while (true) {
            if (shouldCancel && shouldCancel()) {
                return;
            }

            double wait_seconds = 0.0;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                if (rate_bps_ <= 0.0) {
                    return;
                }
                refill(clock_t::now());

                const double want = static_cast<double>(bytes);
                const double admit_at = std::min(want, capacity_);
                if (tokens_ >= admit_at) {
                    tokens_ -= want; // may go negative
                    return;
                }
                wait_seconds = (admit_at - tokens_) / rate_bps_;
            }

            constexpr auto max_slice = std::chrono::milliseconds(50);
            auto sleep_for = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::duration<double>(wait_seconds));
            if (sleep_for.count() <= 0) {
                std::this_thread::yield();
            } else {
                std::this_thread::sleep_for(std::min(sleep_for, max_slice));
            }
        }
    }

private:
    void refill(clock_t::time_point now) {
        const auto dt = std::chrono::duration<double>(now - last_refill_).count();
        if (dt <= 0.0)
            return;
        tokens_ = std::min(capacity_, tokens_ + rate_bps_ * dt);
        last_refill_ = now;
    }

    std::mutex mutex_;
    double rate_bps_{0.0};
    double capacity_{0.0};
    double tokens_{0.0};
    clock_t::time_point last_refill_{clock_t::now()};
};

} // namespace

std::unique_ptr<IRateLimiter> makeRateLimiter() {
    return std::make_unique<TokenBucketLimiter>();
}

} // namespace mediadl::downloader
