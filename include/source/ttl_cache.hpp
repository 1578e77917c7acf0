#pragma once

#include "stats/timestamp.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace cred {

// Source of the current time; injectable for tests
using ClockFn = std::function<TimePoint()>;

inline TimePoint system_now() {
    return Clock::now();
}

/**
 * @brief Single-value get-or-compute cache with a time-to-live
 *
 * The mutex guards only the stored value. The compute callback runs
 * outside the lock, so two callers racing on an expired entry may both
 * recompute; the last writer wins. Callers must supply an idempotent
 * computation.
 */
template <typename T>
class TtlCache {
public:
    explicit TtlCache(std::chrono::milliseconds ttl, ClockFn clock = system_now)
        : ttl_(ttl), clock_(std::move(clock)) {}

    template <typename Compute>
    T get_or_compute(Compute&& compute) {
        TimePoint now = clock_();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (value_ && now < expires_at_) {
                return *value_;
            }
        }

        T fresh = compute();

        std::lock_guard<std::mutex> lock(mutex_);
        value_ = fresh;
        expires_at_ = now + std::chrono::duration_cast<Clock::duration>(ttl_);
        ++refresh_count_;
        return fresh;
    }

    void invalidate() {
        std::lock_guard<std::mutex> lock(mutex_);
        value_.reset();
    }

    std::optional<T> peek() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    size_t refresh_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return refresh_count_;
    }

    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    std::chrono::milliseconds ttl_;
    ClockFn clock_;
    mutable std::mutex mutex_;
    std::optional<T> value_;
    TimePoint expires_at_;
    size_t refresh_count_ = 0;
};

} // namespace cred
