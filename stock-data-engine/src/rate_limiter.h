#pragma once

#include <chrono>
#include <mutex>
#include <thread>

namespace sde {

/// Fixed-window limiter: at most `calls` acquisitions per `period`.
/// Callers over the limit are booked into the next free window and sleep
/// until it opens. Thread-safe.
class RateLimiter {
public:
    using clock = std::chrono::steady_clock;

    RateLimiter(int calls, clock::duration period)
        : calls_(calls > 0 ? calls : 1), period_(period) {}

    void acquire() {
        auto wait = reserve(clock::now());
        if (wait > clock::duration::zero()) std::this_thread::sleep_for(wait);
    }

    /// Books one call at `now` and returns how long the caller must wait.
    clock::duration reserve(clock::time_point now) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!started_ || now >= window_start_ + period_) {
            window_start_ = now;
            used_ = 0;
            started_ = true;
        }
        while (used_ >= calls_) {
            window_start_ += period_;
            used_ = 0;
        }
        used_++;
        return window_start_ > now ? window_start_ - now : clock::duration::zero();
    }

private:
    const int calls_;
    const clock::duration period_;

    std::mutex mtx_;
    bool started_ = false;
    clock::time_point window_start_;
    int used_ = 0;
};

} // namespace sde
