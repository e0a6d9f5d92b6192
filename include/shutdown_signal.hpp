#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @class ShutdownSignal
 * @brief Process-wide cancellation context shared by the subscriber loop and the worker pool.
 *
 * Stop is one-way: once requested it stays requested. wait_for() doubles as an
 * interruptible sleep for backoff and idle periods.
 */
class ShutdownSignal {
public:
    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool stop_requested() const {
        return stop_requested_.load(std::memory_order_acquire);
    }

    // Sleeps for up to timeout. Returns true if stop was requested.
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stop_requested_.load(std::memory_order_acquire); });
    }

private:
    std::atomic<bool> stop_requested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
