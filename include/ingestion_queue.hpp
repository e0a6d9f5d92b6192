#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

#include "types.hpp"

/**
 * @class BoundedQueue
 * @brief Fixed-capacity FIFO ring shared by one producer and many consumers.
 *
 * Producers block (or time out) while the ring is full, consumers block (or time out)
 * while it is empty. Nothing is ever dropped.
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : capacity_(capacity), buffer_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be greater than zero");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool try_push(T&& value) {
        std::unique_lock<std::mutex> lock(mutex_);
        ensure_open();
        if (count_ == capacity_) {
            return false; // Full
        }
        enqueue(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    // Blocks until a slot frees up.
    void push(T&& value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return count_ < capacity_ || closed_; });
        ensure_open();
        enqueue(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
    }

    // Returns false on timeout; value is left untouched in that case.
    template<typename Rep, typename Period>
    bool push_for(T&& value, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, timeout, [this] { return count_ < capacity_ || closed_; })) {
            return false;
        }
        ensure_open();
        enqueue(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool try_pop(T& value) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (count_ == 0) {
            return false; // Empty
        }
        dequeue(value);
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    // Returns false on timeout, or immediately once the queue is closed and drained.
    template<typename Rep, typename Period>
    bool pop_for(T& value, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return count_ > 0 || closed_; })) {
            return false;
        }
        if (count_ == 0) {
            return false;
        }
        dequeue(value);
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    // No further pushes. Remaining entries can still be popped.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }

private:
    void ensure_open() const {
        if (closed_) {
            throw std::logic_error("push on a closed BoundedQueue");
        }
    }

    void enqueue(T&& value) {
        buffer_[tail_] = std::move(value);
        tail_ = (tail_ + 1) % capacity_;
        ++count_;
    }

    void dequeue(T& value) {
        value = std::move(buffer_[head_]);
        buffer_[head_] = T{};
        head_ = (head_ + 1) % capacity_;
        --count_;
    }

    const size_t capacity_;
    std::vector<T> buffer_;
    size_t head_ = 0;
    size_t tail_ = 0;
    size_t count_ = 0;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

// An empty entry is the "no more work" sentinel; each worker consumes exactly one.
using QueueEntry = std::optional<RawFrame>;
using IngestionQueue = BoundedQueue<QueueEntry>;

inline QueueEntry make_stop_sentinel() { return std::nullopt; }

inline bool is_stop_sentinel(const QueueEntry& entry) { return !entry.has_value(); }
