#pragma once
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "ingestion_queue.hpp"
#include "logger.hpp"
#include "message_processor.hpp"
#include "shutdown_signal.hpp"

/**
 * @class WorkerPool
 * @brief Fixed set of symmetric workers draining the ingestion queue in FIFO order.
 *
 * Each worker stops after consuming exactly one stop sentinel, so every frame enqueued before
 * the sentinels is processed. Processing order across workers is not guaranteed.
 */
class WorkerPool {
private:
    IngestionQueue& queue_;
    MessageProcessor& processor_;
    ShutdownSignal& shutdown_;
    Logger& logger_;
    size_t worker_count_;
    std::chrono::milliseconds dequeue_timeout_;
    std::vector<std::thread> workers_;
    std::atomic<size_t> active_workers_{0};
    bool running_ = false;

    void worker_loop(size_t worker_id);

public:
    WorkerPool(IngestionQueue& queue, MessageProcessor& processor, ShutdownSignal& shutdown, Logger& logger,
               size_t worker_count, std::chrono::milliseconds dequeue_timeout);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    // Enqueues one sentinel per worker, closes the queue and joins every worker.
    void stop();

    size_t worker_count() const { return worker_count_; }
    size_t active_workers() const { return active_workers_.load(std::memory_order_acquire); }
};
