#include "worker_pool.hpp"

#include <stdexcept>

WorkerPool::WorkerPool(IngestionQueue& queue, MessageProcessor& processor, ShutdownSignal& shutdown,
                       Logger& logger, size_t worker_count, std::chrono::milliseconds dequeue_timeout)
    : queue_(queue), processor_(processor), shutdown_(shutdown), logger_(logger),
      worker_count_(worker_count), dequeue_timeout_(dequeue_timeout) {
    if (worker_count_ == 0) {
        throw std::invalid_argument("WorkerPool needs at least one worker");
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_) {
        logger_.logWarn("WorkerPool already running!");
        return;
    }
    running_ = true;

    workers_.reserve(worker_count_);
    for (size_t i = 0; i < worker_count_; ++i) {
        active_workers_.fetch_add(1, std::memory_order_acq_rel);
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
    logger_.logInfo("WorkerPool started with " + std::to_string(worker_count_) + " workers.");
}

void WorkerPool::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    // Sentinels queue up behind any frames still pending, so those are processed first.
    for (size_t i = 0; i < worker_count_; ++i) {
        queue_.push(make_stop_sentinel());
    }
    queue_.close();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    logger_.logInfo("WorkerPool stopped.");
}

void WorkerPool::worker_loop(size_t worker_id) {
    QueueEntry entry;
    for (;;) {
        if (!queue_.pop_for(entry, dequeue_timeout_)) {
            // Nothing left and nothing more coming.
            if (shutdown_.stop_requested() && queue_.closed() && queue_.empty()) {
                break;
            }
            continue;
        }
        if (is_stop_sentinel(entry)) {
            break;
        }
        processor_.process(*entry);
        entry.reset();
    }
    active_workers_.fetch_sub(1, std::memory_order_acq_rel);
    logger_.logDebug("Worker " + std::to_string(worker_id) + " stopped.");
}
