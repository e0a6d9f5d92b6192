#pragma once
#include <atomic>
#include <memory>
#include <thread>

#include "config.hpp"
#include "event_bus.hpp"
#include "feed_socket.hpp"
#include "feed_subscriber.hpp"
#include "ingest_stats.hpp"
#include "ingestion_queue.hpp"
#include "logger.hpp"
#include "message_processor.hpp"
#include "persistence_adapter.hpp"
#include "shutdown_signal.hpp"
#include "worker_pool.hpp"

/**
 * @class IngestPipeline
 * @brief Wires the subscriber thread, the ingestion queue and the worker pool together.
 *
 * stop() requests shutdown, waits for the subscriber to close the feed, then drains the queue
 * through the workers before returning.
 */
class IngestPipeline {
private:
    Config config_;
    Logger& logger_;
    std::shared_ptr<EventBus> event_bus_;
    ShutdownSignal shutdown_;
    IngestStats stats_;
    IngestionQueue queue_;
    std::unique_ptr<IPersistence> persistence_;
    MessageProcessor processor_;
    FeedSubscriber subscriber_;
    WorkerPool workers_;
    std::thread subscriber_thread_;
    std::atomic<bool> subscriber_failed_{false};
    bool running_ = false;

public:
    IngestPipeline(Config config, FeedSocketFactory socket_factory, std::unique_ptr<IPersistence> persistence,
                   std::shared_ptr<EventBus> event_bus, Logger& logger);
    ~IngestPipeline();

    IngestPipeline(const IngestPipeline&) = delete;
    IngestPipeline& operator=(const IngestPipeline&) = delete;

    // Opens the feed and launches the threads. Throws StartupError when the feed cannot be opened.
    void start();
    void stop();

    // True once the subscriber thread ended with an unexpected exception.
    bool failed() const { return subscriber_failed_.load(std::memory_order_acquire); }

    ShutdownSignal& shutdown_signal() { return shutdown_; }
    const IngestStats& stats() const { return stats_; }
    SubscriberState subscriber_state() const { return subscriber_.state(); }
};
