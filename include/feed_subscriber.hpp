#pragma once
#include <atomic>
#include <memory>

#include "config.hpp"
#include "feed_socket.hpp"
#include "ingest_stats.hpp"
#include "ingestion_queue.hpp"
#include "logger.hpp"
#include "shutdown_signal.hpp"

enum class SubscriberState {
    Connecting,
    Subscribed,
    Polling,
    Enqueuing,
    Closing,
    Closed
};

const char* to_string(SubscriberState state);

/**
 * @class FeedSubscriber
 * @brief Network-facing side of the pipeline: polls the feed and enqueues frames in arrival order.
 *
 * Connecting -> Subscribed -> {Polling <-> Enqueuing} -> Closing -> Closed.
 * A full queue blocks the loop (frames are never dropped). Poll/receive errors are treated as
 * transient: the loop backs off and retries. The loop ends after the cycle in which shutdown is
 * observed, then closes the socket.
 */
class FeedSubscriber {
private:
    std::unique_ptr<IFeedSocket> socket_;
    IngestionQueue& queue_;
    ShutdownSignal& shutdown_;
    IngestStats& stats_;
    Logger& logger_;
    FeedConfig config_;
    std::atomic<SubscriberState> state_{SubscriberState::Closed};

    void set_state(SubscriberState state) { state_.store(state, std::memory_order_release); }
    void poll_cycle();
    void enqueue(RawFrame&& frame);
    void close();

public:
    FeedSubscriber(std::unique_ptr<IFeedSocket> socket, IngestionQueue& queue, ShutdownSignal& shutdown,
                   IngestStats& stats, Logger& logger, FeedConfig config);
    ~FeedSubscriber();

    FeedSubscriber(const FeedSubscriber&) = delete;
    FeedSubscriber& operator=(const FeedSubscriber&) = delete;

    // Throws StartupError when the feed cannot be opened.
    void open();

    // Blocks until shutdown is requested. open() must have succeeded.
    void run();

    SubscriberState state() const { return state_.load(std::memory_order_acquire); }
};
