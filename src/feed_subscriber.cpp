#include "feed_subscriber.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <utility>

const char* to_string(SubscriberState state) {
    switch (state) {
        case SubscriberState::Connecting: return "connecting";
        case SubscriberState::Subscribed: return "subscribed";
        case SubscriberState::Polling: return "polling";
        case SubscriberState::Enqueuing: return "enqueuing";
        case SubscriberState::Closing: return "closing";
        case SubscriberState::Closed: return "closed";
    }
    return "unknown";
}

FeedSubscriber::FeedSubscriber(std::unique_ptr<IFeedSocket> socket, IngestionQueue& queue,
                               ShutdownSignal& shutdown, IngestStats& stats, Logger& logger, FeedConfig config)
    : socket_(std::move(socket)), queue_(queue), shutdown_(shutdown), stats_(stats), logger_(logger),
      config_(std::move(config)) {
    if (!socket_) {
        throw std::invalid_argument("FeedSubscriber requires a socket");
    }
}

FeedSubscriber::~FeedSubscriber() {
    close();
}

void FeedSubscriber::open() {
    set_state(SubscriberState::Connecting);
    try {
        socket_->open();
    } catch (const StartupError&) {
        set_state(SubscriberState::Closed);
        throw;
    }
    set_state(SubscriberState::Subscribed);
    logger_.logInfo("Subscribed to EDDN relay at " + socket_->endpoint());
}

void FeedSubscriber::run() {
    if (state() != SubscriberState::Subscribed) {
        throw std::logic_error("FeedSubscriber::run() called before open()");
    }

    while (!shutdown_.stop_requested()) {
        try {
            poll_cycle();
        } catch (const TransientIOError& e) {
            IngestStats::bump(stats_.transient_io_errors);
            logger_.logWarn(std::string("Error receiving message: ") + e.what());
            shutdown_.wait_for(config_.error_backoff);
        }
    }

    close();
}

void FeedSubscriber::poll_cycle() {
    set_state(SubscriberState::Polling);
    const bool readable = socket_->poll(config_.poll_timeout);

    if (shutdown_.stop_requested()) {
        return;
    }

    if (!readable) {
        shutdown_.wait_for(config_.idle_sleep);
        return;
    }

    std::optional<RawFrame> frame = socket_->receive();
    if (frame) {
        set_state(SubscriberState::Enqueuing);
        IngestStats::bump(stats_.frames_received);
        enqueue(std::move(*frame));
    }
}

void FeedSubscriber::enqueue(RawFrame&& frame) {
    QueueEntry entry(std::move(frame));
    if (queue_.try_push(std::move(entry))) {
        return;
    }

    // Workers keep draining during shutdown, so waiting here always terminates.
    IngestStats::bump(stats_.backpressure_waits);
    logger_.logWarn("Ingestion queue full (" + std::to_string(queue_.capacity()) + " frames), waiting for workers");
    while (!queue_.push_for(std::move(entry), config_.poll_timeout)) {
        logger_.logDebug("Still waiting for space in the ingestion queue");
    }
}

void FeedSubscriber::close() {
    if (state() == SubscriberState::Closed) {
        return;
    }
    set_state(SubscriberState::Closing);
    socket_->close();
    set_state(SubscriberState::Closed);
    logger_.logInfo("Unsubscribed from " + socket_->endpoint());
}
