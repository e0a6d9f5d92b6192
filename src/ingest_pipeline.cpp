#include "ingest_pipeline.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <utility>

namespace {

std::unique_ptr<IFeedSocket> make_socket(const FeedSocketFactory& factory) {
    if (!factory) {
        throw std::invalid_argument("IngestPipeline requires a feed socket factory");
    }
    return factory();
}

std::unique_ptr<IPersistence> require_persistence(std::unique_ptr<IPersistence> persistence) {
    if (!persistence) {
        throw std::invalid_argument("IngestPipeline requires a persistence adapter");
    }
    return persistence;
}

}  // namespace

IngestPipeline::IngestPipeline(Config config, FeedSocketFactory socket_factory,
                               std::unique_ptr<IPersistence> persistence, std::shared_ptr<EventBus> event_bus,
                               Logger& logger)
    : config_(std::move(config)),
      logger_(logger),
      event_bus_(std::move(event_bus)),
      queue_(config_.pipeline.queue_capacity),
      persistence_(require_persistence(std::move(persistence))),
      processor_(*persistence_, event_bus_, stats_, logger_),
      subscriber_(make_socket(socket_factory), queue_, shutdown_, stats_, logger_, config_.feed),
      workers_(queue_, processor_, shutdown_, logger_, config_.pipeline.worker_count,
               config_.pipeline.dequeue_timeout) {}

IngestPipeline::~IngestPipeline() {
    stop();
}

void IngestPipeline::start() {
    if (running_) {
        logger_.logWarn("IngestPipeline already running!");
        return;
    }

    subscriber_.open();
    running_ = true;

    workers_.start();

    // Launch subscriber thread
    subscriber_thread_ = std::thread([this] {
        try {
            this->subscriber_.run();
        } catch (const std::exception& e) {
            logger_.logError(std::string("Subscriber thread exception: ") + e.what());
            subscriber_failed_.store(true, std::memory_order_release);
            shutdown_.request_stop();
        }
    });

    // Pin the network I/O thread when asked to.
    if (config_.feed.subscriber_cpu && subscriber_thread_.joinable()) {
        if (pin_thread_to_cpu(subscriber_thread_, *config_.feed.subscriber_cpu)) {
            logger_.logInfo("Pinned subscriber thread to CPU " + std::to_string(*config_.feed.subscriber_cpu) + ".");
        }
    }

    logger_.logInfo("IngestPipeline started with feed subscriber and " +
                    std::to_string(workers_.worker_count()) + " workers.");
}

void IngestPipeline::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    // Stop the subscriber first so no new frames arrive, then drain the queue.
    shutdown_.request_stop();
    if (subscriber_thread_.joinable()) {
        subscriber_thread_.join();
        logger_.logInfo("Subscriber thread stopped.");
    }

    workers_.stop();

    logger_.logInfo("IngestPipeline stopped. " + stats_.snapshot().summary());
}
