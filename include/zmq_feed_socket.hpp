#pragma once
#include <optional>
#include <string>

#include <zmq.hpp>

#include "feed_socket.hpp"

// ZeroMQ SUB socket subscribed to all topics of a relay.
class ZmqFeedSocket : public IFeedSocket {
private:
    FeedConfig config_;
    std::optional<zmq::context_t> ctx_;
    std::optional<zmq::socket_t> sub_;

public:
    explicit ZmqFeedSocket(FeedConfig config);
    ~ZmqFeedSocket() noexcept override;

    void open() override;
    bool poll(std::chrono::milliseconds timeout) override;
    std::optional<RawFrame> receive() override;
    void close() override;
    std::string endpoint() const override { return config_.endpoint; }
};

FeedSocketFactory make_zmq_socket_factory(const FeedConfig& config);
