#include "zmq_feed_socket.hpp"
#include "errors.hpp"

#include <cerrno>
#include <utility>

ZmqFeedSocket::ZmqFeedSocket(FeedConfig config)
    : config_(std::move(config)) {}

ZmqFeedSocket::~ZmqFeedSocket() noexcept {
    close();
}

void ZmqFeedSocket::open() {
    try {
        ctx_.emplace(1);
        sub_.emplace(*ctx_, zmq::socket_type::sub);

        sub_->set(zmq::sockopt::rcvhwm, config_.receive_high_water_mark);
        sub_->set(zmq::sockopt::linger, 0);
        sub_->set(zmq::sockopt::subscribe, "");
        sub_->connect(config_.endpoint);
    } catch (const zmq::error_t& e) {
        sub_.reset();
        ctx_.reset();
        throw StartupError("cannot subscribe to " + config_.endpoint + ": " + e.what());
    }
}

bool ZmqFeedSocket::poll(std::chrono::milliseconds timeout) {
    if (!sub_) {
        throw TransientIOError("socket is not open");
    }
    zmq::pollitem_t items[] = {{sub_->handle(), 0, ZMQ_POLLIN, 0}};
    try {
        zmq::poll(items, 1, timeout);
    } catch (const zmq::error_t& e) {
        // A signal (Ctrl+C) interrupted the wait; let the caller re-check for shutdown.
        if (e.num() == EINTR) {
            return false;
        }
        throw TransientIOError(std::string("poll failed: ") + e.what());
    }
    return (items[0].revents & ZMQ_POLLIN) != 0;
}

std::optional<RawFrame> ZmqFeedSocket::receive() {
    if (!sub_) {
        throw TransientIOError("socket is not open");
    }
    try {
        zmq::message_t msg;
        if (!sub_->recv(msg, zmq::recv_flags::dontwait)) {
            return std::nullopt;
        }
        RawFrame frame(static_cast<const char*>(msg.data()), msg.size());

        // One message per frame; trailing parts are not part of the feed contract.
        while (sub_->get(zmq::sockopt::rcvmore)) {
            zmq::message_t extra;
            if (!sub_->recv(extra, zmq::recv_flags::dontwait)) {
                break;
            }
        }
        return frame;
    } catch (const zmq::error_t& e) {
        if (e.num() == EINTR) {
            return std::nullopt;
        }
        throw TransientIOError(std::string("receive failed: ") + e.what());
    }
}

void ZmqFeedSocket::close() {
    if (sub_) {
        sub_->close();
        sub_.reset();
    }
    if (ctx_) {
        ctx_->close();
        ctx_.reset();
    }
}

FeedSocketFactory make_zmq_socket_factory(const FeedConfig& config) {
    return [config]() -> std::unique_ptr<IFeedSocket> {
        return std::make_unique<ZmqFeedSocket>(config);
    };
}
