#include <gtest/gtest.h>
#include "errors.hpp"
#include "zmq_feed_socket.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

#include <pthread.h>

using namespace std::chrono_literals;

namespace {

void ignore_signal(int) {}

FeedConfig unreachable_feed() {
    FeedConfig cfg;
    // Connects lazily; nothing ever publishes here.
    cfg.endpoint = "tcp://127.0.0.1:1";
    return cfg;
}

}  // namespace

TEST(ZmqFeedSocket, PollBeforeOpen_Throws) {
    ZmqFeedSocket socket(unreachable_feed());
    EXPECT_THROW(socket.poll(10ms), TransientIOError);
    EXPECT_THROW(socket.receive(), TransientIOError);
}

TEST(ZmqFeedSocket, UnsupportedEndpoint_ThrowsStartupError) {
    FeedConfig cfg;
    cfg.endpoint = "carrier-pigeon://relay";
    ZmqFeedSocket socket(cfg);
    EXPECT_THROW(socket.open(), StartupError);
}

TEST(ZmqFeedSocket, QuietFeedPollsEmpty) {
    ZmqFeedSocket socket(unreachable_feed());
    socket.open();
    EXPECT_FALSE(socket.poll(20ms));
    EXPECT_FALSE(socket.receive().has_value());
    socket.close();
}

TEST(ZmqFeedSocket, SignalDuringPollReturnsEmptyWithoutError) {
    // No SA_RESTART, so the signal interrupts zmq_poll with EINTR.
    struct sigaction action {};
    struct sigaction previous {};
    action.sa_handler = ignore_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    ASSERT_EQ(sigaction(SIGUSR1, &action, &previous), 0);

    ZmqFeedSocket socket(unreachable_feed());
    socket.open();

    std::atomic<bool> polling{false};
    std::atomic<bool> done{false};
    bool readable = true;
    bool threw = false;
    std::chrono::steady_clock::duration elapsed{};

    std::thread poller([&] {
        polling = true;
        auto start = std::chrono::steady_clock::now();
        try {
            readable = socket.poll(5000ms);
        } catch (const TransientIOError&) {
            threw = true;
        }
        elapsed = std::chrono::steady_clock::now() - start;
        done = true;
    });

    while (!polling) {
        std::this_thread::sleep_for(1ms);
    }
    // Keep signalling in case the first one lands before the poll starts waiting.
    auto deadline = std::chrono::steady_clock::now() + 3000ms;
    while (!done && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
        if (!done) {
            pthread_kill(poller.native_handle(), SIGUSR1);
        }
    }
    poller.join();
    socket.close();
    sigaction(SIGUSR1, &previous, nullptr);

    EXPECT_FALSE(threw);
    EXPECT_FALSE(readable);
    EXPECT_LT(elapsed, std::chrono::steady_clock::duration(3500ms));
}
