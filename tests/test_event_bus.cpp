#include <gtest/gtest.h>
#include "event_bus.hpp"
#include "logger.hpp"

#include <atomic>
#include <thread>
#include <vector>

TEST(EventBus, DeliversOnlyMatchingEventType) {
    EventBus bus;
    int markets = 0;
    int systems = 0;
    bus.subscribe<MarketUpdateEvent>([&markets](const MarketUpdateEvent& e) {
        EXPECT_EQ(e.station_name, "Jameson Memorial");
        ++markets;
    });
    bus.subscribe<SystemUpdateEvent>([&systems](const SystemUpdateEvent&) { ++systems; });

    MarketUpdateEvent market;
    market.station_name = "Jameson Memorial";
    bus.publish(market);
    bus.publish(market);

    EXPECT_EQ(markets, 2);
    EXPECT_EQ(systems, 0);
}

TEST(EventBus, PublishWithoutSubscribersIsHarmless) {
    EventBus bus;
    EXPECT_EQ(bus.subscriber_count<SystemUpdateEvent>(), 0u);
    EXPECT_NO_THROW(bus.publish(SystemUpdateEvent{}));
}

TEST(EventBus, ConcurrentPublishersReachEveryHandler) {
    EventBus bus;
    std::atomic<int> seen{0};
    bus.subscribe<MarketUpdateEvent>([&seen](const MarketUpdateEvent&) { ++seen; });

    std::vector<std::thread> publishers;
    for (int t = 0; t < 8; ++t) {
        publishers.emplace_back([&bus] {
            for (int i = 0; i < 100; ++i) {
                bus.publish(MarketUpdateEvent{});
            }
        });
    }
    for (auto& t : publishers) {
        t.join();
    }
    EXPECT_EQ(seen.load(), 800);
}

TEST(Logger, SubscribesToMarketAndSystemEvents) {
    auto bus = std::make_shared<EventBus>();
    Logger::getInstance().subscribeToBus(bus);
    EXPECT_EQ(bus->subscriber_count<MarketUpdateEvent>(), 1u);
    EXPECT_EQ(bus->subscriber_count<SystemUpdateEvent>(), 1u);

    MarketUpdateEvent market;
    market.system_name = "Shinrarta Dezhra";
    market.station_name = "Jameson Memorial";
    market.market_id = 128666762;
    market.software_name = "EDDiscovery";
    market.software_version = "18.0";
    market.result = CommodityApplyResult{12, 1};

    SystemUpdateEvent system;
    system.star_system = "Achenar";
    system.powerplay_state = "Unoccupied";
    system.software_name = "EDDiscovery";
    system.software_version = "18.0";

    EXPECT_NO_THROW(bus->publish(market));
    EXPECT_NO_THROW(bus->publish(system));
    Logger::getInstance().flush();
}
