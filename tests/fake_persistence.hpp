#pragma once
#include <atomic>
#include <chrono>
#include <thread>

#include "persistence_adapter.hpp"
#include "utils.hpp"

namespace test_helpers {

// Counts applied messages; optionally slow, to keep frames in flight during shutdown.
class CountingPersistence : public IPersistence {
public:
    explicit CountingPersistence(std::chrono::milliseconds delay = std::chrono::milliseconds(0)) : delay_(delay) {}

    CommodityApplyResult apply_commodity_update(const CommodityUpdate& update) override {
        normalize_feed_timestamp(update.timestamp);
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        commodity_updates.fetch_add(1);
        return CommodityApplyResult{update.commodities.size(), 0};
    }

    void apply_system_event(const SystemEvent& event) override {
        if (event.timestamp) {
            normalize_feed_timestamp(*event.timestamp);
        }
        system_events.fetch_add(1);
    }

    std::atomic<int> commodity_updates{0};
    std::atomic<int> system_events{0};

private:
    std::chrono::milliseconds delay_;
};

}  // namespace test_helpers
