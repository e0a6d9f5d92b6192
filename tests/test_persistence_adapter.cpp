#include <gtest/gtest.h>
#include "errors.hpp"
#include "persistence_adapter.hpp"
#include "test_helpers.hpp"
#include "trading_store.hpp"

#include <thread>
#include <vector>

using namespace test_helpers;

namespace {

Commodity commodity(const std::string& name, int64_t sell, int64_t demand, int64_t buy, int64_t stock,
                    int64_t mean) {
    Commodity c;
    c.name = name;
    c.sell_price = sell;
    c.demand = demand;
    c.buy_price = buy;
    c.stock = stock;
    c.mean_price = mean;
    return c;
}

CommodityUpdate update_with(std::vector<Commodity> commodities,
                            const std::string& timestamp = "2024-01-01T12:00:00Z") {
    CommodityUpdate update;
    update.system_name = "Shinrarta Dezhra";
    update.station_name = "Jameson Memorial";
    update.market_id = TempTradingStore::STATION_ID;
    update.timestamp = timestamp;
    update.commodities = std::move(commodities);
    return update;
}

SystemEvent system_event(const std::string& name, std::optional<std::string> power,
                         std::optional<std::string> timestamp = std::string("2024-01-01T12:00:00Z")) {
    SystemEvent event;
    event.star_system = name;
    event.population = 1000000;
    event.controlling_power = std::move(power);
    event.timestamp = std::move(timestamp);
    return event;
}

}  // namespace

class PersistenceAdapterTest : public ::testing::Test {
protected:
    TempTradingStore store;
    SqlitePersistenceAdapter adapter{store.config()};
};

// ─── Commodity path ──────────────────────────────────────────────────────────

TEST_F(PersistenceAdapterTest, AppliesStationItemValues) {
    auto result = adapter.apply_commodity_update(update_with({commodity("Tritium", 1500, 200, 1200, 50, 41000)}));
    EXPECT_EQ(result.applied, 1u);
    EXPECT_EQ(result.skipped, 0u);

    StationItemRow row = store.station_item(1);
    EXPECT_EQ(row.demand_price, 1500);
    EXPECT_EQ(row.demand_units, 200);
    EXPECT_EQ(row.supply_price, 1200);
    EXPECT_EQ(row.supply_units, 50);
    EXPECT_EQ(row.demand_level, 0);
    EXPECT_EQ(row.supply_level, 0);
    EXPECT_EQ(row.modified, "2024-01-01 12:00:00");
    EXPECT_EQ(row.from_live, 1);
    EXPECT_EQ(store.avg_price(1), 41000);
}

TEST_F(PersistenceAdapterTest, LeavesOtherItemsUntouched) {
    adapter.apply_commodity_update(update_with({commodity("Tritium", 1500, 200, 1200, 50, 41000)}));

    StationItemRow gold = store.station_item(2);
    EXPECT_EQ(gold.demand_price, 1);
    EXPECT_EQ(gold.demand_level, 3);
    EXPECT_EQ(gold.modified, "2020-01-01 00:00:00");
    EXPECT_EQ(gold.from_live, 0);
    EXPECT_EQ(store.avg_price(2), 9000);
}

TEST_F(PersistenceAdapterTest, LookupIgnoresWhitespace) {
    auto result = adapter.apply_commodity_update(update_with({
        commodity("Tritium ", 10, 20, 30, 40, 50),
        commodity("LowTemperatureDiamonds", 11, 21, 31, 41, 51),
    }));
    EXPECT_EQ(result.applied, 2u);
    EXPECT_EQ(store.station_item(1).demand_price, 10);
    EXPECT_EQ(store.station_item(3).demand_price, 11);
    EXPECT_EQ(store.avg_price(3), 51);
}

TEST_F(PersistenceAdapterTest, LookupIgnoresCase) {
    auto result = adapter.apply_commodity_update(update_with({commodity("tritium", 10, 20, 30, 40, 50)}));
    EXPECT_EQ(result.applied, 1u);
    EXPECT_EQ(store.station_item(1).supply_units, 40);
}

TEST_F(PersistenceAdapterTest, UnknownCommodityIsSkippedOthersApplied) {
    auto result = adapter.apply_commodity_update(update_with({
        commodity("Unobtainium", 1, 1, 1, 1, 1),
        commodity("Gold", 9500, 100, 9200, 10, 9400),
    }));
    EXPECT_EQ(result.applied, 1u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(store.station_item(2).demand_price, 9500);
    EXPECT_EQ(store.avg_price(2), 9400);
}

TEST_F(PersistenceAdapterTest, ItemMissingAtStationCountsAsSkipped) {
    CommodityUpdate update = update_with({commodity("Tritium", 1500, 200, 1200, 50, 41000)});
    update.market_id = 3228342528;

    auto result = adapter.apply_commodity_update(update);
    EXPECT_EQ(result.applied, 0u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(store.station_item(1).demand_price, 1);
    EXPECT_EQ(store.avg_price(1), 41000);
}

TEST_F(PersistenceAdapterTest, WildcardsInNameMatchLiterally) {
    auto result = adapter.apply_commodity_update(update_with({
        commodity("%", 1, 1, 1, 1, 1),
        commodity("Gol_", 1, 1, 1, 1, 1),
    }));
    EXPECT_EQ(result.applied, 0u);
    EXPECT_EQ(result.skipped, 2u);
    EXPECT_EQ(store.avg_price(1), 40000);
    EXPECT_EQ(store.avg_price(2), 9000);
}

TEST_F(PersistenceAdapterTest, ApplyingTwiceMatchesApplyingOnce) {
    const CommodityUpdate update = update_with({commodity("Tritium", 1500, 200, 1200, 50, 41000)});
    adapter.apply_commodity_update(update);
    StationItemRow once = store.station_item(1);

    adapter.apply_commodity_update(update);
    StationItemRow twice = store.station_item(1);

    EXPECT_EQ(once.demand_price, twice.demand_price);
    EXPECT_EQ(once.demand_units, twice.demand_units);
    EXPECT_EQ(once.supply_price, twice.supply_price);
    EXPECT_EQ(once.supply_units, twice.supply_units);
    EXPECT_EQ(once.modified, twice.modified);
    EXPECT_EQ(once.from_live, twice.from_live);
    EXPECT_EQ(store.avg_price(1), 41000);
}

TEST_F(PersistenceAdapterTest, MalformedTimestampWritesNothing) {
    EXPECT_THROW(adapter.apply_commodity_update(
                     update_with({commodity("Tritium", 1500, 200, 1200, 50, 41000)}, "2024-01-01 12:00")),
                 TimestampError);

    StationItemRow row = store.station_item(1);
    EXPECT_EQ(row.demand_price, 1);
    EXPECT_EQ(row.modified, "2020-01-01 00:00:00");
    EXPECT_EQ(store.avg_price(1), 40000);

    // The next message goes through as usual.
    auto result = adapter.apply_commodity_update(update_with({commodity("Tritium", 7, 7, 7, 7, 7)}));
    EXPECT_EQ(result.applied, 1u);
    EXPECT_EQ(store.station_item(1).demand_price, 7);
}

TEST_F(PersistenceAdapterTest, StoreFailureRollsBackWholeMessage) {
    // Gold's avg_price update fails half way through the message.
    store.exec("CREATE TRIGGER reject_gold BEFORE UPDATE OF avg_price ON Item WHEN NEW.item_id = 2 "
               "BEGIN SELECT RAISE(ABORT, 'gold is read-only'); END;");

    EXPECT_THROW(adapter.apply_commodity_update(update_with({
                     commodity("Tritium", 1500, 200, 1200, 50, 41000),
                     commodity("Gold", 9500, 100, 9200, 10, 9400),
                 })),
                 PersistenceError);

    EXPECT_EQ(store.station_item(1).demand_price, 1);
    EXPECT_EQ(store.avg_price(1), 40000);
    EXPECT_EQ(store.station_item(2).demand_price, 1);
}

TEST_F(PersistenceAdapterTest, MissingDatabase_Throws) {
    StoreConfig missing;
    missing.database_path = store.path() + ".missing";
    SqlitePersistenceAdapter broken(missing);
    EXPECT_THROW(broken.apply_commodity_update(update_with({commodity("Tritium", 1, 1, 1, 1, 1)})),
                 PersistenceError);
}

TEST_F(PersistenceAdapterTest, ConcurrentUpdatesNeverMixFields) {
    const CommodityUpdate first = update_with({commodity("Tritium", 1111, 111, 1110, 11, 1001)},
                                              "2024-01-01T12:00:00Z");
    const CommodityUpdate second = update_with({commodity("Tritium", 2222, 222, 2220, 22, 2002)},
                                               "2024-01-01T13:00:00Z");

    for (int round = 0; round < 10; ++round) {
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&, i] {
                SqlitePersistenceAdapter worker(store.config());
                worker.apply_commodity_update(i % 2 == 0 ? first : second);
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        StationItemRow row = store.station_item(1);
        const int64_t avg = store.avg_price(1);
        if (row.demand_price == 1111) {
            EXPECT_EQ(row.demand_units, 111);
            EXPECT_EQ(row.supply_price, 1110);
            EXPECT_EQ(row.supply_units, 11);
            EXPECT_EQ(row.modified, "2024-01-01 12:00:00");
            EXPECT_EQ(avg, 1001);
        } else {
            EXPECT_EQ(row.demand_price, 2222);
            EXPECT_EQ(row.demand_units, 222);
            EXPECT_EQ(row.supply_price, 2220);
            EXPECT_EQ(row.supply_units, 22);
            EXPECT_EQ(row.modified, "2024-01-01 13:00:00");
            EXPECT_EQ(avg, 2002);
        }
    }
}

// ─── System path ─────────────────────────────────────────────────────────────

TEST_F(PersistenceAdapterTest, SetsControllingPowerAndModified) {
    adapter.apply_system_event(system_event("Sol", "Felicia Winters"));
    EXPECT_EQ(store.system_power("Sol"), "Felicia Winters");
    EXPECT_EQ(store.system_modified("Sol"), "2024-01-01 12:00:00");
    EXPECT_EQ(store.system_modified("Achenar"), "2020-01-01 00:00:00");
}

TEST_F(PersistenceAdapterTest, SystemNameMatchIsCaseInsensitive) {
    adapter.apply_system_event(system_event("ACHENAR", "Zemina Torval"));
    EXPECT_EQ(store.system_power("Achenar"), "Zemina Torval");
}

TEST_F(PersistenceAdapterTest, UnoccupiedSystemClearsPower) {
    adapter.apply_system_event(system_event("Sol", std::nullopt));
    EXPECT_FALSE(store.system_power("Sol").has_value());
    EXPECT_EQ(store.system_modified("Sol"), "2024-01-01 12:00:00");
}

TEST_F(PersistenceAdapterTest, UnknownSystemIsTolerated) {
    EXPECT_NO_THROW(adapter.apply_system_event(system_event("Colonia", "Archon Delaine")));
}

TEST_F(PersistenceAdapterTest, SystemEventWithoutTimestamp_Throws) {
    EXPECT_THROW(adapter.apply_system_event(system_event("Sol", "Felicia Winters", std::nullopt)),
                 TimestampError);
    EXPECT_EQ(store.system_power("Sol"), "Zachary Hudson");
}

TEST_F(PersistenceAdapterTest, SystemEventWithMalformedTimestamp_Throws) {
    EXPECT_THROW(adapter.apply_system_event(system_event("Sol", "Felicia Winters", std::string("yesterday"))),
                 TimestampError);
    EXPECT_EQ(store.system_power("Sol"), "Zachary Hudson");
}

// ─── Store probe and helpers ─────────────────────────────────────────────────

TEST_F(PersistenceAdapterTest, VerifyAcceptsTradingStore) {
    EXPECT_NO_THROW(verify_trading_store(store.config()));
}

TEST_F(PersistenceAdapterTest, VerifyRejectsForeignDatabase) {
    store.exec("DROP TABLE System;");
    EXPECT_THROW(verify_trading_store(store.config()), StartupError);
}

TEST(TradingStoreProbe, VerifyRejectsMissingFile) {
    StoreConfig cfg;
    cfg.database_path = "/nonexistent/dir/TradeDangerous.db";
    EXPECT_THROW(verify_trading_store(cfg), StartupError);
}

TEST(EscapeLikePattern, EscapesWildcards) {
    EXPECT_EQ(escape_like_pattern("Tritium"), "Tritium");
    EXPECT_EQ(escape_like_pattern("50%_off\\"), "50\\%\\_off\\\\");
}
