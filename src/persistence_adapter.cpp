#include "persistence_adapter.hpp"
#include "trading_store.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <utility>

namespace {

constexpr const char* SELECT_ITEM_SQL =
    "SELECT item_id FROM Item WHERE REPLACE(name, ' ', '') LIKE ? ESCAPE '\\'";

constexpr const char* UPDATE_STATION_ITEM_SQL =
    "UPDATE StationItem SET demand_price = ?, demand_units = ?, demand_level = 0, "
    "supply_price = ?, supply_units = ?, supply_level = 0, "
    "modified = ?, from_live = 1 "
    "WHERE station_id = ? AND item_id = ?";

constexpr const char* UPDATE_ITEM_AVG_PRICE_SQL =
    "UPDATE Item SET avg_price = ? WHERE item_id = ?";

constexpr const char* UPDATE_SYSTEM_POWER_SQL =
    "UPDATE System SET power = ?, modified = ? WHERE name LIKE ? ESCAPE '\\'";

}  // namespace

std::string escape_like_pattern(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

SqlitePersistenceAdapter::SqlitePersistenceAdapter(StoreConfig config)
    : config_(std::move(config)) {}

CommodityApplyResult SqlitePersistenceAdapter::apply_commodity_update(const CommodityUpdate& update) {
    // Validate before touching the store.
    const std::string modified = normalize_feed_timestamp(update.timestamp);

    CommodityApplyResult result;
    SqliteConnection connection(config_);
    SqliteTransaction transaction(connection);

    SqliteStatement select_item = connection.prepare(SELECT_ITEM_SQL);
    SqliteStatement update_station_item = connection.prepare(UPDATE_STATION_ITEM_SQL);
    SqliteStatement update_avg_price = connection.prepare(UPDATE_ITEM_AVG_PRICE_SQL);

    for (const Commodity& commodity : update.commodities) {
        select_item.bind(1, escape_like_pattern(strip_whitespace(commodity.name)));
        const bool found = select_item.step();
        const int64_t item_id = found ? select_item.column_int64(0) : 0;
        select_item.reset();

        if (!found) {
            ++result.skipped;
            continue;
        }

        // The store's demand side is what the station buys (our sell price), supply is what it sells.
        update_station_item.bind(1, commodity.sell_price);
        update_station_item.bind(2, commodity.demand);
        update_station_item.bind(3, commodity.buy_price);
        update_station_item.bind(4, commodity.stock);
        update_station_item.bind(5, std::string_view(modified));
        update_station_item.bind(6, update.market_id);
        update_station_item.bind(7, item_id);
        update_station_item.step();
        update_station_item.reset();
        const bool station_has_item = connection.changes() > 0;

        update_avg_price.bind(1, commodity.mean_price);
        update_avg_price.bind(2, item_id);
        update_avg_price.step();
        update_avg_price.reset();

        if (station_has_item) {
            ++result.applied;
        } else {
            ++result.skipped;
        }
    }

    transaction.commit();
    return result;
}

void SqlitePersistenceAdapter::apply_system_event(const SystemEvent& event) {
    if (!event.timestamp) {
        throw TimestampError("system event for '" + event.star_system + "' has no timestamp");
    }
    const std::string modified = normalize_feed_timestamp(*event.timestamp);

    SqliteConnection connection(config_);
    SqliteTransaction transaction(connection);

    SqliteStatement update_system = connection.prepare(UPDATE_SYSTEM_POWER_SQL);
    update_system.bind_optional(1, event.controlling_power);
    update_system.bind(2, std::string_view(modified));
    update_system.bind(3, escape_like_pattern(event.star_system));
    update_system.step();

    transaction.commit();
}
