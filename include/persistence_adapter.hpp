#pragma once
#include <string>
#include <string_view>

#include "config.hpp"
#include "types.hpp"

/**
 * @class IPersistence
 * @brief Applies accepted messages to the trading store.
 *
 * Implementations must be safe to call from several workers at once.
 */
class IPersistence {
public:
    virtual ~IPersistence() = default;

    /**
     * @brief Updates StationItem and Item rows for every known commodity in the update.
     *
     * Unknown commodity names are skipped without affecting the rest of the message. A known
     * commodity the station has no StationItem row for still updates Item.avg_price but counts
     * as skipped.
     * @throws TimestampError before any write when the timestamp is malformed.
     * @throws PersistenceError when the store fails; nothing from the message is kept.
     */
    virtual CommodityApplyResult apply_commodity_update(const CommodityUpdate& update) = 0;

    /**
     * @brief Sets the controlling power and modified time of the matching System rows.
     * @throws TimestampError before any write when the timestamp is absent or malformed.
     * @throws PersistenceError when the store fails.
     */
    virtual void apply_system_event(const SystemEvent& event) = 0;
};

/**
 * @class SqlitePersistenceAdapter
 * @brief IPersistence over a TradeDangerous SQLite database.
 *
 * Every call opens its own connection and transaction, so workers share nothing.
 * Concurrent messages for the same row are applied in commit order (latest applied wins),
 * not in timestamp order.
 */
class SqlitePersistenceAdapter : public IPersistence {
public:
    explicit SqlitePersistenceAdapter(StoreConfig config);

    CommodityApplyResult apply_commodity_update(const CommodityUpdate& update) override;
    void apply_system_event(const SystemEvent& event) override;

    const StoreConfig& config() const { return config_; }

private:
    StoreConfig config_;
};

// Escapes LIKE wildcards ('%', '_') and the escape character itself with a backslash.
std::string escape_like_pattern(std::string_view text);
