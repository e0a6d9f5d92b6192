#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <variant>
#include <optional>

// One compressed frame as received from the feed.
using RawFrame = std::string;

struct Header {
    std::string uploader_id;
    std::string software_name;
    std::string software_version;
    std::optional<std::string> game_version;
    std::optional<std::string> game_build;
    std::optional<std::string> gateway_timestamp;
};

struct Economy {
    std::string name;
    double proportion = 0.0;
};

struct Commodity {
    std::string name;
    int64_t mean_price = 0;
    int64_t buy_price = 0;
    int64_t stock = 0;
    int64_t sell_price = 0;
    int64_t demand = 0;
    std::optional<std::vector<std::string>> status_flags;
};

struct CommodityUpdate {
    std::string system_name;
    std::string station_name;
    int64_t market_id = 0;
    std::string timestamp;
    std::vector<Commodity> commodities;
    std::optional<std::string> station_type;
    std::optional<std::string> carrier_docking_access;
    std::optional<bool> horizons;
    std::optional<bool> odyssey;
    std::optional<std::vector<Economy>> economies;
    std::optional<std::vector<std::string>> prohibited;
};

struct SystemEvent {
    std::string star_system;
    std::optional<std::string> event;
    std::optional<std::string> timestamp;
    std::optional<std::vector<double>> star_pos;
    int64_t system_address = 0;
    std::optional<std::string> system_allegiance;
    std::optional<std::string> system_security;
    int64_t population = 0;
    std::optional<std::vector<std::string>> powers;
    std::optional<std::string> controlling_power;
    std::optional<std::string> powerplay_state;
};

using MessageBody = std::variant<CommodityUpdate, SystemEvent>;

struct Envelope {
    std::string schema_ref;
    Header header;
    MessageBody message;
};

// What the store reported for one persisted commodity update.
struct CommodityApplyResult {
    std::size_t applied = 0;
    std::size_t skipped = 0;
};

struct Event {};

struct MarketUpdateEvent : Event {
    std::string system_name;
    std::string station_name;
    int64_t market_id = 0;
    std::string software_name;
    std::string software_version;
    CommodityApplyResult result;
};

struct SystemUpdateEvent : Event {
    std::string star_system;
    std::optional<std::string> controlling_power;
    std::optional<std::string> powerplay_state;
    std::string software_name;
    std::string software_version;
};
