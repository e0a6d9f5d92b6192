#include "filter_rules.hpp"

#include <cctype>

namespace {

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

bool is_carrier_station(std::string_view station_name) {
    if (station_name.size() != 7 || station_name[3] != '-') {
        return false;
    }
    for (size_t i = 0; i < station_name.size(); ++i) {
        if (i != 3 && !is_alnum(station_name[i])) {
            return false;
        }
    }
    return true;
}

bool accept_commodity_update(const CommodityUpdate& update) {
    return !is_carrier_station(update.station_name);
}

bool accept_system_event(const SystemEvent& event) {
    if (event.population <= 0) {
        return false;
    }
    const bool has_power = event.controlling_power.has_value() && !event.controlling_power->empty();
    const bool unoccupied = event.powerplay_state.has_value() && *event.powerplay_state == "Unoccupied";
    return has_power || unoccupied;
}
