#pragma once
#include <string_view>

#include "types.hpp"

// Fleet carrier callsign: three alphanumerics, a hyphen, three alphanumerics (e.g. "J1X-7QP").
bool is_carrier_station(std::string_view station_name);

// Carrier markets are transient and never persisted.
bool accept_commodity_update(const CommodityUpdate& update);

// Populated systems that are either controlled by a power or unoccupied.
bool accept_system_event(const SystemEvent& event);
