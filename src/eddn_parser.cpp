#include "eddn_parser.hpp"
#include "errors.hpp"

#include <boost/system/error_code.hpp>

namespace {

std::string field_path(const char* context, const char* key) {
    return std::string(context) + "." + key;
}

// Absent and null are both treated as "not provided".
const json::value* find_field(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (v == nullptr || v->is_null()) {
        return nullptr;
    }
    return v;
}

const json::value& require_field(const json::object& obj, const char* key, const char* context) {
    const json::value* v = find_field(obj, key);
    if (v == nullptr) {
        throw ParseError("missing required field '" + field_path(context, key) + "'");
    }
    return *v;
}

std::string as_string(const json::value& v, const char* context, const char* key) {
    if (!v.is_string()) {
        throw ParseError("field '" + field_path(context, key) + "' is not a string");
    }
    const json::string& s = v.get_string();
    return std::string(s.data(), s.size());
}

int64_t as_int(const json::value& v, const char* context, const char* key) {
    if (!v.is_number()) {
        throw ParseError("field '" + field_path(context, key) + "' is not a number");
    }
    boost::system::error_code ec;
    int64_t n = v.to_number<int64_t>(ec);
    if (ec) {
        throw ParseError("field '" + field_path(context, key) + "' is not an integer: " + ec.message());
    }
    return n;
}

double as_double(const json::value& v, const char* context, const char* key) {
    if (!v.is_number()) {
        throw ParseError("field '" + field_path(context, key) + "' is not a number");
    }
    boost::system::error_code ec;
    double d = v.to_number<double>(ec);
    if (ec) {
        throw ParseError("field '" + field_path(context, key) + "': " + ec.message());
    }
    return d;
}

const json::object& as_object(const json::value& v, const char* context, const char* key) {
    if (!v.is_object()) {
        throw ParseError("field '" + field_path(context, key) + "' is not an object");
    }
    return v.get_object();
}

const json::array& as_array(const json::value& v, const char* context, const char* key) {
    if (!v.is_array()) {
        throw ParseError("field '" + field_path(context, key) + "' is not an array");
    }
    return v.get_array();
}

std::string required_string(const json::object& obj, const char* key, const char* context) {
    return as_string(require_field(obj, key, context), context, key);
}

int64_t required_int(const json::object& obj, const char* key, const char* context) {
    return as_int(require_field(obj, key, context), context, key);
}

std::optional<std::string> optional_string(const json::object& obj, const char* key, const char* context) {
    const json::value* v = find_field(obj, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    return as_string(*v, context, key);
}

int64_t optional_int(const json::object& obj, const char* key, const char* context, int64_t fallback) {
    const json::value* v = find_field(obj, key);
    return v == nullptr ? fallback : as_int(*v, context, key);
}

std::optional<bool> optional_bool(const json::object& obj, const char* key, const char* context) {
    const json::value* v = find_field(obj, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (!v->is_bool()) {
        throw ParseError("field '" + field_path(context, key) + "' is not a boolean");
    }
    return v->get_bool();
}

std::optional<std::vector<std::string>> optional_string_list(const json::object& obj, const char* key,
                                                             const char* context) {
    const json::value* v = find_field(obj, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    std::vector<std::string> out;
    for (const auto& item : as_array(*v, context, key)) {
        out.push_back(as_string(item, context, key));
    }
    return out;
}

Commodity parse_commodity(const json::object& obj) {
    static constexpr const char* ctx = "message.commodities[]";
    Commodity c;
    c.name = required_string(obj, "name", ctx);
    c.mean_price = required_int(obj, "meanPrice", ctx);
    c.buy_price = required_int(obj, "buyPrice", ctx);
    c.stock = required_int(obj, "stock", ctx);
    c.sell_price = required_int(obj, "sellPrice", ctx);
    c.demand = required_int(obj, "demand", ctx);
    c.status_flags = optional_string_list(obj, "statusFlags", ctx);
    return c;
}

Economy parse_economy(const json::object& obj) {
    static constexpr const char* ctx = "message.economies[]";
    Economy e;
    e.name = required_string(obj, "name", ctx);
    e.proportion = as_double(require_field(obj, "proportion", ctx), ctx, "proportion");
    return e;
}

}  // namespace

const char* to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::Commodity: return "commodity";
        case MessageKind::FSDJump: return "fsdjump";
    }
    return "unknown";
}

std::vector<MessageKind> classify_payload(std::string_view payload) {
    std::vector<MessageKind> kinds;
    if (payload.find("commodity") != std::string_view::npos) {
        kinds.push_back(MessageKind::Commodity);
    }
    if (payload.find("journal") != std::string_view::npos && payload.find("FSDJump") != std::string_view::npos) {
        kinds.push_back(MessageKind::FSDJump);
    }
    return kinds;
}

Header parse_header(const json::object& obj) {
    static constexpr const char* ctx = "header";
    Header h;
    h.uploader_id = required_string(obj, "uploaderID", ctx);
    h.software_name = required_string(obj, "softwareName", ctx);
    h.software_version = required_string(obj, "softwareVersion", ctx);
    h.game_version = optional_string(obj, "gameVersion", ctx);
    h.game_build = optional_string(obj, "gameBuild", ctx);
    h.gateway_timestamp = optional_string(obj, "gatewayTimestamp", ctx);
    return h;
}

CommodityUpdate parse_commodity_update(const json::object& obj) {
    static constexpr const char* ctx = "message";
    CommodityUpdate u;
    u.system_name = required_string(obj, "systemName", ctx);
    u.station_name = required_string(obj, "stationName", ctx);
    u.market_id = required_int(obj, "marketId", ctx);
    u.timestamp = required_string(obj, "timestamp", ctx);

    const json::array& commodities = as_array(require_field(obj, "commodities", ctx), ctx, "commodities");
    u.commodities.reserve(commodities.size());
    for (const auto& item : commodities) {
        u.commodities.push_back(parse_commodity(as_object(item, ctx, "commodities")));
    }

    u.station_type = optional_string(obj, "stationType", ctx);
    u.carrier_docking_access = optional_string(obj, "carrierDockingAccess", ctx);
    u.horizons = optional_bool(obj, "horizons", ctx);
    u.odyssey = optional_bool(obj, "odyssey", ctx);
    u.prohibited = optional_string_list(obj, "prohibited", ctx);

    if (const json::value* economies = find_field(obj, "economies")) {
        std::vector<Economy> out;
        for (const auto& item : as_array(*economies, ctx, "economies")) {
            out.push_back(parse_economy(as_object(item, ctx, "economies")));
        }
        u.economies = std::move(out);
    }
    return u;
}

SystemEvent parse_system_event(const json::object& obj) {
    static constexpr const char* ctx = "message";
    SystemEvent s;
    s.star_system = required_string(obj, "StarSystem", ctx);
    s.event = optional_string(obj, "event", ctx);
    s.timestamp = optional_string(obj, "timestamp", ctx);

    if (const json::value* pos = find_field(obj, "StarPos")) {
        std::vector<double> coords;
        for (const auto& item : as_array(*pos, ctx, "StarPos")) {
            coords.push_back(as_double(item, ctx, "StarPos"));
        }
        s.star_pos = std::move(coords);
    }

    s.system_address = optional_int(obj, "SystemAddress", ctx, 0);
    s.system_allegiance = optional_string(obj, "SystemAllegiance", ctx);
    s.system_security = optional_string(obj, "SystemSecurity", ctx);
    s.population = optional_int(obj, "Population", ctx, 0);
    s.powers = optional_string_list(obj, "Powers", ctx);
    s.controlling_power = optional_string(obj, "ControllingPower", ctx);
    s.powerplay_state = optional_string(obj, "PowerplayState", ctx);
    return s;
}

Envelope parse_envelope_as(const json::object& root, MessageKind kind) {
    Envelope envelope;
    envelope.schema_ref = required_string(root, "$schemaRef", "envelope");
    envelope.header = parse_header(as_object(require_field(root, "header", "envelope"), "envelope", "header"));

    const json::object& message = as_object(require_field(root, "message", "envelope"), "envelope", "message");
    switch (kind) {
        case MessageKind::Commodity:
            envelope.message = parse_commodity_update(message);
            break;
        case MessageKind::FSDJump:
            envelope.message = parse_system_event(message);
            break;
    }
    return envelope;
}

std::optional<Envelope> parse_envelope(std::string_view payload) {
    const std::vector<MessageKind> candidates = classify_payload(payload);
    if (candidates.empty()) {
        return std::nullopt;
    }

    boost::system::error_code ec;
    json::value root = json::parse(json::string_view(payload.data(), payload.size()), ec);
    if (ec) {
        throw ParseError("invalid JSON: " + ec.message());
    }
    if (!root.is_object()) {
        throw ParseError("envelope is not a JSON object");
    }

    std::optional<ParseError> first_failure;
    for (MessageKind kind : candidates) {
        try {
            return parse_envelope_as(root.get_object(), kind);
        } catch (const ParseError& e) {
            if (!first_failure) {
                first_failure = e;
            }
        }
    }
    throw *first_failure;
}
