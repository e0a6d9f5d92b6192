#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/json.hpp>

#include "types.hpp"

namespace json = boost::json;

enum class MessageKind {
    Commodity,
    FSDJump
};

const char* to_string(MessageKind kind);

/**
 * @brief Content sniff on the decoded payload.
 *
 * Returns the candidate variants in priority order: Commodity when the payload contains
 * "commodity", FSDJump when it contains both "journal" and "FSDJump". An empty result means
 * the schema is not supported and the message is ignored.
 */
std::vector<MessageKind> classify_payload(std::string_view payload);

/**
 * @brief Classifies and parses a decoded payload into a typed Envelope.
 *
 * Each candidate from classify_payload() is parsed structurally in priority order and the
 * first one whose required fields are present wins.
 * @return std::nullopt for unsupported schemas.
 * @throws ParseError when the payload is not JSON or no candidate satisfies its required fields.
 */
std::optional<Envelope> parse_envelope(std::string_view payload);

// Structural parsers for a single variant; throw ParseError on missing or mistyped fields.
Header parse_header(const json::object& obj);
CommodityUpdate parse_commodity_update(const json::object& obj);
SystemEvent parse_system_event(const json::object& obj);
Envelope parse_envelope_as(const json::object& root, MessageKind kind);
