#include "message_processor.hpp"
#include "eddn_parser.hpp"
#include "errors.hpp"
#include "filter_rules.hpp"
#include "frame_decoder.hpp"

#include <utility>
#include <variant>

const char* to_string(ProcessOutcome outcome) {
    switch (outcome) {
        case ProcessOutcome::Persisted: return "persisted";
        case ProcessOutcome::Filtered: return "filtered";
        case ProcessOutcome::Ignored: return "ignored";
        case ProcessOutcome::DecodeFailed: return "decode_failed";
        case ProcessOutcome::ParseFailed: return "parse_failed";
        case ProcessOutcome::TimestampFailed: return "timestamp_failed";
        case ProcessOutcome::PersistenceFailed: return "persistence_failed";
        case ProcessOutcome::UnexpectedFailure: return "unexpected_failure";
    }
    return "unknown";
}

MessageProcessor::MessageProcessor(IPersistence& persistence, std::shared_ptr<EventBus> event_bus,
                                   IngestStats& stats, Logger& logger)
    : persistence_(persistence), event_bus_(std::move(event_bus)), stats_(stats), logger_(logger) {}

ProcessOutcome MessageProcessor::process(const RawFrame& frame) {
    try {
        const std::string payload = decode_frame(frame);
        IngestStats::bump(stats_.frames_decoded);

        std::optional<Envelope> envelope = parse_envelope(payload);
        if (!envelope) {
            IngestStats::bump(stats_.messages_ignored);
            return ProcessOutcome::Ignored;
        }
        IngestStats::bump(stats_.messages_parsed);

        return dispatch(*envelope);
    } catch (const DecodeError& e) {
        IngestStats::bump(stats_.decode_errors);
        logger_.logWarn(std::string("Dropping frame: ") + e.what());
        return ProcessOutcome::DecodeFailed;
    } catch (const ParseError& e) {
        IngestStats::bump(stats_.parse_errors);
        logger_.logWarn(std::string("Dropping message: ") + e.what());
        return ProcessOutcome::ParseFailed;
    } catch (const TimestampError& e) {
        IngestStats::bump(stats_.timestamp_errors);
        logger_.logWarn(std::string("Dropping message: ") + e.what());
        return ProcessOutcome::TimestampFailed;
    } catch (const PersistenceError& e) {
        IngestStats::bump(stats_.persistence_errors);
        logger_.logError(std::string("Rolled back message: ") + e.what());
        return ProcessOutcome::PersistenceFailed;
    } catch (const std::exception& e) {
        IngestStats::bump(stats_.unexpected_errors);
        logger_.logError(std::string("Error processing message: ") + e.what());
        return ProcessOutcome::UnexpectedFailure;
    }
}

ProcessOutcome MessageProcessor::dispatch(const Envelope& envelope) {
    if (const auto* update = std::get_if<CommodityUpdate>(&envelope.message)) {
        return handle_commodity_update(envelope.header, *update);
    }
    return handle_system_event(envelope.header, std::get<SystemEvent>(envelope.message));
}

ProcessOutcome MessageProcessor::handle_commodity_update(const Header& header, const CommodityUpdate& update) {
    if (!accept_commodity_update(update)) {
        IngestStats::bump(stats_.messages_filtered);
        logger_.logDebug("Skipping carrier market " + update.station_name);
        return ProcessOutcome::Filtered;
    }

    CommodityApplyResult result = persistence_.apply_commodity_update(update);
    IngestStats::bump(stats_.messages_persisted);
    IngestStats::bump(stats_.commodities_applied, result.applied);
    IngestStats::bump(stats_.commodities_skipped, result.skipped);

    MarketUpdateEvent event;
    event.system_name = update.system_name;
    event.station_name = update.station_name;
    event.market_id = update.market_id;
    event.software_name = header.software_name;
    event.software_version = header.software_version;
    event.result = result;
    event_bus_->publish(event);

    return ProcessOutcome::Persisted;
}

ProcessOutcome MessageProcessor::handle_system_event(const Header& header, const SystemEvent& system_event) {
    if (!accept_system_event(system_event)) {
        IngestStats::bump(stats_.messages_filtered);
        return ProcessOutcome::Filtered;
    }

    persistence_.apply_system_event(system_event);
    IngestStats::bump(stats_.messages_persisted);

    SystemUpdateEvent event;
    event.star_system = system_event.star_system;
    event.controlling_power = system_event.controlling_power;
    event.powerplay_state = system_event.powerplay_state;
    event.software_name = header.software_name;
    event.software_version = header.software_version;
    event_bus_->publish(event);

    return ProcessOutcome::Persisted;
}
