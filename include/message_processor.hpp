#pragma once
#include <memory>
#include <string>

#include "event_bus.hpp"
#include "ingest_stats.hpp"
#include "logger.hpp"
#include "persistence_adapter.hpp"
#include "types.hpp"

enum class ProcessOutcome {
    Persisted,
    Filtered,
    Ignored,
    DecodeFailed,
    ParseFailed,
    TimestampFailed,
    PersistenceFailed,
    UnexpectedFailure
};

const char* to_string(ProcessOutcome outcome);

/**
 * @class MessageProcessor
 * @brief Runs decode -> classify/parse -> filter -> persist for one frame.
 *
 * Stateless between frames and shared by every worker. Every error is contained to the frame
 * that raised it: it is counted, logged and reported as an outcome, never rethrown.
 */
class MessageProcessor {
private:
    IPersistence& persistence_;
    std::shared_ptr<EventBus> event_bus_;
    IngestStats& stats_;
    Logger& logger_;

    ProcessOutcome dispatch(const Envelope& envelope);
    ProcessOutcome handle_commodity_update(const Header& header, const CommodityUpdate& update);
    ProcessOutcome handle_system_event(const Header& header, const SystemEvent& event);

public:
    MessageProcessor(IPersistence& persistence, std::shared_ptr<EventBus> event_bus,
                     IngestStats& stats, Logger& logger);

    ProcessOutcome process(const RawFrame& frame);
};
