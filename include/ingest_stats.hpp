#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

struct IngestStatsSnapshot {
    uint64_t frames_received = 0;
    uint64_t frames_decoded = 0;
    uint64_t messages_parsed = 0;
    uint64_t messages_ignored = 0;
    uint64_t messages_filtered = 0;
    uint64_t messages_persisted = 0;
    uint64_t commodities_applied = 0;
    uint64_t commodities_skipped = 0;
    uint64_t decode_errors = 0;
    uint64_t parse_errors = 0;
    uint64_t timestamp_errors = 0;
    uint64_t persistence_errors = 0;
    uint64_t unexpected_errors = 0;
    uint64_t transient_io_errors = 0;
    uint64_t backpressure_waits = 0;

    uint64_t total_errors() const {
        return decode_errors + parse_errors + timestamp_errors + persistence_errors + unexpected_errors;
    }

    std::string summary() const {
        std::ostringstream ss;
        ss << "received=" << frames_received
           << " decoded=" << frames_decoded
           << " parsed=" << messages_parsed
           << " ignored=" << messages_ignored
           << " filtered=" << messages_filtered
           << " persisted=" << messages_persisted
           << " commodities_applied=" << commodities_applied
           << " commodities_skipped=" << commodities_skipped
           << " errors=" << total_errors()
           << " (decode=" << decode_errors
           << " parse=" << parse_errors
           << " timestamp=" << timestamp_errors
           << " persistence=" << persistence_errors
           << " unexpected=" << unexpected_errors << ")"
           << " feed_errors=" << transient_io_errors
           << " backpressure_waits=" << backpressure_waits;
        return ss.str();
    }
};

// Counters bumped by the subscriber and the workers; relaxed ordering, observability only.
class IngestStats {
public:
    std::atomic<uint64_t> frames_received{0};
    std::atomic<uint64_t> frames_decoded{0};
    std::atomic<uint64_t> messages_parsed{0};
    std::atomic<uint64_t> messages_ignored{0};
    std::atomic<uint64_t> messages_filtered{0};
    std::atomic<uint64_t> messages_persisted{0};
    std::atomic<uint64_t> commodities_applied{0};
    std::atomic<uint64_t> commodities_skipped{0};
    std::atomic<uint64_t> decode_errors{0};
    std::atomic<uint64_t> parse_errors{0};
    std::atomic<uint64_t> timestamp_errors{0};
    std::atomic<uint64_t> persistence_errors{0};
    std::atomic<uint64_t> unexpected_errors{0};
    std::atomic<uint64_t> transient_io_errors{0};
    std::atomic<uint64_t> backpressure_waits{0};

    static void bump(std::atomic<uint64_t>& counter, uint64_t n = 1) {
        counter.fetch_add(n, std::memory_order_relaxed);
    }

    IngestStatsSnapshot snapshot() const {
        IngestStatsSnapshot s;
        s.frames_received = frames_received.load(std::memory_order_relaxed);
        s.frames_decoded = frames_decoded.load(std::memory_order_relaxed);
        s.messages_parsed = messages_parsed.load(std::memory_order_relaxed);
        s.messages_ignored = messages_ignored.load(std::memory_order_relaxed);
        s.messages_filtered = messages_filtered.load(std::memory_order_relaxed);
        s.messages_persisted = messages_persisted.load(std::memory_order_relaxed);
        s.commodities_applied = commodities_applied.load(std::memory_order_relaxed);
        s.commodities_skipped = commodities_skipped.load(std::memory_order_relaxed);
        s.decode_errors = decode_errors.load(std::memory_order_relaxed);
        s.parse_errors = parse_errors.load(std::memory_order_relaxed);
        s.timestamp_errors = timestamp_errors.load(std::memory_order_relaxed);
        s.persistence_errors = persistence_errors.load(std::memory_order_relaxed);
        s.unexpected_errors = unexpected_errors.load(std::memory_order_relaxed);
        s.transient_io_errors = transient_io_errors.load(std::memory_order_relaxed);
        s.backpressure_waits = backpressure_waits.load(std::memory_order_relaxed);
        return s;
    }
};
