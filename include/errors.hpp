#pragma once
#include <stdexcept>
#include <string>

/**
 * @class PipelineError
 * @brief Base class for every error raised by the ingestion pipeline.
 *
 * Per-message errors (decode, parse, timestamp, persistence) are contained to
 * the message that raised them. Startup and configuration errors are fatal.
 */
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& what) : std::runtime_error(what) {}
};

// Corrupt or unreadable frame.
class DecodeError : public PipelineError {
public:
    explicit DecodeError(const std::string& what) : PipelineError("decode: " + what) {}
};

// Payload is not JSON or a required field is missing / has the wrong type.
class ParseError : public PipelineError {
public:
    explicit ParseError(const std::string& what) : PipelineError("parse: " + what) {}
};

// Wire timestamp is not yyyy-mm-ddThh:mm:ssZ.
class TimestampError : public PipelineError {
public:
    explicit TimestampError(const std::string& what) : PipelineError("timestamp: " + what) {}
};

// Store unreachable or a statement failed; the message transaction is rolled back.
class PersistenceError : public PipelineError {
public:
    explicit PersistenceError(const std::string& what) : PipelineError("persistence: " + what) {}
};

// Feed hiccup during poll/receive. The subscriber backs off and retries.
class TransientIOError : public PipelineError {
public:
    explicit TransientIOError(const std::string& what) : PipelineError("feed: " + what) {}
};

// Cannot open the feed or the store at all.
class StartupError : public PipelineError {
public:
    explicit StartupError(const std::string& what) : PipelineError("startup: " + what) {}
};

class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& what) : PipelineError("config: " + what) {}
};
