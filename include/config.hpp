#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <boost/json.hpp>
#include <quill/core/LogLevel.h>

namespace json = boost::json;

struct FeedConfig {
    std::string endpoint = "tcp://eddn.edcd.io:9500";
    std::chrono::milliseconds poll_timeout{1000};
    std::chrono::milliseconds idle_sleep{100};
    std::chrono::milliseconds error_backoff{1000};
    int receive_high_water_mark = 100000;
    std::optional<int> subscriber_cpu;
};

struct StoreConfig {
    std::string database_path;
    std::chrono::milliseconds busy_timeout{5000};
};

struct PipelineConfig {
    size_t worker_count = 16;
    size_t queue_capacity = 8192;
    std::chrono::milliseconds dequeue_timeout{100};
    std::chrono::seconds stats_interval{60};
};

struct LogConfig {
    std::string file = "logs/eddn_listener.log";
    std::string level = "info";
    bool console = true;
};

struct Config {
    FeedConfig feed;
    StoreConfig store;
    PipelineConfig pipeline;
    LogConfig log;
};

// Defaults, with the store at <cwd>/data/TradeDangerous.db.
Config default_config();

/**
 * @brief Overlays the values found in a JSON document onto config.
 *
 * Recognised sections: "feed", "store", "pipeline", "log". Unknown keys are ignored.
 * @throws ConfigError when a known key has the wrong type or an out-of-range value.
 */
void apply_config_json(Config& config, const json::object& root);

// Reads and applies a JSON config file. Throws ConfigError when it cannot be read or parsed.
void load_config_file(Config& config, const std::string& path);

// Throws ConfigError on values the pipeline cannot run with.
void validate(const Config& config);

// Throws ConfigError for unknown names.
quill::LogLevel parse_log_level(const std::string& name);

/**
 * @brief Builds the runtime configuration from the command line.
 *
 * --config is applied first, then individual flags override it.
 * @return std::nullopt when the process should exit immediately (e.g. --help); exit_code is set.
 */
std::optional<Config> parse_command_line(int argc, char** argv, int& exit_code);
