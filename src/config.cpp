#include "config.hpp"
#include "errors.hpp"

#include <CLI/CLI.hpp>
#include <boost/system/error_code.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

const json::object* section(const json::object& root, const char* name) {
    const json::value* v = root.if_contains(name);
    if (v == nullptr) {
        return nullptr;
    }
    if (!v->is_object()) {
        throw ConfigError(std::string("section '") + name + "' must be an object");
    }
    return &v->get_object();
}

void read_string(const json::object& obj, const char* section_name, const char* key, std::string& out) {
    const json::value* v = obj.if_contains(key);
    if (v == nullptr) {
        return;
    }
    if (!v->is_string()) {
        throw ConfigError(std::string(section_name) + "." + key + " must be a string");
    }
    out = std::string(v->get_string().data(), v->get_string().size());
}

int64_t read_int(const json::value& v, const char* section_name, const char* key) {
    boost::system::error_code ec;
    int64_t n = v.is_number() ? v.to_number<int64_t>(ec) : 0;
    if (!v.is_number() || ec) {
        throw ConfigError(std::string(section_name) + "." + key + " must be an integer");
    }
    return n;
}

void read_size(const json::object& obj, const char* section_name, const char* key, size_t& out) {
    const json::value* v = obj.if_contains(key);
    if (v == nullptr) {
        return;
    }
    int64_t n = read_int(*v, section_name, key);
    if (n < 0) {
        throw ConfigError(std::string(section_name) + "." + key + " must not be negative");
    }
    out = static_cast<size_t>(n);
}

template<typename Duration>
void read_duration(const json::object& obj, const char* section_name, const char* key, Duration& out) {
    const json::value* v = obj.if_contains(key);
    if (v == nullptr) {
        return;
    }
    int64_t n = read_int(*v, section_name, key);
    if (n < 0) {
        throw ConfigError(std::string(section_name) + "." + key + " must not be negative");
    }
    out = Duration(n);
}

void read_bool(const json::object& obj, const char* section_name, const char* key, bool& out) {
    const json::value* v = obj.if_contains(key);
    if (v == nullptr) {
        return;
    }
    if (!v->is_bool()) {
        throw ConfigError(std::string(section_name) + "." + key + " must be a boolean");
    }
    out = v->get_bool();
}

}  // namespace

Config default_config() {
    Config config;
    config.store.database_path = (std::filesystem::current_path() / "data" / "TradeDangerous.db").string();
    return config;
}

void apply_config_json(Config& config, const json::object& root) {
    if (const json::object* feed = section(root, "feed")) {
        read_string(*feed, "feed", "endpoint", config.feed.endpoint);
        read_duration(*feed, "feed", "poll_timeout_ms", config.feed.poll_timeout);
        read_duration(*feed, "feed", "idle_sleep_ms", config.feed.idle_sleep);
        read_duration(*feed, "feed", "error_backoff_ms", config.feed.error_backoff);
        if (const json::value* hwm = feed->if_contains("receive_high_water_mark")) {
            config.feed.receive_high_water_mark = static_cast<int>(read_int(*hwm, "feed", "receive_high_water_mark"));
        }
        if (const json::value* cpu = feed->if_contains("subscriber_cpu")) {
            if (cpu->is_null()) {
                config.feed.subscriber_cpu.reset();
            } else {
                config.feed.subscriber_cpu = static_cast<int>(read_int(*cpu, "feed", "subscriber_cpu"));
            }
        }
    }

    if (const json::object* store = section(root, "store")) {
        read_string(*store, "store", "database_path", config.store.database_path);
        read_duration(*store, "store", "busy_timeout_ms", config.store.busy_timeout);
    }

    if (const json::object* pipeline = section(root, "pipeline")) {
        read_size(*pipeline, "pipeline", "worker_count", config.pipeline.worker_count);
        read_size(*pipeline, "pipeline", "queue_capacity", config.pipeline.queue_capacity);
        read_duration(*pipeline, "pipeline", "dequeue_timeout_ms", config.pipeline.dequeue_timeout);
        read_duration(*pipeline, "pipeline", "stats_interval_s", config.pipeline.stats_interval);
    }

    if (const json::object* log = section(root, "log")) {
        read_string(*log, "log", "file", config.log.file);
        read_string(*log, "log", "level", config.log.level);
        read_bool(*log, "log", "console", config.log.console);
    }
}

void load_config_file(Config& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    boost::system::error_code ec;
    json::value root = json::parse(buffer.str(), ec);
    if (ec) {
        throw ConfigError("invalid JSON in '" + path + "': " + ec.message());
    }
    if (!root.is_object()) {
        throw ConfigError("config file '" + path + "' must contain a JSON object");
    }
    apply_config_json(config, root.get_object());
}

void validate(const Config& config) {
    if (config.feed.endpoint.empty()) {
        throw ConfigError("feed endpoint must not be empty");
    }
    if (config.store.database_path.empty()) {
        throw ConfigError("database path must not be empty");
    }
    if (config.pipeline.worker_count == 0) {
        throw ConfigError("worker count must be at least 1");
    }
    if (config.pipeline.queue_capacity == 0) {
        throw ConfigError("queue capacity must be at least 1");
    }
    if (config.feed.poll_timeout.count() == 0) {
        throw ConfigError("poll timeout must be positive");
    }
    if (config.log.file.empty()) {
        throw ConfigError("log file must not be empty");
    }
    parse_log_level(config.log.level);
}

quill::LogLevel parse_log_level(const std::string& name) {
    if (name == "trace_l3") return quill::LogLevel::TraceL3;
    if (name == "trace_l2") return quill::LogLevel::TraceL2;
    if (name == "trace_l1") return quill::LogLevel::TraceL1;
    if (name == "debug") return quill::LogLevel::Debug;
    if (name == "info") return quill::LogLevel::Info;
    if (name == "notice") return quill::LogLevel::Notice;
    if (name == "warning") return quill::LogLevel::Warning;
    if (name == "error") return quill::LogLevel::Error;
    if (name == "critical") return quill::LogLevel::Critical;
    throw ConfigError("unknown log level '" + name + "'");
}

std::optional<Config> parse_command_line(int argc, char** argv, int& exit_code) {
    CLI::App app{"Applies EDDN market and Powerplay updates to a TradeDangerous database"};

    std::string config_path;
    std::optional<std::string> endpoint;
    std::optional<std::string> database;
    std::optional<size_t> workers;
    std::optional<size_t> queue_capacity;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;
    std::optional<int64_t> stats_interval;
    bool no_console = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")->check(CLI::ExistingFile);
    app.add_option("--endpoint", endpoint, "Feed relay endpoint (e.g. tcp://eddn.edcd.io:9500)");
    app.add_option("-d,--database", database, "Path to TradeDangerous.db");
    app.add_option("-w,--workers", workers, "Number of worker threads")->check(CLI::PositiveNumber);
    app.add_option("--queue-capacity", queue_capacity, "Frames buffered between subscriber and workers")
        ->check(CLI::PositiveNumber);
    app.add_option("--log-file", log_file, "Log file path");
    app.add_option("-l,--log-level", log_level,
                   "trace_l3 | trace_l2 | trace_l1 | debug | info | notice | warning | error | critical");
    app.add_option("--stats-interval", stats_interval, "Seconds between statistics reports (0 disables)")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("--no-console", no_console, "Log to the file only");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e, std::cout, std::cerr);
        return std::nullopt;
    }

    Config config = default_config();
    if (!config_path.empty()) {
        load_config_file(config, config_path);
    }
    if (endpoint) config.feed.endpoint = *endpoint;
    if (database) config.store.database_path = *database;
    if (workers) config.pipeline.worker_count = *workers;
    if (queue_capacity) config.pipeline.queue_capacity = *queue_capacity;
    if (log_file) config.log.file = *log_file;
    if (log_level) config.log.level = *log_level;
    if (stats_interval) config.pipeline.stats_interval = std::chrono::seconds(*stats_interval);
    if (no_console) config.log.console = false;

    validate(config);
    exit_code = 0;
    return config;
}
