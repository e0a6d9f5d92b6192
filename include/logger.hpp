#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "event_bus.hpp"
#include "types.hpp"

class Logger {
private:
    quill::Logger* logger_;
    inline static std::string filename_;
    inline static bool console_ = false;
    inline static std::mutex init_mutex_;
    inline static bool is_initialized_ = false;

    Logger() {
        if (filename_.empty()) {
            throw std::runtime_error("Logger filename is empty");
        }
        try {
            std::filesystem::path file_path(filename_);
            if (auto parent = file_path.parent_path(); !parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            if (!quill::Backend::is_running()) {
                quill::BackendOptions backend_options;
                quill::Backend::start(backend_options);
            }

            quill::PatternFormatterOptions formatter_options;
            formatter_options.format_pattern = "%(time) [%(log_level)] %(file_name): %(message)";
            formatter_options.timestamp_pattern = "%Y-%m-%d %H:%M:%S.%Qus";
            formatter_options.timestamp_timezone = quill::Timezone::LocalTime;

            // File sink
            quill::FileSinkConfig file_cfg;
            file_cfg.set_open_mode('a');
            file_cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
            file_cfg.set_override_pattern_formatter_options(formatter_options);

            std::vector<std::shared_ptr<quill::Sink>> sinks;
            sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
                filename_, file_cfg, quill::FileEventNotifier{}
            ));

            if (console_) {
                sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("eddn_console"));
            }

            logger_ = quill::Frontend::create_or_get_logger("eddn", std::move(sinks), formatter_options);

            logger_->set_log_level(quill::LogLevel::Info);

        } catch (const std::exception& e) {
            throw std::runtime_error("Logger initialization failed: " + std::string(e.what()));
        }
    }

    static std::string or_none(const std::optional<std::string>& value) {
        return value ? *value : std::string("None");
    }

public:
    // --- Initialization ---
    static void init(const std::string& custom_filename, bool enable_console = false) {
        std::lock_guard<std::mutex> lock(init_mutex_);
        if (is_initialized_) {
            throw std::runtime_error("Logger already initialized");
        }
        if (custom_filename.empty()) {
            throw std::invalid_argument("Custom filename cannot be empty");
        }
        filename_ = custom_filename;
        console_ = enable_console;
        is_initialized_ = true;
    }

    static Logger& getInstance() {
        std::lock_guard<std::mutex> lock(init_mutex_);
        if (!is_initialized_) {
            throw std::runtime_error("Logger not initialized. Call Logger::init first.");
        }
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    inline void logInfo(const std::string& msg) { LOG_INFO(logger_, "{}", msg); }
    inline void logWarn(const std::string& msg) { LOG_WARNING(logger_, "{}", msg); }
    inline void logError(const std::string& msg) { LOG_ERROR(logger_, "{}", msg); }
    inline void logDebug(const std::string& msg) { LOG_DEBUG(logger_, "{}", msg); }

    inline void logMarketUpdateEvent(const MarketUpdateEvent& event) {
        LOG_INFO(logger_, "[Market] {} - {} ({} {}) market_id={} applied={} skipped={}",
            event.system_name, event.station_name, event.software_name, event.software_version,
            event.market_id, event.result.applied, event.result.skipped);
    }

    inline void logSystemUpdateEvent(const SystemUpdateEvent& event) {
        LOG_INFO(logger_, "[System] {} {} - {} ({} {})",
            event.star_system, or_none(event.controlling_power), or_none(event.powerplay_state),
            event.software_name, event.software_version);
    }

    void subscribeToBus(const std::shared_ptr<EventBus>& event_bus) {
        event_bus->subscribe<MarketUpdateEvent>([this](const MarketUpdateEvent& e) { this->logMarketUpdateEvent(e); });
        event_bus->subscribe<SystemUpdateEvent>([this](const SystemUpdateEvent& e) { this->logSystemUpdateEvent(e); });
    }

    void setLogLevel(quill::LogLevel level) {
        logger_->set_log_level(level);
    }

    void flush() {
        logger_->flush_log();
    }

    static void shutdown() {
        std::lock_guard<std::mutex> lock(init_mutex_);
        if (is_initialized_) {
            quill::Backend::stop();
            is_initialized_ = false;
        }
    }
};
