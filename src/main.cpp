#include "config.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "ingest_pipeline.hpp"
#include "logger.hpp"
#include "persistence_adapter.hpp"
#include "trading_store.hpp"
#include "zmq_feed_socket.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

volatile sig_atomic_t g_running = 1;

void signal_handler(int) {
    g_running = 0;
}

int main(int argc, char** argv) {
    try {
        int exit_code = 0;
        std::optional<Config> parsed = parse_command_line(argc, argv, exit_code);
        if (!parsed) {
            return exit_code;
        }
        Config config = std::move(*parsed);

        // Set up signal handling for graceful shutdown
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        Logger::init(config.log.file, config.log.console);
        Logger& logger = Logger::getInstance();
        logger.setLogLevel(parse_log_level(config.log.level));

        auto event_bus = std::make_shared<EventBus>();
        logger.subscribeToBus(event_bus);

        // Refuse to start against a missing or foreign database.
        verify_trading_store(config.store);
        logger.logInfo("Using trading store " + config.store.database_path);

        IngestPipeline pipeline(config,
                                make_zmq_socket_factory(config.feed),
                                std::make_unique<SqlitePersistenceAdapter>(config.store),
                                event_bus,
                                logger);
        pipeline.start();

        // Run until interrupted
        const auto stats_interval = config.pipeline.stats_interval;
        auto next_report = std::chrono::steady_clock::now() + stats_interval;
        while (g_running && !pipeline.failed()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            if (stats_interval.count() > 0 && std::chrono::steady_clock::now() >= next_report) {
                logger.logInfo("Stats: " + pipeline.stats().snapshot().summary());
                next_report += stats_interval;
            }
        }

        std::cout << "Shutting down..." << std::endl;
        logger.logInfo("Shutdown requested, draining in-flight messages.");
        const bool failed = pipeline.failed();
        pipeline.stop();

        Logger::shutdown();
        return failed ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Main exception: " << e.what() << std::endl;
        Logger::shutdown();
        return 1;
    }
}
