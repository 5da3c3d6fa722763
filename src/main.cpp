#include "Config.hpp"
#include "ConnectionPool.hpp"
#include "Context.hpp"
#include "ErrorHandler.hpp"
#include "PrometheusMetricsSink.hpp"
#include "Replayer.hpp"
#include <prometheus/exposer.h>
#include <prometheus/registry.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace sqlreplay;

namespace {

volatile std::sig_atomic_t g_signal_received = 0;

void signalHandler(int signal) {
    g_signal_received = signal;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void setupLogging(const LogConfig& log) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        spdlog::level::level_enum level = spdlog::level::from_str(log.level);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        if (!log.file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log.file, false);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << log.file << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sql-replay", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

// Signal handlers may not touch the Context; forward the flag from a thread
class SignalWatcher {
public:
    explicit SignalWatcher(Context& ctx)
        : m_thread([this, &ctx]() {
              while (!m_stop.load()) {
                  if (g_signal_received) {
                      spdlog::info("Received signal {}, cancelling", g_signal_received);
                      ctx.cancel();
                      return;
                  }
                  std::this_thread::sleep_for(std::chrono::milliseconds(100));
              }
          }) {
    }

    ~SignalWatcher() {
        m_stop = true;
        m_thread.join();
    }

private:
    std::atomic<bool> m_stop{false};
    std::thread m_thread;
};

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.log);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    spdlog::info("Starting sql-replay task {} (source {})",
                 config.loader.task_name, config.loader.source_id);
    spdlog::info("Connecting to {}:{} as {} with {} workers", config.connection.host,
                 config.connection.port, config.connection.user, config.loader.worker_count);

    setupSignalHandlers();

    // Metrics
    auto registry = std::make_shared<prometheus::Registry>();
    PrometheusMetricsSink metrics(registry);
    std::unique_ptr<prometheus::Exposer> exposer;
    if (!config.metrics.listen_address.empty()) {
        try {
            exposer = std::make_unique<prometheus::Exposer>(config.metrics.listen_address);
            exposer->RegisterCollectable(registry);
            spdlog::info("Metrics exposed on {}/metrics", config.metrics.listen_address);
        } catch (const std::exception& e) {
            spdlog::error("Failed to start metrics exporter on {}: {}",
                          config.metrics.listen_address, e.what());
            return 1;
        }
    }

    Context ctx;
    SignalWatcher watcher(ctx);

    PoolOptions options;
    options.name = config.loader.task_name;
    options.sourceId = config.loader.source_id;
    options.metrics = &metrics;

    std::unique_ptr<ConnectionPool> pool;
    try {
        pool = ConnectionPool::create(ctx, config.connection, config.loader.worker_count, options);
    } catch (const ReplayException& e) {
        spdlog::error("Failed to create connection pool: {} (scope={})", e.what(),
                      toString(e.scope()));
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    Replayer replayer(*pool, ctx);
    bool ok = replayer.run(config.sql_files);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    pool->close();

    ReplayStats stats = replayer.stats();
    spdlog::info("Replayed {} files, {} statements ({} skipped) in {} ms",
                 stats.files, stats.statements, stats.skipped, elapsed.count());

    if (!ok) {
        spdlog::error("sql-replay failed: {}", replayer.firstError().value_or("unknown error"));
        return 1;
    }

    spdlog::info("sql-replay finished");
    return 0;
}
