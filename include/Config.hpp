#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sqlreplay {

struct ConnectionConfig {
    std::string host = "localhost";
    uint16_t port = 3306;
    std::string user;
    std::string password;
    std::string socket;
    std::string default_database;

    // SSL options
    bool use_ssl = false;
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;

    // Timeouts
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{30000};
    std::chrono::milliseconds write_timeout{30000};
};

struct LoaderConfig {
    std::string task_name = "sql-replay";
    std::string source_id = "source-01";
    size_t worker_count = 4;

    // One connection per worker
    static constexpr size_t kMaxWorkers = 1024;
};

struct LogConfig {
    std::string level = "info";   // trace, debug, info, warn, error
    std::string file;             // empty: console only
};

struct MetricsConfig {
    std::string listen_address;   // e.g. 127.0.0.1:8262, empty disables the exporter
};

struct Config {
    ConnectionConfig connection;
    LoaderConfig loader;
    LogConfig log;
    MetricsConfig metrics;

    std::vector<std::string> sql_files;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments, values given there override the config file
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();
};

}  // namespace sqlreplay
