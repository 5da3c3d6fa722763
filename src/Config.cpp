#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>

namespace sqlreplay {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

// Whole-string integer in [min, max]
long long parseInRange(const std::string& value, long long min, long long max) {
    size_t pos = 0;
    long long parsed = std::stoll(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    if (parsed < min || parsed > max) {
        throw std::out_of_range("must be between " + std::to_string(min) +
                                " and " + std::to_string(max));
    }
    return parsed;
}

const std::vector<std::string> kLogLevels = {"trace", "debug", "info", "warn", "error"};

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    int line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "connection") {
                if (key == "host") config.connection.host = value;
                else if (key == "port") config.connection.port = static_cast<uint16_t>(parseInRange(value, 1, 65535));
                else if (key == "user") config.connection.user = value;
                else if (key == "password") config.connection.password = value;
                else if (key == "socket") config.connection.socket = value;
                else if (key == "database" || key == "default_database") config.connection.default_database = value;
                else if (key == "use_ssl") config.connection.use_ssl = parseBool(value);
                else if (key == "ssl_ca") config.connection.ssl_ca = value;
                else if (key == "ssl_cert") config.connection.ssl_cert = value;
                else if (key == "ssl_key") config.connection.ssl_key = value;
                else if (key == "connect_timeout")
                    config.connection.connect_timeout = std::chrono::milliseconds(std::stoi(value));
                else if (key == "read_timeout")
                    config.connection.read_timeout = std::chrono::milliseconds(std::stoi(value));
                else if (key == "write_timeout")
                    config.connection.write_timeout = std::chrono::milliseconds(std::stoi(value));
            }
            else if (current_section == "loader") {
                if (key == "task_name") config.loader.task_name = value;
                else if (key == "source_id") config.loader.source_id = value;
                else if (key == "worker_count")
                    config.loader.worker_count = static_cast<size_t>(
                        parseInRange(value, 1, LoaderConfig::kMaxWorkers));
            }
            else if (current_section == "log") {
                if (key == "level") config.log.level = value;
                else if (key == "file") config.log.file = value;
            }
            else if (current_section == "metrics") {
                if (key == "listen_address") config.metrics.listen_address = value;
            }
        } catch (const std::logic_error& e) {
            spdlog::warn("{}:{}: invalid value '{}' for {}: {}",
                         path.string(), line_no, value, key, e.what());
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"sql-replay - Replay SQL files against a MySQL compatible database"};

    // Connection options
    app.add_option("-H,--host", config.connection.host, "Target database host")
        ->default_val("localhost");
    app.add_option("-P,--port", config.connection.port, "Target database port")
        ->default_val(3306)
        ->check(CLI::Range(1, 65535));
    app.add_option("-u,--user", config.connection.user, "Database username");
    app.add_option("-p,--password", config.connection.password, "Database password");
    app.add_option("-S,--socket", config.connection.socket, "Unix socket path");
    app.add_option("-D,--database", config.connection.default_database, "Default database");

    // SSL options
    app.add_flag("--ssl", config.connection.use_ssl, "Enable SSL connection");
    app.add_option("--ssl-ca", config.connection.ssl_ca, "SSL CA certificate file");
    app.add_option("--ssl-cert", config.connection.ssl_cert, "SSL client certificate file");
    app.add_option("--ssl-key", config.connection.ssl_key, "SSL client key file");

    // Loader options
    app.add_option("-w,--workers", config.loader.worker_count,
                   "Number of worker connections")
        ->default_val(4)
        ->check(CLI::Range(size_t{1}, LoaderConfig::kMaxWorkers));
    app.add_option("--task", config.loader.task_name, "Task name used in logs and metrics");
    app.add_option("--source-id", config.loader.source_id, "Source id used in logs and metrics");

    // Logging and metrics
    app.add_option("-L,--log-level", config.log.level, "Log level")
        ->check(CLI::IsMember(kLogLevels));
    app.add_option("--log-file", config.log.file, "Also write logs to this file");
    app.add_option("--metrics-addr", config.metrics.listen_address,
                   "Expose Prometheus metrics on host:port");

    // Config file
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // SQL files (positional)
    app.add_option("files", config.sql_files, "SQL files to replay")
        ->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            // Command line args override file config
            auto given = [&app](const std::string& name) { return app.count(name) > 0; };
            Config merged = *file_config;

            if (given("--host")) merged.connection.host = config.connection.host;
            if (given("--port")) merged.connection.port = config.connection.port;
            if (given("--user")) merged.connection.user = config.connection.user;
            if (given("--password")) merged.connection.password = config.connection.password;
            if (given("--socket")) merged.connection.socket = config.connection.socket;
            if (given("--database")) merged.connection.default_database = config.connection.default_database;
            if (given("--ssl")) merged.connection.use_ssl = config.connection.use_ssl;
            if (given("--ssl-ca")) merged.connection.ssl_ca = config.connection.ssl_ca;
            if (given("--ssl-cert")) merged.connection.ssl_cert = config.connection.ssl_cert;
            if (given("--ssl-key")) merged.connection.ssl_key = config.connection.ssl_key;
            if (given("--workers")) merged.loader.worker_count = config.loader.worker_count;
            if (given("--task")) merged.loader.task_name = config.loader.task_name;
            if (given("--source-id")) merged.loader.source_id = config.loader.source_id;
            if (given("--log-level")) merged.log.level = config.log.level;
            if (given("--log-file")) merged.log.file = config.log.file;
            if (given("--metrics-addr")) merged.metrics.listen_address = config.metrics.listen_address;

            merged.sql_files = config.sql_files;
            config = std::move(merged);
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Resolve password from environment if not set
    config.resolvePassword();

    return config;
}

bool Config::validate() const {
    if (connection.user.empty()) {
        spdlog::error("Database username is required (use -u option)");
        return false;
    }

    if (loader.worker_count == 0 || loader.worker_count > LoaderConfig::kMaxWorkers) {
        spdlog::error("Worker count must be between 1 and {}", LoaderConfig::kMaxWorkers);
        return false;
    }

    if (connection.port == 0 && connection.socket.empty()) {
        spdlog::error("Database port must be between 1 and 65535");
        return false;
    }

    if (std::find(kLogLevels.begin(), kLogLevels.end(), log.level) == kLogLevels.end()) {
        spdlog::error("Unknown log level: {}", log.level);
        return false;
    }

    if (sql_files.empty()) {
        spdlog::error("No SQL files to replay");
        return false;
    }

    for (const auto& file : sql_files) {
        if (!std::filesystem::is_regular_file(file)) {
            spdlog::error("SQL file not found: {}", file);
            return false;
        }
    }

    if (connection.use_ssl) {
        if (!connection.ssl_ca.empty() && !std::filesystem::exists(connection.ssl_ca)) {
            spdlog::error("SSL CA file not found: {}", connection.ssl_ca);
            return false;
        }
        if (!connection.ssl_cert.empty() && !std::filesystem::exists(connection.ssl_cert)) {
            spdlog::error("SSL certificate file not found: {}", connection.ssl_cert);
            return false;
        }
        if (!connection.ssl_key.empty() && !std::filesystem::exists(connection.ssl_key)) {
            spdlog::error("SSL key file not found: {}", connection.ssl_key);
            return false;
        }
    }

    return true;
}

void Config::resolvePassword() {
    if (connection.password.empty()) {
        const char* env_pwd = std::getenv("MYSQL_PWD");
        if (env_pwd) {
            connection.password = env_pwd;
        }
    }
}

}  // namespace sqlreplay
