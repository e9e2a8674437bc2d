#include "Config.hpp"
#include "UriTranslator.hpp"
#include "ErrorHandler.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>

namespace dbscope {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    size_t line_no = 0;

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
            if (current_section == "database") {
                if (key == "url") config.engine.url = value;
                else if (key == "data_path") config.engine.data_path = value;
                else if (key == "exec_env") config.engine.exec_env = value;
                else if (key == "pool_size")
                    config.engine.pool_size = static_cast<size_t>(std::stoul(value));
                else if (key == "max_overflow")
                    config.engine.max_overflow = static_cast<size_t>(std::stoul(value));
                else if (key == "pool_timeout")
                    config.engine.pool_timeout = std::chrono::milliseconds(std::stol(value));
                else if (key == "pool_recycle")
                    config.engine.pool_recycle = std::chrono::seconds(std::stol(value));
                else if (key == "pool_pre_ping")
                    config.engine.pool_pre_ping = parseBool(value);
            }
            else if (current_section == "analyzer") {
                if (key == "select_threshold")
                    config.analyzer.select_threshold = static_cast<size_t>(std::stoul(value));
            }
            else if (current_section == "logging") {
                if (key == "level") config.logging.level = value;
                else if (key == "file") config.logging.file = value;
                else if (key == "console") config.logging.console = parseBool(value);
            }
        } catch (const std::logic_error&) {
            spdlog::warn("{}:{}: invalid value for '{}': {}", path.string(), line_no, key, value);
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"dbscope-info - inspect the data-access runtime configuration"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    std::string url;
    app.add_option("-U,--url", url, "Blocking-mode database URL");

    std::string exec_env;
    app.add_option("-e,--env", exec_env, "Execution environment (dev, test, prod)");

    size_t pool_size = 0;
    app.add_option("--pool-size", pool_size, "Persistent connections per pool");

    bool debug = false;
    app.add_flag("-d,--debug", debug, "Enable debug output");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Load config file if specified
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    config.applyEnvironment();

    // Command line args override file and environment
    if (!url.empty()) config.engine.url = url;
    if (!exec_env.empty()) config.engine.exec_env = exec_env;
    if (pool_size > 0) config.engine.pool_size = pool_size;
    if (debug) config.logging.level = "debug";

    return config;
}

Config Config::fromEnvironment() {
    Config config;

    if (const char* path = std::getenv("DBSCOPE_CONFIG")) {
        auto file_config = loadFromFile(path);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", path);
        }
    }

    config.applyEnvironment();
    return config;
}

void Config::applyEnvironment() {
    if (const char* env_url = std::getenv("DBSCOPE_DATABASE_URL")) {
        if (*env_url) engine.url = env_url;
    }
    if (const char* env = std::getenv("DBSCOPE_EXEC_ENV")) {
        if (*env) engine.exec_env = env;
    }
}

std::string EngineConfig::resolvedUrl() const {
    if (!url.empty()) {
        return url;
    }

    std::string filename = (exec_env == "dev" || exec_env == "test")
        ? "db." + exec_env + ".sqlite3"
        : "db.sqlite3";
    return "sqlite:///" + (std::filesystem::path(data_path) / filename).string();
}

std::string Config::databaseUrl() const {
    return engine.resolvedUrl();
}

bool Config::validate() const {
    if (engine.pool_size == 0 && engine.max_overflow == 0) {
        spdlog::error("Pool capacity is zero (pool_size and max_overflow are both 0)");
        return false;
    }

    if (engine.pool_timeout.count() < 0) {
        spdlog::error("pool_timeout must not be negative");
        return false;
    }

    try {
        DatabaseUrl url = parseDatabaseUrl(databaseUrl());
        if (!isSupportedFamily(url.family)) {
            spdlog::error("Unsupported database scheme: {}", url.family);
            return false;
        }
    } catch (const DatabaseError& e) {
        spdlog::error("Invalid database URL: {}", e.what());
        return false;
    }

    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (std::find(std::begin(levels), std::end(levels), logging.level) == std::end(levels)) {
        spdlog::error("Unknown log level: {}", logging.level);
        return false;
    }

    return true;
}

}  // namespace dbscope
