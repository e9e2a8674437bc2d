#pragma once

#include <string>
#include <chrono>
#include <cstddef>
#include <optional>
#include <filesystem>

namespace dbscope {

struct EngineConfig {
    // Blocking-mode connection URL; empty means "derive from data_path/exec_env"
    std::string url;
    std::string data_path = "data";
    std::string exec_env = "dev";

    // Pool parameters (read once per engine construction)
    size_t pool_size = 5;
    size_t max_overflow = 10;
    std::chrono::milliseconds pool_timeout{30000};
    std::chrono::seconds pool_recycle{-1};  // negative disables recycling
    bool pool_pre_ping = false;

    // `url`, or the SQLite file derived from data_path and exec_env
    std::string resolvedUrl() const;
};

struct AnalyzerConfig {
    // potentialNPlusOne requires strictly more SELECTs than this
    size_t select_threshold = 2;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    bool console = true;
};

struct Config {
    EngineConfig engine;
    AnalyzerConfig analyzer;
    LoggingConfig logging;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments (dbscope-info)
    static Config parseArgs(int argc, char* argv[]);

    // Defaults overridden by DBSCOPE_DATABASE_URL / DBSCOPE_EXEC_ENV
    static Config fromEnvironment();

    // Validate configuration
    bool validate() const;

    // Apply environment overrides in place
    void applyEnvironment();

    // Blocking-mode URL, derived when engine.url is empty
    std::string databaseUrl() const;
};

}  // namespace dbscope
