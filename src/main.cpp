#include "Config.hpp"
#include "DatabaseManager.hpp"
#include "ErrorHandler.hpp"
#include "Logging.hpp"
#include "UriTranslator.hpp"
#include <spdlog/spdlog.h>
#include <iostream>

using namespace dbscope;

namespace {

void printEngineSettings(const Config& config) {
    const EngineConfig& engine = config.engine;
    std::string blocking = config.databaseUrl();

    std::cout << "Environment:       " << engine.exec_env << "\n";
    std::cout << "Blocking URL:      " << parseDatabaseUrl(blocking).redacted() << "\n";
    std::cout << "Non-blocking URL:  " << parseDatabaseUrl(toAsyncUri(blocking)).redacted() << "\n";
    std::cout << "Pool size:         " << engine.pool_size << "\n";
    std::cout << "Max overflow:      " << engine.max_overflow << "\n";
    std::cout << "Pool timeout:      " << engine.pool_timeout.count() << " ms\n";
    std::cout << "Pool recycle:      ";
    if (engine.pool_recycle.count() < 0) {
        std::cout << "disabled\n";
    } else {
        std::cout << engine.pool_recycle.count() << " s\n";
    }
    std::cout << "Pre-ping:          " << (engine.pool_pre_ping ? "yes" : "no") << "\n";
    std::cout << "N+1 threshold:     " << config.analyzer.select_threshold << " SELECTs\n";
}

void printTables(DatabaseManager& db) {
    SchemaInspector inspector = db.inspector();
    auto tables = inspector.tableNames();

    std::cout << "\nTables (" << tables.size() << "):\n";
    for (const auto& table : tables) {
        auto columns = inspector.columnNames(table);
        std::cout << "  " << table << " (" << columns.size() << " columns)\n";
    }
    std::cout << "\nPool: " << db.engine()->status().toString() << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = Config::parseArgs(argc, argv);

    setupLogging(config.logging);

    if (!config.validate()) {
        return 1;
    }

    printEngineSettings(config);

    try {
        DatabaseManager db(config.engine);
        printTables(db);
        db.registry().disposeAll();
    } catch (const DatabaseError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
