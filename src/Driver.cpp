#include "Driver.hpp"
#include "ErrorHandler.hpp"
#include "sqlite/SQLiteConnection.hpp"
#ifdef DBSCOPE_HAVE_POSTGRESQL
#include "postgresql/PostgreSQLConnection.hpp"
#endif
#ifdef DBSCOPE_HAVE_MYSQL
#include "mysql/MySQLConnection.hpp"
#endif
#include <spdlog/spdlog.h>
#include <atomic>
#include <stdexcept>

namespace dbscope {

std::string Driver::nextMemoryName() {
    static std::atomic<unsigned> counter{0};
    return "dbscope_mem_" + std::to_string(++counter);
}

std::string Driver::sqliteFilename(const DatabaseUrl& url, const std::string& memoryName) {
    if (url.isMemorySqlite()) {
        return "file:" + memoryName + "?mode=memory&cache=shared";
    }
    return url.database;
}

bool Driver::isAvailable(const std::string& family) {
    if (family == "sqlite") return true;
#ifdef DBSCOPE_HAVE_POSTGRESQL
    if (family == "postgresql") return true;
#endif
#ifdef DBSCOPE_HAVE_MYSQL
    if (family == "mysql") return true;
#endif
    return false;
}

ConnectionFactory Driver::makeFactory(const DatabaseUrl& url, const DriverOptions& options) {
    if (!isSupportedFamily(url.family)) {
        throw UnsupportedSchemeError(url.family);
    }
    if (!isAvailable(url.family)) {
        throw EngineConstructionError("Backend '" + url.family + "' is not built into this binary");
    }

    if (url.family == "sqlite") {
        std::string filename = sqliteFilename(url, nextMemoryName());
        int busyTimeout = options.sqlite_busy_timeout;
        // `?busy_timeout=<ms>` overrides the driver default
        if (auto it = url.query.find("busy_timeout"); it != url.query.end()) {
            try {
                busyTimeout = std::stoi(it->second);
            } catch (const std::logic_error&) {
                throw EngineConstructionError("Invalid busy_timeout '" + it->second + "'");
            }
            if (busyTimeout < 0) {
                throw EngineConstructionError("Invalid busy_timeout '" + it->second + "'");
            }
        }
        spdlog::debug("SQLite driver using '{}'", filename);
        return [filename, busyTimeout]() -> std::unique_ptr<Connection> {
            return std::make_unique<SQLiteConnection>(filename, busyTimeout);
        };
    }

#ifdef DBSCOPE_HAVE_POSTGRESQL
    if (url.family == "postgresql") {
        int timeout = options.connect_timeout;
        return [url, timeout]() -> std::unique_ptr<Connection> {
            return std::make_unique<PostgreSQLConnection>(url, timeout);
        };
    }
#endif

#ifdef DBSCOPE_HAVE_MYSQL
    if (url.family == "mysql") {
        auto timeout = static_cast<unsigned int>(options.connect_timeout);
        return [url, timeout]() -> std::unique_ptr<Connection> {
            return std::make_unique<MySQLConnection>(url, timeout);
        };
    }
#endif

    throw EngineConstructionError("No driver for family '" + url.family + "'");
}

}  // namespace dbscope
