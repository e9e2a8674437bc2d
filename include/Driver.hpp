#pragma once

/**
 * @file Driver.hpp
 * @brief Opens backend connections from a parsed database URL.
 *
 * The driver layer is the only place that knows which Connection subclass
 * serves which database family. Backends not compiled in (PostgreSQL or
 * MySQL client library missing at build time) are reported as unavailable.
 */

#include "Connection.hpp"
#include "UriTranslator.hpp"
#include <functional>
#include <memory>
#include <string>

namespace dbscope {

// Opens one new connection each time it is called
using ConnectionFactory = std::function<std::unique_ptr<Connection>()>;

struct DriverOptions {
    int connect_timeout = 10;           // seconds (server backends)
    int sqlite_busy_timeout = 5000;     // milliseconds
};

class Driver {
public:
    /**
     * @brief Build a factory for the database named by `url`.
     * @throws EngineConstructionError if the family's backend is not built in.
     *
     * For an in-memory SQLite URL the factory opens every connection on one
     * named shared-cache memory database, generated once per factory, so all
     * pooled connections see the same data.
     */
    static ConnectionFactory makeFactory(const DatabaseUrl& url, const DriverOptions& options = {});

    // Whether a backend for `family` was compiled in
    static bool isAvailable(const std::string& family);

    /**
     * @brief Filename handed to sqlite3_open_v2() for a parsed SQLite URL.
     * @param memoryName Name used for in-memory databases.
     */
    static std::string sqliteFilename(const DatabaseUrl& url, const std::string& memoryName);

private:
    static std::string nextMemoryName();
};

}  // namespace dbscope
