#pragma once

/**
 * @file MySQLConnection.hpp
 * @brief RAII wrapper for a MySQL server connection.
 */

#include "Connection.hpp"
#include "UriTranslator.hpp"
#include <mysql/mysql.h>
#include <string>
#include <cstdint>

namespace dbscope {

/**
 * @class MySQLConnection
 * @brief Owns one MYSQL* handle for its whole lifetime.
 *
 * The classic client API has no server-side placeholders for plain
 * queries, so `?` placeholders are interpolated client-side with
 * mysql_real_escape_string(), which honours the connection character set.
 *
 * Connection Validation:
 * - isValid() checks the handle is open
 * - ping() calls mysql_ping()
 */
class MySQLConnection : public Connection {
public:
    /**
     * @brief Connect to the server described by `url`.
     * @param connectTimeout Seconds to wait for the server.
     * @throws ConnectionError if the server refuses or cannot be reached.
     *
     * The connection uses utf8mb4 and CLIENT_MULTI_STATEMENTS.
     */
    MySQLConnection(const DatabaseUrl& url, unsigned int connectTimeout = 10);

    ~MySQLConnection() override;

    MYSQL* get() const { return m_conn; }

    std::string family() const override { return "mysql"; }

    bool isValid() const override { return m_conn != nullptr; }

    bool ping() override;

    QueryResult execute(const std::string& sql, const Params& params = {}) override;

    std::vector<std::string> tableNames() override;
    std::vector<std::string> columnNames(const std::string& table) override;

    /**
     * @brief Escape a string value for safe SQL interpolation.
     * @return Escaped string wrapped in single quotes.
     */
    std::string quote(const std::string& value) const;

    const char* error() const;

    /**
     * @brief Get the last error number.
     * @return MySQL error code (e.g., ER_DUP_ENTRY is 1062).
     */
    unsigned int errorNumber() const;

    // Lost connections, lock wait timeouts and deadlocks
    static bool isRetryableError(unsigned int code);

private:
    [[noreturn]] void fail(const std::string& what) const;

    MYSQL* m_conn = nullptr;  ///< MySQL connection handle (owned)
};

}  // namespace dbscope
