#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief RAII wrapper for a PostgreSQL server connection.
 *
 * Blocking execution goes through PQexecParams(). Non-blocking execution
 * sends the statement with PQsendQueryParams() and suspends the calling
 * coroutine on the connection socket until the result arrives.
 */

#include "Connection.hpp"
#include "UriTranslator.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>

namespace dbscope {

/**
 * @class PostgreSQLConnection
 * @brief Owns one PGconn* for its whole lifetime.
 *
 * PostgreSQL libpq API Usage:
 * - PQconnectdbParams() to connect from URL components
 * - PQexecParams() for parameterized statements ($1, $2, ... placeholders)
 * - PQsendQueryParams() / PQconsumeInput() / PQisBusy() for the async path
 * - PQstatus() for connection state checking
 *
 * Statement text uses `?` placeholders; they are rewritten to `$n` before
 * the statement is sent.
 *
 * Thread Safety:
 * - A connection serves one session at a time; the pool hands it out
 */
class PostgreSQLConnection : public Connection {
public:
    /**
     * @brief Connect to the server described by `url`.
     * @param connectTimeout Seconds to wait for the server (connect_timeout).
     * @throws ConnectionError if the server refuses or cannot be reached.
     *
     * Query parameters of the URL (sslmode, application_name, ...) are passed
     * to libpq as connection keywords.
     */
    PostgreSQLConnection(const DatabaseUrl& url, int connectTimeout = 10);

    ~PostgreSQLConnection() override;

    PGconn* get() const { return m_conn; }

    std::string family() const override { return "postgresql"; }

    /**
     * @brief Check PQstatus() == CONNECTION_OK.
     */
    bool isValid() const override;

    bool ping() override;

    QueryResult execute(const std::string& sql, const Params& params = {}) override;

    /**
     * @brief Send the statement and suspend until the server answers.
     *
     * The coroutine waits for the socket to become readable instead of
     * blocking the executor thread.
     */
    boost::asio::awaitable<QueryResult> asyncExecute(std::string sql, Params params) override;

    std::vector<std::string> tableNames() override;
    std::vector<std::string> columnNames(const std::string& table) override;

    const char* error() const;

private:
    // Text form of each parameter; NULL stays nullptr
    struct EncodedParams {
        std::vector<std::string> storage;
        std::vector<const char*> values;
    };

    static EncodedParams encode(const Params& params);

    // Drain a completed async round trip: keep the first result, clear the rest
    PGresult* takeResult();

    PGconn* m_conn = nullptr;  ///< PostgreSQL connection handle (owned)
};

}  // namespace dbscope
