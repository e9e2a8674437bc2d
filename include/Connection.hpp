#pragma once

/**
 * @file Connection.hpp
 * @brief Common interface of the per-family database connections.
 *
 * A Connection wraps exactly one native driver handle (sqlite3*, PGconn*,
 * MYSQL*). Connections are created by Driver, owned by a connection pool while
 * idle and lent to one Session at a time through PooledConnection.
 */

#include "QueryResult.hpp"
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace dbscope {

class Connection {
public:
    virtual ~Connection() = default;

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Database family served by this connection.
     * @return "sqlite", "postgresql" or "mysql".
     */
    virtual std::string family() const = 0;

    /**
     * @brief Check that the native handle is open.
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Round-trip a trivial statement to check liveness.
     * @return false when the server is gone; never throws.
     */
    virtual bool ping() = 0;

    /**
     * @brief Execute one statement, blocking the calling thread.
     * @param sql Statement text with `?` placeholders.
     * @param params Values bound to the placeholders in order.
     * @throws StatementError on any driver failure.
     */
    virtual QueryResult execute(const std::string& sql, const Params& params = {}) = 0;

    /**
     * @brief Execute one statement from a coroutine.
     *
     * The default implementation yields to the executor once and then runs
     * execute(); backends with a non-blocking client protocol override it so
     * the coroutine suspends for the whole round trip.
     */
    virtual boost::asio::awaitable<QueryResult> asyncExecute(std::string sql, Params params);

    // Schema introspection
    virtual std::vector<std::string> tableNames() = 0;
    virtual std::vector<std::string> columnNames(const std::string& table) = 0;

    std::chrono::steady_clock::time_point createdAt() const { return m_createdAt; }

protected:
    Connection() : m_createdAt(std::chrono::steady_clock::now()) {}

    // Collect the first column of every row
    static std::vector<std::string> firstColumn(const QueryResult& result);

private:
    std::chrono::steady_clock::time_point m_createdAt;
};

}  // namespace dbscope
