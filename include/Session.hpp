#pragma once

/**
 * @file Session.hpp
 * @brief Units of work bound to one pooled connection.
 *
 * A session begins a transaction lazily, on its first statement. Statements
 * queued with add() run at the next flush() or commit(); rollback() discards
 * them. Closing a session rolls back whatever is still open and returns the
 * connection to its pool. A closed session rejects every operation with
 * SessionStateError.
 */

#include "ConnectionPool.hpp"
#include "Engine.hpp"
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dbscope {

class SessionBase {
public:
    virtual ~SessionBase() = default;

    SessionBase(const SessionBase&) = delete;
    SessionBase& operator=(const SessionBase&) = delete;

    bool isClosed() const { return m_closed; }
    bool inTransaction() const { return m_inTransaction; }
    size_t pendingCount() const { return m_pending.size(); }

    // Queue a statement for the next flush
    void add(std::string sql, Params params = {});

    EngineBase& engine() const { return *m_engine; }

protected:
    SessionBase(std::shared_ptr<EngineBase> engine, PooledConnection conn);
    SessionBase(SessionBase&& other) noexcept;
    SessionBase& operator=(SessionBase&& other) noexcept;

    // Throws SessionStateError once closed
    void ensureOpen(const char* operation) const;

    // Dialect-specific transaction verbs
    std::string beginStatement() const;

    // Announce a successfully executed statement
    void announce(const std::string& sql, const Params& params) const;

    // Synchronous rollback and release; never throws DatabaseError
    void closeNow();

    std::shared_ptr<EngineBase> m_engine;
    PooledConnection m_conn;
    std::vector<std::pair<std::string, Params>> m_pending;
    bool m_inTransaction = false;
    bool m_closed = false;
};

/**
 * @class Session
 * @brief Blocking session.
 *
 * Usage:
 * @code
 *   Session session = factory.openSession();
 *   session.execute("INSERT INTO authors(name) VALUES (?)", {std::string("Ann")});
 *   session.commit();
 * @endcode
 */
class Session : public SessionBase {
public:
    Session(std::shared_ptr<Engine> engine, PooledConnection conn);
    ~Session() override;

    Session(Session&& other) noexcept = default;
    Session& operator=(Session&& other) noexcept;

    /**
     * @brief Flush pending statements, then run `sql`.
     * @throws StatementError from the driver.
     */
    QueryResult execute(const std::string& sql, const Params& params = {});

    void flush();
    void commit();
    void rollback();

    // Roll back an open transaction and return the connection. Idempotent.
    void close();

private:
    void begin();
    QueryResult run(const std::string& sql, const Params& params);
};

/**
 * @class AsyncSession
 * @brief Coroutine session; every round trip is a suspension point.
 *
 * If the owning coroutine is destroyed while suspended, the destructor
 * rolls back synchronously and returns the connection.
 */
class AsyncSession : public SessionBase {
public:
    AsyncSession(std::shared_ptr<AsyncEngine> engine, PooledConnection conn);
    ~AsyncSession() override;

    AsyncSession(AsyncSession&& other) noexcept = default;
    AsyncSession& operator=(AsyncSession&& other) noexcept;

    boost::asio::awaitable<QueryResult> execute(std::string sql, Params params = {});
    boost::asio::awaitable<void> flush();
    boost::asio::awaitable<void> commit();
    boost::asio::awaitable<void> rollback();
    boost::asio::awaitable<void> close();

private:
    boost::asio::awaitable<void> begin();
    boost::asio::awaitable<QueryResult> run(std::string sql, Params params);
};

}  // namespace dbscope
