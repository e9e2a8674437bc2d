#pragma once

/**
 * @file ConnectionPool.hpp
 * @brief Bookkeeping shared by the blocking and non-blocking queue pools.
 *
 * A pool keeps up to `pool_size` idle connections and allows up to
 * `pool_size + max_overflow` connections to exist at once. Subclasses add
 * the waiting primitive: a condition variable (QueuePool) or asio timers
 * suspended in coroutines (AsyncQueuePool).
 */

#include "Connection.hpp"
#include "Driver.hpp"
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace dbscope {

struct PoolOptions {
    size_t pool_size = 5;
    size_t max_overflow = 10;
    std::chrono::milliseconds timeout{30000};
    std::chrono::seconds recycle{-1};  // negative disables recycling
    bool pre_ping = false;
};

struct PoolStatus {
    size_t pool_size = 0;
    size_t idle = 0;
    size_t checked_out = 0;
    size_t overflow = 0;
    size_t waiting = 0;

    std::string toString() const;
};

class ConnectionPool;

/**
 * @class PooledConnection
 * @brief A connection lent by a pool; returns itself when destroyed.
 *
 * Move-only. The lending pool is kept alive by the handle, so a handle that
 * outlives its engine still returns (and then closes) its connection.
 */
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(std::shared_ptr<ConnectionPool> pool, std::unique_ptr<Connection> conn);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    Connection* get() const { return m_conn.get(); }
    Connection* operator->() const { return m_conn.get(); }
    Connection& operator*() const { return *m_conn; }

    explicit operator bool() const { return m_conn != nullptr; }

    // Return the connection to its pool now
    void release();

    // Close the connection instead of returning it (broken connections)
    void discard();

private:
    std::shared_ptr<ConnectionPool> m_pool;
    std::unique_ptr<Connection> m_conn;
};

class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
public:
    virtual ~ConnectionPool() = default;

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    const PoolOptions& options() const { return m_options; }

    // Pool statistics
    PoolStatus status() const;
    size_t checkedOutCount() const;

    /**
     * @brief Close idle connections and refuse further acquisition.
     * @return Number of connections still checked out.
     *
     * Waiters wake up with PoolExhaustedError. Connections checked out at
     * this point keep working and are closed when returned. Idempotent.
     */
    size_t dispose();

    bool isDisposed() const;

    // Never waits: returns an empty handle when the pool is at capacity
    PooledConnection tryAcquire();

protected:
    ConnectionPool(ConnectionFactory factory, PoolOptions options);

    // Outcome of one look at the pool under the lock
    struct Grant {
        std::unique_ptr<Connection> conn;  // idle connection, or null: open a new one
    };

    /**
     * @brief Take an idle connection or reserve a slot for a new one.
     * @return nullopt when the pool is at capacity.
     * @throws PoolExhaustedError if the pool is disposed.
     *
     * Caller holds m_mutex.
     */
    std::optional<Grant> tryGrantLocked();

    /**
     * @brief Turn a grant into a usable connection, outside the lock.
     *
     * Applies recycle and pre-ping to idle connections and opens new ones.
     * A failed open gives the reserved slot back before rethrowing.
     */
    PooledConnection finishGrant(Grant grant);

    // Wake one waiter; called with m_mutex held
    virtual void notifyOneLocked() = 0;
    // Wake every waiter; called with m_mutex held
    virtual void notifyAllLocked() = 0;

    mutable std::mutex m_mutex;
    size_t m_waiting = 0;

private:
    friend class PooledConnection;

    void checkin(std::unique_ptr<Connection> conn, bool reusable);
    std::unique_ptr<Connection> open();
    bool isStale(const Connection& conn) const;

    ConnectionFactory m_factory;
    PoolOptions m_options;
    std::deque<std::unique_ptr<Connection>> m_idle;
    size_t m_checkedOut = 0;
    bool m_disposed = false;
};

}  // namespace dbscope
