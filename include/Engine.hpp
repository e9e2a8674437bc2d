#pragma once

/**
 * @file Engine.hpp
 * @brief Engine handles: a connection pool plus driver configuration for one
 *        database and one execution mode.
 *
 * Engine serves blocking sessions from a QueuePool; AsyncEngine serves
 * coroutine sessions from an AsyncQueuePool. Both announce executed
 * statements through their StatementEvents hub.
 */

#include "AsyncQueuePool.hpp"
#include "Config.hpp"
#include "QueuePool.hpp"
#include "StatementEvents.hpp"
#include "UriTranslator.hpp"
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <string>

namespace dbscope {

class EngineBase {
public:
    virtual ~EngineBase() = default;

    EngineBase(const EngineBase&) = delete;
    EngineBase& operator=(const EngineBase&) = delete;

    EngineMode mode() const { return m_mode; }

    // Connection URI of this mode (already translated for non-blocking engines)
    const std::string& uri() const { return m_uri; }
    const DatabaseUrl& url() const { return m_url; }

    size_t poolSize() const { return m_config.pool_size; }
    size_t maxOverflow() const { return m_config.max_overflow; }
    const EngineConfig& config() const { return m_config; }

    StatementEvents& events() { return m_events; }
    const StatementEvents& events() const { return m_events; }

    PoolStatus status() const { return m_pool->status(); }

    /**
     * @brief Close the pool. Idempotent.
     *
     * Warns when sessions still hold connections; those connections keep
     * working and are closed when their sessions finish.
     */
    void dispose();

    bool isDisposed() const { return m_pool->isDisposed(); }

protected:
    EngineBase(EngineMode mode, std::string uri, EngineConfig config);

    // Called by subclasses once their pool exists
    void attachPool(std::shared_ptr<ConnectionPool> pool) { m_pool = std::move(pool); }

    ConnectionFactory makeFactory() const;
    PoolOptions poolOptions() const;

private:
    EngineMode m_mode;
    std::string m_uri;
    DatabaseUrl m_url;
    EngineConfig m_config;
    StatementEvents m_events;
    std::shared_ptr<ConnectionPool> m_pool;
};

/**
 * @class Engine
 * @brief Blocking-mode engine.
 */
class Engine : public EngineBase {
public:
    /**
     * @brief Build the pool and open one connection to prove the database is reachable.
     * @throws UnsupportedSchemeError for an unknown scheme.
     * @throws EngineConstructionError for anything else that prevents connecting.
     */
    Engine(std::string uri, EngineConfig config);

    // Check out a connection, blocking up to the pool timeout
    PooledConnection connect();

    // Table names of the connected database
    std::vector<std::string> tableNames();

private:
    std::shared_ptr<QueuePool> m_queue;
};

/**
 * @class AsyncEngine
 * @brief Non-blocking-mode engine; connection checkout suspends.
 */
class AsyncEngine : public EngineBase {
public:
    // `uri` must already be in non-blocking form
    AsyncEngine(std::string uri, EngineConfig config);

    boost::asio::awaitable<PooledConnection> connect();

    boost::asio::awaitable<std::vector<std::string>> tableNames();

private:
    std::shared_ptr<AsyncQueuePool> m_queue;
};

}  // namespace dbscope
