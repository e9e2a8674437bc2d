#pragma once

#include "EngineRegistry.hpp"
#include "Session.hpp"
#include <boost/asio/awaitable.hpp>

namespace dbscope {

// Opens sessions on the registry's engines, building them on first use
class SessionFactory {
public:
    explicit SessionFactory(EngineRegistry& registry) : m_registry(registry) {}

    /**
     * @brief Open a blocking session on one pooled connection.
     * @throws PoolExhaustedError when no connection frees up within the pool timeout.
     */
    Session openSession();

    // Connection checkout suspends the calling coroutine
    boost::asio::awaitable<AsyncSession> openAsyncSession();

    EngineRegistry& registry() { return m_registry; }

private:
    EngineRegistry& m_registry;
};

}  // namespace dbscope
