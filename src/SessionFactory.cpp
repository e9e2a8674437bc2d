#include "SessionFactory.hpp"

namespace dbscope {

Session SessionFactory::openSession() {
    auto engine = m_registry.getEngine();
    PooledConnection conn = engine->connect();
    return Session(std::move(engine), std::move(conn));
}

boost::asio::awaitable<AsyncSession> SessionFactory::openAsyncSession() {
    auto engine = m_registry.getAsyncEngine();
    PooledConnection conn = co_await engine->connect();
    co_return AsyncSession(std::move(engine), std::move(conn));
}

}  // namespace dbscope
