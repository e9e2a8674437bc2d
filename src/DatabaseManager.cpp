#include "DatabaseManager.hpp"
#include "ErrorHandler.hpp"

namespace dbscope {

DatabaseManager::DatabaseManager(EngineConfig config)
    : m_registry(std::move(config)), m_sessions(m_registry) {
}

DatabaseManager::~DatabaseManager() {
    m_registry.disposeAll();
}

DatabaseManager& DatabaseManager::instance() {
    static DatabaseManager manager(Config::fromEnvironment().engine);
    return manager;
}

ScopedSession DatabaseManager::scopedSession() {
    return ScopedSession(m_sessions.openSession());
}

void DatabaseManager::rollbackQuietly(Session& s) {
    if (s.isClosed()) return;
    try {
        s.rollback();
        spdlog::debug("Transaction rolled back after failure");
    } catch (const DatabaseError& e) {
        spdlog::warn("Rollback after failure also failed: {}", e.what());
    }
    s.close();
}

boost::asio::awaitable<void> DatabaseManager::asyncRollbackQuietly(AsyncSession& s) {
    if (s.isClosed()) co_return;
    try {
        co_await s.rollback();
        spdlog::debug("Transaction rolled back after failure");
    } catch (const DatabaseError& e) {
        spdlog::warn("Rollback after failure also failed: {}", e.what());
    }
}

}  // namespace dbscope
