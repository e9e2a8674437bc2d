#include "Session.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace dbscope {

namespace net = boost::asio;

// ============================================================================
// SessionBase
// ============================================================================

SessionBase::SessionBase(std::shared_ptr<EngineBase> engine, PooledConnection conn)
    : m_engine(std::move(engine)), m_conn(std::move(conn)) {
}

SessionBase::SessionBase(SessionBase&& other) noexcept
    : m_engine(std::move(other.m_engine))
    , m_conn(std::move(other.m_conn))
    , m_pending(std::move(other.m_pending))
    , m_inTransaction(other.m_inTransaction)
    , m_closed(other.m_closed) {
    other.m_inTransaction = false;
    other.m_closed = true;
}

SessionBase& SessionBase::operator=(SessionBase&& other) noexcept {
    if (this != &other) {
        closeNow();
        m_engine = std::move(other.m_engine);
        m_conn = std::move(other.m_conn);
        m_pending = std::move(other.m_pending);
        m_inTransaction = other.m_inTransaction;
        m_closed = other.m_closed;
        other.m_inTransaction = false;
        other.m_closed = true;
    }
    return *this;
}

void SessionBase::add(std::string sql, Params params) {
    ensureOpen("add");
    m_pending.emplace_back(std::move(sql), std::move(params));
}

void SessionBase::ensureOpen(const char* operation) const {
    if (m_closed) {
        throw SessionStateError(std::string("Cannot ") + operation + ": session is closed");
    }
}

std::string SessionBase::beginStatement() const {
    return m_conn->family() == "mysql" ? "START TRANSACTION" : "BEGIN";
}

void SessionBase::announce(const std::string& sql, const Params& params) const {
    m_engine->events().notify(sql, params);
}

void SessionBase::closeNow() {
    if (m_closed) return;
    m_closed = true;
    m_pending.clear();

    if (m_conn && m_inTransaction) {
        try {
            m_conn->execute("ROLLBACK");
            spdlog::debug("Rolled back open transaction on session close");
        } catch (const DatabaseError& e) {
            // State of the connection is unknown; do not pool it
            spdlog::warn("Rollback on close failed, discarding connection: {}", e.what());
            m_conn.discard();
        }
    }
    m_inTransaction = false;
    m_conn.release();
}

// ============================================================================
// Session
// ============================================================================

Session::Session(std::shared_ptr<Engine> engine, PooledConnection conn)
    : SessionBase(std::move(engine), std::move(conn)) {
}

Session::~Session() {
    close();
}

Session& Session::operator=(Session&& other) noexcept {
    SessionBase::operator=(std::move(other));
    return *this;
}

void Session::begin() {
    m_conn->execute(beginStatement());
    m_inTransaction = true;
}

QueryResult Session::run(const std::string& sql, const Params& params) {
    if (!m_inTransaction) {
        begin();
    }
    QueryResult result = m_conn->execute(sql, params);
    announce(sql, params);
    return result;
}

QueryResult Session::execute(const std::string& sql, const Params& params) {
    ensureOpen("execute");
    flush();
    return run(sql, params);
}

void Session::flush() {
    ensureOpen("flush");
    auto pending = std::move(m_pending);
    m_pending.clear();
    for (const auto& [sql, params] : pending) {
        run(sql, params);
    }
}

void Session::commit() {
    ensureOpen("commit");
    flush();
    // The flag stays set until COMMIT succeeds so a failed commit is still rolled back
    if (m_inTransaction) {
        m_conn->execute("COMMIT");
        m_inTransaction = false;
    }
}

void Session::rollback() {
    ensureOpen("rollback");
    m_pending.clear();
    if (m_inTransaction) {
        m_conn->execute("ROLLBACK");
        m_inTransaction = false;
    }
}

void Session::close() {
    closeNow();
}

// ============================================================================
// AsyncSession
// ============================================================================

AsyncSession::AsyncSession(std::shared_ptr<AsyncEngine> engine, PooledConnection conn)
    : SessionBase(std::move(engine), std::move(conn)) {
}

AsyncSession::~AsyncSession() {
    // Reached without close() when the owning coroutine was cancelled
    closeNow();
}

AsyncSession& AsyncSession::operator=(AsyncSession&& other) noexcept {
    SessionBase::operator=(std::move(other));
    return *this;
}

net::awaitable<void> AsyncSession::begin() {
    co_await m_conn->asyncExecute(beginStatement(), {});
    m_inTransaction = true;
}

net::awaitable<QueryResult> AsyncSession::run(std::string sql, Params params) {
    if (!m_inTransaction) {
        co_await begin();
    }
    QueryResult result = co_await m_conn->asyncExecute(sql, params);
    announce(sql, params);
    co_return result;
}

net::awaitable<QueryResult> AsyncSession::execute(std::string sql, Params params) {
    ensureOpen("execute");
    co_await flush();
    co_return co_await run(std::move(sql), std::move(params));
}

net::awaitable<void> AsyncSession::flush() {
    ensureOpen("flush");
    auto pending = std::move(m_pending);
    m_pending.clear();
    for (auto& [sql, params] : pending) {
        co_await run(std::move(sql), std::move(params));
    }
}

net::awaitable<void> AsyncSession::commit() {
    ensureOpen("commit");
    co_await flush();
    if (m_inTransaction) {
        co_await m_conn->asyncExecute("COMMIT", {});
        m_inTransaction = false;
    }
}

net::awaitable<void> AsyncSession::rollback() {
    ensureOpen("rollback");
    m_pending.clear();
    if (m_inTransaction) {
        co_await m_conn->asyncExecute("ROLLBACK", {});
        m_inTransaction = false;
    }
}

net::awaitable<void> AsyncSession::close() {
    if (m_closed) co_return;

    bool rollbackFailed = false;
    if (m_conn && m_inTransaction) {
        try {
            co_await m_conn->asyncExecute("ROLLBACK", {});
            spdlog::debug("Rolled back open transaction on session close");
        } catch (const DatabaseError& e) {
            spdlog::warn("Rollback on close failed, discarding connection: {}", e.what());
            rollbackFailed = true;
        }
    }

    m_closed = true;
    m_inTransaction = false;
    m_pending.clear();
    if (rollbackFailed) {
        m_conn.discard();
    } else {
        m_conn.release();
    }
}

}  // namespace dbscope
