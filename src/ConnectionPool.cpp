#include "ConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace dbscope {

std::string PoolStatus::toString() const {
    std::ostringstream out;
    out << "Pool size: " << pool_size
        << "  Connections in pool: " << idle
        << " Current Overflow: " << overflow
        << " Current Checked out connections: " << checked_out
        << " Waiting: " << waiting;
    return out.str();
}

// ============================================================================
// PooledConnection
// ============================================================================

PooledConnection::PooledConnection(std::shared_ptr<ConnectionPool> pool,
                                   std::unique_ptr<Connection> conn)
    : m_pool(std::move(pool)), m_conn(std::move(conn)) {
}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : m_pool(std::move(other.m_pool)), m_conn(std::move(other.m_conn)) {
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        m_pool = std::move(other.m_pool);
        m_conn = std::move(other.m_conn);
    }
    return *this;
}

void PooledConnection::release() {
    if (m_pool && m_conn) {
        m_pool->checkin(std::move(m_conn), true);
    }
    m_pool.reset();
    m_conn.reset();
}

void PooledConnection::discard() {
    if (m_pool && m_conn) {
        m_pool->checkin(std::move(m_conn), false);
    }
    m_pool.reset();
    m_conn.reset();
}

// ============================================================================
// ConnectionPool
// ============================================================================

ConnectionPool::ConnectionPool(ConnectionFactory factory, PoolOptions options)
    : m_factory(std::move(factory)), m_options(options) {
}

PoolStatus ConnectionPool::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    PoolStatus st;
    st.pool_size = m_options.pool_size;
    st.idle = m_idle.size();
    st.checked_out = m_checkedOut;
    size_t total = m_idle.size() + m_checkedOut;
    st.overflow = total > m_options.pool_size ? total - m_options.pool_size : 0;
    st.waiting = m_waiting;
    return st;
}

size_t ConnectionPool::checkedOutCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_checkedOut;
}

bool ConnectionPool::isDisposed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_disposed;
}

size_t ConnectionPool::dispose() {
    std::deque<std::unique_ptr<Connection>> closing;
    size_t checkedOut = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disposed) {
            return m_checkedOut;
        }
        m_disposed = true;
        closing.swap(m_idle);
        checkedOut = m_checkedOut;
        notifyAllLocked();
    }

    spdlog::debug("Connection pool disposed ({} idle closed, {} checked out)",
                  closing.size(), checkedOut);
    return checkedOut;
}

PooledConnection ConnectionPool::tryAcquire() {
    std::optional<Grant> grant;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        grant = tryGrantLocked();
    }
    if (!grant) {
        return PooledConnection();
    }
    return finishGrant(std::move(*grant));
}

std::optional<ConnectionPool::Grant> ConnectionPool::tryGrantLocked() {
    if (m_disposed) {
        throw PoolExhaustedError("Connection pool is disposed");
    }

    if (!m_idle.empty()) {
        Grant grant{std::move(m_idle.front())};
        m_idle.pop_front();
        ++m_checkedOut;
        return grant;
    }

    if (m_checkedOut < m_options.pool_size + m_options.max_overflow) {
        ++m_checkedOut;
        return Grant{nullptr};
    }

    return std::nullopt;
}

std::unique_ptr<Connection> ConnectionPool::open() {
    try {
        auto conn = m_factory();
        spdlog::debug("Opened new pooled {} connection", conn->family());
        return conn;
    } catch (const std::exception& e) {
        // Give the reserved slot back so a waiter can try instead
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_checkedOut;
        notifyOneLocked();
        spdlog::error("Failed to create connection: {}", e.what());
        throw;
    }
}

bool ConnectionPool::isStale(const Connection& conn) const {
    if (m_options.recycle.count() < 0) return false;
    return std::chrono::steady_clock::now() - conn.createdAt() >= m_options.recycle;
}

PooledConnection ConnectionPool::finishGrant(Grant grant) {
    std::unique_ptr<Connection> conn = std::move(grant.conn);

    if (conn && isStale(*conn)) {
        spdlog::debug("Recycling {} connection past its maximum age", conn->family());
        conn.reset();
    } else if (conn && m_options.pre_ping && !conn->ping()) {
        spdlog::info("Pre-ping failed, replacing {} connection", conn->family());
        conn.reset();
    }

    if (!conn) {
        conn = open();
    }
    return PooledConnection(shared_from_this(), std::move(conn));
}

void ConnectionPool::checkin(std::unique_ptr<Connection> conn, bool reusable) {
    std::unique_ptr<Connection> closing;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_checkedOut;
        if (m_disposed || !reusable || !conn->isValid() ||
            m_idle.size() >= m_options.pool_size) {
            // Overflow, broken, or returned after dispose: close outside the lock
            closing = std::move(conn);
        } else {
            m_idle.push_back(std::move(conn));
        }
        notifyOneLocked();
    }
}

}  // namespace dbscope
