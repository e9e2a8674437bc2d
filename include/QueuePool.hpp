#pragma once

#include "ConnectionPool.hpp"
#include <condition_variable>

namespace dbscope {

/**
 * @class QueuePool
 * @brief Blocking pool: acquire() waits on a condition variable.
 *
 * Usage:
 * @code
 *   auto pool = QueuePool::create(Driver::makeFactory(url), options);
 *   PooledConnection conn = pool->acquire();
 *   conn->execute("SELECT 1");
 * @endcode
 */
class QueuePool : public ConnectionPool {
public:
    static std::shared_ptr<QueuePool> create(ConnectionFactory factory, PoolOptions options);

    /**
     * @brief Check out a connection, blocking the calling thread.
     * @throws PoolExhaustedError if none becomes available within the
     *         configured timeout, or the pool is disposed.
     */
    PooledConnection acquire();
    PooledConnection acquire(std::chrono::milliseconds timeout);

protected:
    QueuePool(ConnectionFactory factory, PoolOptions options);

    void notifyOneLocked() override { m_cv.notify_one(); }
    void notifyAllLocked() override { m_cv.notify_all(); }

private:
    std::condition_variable m_cv;
};

}  // namespace dbscope
