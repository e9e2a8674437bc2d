#include "QueuePool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace dbscope {

QueuePool::QueuePool(ConnectionFactory factory, PoolOptions options)
    : ConnectionPool(std::move(factory), options) {
}

std::shared_ptr<QueuePool> QueuePool::create(ConnectionFactory factory, PoolOptions options) {
    // Constructor is protected; make_shared cannot reach it
    return std::shared_ptr<QueuePool>(new QueuePool(std::move(factory), options));
}

PooledConnection QueuePool::acquire() {
    return acquire(options().timeout);
}

PooledConnection QueuePool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (auto grant = tryGrantLocked()) {
            lock.unlock();
            return finishGrant(std::move(*grant));
        }

        // Wait for a connection to be released
        ++m_waiting;
        std::cv_status st = m_cv.wait_until(lock, deadline);
        --m_waiting;

        if (st == std::cv_status::timeout) {
            // One last look: a release may have raced the deadline
            if (auto grant = tryGrantLocked()) {
                lock.unlock();
                return finishGrant(std::move(*grant));
            }
            spdlog::warn("Timed out after {}ms waiting for a pooled connection", timeout.count());
            throw PoolExhaustedError("QueuePool limit of size " + std::to_string(options().pool_size) +
                                     " overflow " + std::to_string(options().max_overflow) +
                                     " reached, connection timed out, timeout " +
                                     std::to_string(timeout.count()) + "ms");
        }
    }
}

}  // namespace dbscope
