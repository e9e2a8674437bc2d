#pragma once

#include "ConnectionPool.hpp"
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <list>

namespace dbscope {

/**
 * @class AsyncQueuePool
 * @brief Non-blocking pool: acquire() suspends the calling coroutine.
 *
 * Each waiting coroutine parks on its own steady_timer that expires at the
 * acquire deadline. Returning a connection wakes the oldest waiter by
 * expiring its timer on the waiter's executor. A waiter whose coroutine is
 * destroyed while suspended unregisters itself.
 */
class AsyncQueuePool : public ConnectionPool {
public:
    static std::shared_ptr<AsyncQueuePool> create(ConnectionFactory factory, PoolOptions options);

    /**
     * @brief Check out a connection, suspending until one is available.
     * @throws PoolExhaustedError on timeout or when the pool is disposed.
     */
    boost::asio::awaitable<PooledConnection> acquire();
    boost::asio::awaitable<PooledConnection> acquire(std::chrono::milliseconds timeout);

protected:
    AsyncQueuePool(ConnectionFactory factory, PoolOptions options);

    void notifyOneLocked() override;
    void notifyAllLocked() override;

private:
    struct Waiter {
        explicit Waiter(const boost::asio::any_io_executor& executor) : timer(executor) {}

        boost::asio::steady_timer timer;
        bool notified = false;
    };

    static void wake(const std::shared_ptr<Waiter>& waiter);

    std::list<std::shared_ptr<Waiter>> m_waiters;
};

}  // namespace dbscope
