#include "AsyncQueuePool.hpp"
#include "ErrorHandler.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
#include <optional>

namespace dbscope {

namespace net = boost::asio;

AsyncQueuePool::AsyncQueuePool(ConnectionFactory factory, PoolOptions options)
    : ConnectionPool(std::move(factory), options) {
}

std::shared_ptr<AsyncQueuePool> AsyncQueuePool::create(ConnectionFactory factory, PoolOptions options) {
    return std::shared_ptr<AsyncQueuePool>(new AsyncQueuePool(std::move(factory), options));
}

void AsyncQueuePool::wake(const std::shared_ptr<Waiter>& waiter) {
    waiter->notified = true;
    // Timers are not thread-safe; touch this one only on its own executor.
    // An already-expired timer also covers a wait that has not started yet.
    net::post(waiter->timer.get_executor(), [waiter]() {
        waiter->timer.expires_after(std::chrono::milliseconds(0));
    });
}

void AsyncQueuePool::notifyOneLocked() {
    for (auto& waiter : m_waiters) {
        if (!waiter->notified) {
            wake(waiter);
            return;
        }
    }
}

void AsyncQueuePool::notifyAllLocked() {
    for (auto& waiter : m_waiters) {
        wake(waiter);
    }
}

net::awaitable<PooledConnection> AsyncQueuePool::acquire() {
    return acquire(options().timeout);
}

net::awaitable<PooledConnection> AsyncQueuePool::acquire(std::chrono::milliseconds timeout) {
    auto executor = co_await net::this_coro::executor;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    // Unregisters the waiter on every exit, including destruction of the
    // suspended coroutine frame
    struct WaiterGuard {
        AsyncQueuePool* pool;
        std::list<std::shared_ptr<Waiter>>::iterator it;
        bool active = false;

        void reset() {
            if (!active) return;
            std::lock_guard<std::mutex> lock(pool->m_mutex);
            // A wakeup this waiter never used is passed on
            bool passOn = (*it)->notified;
            pool->m_waiters.erase(it);
            --pool->m_waiting;
            active = false;
            if (passOn) pool->notifyOneLocked();
        }
        ~WaiterGuard() { reset(); }
    };

    while (true) {
        WaiterGuard guard{this, {}};
        std::shared_ptr<Waiter> waiter;
        std::optional<Grant> grant;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            grant = tryGrantLocked();
            if (!grant) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    spdlog::warn("Timed out after {}ms waiting for a pooled connection",
                                 timeout.count());
                    throw PoolExhaustedError("AsyncQueuePool limit of size " +
                                             std::to_string(options().pool_size) + " overflow " +
                                             std::to_string(options().max_overflow) +
                                             " reached, connection timed out, timeout " +
                                             std::to_string(timeout.count()) + "ms");
                }

                waiter = std::make_shared<Waiter>(executor);
                waiter->timer.expires_at(deadline);
                guard.it = m_waiters.insert(m_waiters.end(), waiter);
                guard.active = true;
                ++m_waiting;
            }
        }

        // finishGrant may open a connection, so it runs outside the lock
        if (grant) {
            co_return finishGrant(std::move(*grant));
        }

        boost::system::error_code ec;
        co_await waiter->timer.async_wait(net::redirect_error(net::use_awaitable, ec));

        // Woken or timed out, the next pass decides; the wakeup is consumed here
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            waiter->notified = false;
        }
    }
}

}  // namespace dbscope
