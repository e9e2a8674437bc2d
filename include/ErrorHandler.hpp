#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <stdexcept>
#include <exception>
#include <thread>
#include <chrono>

namespace dbscope {

// Base of every error raised by the runtime
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& message) : std::runtime_error(message) {}
};

// Unknown URI scheme during translation or engine construction; never retried
class UnsupportedSchemeError : public DatabaseError {
public:
    explicit UnsupportedSchemeError(const std::string& scheme);

    const std::string& scheme() const { return m_scheme; }

private:
    std::string m_scheme;
};

// Bad connection parameters or unreachable database; the registry stays retryable
class EngineConstructionError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

// Acquire timeout elapsed, or the pool was disposed while waiting
class PoolExhaustedError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

// Opening a driver connection failed (refused, authentication, bad file)
class ConnectionError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

// Session used after it was closed
class SessionStateError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

// Driver-level failure while executing a statement
class StatementError : public DatabaseError {
public:
    StatementError(const std::string& message, int code = 0,
                   std::string sqlState = "", bool transient = false);

    int code() const { return m_code; }
    const std::string& sqlState() const { return m_sqlState; }
    bool isTransient() const { return m_transient; }

private:
    int m_code;
    std::string m_sqlState;
    bool m_transient;
};

class ErrorHandler {
public:
    // Pool exhaustion, connection failures and transient statement errors are worth retrying
    static bool isRetryable(const std::exception& e);

    // Check if a PostgreSQL SQLSTATE denotes a transient condition
    static bool isTransientSqlState(const std::string& sqlState);

    // Backoff before retry number `attempt` (1-based): 100ms, 200ms, 400ms...
    static std::chrono::milliseconds backoffDelay(int attempt);

    // Execute with retry logic
    template<typename Func>
    static auto executeWithRetry(Func&& operation, int maxRetries = 3) -> decltype(operation()) {
        int attempt = 0;
        while (true) {
            try {
                return operation();
            } catch (const DatabaseError& e) {
                ++attempt;
                if (!isRetryable(e) || attempt >= maxRetries) {
                    throw;
                }
                spdlog::debug("Retryable failure (attempt {}/{}): {}", attempt, maxRetries, e.what());
            }
            std::this_thread::sleep_for(backoffDelay(attempt));
        }
    }

    // Coroutine variant; the backoff suspends instead of blocking the thread
    template<typename Func>
    static auto asyncExecuteWithRetry(Func operation, int maxRetries = 3) -> decltype(operation()) {
        int attempt = 0;
        while (true) {
            try {
                co_return co_await operation();
            } catch (const DatabaseError& e) {
                ++attempt;
                if (!isRetryable(e) || attempt >= maxRetries) {
                    throw;
                }
                spdlog::debug("Retryable failure (attempt {}/{}): {}", attempt, maxRetries, e.what());
            }
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
            timer.expires_after(backoffDelay(attempt));
            co_await timer.async_wait(boost::asio::use_awaitable);
        }
    }
};

}  // namespace dbscope
