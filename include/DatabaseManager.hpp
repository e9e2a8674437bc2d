#pragma once

/**
 * @file DatabaseManager.hpp
 * @brief Scope managers: the entry points model and repository code uses.
 *
 * Two contracts, each in a blocking and a coroutine form:
 * - session(fn): hands a session to `fn` and closes it on every exit path.
 *   Nothing is committed implicitly; closing rolls back open work.
 * - transaction(fn): commits when `fn` returns, rolls back when it throws
 *   and rethrows the original exception unchanged. The session is closed
 *   in both cases.
 *
 * Usage:
 * @code
 *   DatabaseManager db(config.engine);
 *   db.transaction([](Session& s) {
 *       s.execute("INSERT INTO authors(name) VALUES (?)", {std::string("Ann")});
 *   });
 *
 *   co_await db.asyncTransaction([](AsyncSession& s) -> net::awaitable<void> {
 *       co_await s.execute("DELETE FROM authors WHERE id = ?", {int64_t{3}});
 *   });
 * @endcode
 */

#include "EngineRegistry.hpp"
#include "SchemaInspector.hpp"
#include "Session.hpp"
#include "SessionFactory.hpp"
#include <boost/asio/awaitable.hpp>
#include <exception>
#include <optional>
#include <type_traits>
#include <spdlog/spdlog.h>

namespace dbscope {

namespace detail {

// Value type of the awaitable returned by `Fn(Arg)`
template<typename Fn, typename Arg>
using AwaitedResult = typename std::invoke_result_t<Fn&, Arg>::value_type;

// Disposes one engine mode when the scope ends
struct DisposeOnExit {
    EngineRegistry& registry;
    EngineMode mode;
    ~DisposeOnExit() { registry.dispose(mode); }
};

}  // namespace detail

class ScopedSession;

class DatabaseManager {
public:
    explicit DatabaseManager(EngineConfig config = {});
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Process-wide manager configured from DBSCOPE_* environment variables
    static DatabaseManager& instance();

    EngineRegistry& registry() { return m_registry; }
    SessionFactory& sessions() { return m_sessions; }

    std::shared_ptr<Engine> engine() { return m_registry.getEngine(); }
    std::shared_ptr<AsyncEngine> asyncEngine() { return m_registry.getAsyncEngine(); }
    SchemaInspector inspector() { return SchemaInspector(engine()); }

    ScopedSession scopedSession();

    // ------------------------------------------------------------------
    // Blocking scopes
    // ------------------------------------------------------------------

    template<typename Func>
    auto session(Func&& func) -> std::invoke_result_t<Func&, Session&> {
        Session s = m_sessions.openSession();
        // The destructor closes the session on every path
        return func(s);
    }

    template<typename Func>
    auto transaction(Func&& func) -> std::invoke_result_t<Func&, Session&> {
        Session s = m_sessions.openSession();
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Func&, Session&>>) {
                func(s);
                s.commit();
                s.close();
            } else {
                auto result = func(s);
                s.commit();
                s.close();
                return result;
            }
        } catch (...) {
            rollbackQuietly(s);
            throw;
        }
    }

    // Transaction on a fresh engine that is disposed afterwards (one-shot tools)
    template<typename Func>
    auto standaloneTransaction(Func&& func) -> std::invoke_result_t<Func&, Session&> {
        detail::DisposeOnExit guard{m_registry, EngineMode::Blocking};
        return transaction(std::forward<Func>(func));
    }

    // ------------------------------------------------------------------
    // Coroutine scopes; `func` returns boost::asio::awaitable<T>
    // ------------------------------------------------------------------

    template<typename Func>
    auto asyncSession(Func func) -> boost::asio::awaitable<detail::AwaitedResult<Func, AsyncSession&>> {
        using Result = detail::AwaitedResult<Func, AsyncSession&>;
        AsyncSession s = co_await m_sessions.openAsyncSession();

        std::exception_ptr failure;
        std::optional<std::conditional_t<std::is_void_v<Result>, bool, Result>> result;
        try {
            if constexpr (std::is_void_v<Result>) {
                co_await func(s);
            } else {
                result.emplace(co_await func(s));
            }
        } catch (...) {
            failure = std::current_exception();
        }

        co_await s.close();
        if (failure) {
            std::rethrow_exception(failure);
        }
        if constexpr (!std::is_void_v<Result>) {
            co_return std::move(*result);
        }
    }

    template<typename Func>
    auto asyncTransaction(Func func) -> boost::asio::awaitable<detail::AwaitedResult<Func, AsyncSession&>> {
        using Result = detail::AwaitedResult<Func, AsyncSession&>;
        AsyncSession s = co_await m_sessions.openAsyncSession();

        // No co_await is allowed inside a handler: record, then finalize
        std::exception_ptr failure;
        std::optional<std::conditional_t<std::is_void_v<Result>, bool, Result>> result;
        try {
            if constexpr (std::is_void_v<Result>) {
                co_await func(s);
            } else {
                result.emplace(co_await func(s));
            }
            co_await s.commit();
        } catch (...) {
            failure = std::current_exception();
        }

        if (failure) {
            co_await asyncRollbackQuietly(s);
            co_await s.close();
            std::rethrow_exception(failure);
        }

        co_await s.close();
        if constexpr (!std::is_void_v<Result>) {
            co_return std::move(*result);
        }
    }

    template<typename Func>
    auto asyncStandaloneTransaction(Func func)
        -> boost::asio::awaitable<detail::AwaitedResult<Func, AsyncSession&>> {
        detail::DisposeOnExit guard{m_registry, EngineMode::NonBlocking};
        co_return co_await asyncTransaction(std::move(func));
    }

private:
    // Rollback after a failure; a failing rollback must not mask the original error
    static void rollbackQuietly(Session& s);
    static boost::asio::awaitable<void> asyncRollbackQuietly(AsyncSession& s);

    EngineRegistry m_registry;
    SessionFactory m_sessions;
};

/**
 * @class ScopedSession
 * @brief Bare scope as an object: closes (and so rolls back) on destruction.
 *
 * @code
 *   {
 *       ScopedSession scope = db.scopedSession();
 *       scope->execute("UPDATE authors SET name = ? WHERE id = ?", {...});
 *       scope->commit();
 *   }
 * @endcode
 */
class ScopedSession {
public:
    explicit ScopedSession(Session session) : m_session(std::move(session)) {}
    ~ScopedSession() { m_session.close(); }

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;
    ScopedSession(ScopedSession&&) noexcept = default;
    ScopedSession& operator=(ScopedSession&&) = delete;

    Session& get() { return m_session; }
    Session* operator->() { return &m_session; }
    Session& operator*() { return m_session; }

private:
    Session m_session;
};

}  // namespace dbscope
