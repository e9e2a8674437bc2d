#pragma once

/**
 * @file StatementEvents.hpp
 * @brief Post-execution notification hub of an engine.
 *
 * Every statement a session executes successfully is announced with its raw
 * text and bound parameters. Listeners observe; they cannot alter execution.
 */

#include "QueryResult.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace dbscope {

using StatementListener = std::function<void(const std::string& sql, const Params& params)>;

namespace detail {
struct ListenerTable {
    std::mutex mutex;
    std::map<uint64_t, StatementListener> listeners;
    uint64_t nextId = 1;
};
}  // namespace detail

/**
 * @class ListenerToken
 * @brief Deregistration handle returned by StatementEvents::subscribe().
 *
 * Move-only. remove() unregisters the listener exactly once; later calls
 * and the destructor do nothing. A token outliving its hub is harmless.
 */
class ListenerToken {
public:
    ListenerToken() = default;
    ListenerToken(std::weak_ptr<detail::ListenerTable> table, uint64_t id);
    ~ListenerToken();

    ListenerToken(const ListenerToken&) = delete;
    ListenerToken& operator=(const ListenerToken&) = delete;

    ListenerToken(ListenerToken&& other) noexcept;
    ListenerToken& operator=(ListenerToken&& other) noexcept;

    void remove();

    bool active() const { return m_id != 0; }

private:
    std::weak_ptr<detail::ListenerTable> m_table;
    uint64_t m_id = 0;
};

class StatementEvents {
public:
    StatementEvents();

    [[nodiscard]] ListenerToken subscribe(StatementListener listener);

    /**
     * @brief Deliver one executed statement to every listener.
     *
     * Listeners run on the executing thread, outside the table lock.
     * A listener that throws is logged and skipped.
     */
    void notify(const std::string& sql, const Params& params) const;

    size_t listenerCount() const;

private:
    std::shared_ptr<detail::ListenerTable> m_table;
};

}  // namespace dbscope
