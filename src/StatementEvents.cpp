#include "StatementEvents.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace dbscope {

ListenerToken::ListenerToken(std::weak_ptr<detail::ListenerTable> table, uint64_t id)
    : m_table(std::move(table)), m_id(id) {
}

ListenerToken::~ListenerToken() {
    remove();
}

ListenerToken::ListenerToken(ListenerToken&& other) noexcept
    : m_table(std::move(other.m_table)), m_id(other.m_id) {
    other.m_id = 0;
}

ListenerToken& ListenerToken::operator=(ListenerToken&& other) noexcept {
    if (this != &other) {
        remove();
        m_table = std::move(other.m_table);
        m_id = other.m_id;
        other.m_id = 0;
    }
    return *this;
}

void ListenerToken::remove() {
    if (m_id == 0) return;
    if (auto table = m_table.lock()) {
        std::lock_guard<std::mutex> lock(table->mutex);
        table->listeners.erase(m_id);
    }
    m_id = 0;
    m_table.reset();
}

StatementEvents::StatementEvents()
    : m_table(std::make_shared<detail::ListenerTable>()) {
}

ListenerToken StatementEvents::subscribe(StatementListener listener) {
    std::lock_guard<std::mutex> lock(m_table->mutex);
    uint64_t id = m_table->nextId++;
    m_table->listeners.emplace(id, std::move(listener));
    return ListenerToken(m_table, id);
}

void StatementEvents::notify(const std::string& sql, const Params& params) const {
    std::vector<StatementListener> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_table->mutex);
        if (m_table->listeners.empty()) return;
        snapshot.reserve(m_table->listeners.size());
        for (const auto& [id, listener] : m_table->listeners) {
            snapshot.push_back(listener);
        }
    }

    for (const auto& listener : snapshot) {
        try {
            listener(sql, params);
        } catch (const std::exception& e) {
            spdlog::warn("Statement listener failed: {}", e.what());
        }
    }
}

size_t StatementEvents::listenerCount() const {
    std::lock_guard<std::mutex> lock(m_table->mutex);
    return m_table->listeners.size();
}

}  // namespace dbscope
