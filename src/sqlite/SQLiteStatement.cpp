#include "SQLiteStatement.hpp"
#include "ErrorHandler.hpp"

#include <type_traits>
#include <utility>

namespace dbscope {

SQLiteStatement::SQLiteStatement(sqlite3_stmt* stmt) : m_stmt(stmt) {}

SQLiteStatement::~SQLiteStatement() {
    finalize();
}

SQLiteStatement::SQLiteStatement(SQLiteStatement&& other) noexcept
    : m_stmt(std::exchange(other.m_stmt, nullptr)) {}

SQLiteStatement& SQLiteStatement::operator=(SQLiteStatement&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = std::exchange(other.m_stmt, nullptr);
    }
    return *this;
}

void SQLiteStatement::bind(const Params& params) {
    if (!m_stmt) return;

    const int placeholders = sqlite3_bind_parameter_count(m_stmt);
    if (placeholders != static_cast<int>(params.size())) {
        throw StatementError(std::to_string(params.size()) + " values supplied for " +
                             std::to_string(placeholders) + " placeholders",
                             SQLITE_RANGE);
    }

    // SQLite placeholders are numbered from 1
    int slot = 1;
    for (const Value& value : params) {
        int rc = std::visit([&](const auto& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return sqlite3_bind_null(m_stmt, slot);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(m_stmt, slot, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(m_stmt, slot, v);
            } else {
                return sqlite3_bind_text(m_stmt, slot, v.data(),
                                         static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, value);

        if (rc != SQLITE_OK) {
            raise("cannot bind parameter " + std::to_string(slot), rc);
        }
        ++slot;
    }
}

bool SQLiteStatement::next() {
    if (!m_stmt) return false;

    switch (int rc = sqlite3_step(m_stmt)) {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default:
            raise("statement failed", rc);
    }
}

QueryResult SQLiteStatement::fetchAll() {
    QueryResult out;
    const int n = width();
    out.columns.reserve(static_cast<size_t>(n));
    for (int c = 0; c < n; ++c) {
        const char* name = sqlite3_column_name(m_stmt, c);
        out.columns.emplace_back(name ? name : "");
    }

    while (next()) {
        QueryResult::Row& row = out.rows.emplace_back();
        row.reserve(static_cast<size_t>(n));
        for (int c = 0; c < n; ++c) {
            row.push_back(cell(c));
        }
    }
    return out;
}

void SQLiteStatement::finalize() {
    if (m_stmt) {
        sqlite3_finalize(std::exchange(m_stmt, nullptr));
    }
}

int SQLiteStatement::width() const {
    return m_stmt ? sqlite3_column_count(m_stmt) : 0;
}

// Dynamic typing lets every non-NULL cell be read back as text
std::optional<std::string> SQLiteStatement::cell(int column) const {
    if (sqlite3_column_type(m_stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, column));
    const int bytes = sqlite3_column_bytes(m_stmt, column);
    return text ? std::string(text, static_cast<size_t>(bytes)) : std::string();
}

void SQLiteStatement::raise(const std::string& context, int rc) const {
    sqlite3* db = m_stmt ? sqlite3_db_handle(m_stmt) : nullptr;
    const int primary = rc & 0xff;
    throw StatementError("SQLite " + context + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)),
                         rc, "", primary == SQLITE_BUSY || primary == SQLITE_LOCKED);
}

}  // namespace dbscope
