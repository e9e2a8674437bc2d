#include "SQLiteConnection.hpp"
#include "SQLiteStatement.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace dbscope {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath, int busyTimeout)
    : m_path(dbPath) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (dbPath.rfind("file:", 0) == 0) {
        flags |= SQLITE_OPEN_URI;
    }

    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        throw ConnectionError("Failed to open SQLite database '" + dbPath + "': " + message);
    }

    sqlite3_busy_timeout(m_db, busyTimeout);
    spdlog::debug("Opened SQLite connection to '{}'", dbPath);
}

SQLiteConnection::~SQLiteConnection() {
    if (m_db) {
        sqlite3_close_v2(m_db);
    }
}

// ============================================================================
// Query Execution
// ============================================================================

bool SQLiteConnection::ping() {
    if (!m_db) return false;
    try {
        execute("SELECT 1");
        return true;
    } catch (const StatementError& e) {
        spdlog::debug("SQLite ping failed: {}", e.what());
        return false;
    }
}

QueryResult SQLiteConnection::execute(const std::string& sql, const Params& params) {
    if (!m_db) {
        throw StatementError("SQLite connection is closed");
    }

    QueryResult result;
    const char* cursor = sql.c_str();
    const char* end = cursor + sql.size();
    bool first = true;

    while (cursor < end) {
        // Compile the next statement; `tail` points past it
        sqlite3_stmt* raw = nullptr;
        const char* tail = nullptr;
        int rc = sqlite3_prepare_v2(m_db, cursor, static_cast<int>(end - cursor), &raw, &tail);
        if (rc != SQLITE_OK) {
            int primary = rc & 0xff;
            throw StatementError(std::string("SQLite prepare failed: ") + sqlite3_errmsg(m_db),
                                 rc, "", primary == SQLITE_BUSY || primary == SQLITE_LOCKED);
        }
        cursor = tail;

        // Whitespace or a comment compiles to no statement
        if (!raw) continue;

        SQLiteStatement stmt(raw);
        if (first) {
            stmt.bind(params);
            first = false;
        }
        result = stmt.fetchAll();
        result.affectedRows = static_cast<uint64_t>(sqlite3_changes(m_db));
        result.lastInsertId = sqlite3_last_insert_rowid(m_db);
    }

    if (first && !params.empty()) {
        throw StatementError("Parameters supplied for empty statement");
    }
    return result;
}

// ============================================================================
// Schema Introspection
// ============================================================================

std::vector<std::string> SQLiteConnection::tableNames() {
    return firstColumn(execute(
        "SELECT name FROM sqlite_master WHERE type = 'table' "
        "AND name NOT LIKE 'sqlite_%' ORDER BY name"));
}

std::vector<std::string> SQLiteConnection::columnNames(const std::string& table) {
    // PRAGMA arguments cannot be bound; quote the identifier instead
    std::string quoted = "\"";
    for (char c : table) {
        quoted += c;
        if (c == '"') quoted += '"';
    }
    quoted += "\"";

    QueryResult info = execute("PRAGMA table_info(" + quoted + ")");
    int nameCol = info.columnIndex("name");
    std::vector<std::string> names;
    for (size_t i = 0; i < info.rowCount(); ++i) {
        if (auto name = info.get(i, static_cast<size_t>(nameCol < 0 ? 1 : nameCol))) {
            names.push_back(*name);
        }
    }
    return names;
}

}  // namespace dbscope
