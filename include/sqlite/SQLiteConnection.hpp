#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief Connection over an sqlite3 handle.
 *
 * SQLite has no server; a "connection" is an open handle on a database file
 * or on a named shared-cache memory database. Pooling still applies so every
 * backend shares one lifecycle.
 */

#include "Connection.hpp"
#include <sqlite3.h>
#include <string>

namespace dbscope {

/**
 * @class SQLiteConnection
 * @brief Owns one sqlite3 handle, closed on destruction.
 *
 * A busy timeout makes a writer wait for the database lock rather than fail
 * immediately when another connection holds it.
 */
class SQLiteConnection : public Connection {
public:
    /**
     * @param dbPath File path, or a `file:` URI (opened with SQLITE_OPEN_URI).
     * @param busyTimeout Milliseconds to wait on a locked database.
     * @throws ConnectionError if the database cannot be opened.
     */
    explicit SQLiteConnection(const std::string& dbPath, int busyTimeout = 5000);
    ~SQLiteConnection() override;

    sqlite3* handle() const { return m_db; }

    std::string family() const override { return "sqlite"; }
    bool isValid() const override { return m_db != nullptr; }
    bool ping() override;

    /**
     * @brief Run one or more `;`-separated statements.
     *
     * Parameters bind to the first statement; the last statement's rows,
     * change count and rowid are returned.
     */
    QueryResult execute(const std::string& sql, const Params& params = {}) override;

    std::vector<std::string> tableNames() override;
    std::vector<std::string> columnNames(const std::string& table) override;

private:
    sqlite3* m_db = nullptr;
    std::string m_path;
};

}  // namespace dbscope
