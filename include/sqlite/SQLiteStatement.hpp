#pragma once

/**
 * @file SQLiteStatement.hpp
 * @brief Owning handle for one prepared SQLite statement.
 */

#include "QueryResult.hpp"
#include <sqlite3.h>
#include <string>

namespace dbscope {

/**
 * @class SQLiteStatement
 * @brief Prepared statement that binds dbscope Params and drains rows into a QueryResult.
 *
 * sqlite3_step() both runs the statement and yields rows, so a DML statement
 * is executed by draining it with fetchAll() and ignoring the empty result.
 *
 * @code
 *   SQLiteStatement stmt(raw);
 *   stmt.bind({int64_t{1}});
 *   QueryResult rows = stmt.fetchAll();
 * @endcode
 */
class SQLiteStatement {
public:
    explicit SQLiteStatement(sqlite3_stmt* stmt = nullptr);
    ~SQLiteStatement();

    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;
    SQLiteStatement(SQLiteStatement&& other) noexcept;
    SQLiteStatement& operator=(SQLiteStatement&& other) noexcept;

    sqlite3_stmt* handle() const { return m_stmt; }
    explicit operator bool() const { return m_stmt != nullptr; }

    /**
     * @brief Bind every value in order.
     * @throws StatementError on a placeholder count mismatch or a rejected value.
     */
    void bind(const Params& params);

    /// Advance one row; false once the statement is exhausted.
    bool next();

    QueryResult fetchAll();

    /// Idempotent; the destructor calls it.
    void finalize();

private:
    int width() const;
    std::optional<std::string> cell(int column) const;
    [[noreturn]] void raise(const std::string& context, int rc) const;

    sqlite3_stmt* m_stmt;
};

}  // namespace dbscope
