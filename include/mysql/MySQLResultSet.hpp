#pragma once

/**
 * @file MySQLResultSet.hpp
 * @brief Owning handle for a buffered MYSQL_RES.
 */

#include "QueryResult.hpp"
#include <mysql/mysql.h>

namespace dbscope {

/**
 * @class MySQLResultSet
 * @brief Frees a mysql_store_result() handle and copies its rows out.
 *
 * A statement with no result set (INSERT, UPDATE, DDL) yields a null handle;
 * toQueryResult() then returns an empty result and the caller fills in the
 * affected-row count.
 */
class MySQLResultSet {
public:
    explicit MySQLResultSet(MYSQL_RES* res = nullptr);
    ~MySQLResultSet();

    MySQLResultSet(const MySQLResultSet&) = delete;
    MySQLResultSet& operator=(const MySQLResultSet&) = delete;
    MySQLResultSet(MySQLResultSet&& other) noexcept;
    MySQLResultSet& operator=(MySQLResultSet&& other) noexcept;

    explicit operator bool() const { return m_res != nullptr; }

    /// Drains the remaining rows; NULL cells become nullopt.
    QueryResult toQueryResult();

private:
    MYSQL_RES* m_res;
};

}  // namespace dbscope
