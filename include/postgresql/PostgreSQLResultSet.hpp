#pragma once

/**
 * @file PostgreSQLResultSet.hpp
 * @brief Owning handle for a PGresult.
 */

#include "QueryResult.hpp"
#include <libpq-fe.h>
#include <string>

namespace dbscope {

/**
 * @class PostgreSQLResultSet
 * @brief Holds one PGresult and turns it into a QueryResult or a StatementError.
 *
 * libpq materializes the whole result client side, so conversion is a
 * single pass over PQntuples() x PQnfields() cells. PQclear() runs on
 * destruction.
 *
 * @code
 *   PostgreSQLResultSet res(PQexec(conn, "SELECT id, name FROM authors"));
 *   res.check(conn);
 *   QueryResult rows = res.toQueryResult();
 * @endcode
 */
class PostgreSQLResultSet {
public:
    explicit PostgreSQLResultSet(PGresult* res = nullptr);
    ~PostgreSQLResultSet();

    PostgreSQLResultSet(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet& operator=(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept;
    PostgreSQLResultSet& operator=(PostgreSQLResultSet&& other) noexcept;

    /// PGRES_FATAL_ERROR when there is no result at all.
    ExecStatusType status() const;

    /**
     * @brief Throw StatementError unless the command or query succeeded.
     * @param conn Supplies the message when libpq returned no result.
     *
     * The SQLSTATE travels on the error. Serialization failures, deadlocks
     * and connection exceptions are marked transient.
     */
    void check(PGconn* conn) const;

    /// lastInsertId stays 0; generated keys come back through RETURNING.
    QueryResult toQueryResult() const;

private:
    std::string sqlState() const;

    PGresult* m_res;
};

}  // namespace dbscope
