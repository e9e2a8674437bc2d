#include "PostgreSQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include <cstdlib>
#include <utility>

namespace dbscope {

PostgreSQLResultSet::PostgreSQLResultSet(PGresult* res) : m_res(res) {}

PostgreSQLResultSet::~PostgreSQLResultSet() {
    PQclear(m_res);  // accepts nullptr
}

PostgreSQLResultSet::PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept
    : m_res(std::exchange(other.m_res, nullptr)) {}

PostgreSQLResultSet& PostgreSQLResultSet::operator=(PostgreSQLResultSet&& other) noexcept {
    if (this != &other) {
        PQclear(m_res);
        m_res = std::exchange(other.m_res, nullptr);
    }
    return *this;
}

ExecStatusType PostgreSQLResultSet::status() const {
    return m_res ? PQresultStatus(m_res) : PGRES_FATAL_ERROR;
}

void PostgreSQLResultSet::check(PGconn* conn) const {
    switch (status()) {
        case PGRES_COMMAND_OK:
        case PGRES_TUPLES_OK:
        case PGRES_EMPTY_QUERY:
            return;
        default:
            break;
    }

    if (!m_res) {
        // libpq hands back no result when the connection is gone
        throw StatementError(std::string("PostgreSQL query failed: ") +
                                 (conn ? PQerrorMessage(conn) : "no connection"),
                             0, "08006", true);
    }

    const std::string state = sqlState();
    throw StatementError(std::string("PostgreSQL query failed: ") + PQresultErrorMessage(m_res),
                         static_cast<int>(status()), state,
                         ErrorHandler::isTransientSqlState(state));
}

QueryResult PostgreSQLResultSet::toQueryResult() const {
    QueryResult out;
    if (!m_res) return out;

    const int width = PQnfields(m_res);
    const int height = PQntuples(m_res);

    out.columns.reserve(static_cast<size_t>(width));
    for (int c = 0; c < width; ++c) {
        const char* name = PQfname(m_res, c);
        out.columns.emplace_back(name ? name : "");
    }

    out.rows.resize(static_cast<size_t>(height));
    for (int r = 0; r < height; ++r) {
        QueryResult::Row& row = out.rows[static_cast<size_t>(r)];
        row.reserve(static_cast<size_t>(width));
        for (int c = 0; c < width; ++c) {
            if (PQgetisnull(m_res, r, c)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::in_place, PQgetvalue(m_res, r, c),
                                 static_cast<size_t>(PQgetlength(m_res, r, c)));
            }
        }
    }

    // PQcmdTuples() is an empty string for statements that count nothing
    const char* counted = PQcmdTuples(m_res);
    out.affectedRows = (counted && *counted) ? std::strtoull(counted, nullptr, 10) : 0;
    return out;
}

std::string PostgreSQLResultSet::sqlState() const {
    const char* state = PQresultErrorField(m_res, PG_DIAG_SQLSTATE);
    return state ? state : "";
}

}  // namespace dbscope
