#include "MySQLConnection.hpp"
#include "MySQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include "SqlText.hpp"
#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>
#include <spdlog/spdlog.h>

namespace dbscope {

MySQLConnection::MySQLConnection(const DatabaseUrl& url, unsigned int connectTimeout) {
    m_conn = mysql_init(nullptr);
    if (!m_conn) {
        throw ConnectionError("mysql_init failed: out of memory");
    }

    mysql_options(m_conn, MYSQL_OPT_CONNECT_TIMEOUT, &connectTimeout);

    // A `unix_socket` query parameter selects a local socket instead of TCP
    const char* socket = nullptr;
    auto it = url.query.find("unix_socket");
    if (it != url.query.end()) {
        socket = it->second.c_str();
    }

    if (!mysql_real_connect(m_conn,
                            url.host.empty() ? nullptr : url.host.c_str(),
                            url.user.empty() ? nullptr : url.user.c_str(),
                            url.password.empty() ? nullptr : url.password.c_str(),
                            url.database.empty() ? nullptr : url.database.c_str(),
                            url.port.value_or(0),
                            socket,
                            CLIENT_MULTI_STATEMENTS)) {
        std::string msg = mysql_error(m_conn);
        mysql_close(m_conn);
        m_conn = nullptr;
        throw ConnectionError("Failed to connect to " + url.redacted() + ": " + msg);
    }

    // utf8mb4 covers the full Unicode range
    mysql_set_character_set(m_conn, "utf8mb4");
    spdlog::debug("Opened MySQL connection to {}", url.redacted());
}

MySQLConnection::~MySQLConnection() {
    if (m_conn) {
        mysql_close(m_conn);
    }
}

bool MySQLConnection::ping() {
    if (!isValid()) return false;
    return mysql_ping(m_conn) == 0;
}

QueryResult MySQLConnection::execute(const std::string& sql, const Params& params) {
    if (!isValid()) {
        throw StatementError("MySQL connection is closed", CR_SERVER_GONE_ERROR, "", true);
    }

    std::string text = params.empty()
        ? sql
        : SqlText::interpolate(sql, params, [this](const std::string& v) { return quote(v); });

    // Length-delimited so quoted binary values survive
    if (mysql_real_query(m_conn, text.c_str(), text.size()) != 0) {
        fail("MySQL query failed");
    }

    // Walk every result of a multi-statement string; the last one is returned
    QueryResult result;
    while (true) {
        MySQLResultSet res(mysql_store_result(m_conn));
        if (res) {
            result = res.toQueryResult();
        } else if (mysql_field_count(m_conn) != 0) {
            fail("MySQL result retrieval failed");
        } else {
            result = QueryResult();
        }
        result.affectedRows = res ? result.rowCount() : mysql_affected_rows(m_conn);
        result.lastInsertId = static_cast<int64_t>(mysql_insert_id(m_conn));

        int next = mysql_next_result(m_conn);
        if (next > 0) {
            fail("MySQL statement failed");
        }
        if (next != 0) {
            break;
        }
    }
    return result;
}

std::vector<std::string> MySQLConnection::tableNames() {
    return firstColumn(execute(
        "SELECT TABLE_NAME FROM INFORMATION_SCHEMA.TABLES "
        "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_TYPE = 'BASE TABLE' "
        "ORDER BY TABLE_NAME"));
}

std::vector<std::string> MySQLConnection::columnNames(const std::string& table) {
    return firstColumn(execute(
        "SELECT COLUMN_NAME FROM INFORMATION_SCHEMA.COLUMNS "
        "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_NAME = ? "
        "ORDER BY ORDINAL_POSITION",
        {table}));
}

std::string MySQLConnection::quote(const std::string& value) const {
    if (!m_conn) return "'" + SqlText::escapeLiteral(value) + "'";

    // Worst case every byte is escaped, plus the terminator
    std::string buffer(value.size() * 2 + 1, '\0');
    unsigned long written = mysql_real_escape_string(m_conn, buffer.data(),
                                                     value.c_str(), value.size());
    buffer.resize(written);
    return "'" + buffer + "'";
}

const char* MySQLConnection::error() const {
    if (!m_conn) return "No connection";
    return mysql_error(m_conn);
}

unsigned int MySQLConnection::errorNumber() const {
    if (!m_conn) return 0;
    return mysql_errno(m_conn);
}

bool MySQLConnection::isRetryableError(unsigned int code) {
    switch (code) {
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_SERVER_LOST_EXTENDED:
        case ER_LOCK_WAIT_TIMEOUT:
        case ER_LOCK_DEADLOCK:
        case ER_TOO_MANY_CONCURRENT_TRXS:
            return true;
        default:
            return false;
    }
}

void MySQLConnection::fail(const std::string& what) const {
    unsigned int code = errorNumber();
    const char* state = m_conn ? mysql_sqlstate(m_conn) : "";
    throw StatementError(what + ": " + error(), static_cast<int>(code),
                         state ? state : "", isRetryableError(code));
}

}  // namespace dbscope
