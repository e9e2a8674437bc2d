#include "PostgreSQLConnection.hpp"
#include "PostgreSQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include "SqlText.hpp"
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace dbscope {

namespace net = boost::asio;

PostgreSQLConnection::PostgreSQLConnection(const DatabaseUrl& url, int connectTimeout) {
    std::vector<std::string> keys;
    std::vector<std::string> values;
    auto add = [&](const std::string& key, const std::string& value) {
        if (!value.empty()) {
            keys.push_back(key);
            values.push_back(value);
        }
    };

    add("host", url.host);
    if (url.port) add("port", std::to_string(*url.port));
    add("dbname", url.database);
    add("user", url.user);
    add("password", url.password);
    add("connect_timeout", std::to_string(connectTimeout));
    for (const auto& [key, value] : url.query) {
        add(key, value);
    }

    std::vector<const char*> keyPtrs;
    std::vector<const char*> valuePtrs;
    for (size_t i = 0; i < keys.size(); ++i) {
        keyPtrs.push_back(keys[i].c_str());
        valuePtrs.push_back(values[i].c_str());
    }
    keyPtrs.push_back(nullptr);
    valuePtrs.push_back(nullptr);

    m_conn = PQconnectdbParams(keyPtrs.data(), valuePtrs.data(), 0);
    if (!m_conn || PQstatus(m_conn) != CONNECTION_OK) {
        std::string message = m_conn ? PQerrorMessage(m_conn) : "out of memory";
        if (m_conn) {
            PQfinish(m_conn);
            m_conn = nullptr;
        }
        throw ConnectionError("Failed to connect to " + url.redacted() + ": " + message);
    }

    spdlog::debug("Opened PostgreSQL connection to {}", url.redacted());
}

PostgreSQLConnection::~PostgreSQLConnection() {
    if (m_conn) {
        PQfinish(m_conn);
    }
}

bool PostgreSQLConnection::isValid() const {
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

bool PostgreSQLConnection::ping() {
    if (!isValid()) return false;

    // Try a simple query to check connection
    PostgreSQLResultSet res(PQexec(m_conn, "SELECT 1"));
    return res.status() == PGRES_TUPLES_OK;
}

PostgreSQLConnection::EncodedParams PostgreSQLConnection::encode(const Params& params) {
    EncodedParams encoded;
    encoded.storage.reserve(params.size());
    for (const auto& value : params) {
        if (const auto* s = std::get_if<std::string>(&value)) {
            encoded.storage.push_back(*s);
        } else if (const auto* i = std::get_if<int64_t>(&value)) {
            encoded.storage.push_back(std::to_string(*i));
        } else if (const auto* d = std::get_if<double>(&value)) {
            std::ostringstream out;
            out.precision(17);
            out << *d;
            encoded.storage.push_back(out.str());
        } else {
            encoded.storage.emplace_back();
        }
    }

    // Pointers are taken after storage stops growing
    for (size_t i = 0; i < params.size(); ++i) {
        bool isNull = std::holds_alternative<std::monostate>(params[i]);
        encoded.values.push_back(isNull ? nullptr : encoded.storage[i].c_str());
    }
    return encoded;
}

QueryResult PostgreSQLConnection::execute(const std::string& sql, const Params& params) {
    if (!isValid()) {
        throw StatementError("PostgreSQL connection is not open", 0, "08003", true);
    }

    EncodedParams encoded = encode(params);
    std::string text = params.empty() ? sql : SqlText::numberPlaceholders(sql);

    PostgreSQLResultSet res(
        params.empty()
            ? PQexec(m_conn, text.c_str())
            : PQexecParams(m_conn, text.c_str(), static_cast<int>(encoded.values.size()),
                           nullptr, encoded.values.data(), nullptr, nullptr, 0));
    res.check(m_conn);
    return res.toQueryResult();
}

PGresult* PostgreSQLConnection::takeResult() {
    PGresult* first = PQgetResult(m_conn);
    PGresult* next = nullptr;
    while ((next = PQgetResult(m_conn)) != nullptr) {
        // Only the last result of a multi-statement string matters
        if (first) PQclear(first);
        first = next;
    }
    return first;
}

net::awaitable<QueryResult> PostgreSQLConnection::asyncExecute(std::string sql, Params params) {
    if (!isValid()) {
        throw StatementError("PostgreSQL connection is not open", 0, "08003", true);
    }

    EncodedParams encoded = encode(params);
    std::string text = params.empty() ? sql : SqlText::numberPlaceholders(sql);

    int sent = params.empty()
        ? PQsendQuery(m_conn, text.c_str())
        : PQsendQueryParams(m_conn, text.c_str(), static_cast<int>(encoded.values.size()),
                            nullptr, encoded.values.data(), nullptr, nullptr, 0);
    if (!sent) {
        throw StatementError(std::string("Failed to send statement: ") + error(), 0, "08006", true);
    }

    int fd = PQsocket(m_conn);
    if (fd < 0) {
        throw StatementError("Invalid socket from PostgreSQL connection", 0, "08006", true);
    }

    // libpq owns the descriptor, whatever its transport; it is only borrowed for waiting
    net::posix::stream_descriptor socket(co_await net::this_coro::executor, fd);
    struct SocketReleaser {
        net::posix::stream_descriptor& sock;
        ~SocketReleaser() { sock.release(); }
    } releaser{socket};

    while (true) {
        if (PQconsumeInput(m_conn) == 0) {
            throw StatementError(std::string("Failed to read from server: ") + error(),
                                 0, "08006", true);
        }
        if (PQisBusy(m_conn) == 0) {
            break;
        }
        co_await socket.async_wait(net::posix::descriptor_base::wait_read, net::use_awaitable);
    }

    PostgreSQLResultSet res(takeResult());
    res.check(m_conn);
    co_return res.toQueryResult();
}

std::vector<std::string> PostgreSQLConnection::tableNames() {
    return firstColumn(execute(
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema = current_schema() AND table_type = 'BASE TABLE' "
        "ORDER BY table_name"));
}

std::vector<std::string> PostgreSQLConnection::columnNames(const std::string& table) {
    return firstColumn(execute(
        "SELECT column_name FROM information_schema.columns "
        "WHERE table_schema = current_schema() AND table_name = ? "
        "ORDER BY ordinal_position",
        {table}));
}

const char* PostgreSQLConnection::error() const {
    if (!m_conn) return "No connection";
    return PQerrorMessage(m_conn);
}

}  // namespace dbscope
