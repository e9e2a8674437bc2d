#include "Connection.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace dbscope {

namespace net = boost::asio;

net::awaitable<QueryResult> Connection::asyncExecute(std::string sql, Params params) {
    // Statement boundary: let other pending tasks run before the round trip
    co_await net::post(co_await net::this_coro::executor, net::use_awaitable);
    co_return execute(sql, params);
}

std::vector<std::string> Connection::firstColumn(const QueryResult& result) {
    std::vector<std::string> values;
    values.reserve(result.rowCount());
    for (const auto& row : result.rows) {
        if (!row.empty() && row[0]) {
            values.push_back(*row[0]);
        }
    }
    return values;
}

}  // namespace dbscope
