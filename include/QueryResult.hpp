#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dbscope {

// Bound parameter value; `?` placeholders in statement text are bound in order
using Value = std::variant<std::monostate, int64_t, double, std::string>;
using Params = std::vector<Value>;

// Render a bound value the way it would appear in a log line
std::string valueToString(const Value& value);

// Materialized result of one statement; cells are nullable text
struct QueryResult {
    using Row = std::vector<std::optional<std::string>>;

    std::vector<std::string> columns;
    std::vector<Row> rows;
    uint64_t affectedRows = 0;
    int64_t lastInsertId = 0;

    size_t rowCount() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    // Returns nullopt for NULL cells and out-of-range positions
    std::optional<std::string> get(size_t row, size_t col) const;
    std::optional<int64_t> getInt(size_t row, size_t col) const;

    // Column index by name, or -1
    int columnIndex(const std::string& name) const;
};

}  // namespace dbscope
