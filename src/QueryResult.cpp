#include "QueryResult.hpp"
#include <cstdlib>
#include <sstream>

namespace dbscope {

std::string valueToString(const Value& value) {
    struct Visitor {
        std::string operator()(std::monostate) const { return "NULL"; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const {
            std::ostringstream out;
            out << v;
            return out.str();
        }
        std::string operator()(const std::string& v) const { return "'" + v + "'"; }
    };
    return std::visit(Visitor{}, value);
}

std::optional<std::string> QueryResult::get(size_t row, size_t col) const {
    if (row >= rows.size() || col >= rows[row].size()) {
        return std::nullopt;
    }
    return rows[row][col];
}

std::optional<int64_t> QueryResult::getInt(size_t row, size_t col) const {
    auto cell = get(row, col);
    if (!cell || cell->empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    long long value = std::strtoll(cell->c_str(), &end, 10);
    if (end == cell->c_str()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

int QueryResult::columnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

}  // namespace dbscope
