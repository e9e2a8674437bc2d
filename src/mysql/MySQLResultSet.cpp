#include "MySQLResultSet.hpp"
#include <utility>

namespace dbscope {

MySQLResultSet::MySQLResultSet(MYSQL_RES* res) : m_res(res) {}

MySQLResultSet::~MySQLResultSet() {
    if (m_res) mysql_free_result(m_res);
}

MySQLResultSet::MySQLResultSet(MySQLResultSet&& other) noexcept
    : m_res(std::exchange(other.m_res, nullptr)) {}

MySQLResultSet& MySQLResultSet::operator=(MySQLResultSet&& other) noexcept {
    if (this != &other) {
        if (m_res) mysql_free_result(m_res);
        m_res = std::exchange(other.m_res, nullptr);
    }
    return *this;
}

QueryResult MySQLResultSet::toQueryResult() {
    QueryResult out;
    if (!m_res) return out;

    const unsigned int width = mysql_num_fields(m_res);
    const MYSQL_FIELD* fields = mysql_fetch_fields(m_res);
    out.columns.reserve(width);
    for (unsigned int c = 0; c < width; ++c) {
        out.columns.emplace_back(fields[c].name ? fields[c].name : "");
    }

    while (MYSQL_ROW cells = mysql_fetch_row(m_res)) {
        // Explicit lengths keep embedded NUL bytes intact
        const unsigned long* lengths = mysql_fetch_lengths(m_res);
        QueryResult::Row& row = out.rows.emplace_back();
        row.reserve(width);
        for (unsigned int c = 0; c < width; ++c) {
            if (cells[c]) {
                row.emplace_back(std::in_place, cells[c], lengths[c]);
            } else {
                row.emplace_back(std::nullopt);
            }
        }
    }
    return out;
}

}  // namespace dbscope
