#include "SchemaInspector.hpp"
#include <algorithm>

namespace dbscope {

SchemaInspector::SchemaInspector(std::shared_ptr<Engine> engine)
    : m_engine(std::move(engine)) {
}

std::vector<std::string> SchemaInspector::tableNames() const {
    return m_engine->tableNames();
}

std::vector<std::string> SchemaInspector::columnNames(const std::string& table) const {
    PooledConnection conn = m_engine->connect();
    return conn->columnNames(table);
}

bool SchemaInspector::hasTable(const std::string& table) const {
    auto tables = tableNames();
    return std::find(tables.begin(), tables.end(), table) != tables.end();
}

}  // namespace dbscope
