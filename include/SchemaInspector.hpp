#pragma once

#include "Engine.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dbscope {

/**
 * @class SchemaInspector
 * @brief Read-only view of the tables behind a blocking engine.
 *
 * Each call checks out a connection for its duration only.
 */
class SchemaInspector {
public:
    explicit SchemaInspector(std::shared_ptr<Engine> engine);

    // User tables, sorted; internal tables (sqlite_*) excluded
    std::vector<std::string> tableNames() const;

    // Columns of `table` in declaration order; empty if the table is unknown
    std::vector<std::string> columnNames(const std::string& table) const;

    bool hasTable(const std::string& table) const;

    const Engine& engine() const { return *m_engine; }

private:
    std::shared_ptr<Engine> m_engine;
};

}  // namespace dbscope
