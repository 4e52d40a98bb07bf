#pragma once

#include <string>
#include <vector>

namespace relsync {

struct ColumnSpec {
    std::string name;
    std::string type;           // SQL type fragment, e.g. "VARCHAR(255)", "TEXT[]"
    bool primary_key = false;
};

/**
 * @brief Desired shape of an entity table
 *
 * Additive only: ensuring a spec never drops or retypes existing columns.
 * Column names are unique within a table.
 */
struct TableSpec {
    std::string schema;
    std::string table;
    std::vector<ColumnSpec> columns;

    [[nodiscard]] std::vector<std::string> primary_key_columns() const {
        std::vector<std::string> keys;
        for (const auto& c : columns) {
            if (c.primary_key) keys.push_back(c.name);
        }
        return keys;
    }
};

/**
 * @brief Two-column table realizing a many-to-many relation
 *
 * Lives in join_schema; both columns reference the primary key of their
 * entity table in schema with ON DELETE CASCADE. The composite primary key
 * is (column1_name, column2_name).
 */
struct JoinTableSpec {
    std::string table_name;
    std::string schema;          // schema of the two entity tables
    std::string join_schema;     // schema holding the join table
    std::string column1_name;
    std::string column1_table;
    std::string column2_name;
    std::string column2_table;

    bool operator==(const JoinTableSpec&) const = default;
};

// One row of information_schema.columns
struct ColumnInfo {
    std::string name;
    std::string data_type;
    bool nullable = true;
};

} // namespace relsync
