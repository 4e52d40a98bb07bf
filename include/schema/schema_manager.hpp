#pragma once

#include "query/sql_builder.hpp"
#include "schema/schema_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace relsync {

/**
 * @brief DDL and catalog statements for additive schema management
 *
 * Every statement is idempotent (IF NOT EXISTS), so replaying a spec, or a
 * spec that only adds columns, converges to the same schema.
 */
class SchemaManager {
public:
    /**
     * @brief CREATE SCHEMA, CREATE TABLE, then ADD COLUMN per non-key column
     * @throws SchemaDefinitionError on an invalid spec
     */
    [[nodiscard]] static std::vector<std::string> table_ddl(const TableSpec& spec);

    /**
     * @brief CREATE SCHEMA and CREATE TABLE for a join table
     * @param pk_column Primary-key column of both entity tables
     * @throws SchemaDefinitionError on an invalid spec
     */
    [[nodiscard]] static std::vector<std::string> join_table_ddl(const JoinTableSpec& spec,
                                                                 const std::string& pk_column);

    // Base tables of a schema, ordered by name
    [[nodiscard]] static Statement list_tables_query(const std::string& schema);

    // Columns of a table in ordinal order: column_name, data_type, is_nullable
    [[nodiscard]] static Statement table_columns_query(const std::string& schema,
                                                       const std::string& table);

    // @throws SchemaDefinitionError
    static void validate(const TableSpec& spec);

    /**
     * @brief Accepts letters, digits, '_', ' ', '(', ')', '[', ']' and ','
     */
    [[nodiscard]] static bool is_valid_type(const std::string& type);
};

/**
 * @brief Pick the table a loose name refers to
 *
 * Tries, in order: exact match, match after lower-casing and removing
 * spaces and underscores, containment of either normalized form in the
 * other, and finally any shared whitespace-separated token.
 */
[[nodiscard]] std::optional<std::string> find_table_name(const std::string& key,
                                                         const std::vector<std::string>& tables);

} // namespace relsync
