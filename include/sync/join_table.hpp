#pragma once

#include "schema/schema_types.hpp"

#include <string>
#include <utility>

namespace relsync {

/**
 * @brief Join table for the relation between two entity tables
 *
 * The pair of table names is sorted, so both directions of a relation land
 * in the same table: {schema}_{t0}_{t1} with columns {t0}_id and {t1}_id.
 * A self-relation names its second column {t1}_id2.
 */
[[nodiscard]] JoinTableSpec derive_join_spec(const std::string& schema,
                                             const std::string& join_schema,
                                             const std::string& table,
                                             const std::string& related_table);

/**
 * @brief Which join column holds the record being synchronized
 *
 * A record of column1_table owns column1; otherwise column2. For a
 * self-relation the record always owns column1.
 */
struct JoinOrientation {
    std::string record_column;
    std::string related_column;
};

[[nodiscard]] JoinOrientation orient(const JoinTableSpec& spec, const std::string& current_table);

// (record, related) reordered as (column1 value, column2 value)
[[nodiscard]] std::pair<std::string, std::string> oriented_pair(const JoinTableSpec& spec,
                                                                const std::string& current_table,
                                                                const std::string& record_id,
                                                                const std::string& related_id);

} // namespace relsync
