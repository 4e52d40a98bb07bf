#include "sync/join_table.hpp"

#include <algorithm>
#include <format>

namespace relsync {

JoinTableSpec derive_join_spec(const std::string& schema,
                               const std::string& join_schema,
                               const std::string& table,
                               const std::string& related_table) {
    const auto [first, second] = std::minmax(table, related_table);

    JoinTableSpec spec;
    spec.table_name = std::format("{}_{}_{}", schema, first, second);
    spec.schema = schema;
    spec.join_schema = join_schema;
    spec.column1_name = first + "_id";
    spec.column1_table = first;
    spec.column2_name = second + (table == related_table ? "_id2" : "_id");
    spec.column2_table = second;
    return spec;
}

JoinOrientation orient(const JoinTableSpec& spec, const std::string& current_table) {
    if (current_table == spec.column1_table) {
        return {spec.column1_name, spec.column2_name};
    }
    return {spec.column2_name, spec.column1_name};
}

std::pair<std::string, std::string> oriented_pair(const JoinTableSpec& spec,
                                                  const std::string& current_table,
                                                  const std::string& record_id,
                                                  const std::string& related_id) {
    if (current_table == spec.column1_table) {
        return {record_id, related_id};
    }
    return {related_id, record_id};
}

} // namespace relsync
