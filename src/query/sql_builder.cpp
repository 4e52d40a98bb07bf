#include "query/sql_builder.hpp"
#include "query/sql_identifier.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace relsync {

const char* conflict_strategy_to_string(ConflictStrategy strategy) {
    switch (strategy) {
        case ConflictStrategy::OVERWRITE: return "overwrite";
        case ConflictStrategy::IGNORE:    return "ignore";
        case ConflictStrategy::NONE:      return "none";
    }
    return "unknown";
}

ConflictStrategy parse_conflict_strategy(const std::string& name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "overwrite") return ConflictStrategy::OVERWRITE;
    if (lower == "ignore") return ConflictStrategy::IGNORE;
    if (lower == "none") return ConflictStrategy::NONE;
    throw MalformedRuleError(std::format("Unknown conflict strategy '{}'", name));
}

namespace {

std::string join_idents(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote_ident(names[i]);
    }
    return out;
}

// "$k, $k+1, ..." for count placeholders starting at first
std::string placeholders(size_t first, size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) out += ", ";
        out += std::format("${}", first + i);
    }
    return out;
}

} // anonymous namespace

Statement build_select(const std::string& schema,
                       const std::string& table,
                       const std::vector<FilterGroup>& groups,
                       const std::optional<SortSpec>& sort) {
    SelectOptions options;
    options.sort = sort;
    return build_select(schema, table, groups, options);
}

Statement build_select(const std::string& schema,
                       const std::string& table,
                       const std::vector<FilterGroup>& groups,
                       const SelectOptions& options) {
    Statement stmt;
    const std::string cols = options.columns.empty() ? "*" : join_idents(options.columns);
    stmt.sql = std::format("SELECT {} FROM {}", cols, qualified_name(schema, table));

    auto where = render_where(groups, 1);
    if (!where.empty()) {
        stmt.sql += " WHERE " + where.sql;
        stmt.params = std::move(where.params);
    }

    if (options.sort) {
        stmt.sql += std::format(" ORDER BY {} {} NULLS {}",
            quote_ident(options.sort->column),
            options.sort->descending ? "DESC" : "ASC",
            options.sort->nulls_last ? "LAST" : "FIRST");
    }

    if (options.limit) {
        if (*options.limit < 1) {
            throw MalformedRuleError(std::format("LIMIT must be >= 1, got {}", *options.limit));
        }
        stmt.params.emplace_back(*options.limit);
        stmt.sql += std::format(" LIMIT ${}", stmt.params.size());
    }
    if (options.offset) {
        if (*options.offset < 0) {
            throw MalformedRuleError(std::format("OFFSET must be >= 0, got {}", *options.offset));
        }
        stmt.params.emplace_back(*options.offset);
        stmt.sql += std::format(" OFFSET ${}", stmt.params.size());
    }

    return stmt;
}

Statement build_select_in(const std::string& schema,
                          const std::string& table,
                          const std::string& column,
                          const std::vector<std::string>& values) {
    Statement stmt;
    stmt.sql = std::format("SELECT * FROM {} WHERE {} = ANY($1)",
                           qualified_name(schema, table), quote_ident(column));
    stmt.params.emplace_back(values);
    return stmt;
}

Statement build_delete_where(const std::string& schema,
                             const std::string& table,
                             const std::vector<std::string>& columns,
                             const std::vector<SqlValue>& values) {
    if (columns.size() != values.size()) {
        throw ArityMismatchError(std::format(
            "DELETE on {}.{}: {} columns but {} values", schema, table, columns.size(), values.size()));
    }
    if (columns.empty()) {
        throw MalformedRuleError(std::format("DELETE on {}.{} needs at least one condition", schema, table));
    }

    Statement stmt;
    stmt.sql = std::format("DELETE FROM {} WHERE ", qualified_name(schema, table));
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) stmt.sql += " AND ";
        stmt.sql += std::format("{} = ${}", quote_ident(columns[i]), i + 1);
    }
    stmt.params = values;
    return stmt;
}

Statement build_update_where(const std::string& schema,
                             const std::string& table,
                             const std::vector<std::string>& set_columns,
                             const std::vector<SqlValue>& set_values,
                             const std::string& where_column,
                             const SqlValue& where_value) {
    if (set_columns.size() != set_values.size() || set_columns.empty()) {
        throw ArityMismatchError(std::format(
            "UPDATE on {}.{}: {} columns but {} values",
            schema, table, set_columns.size(), set_values.size()));
    }

    Statement stmt;
    stmt.sql = std::format("UPDATE {} SET ", qualified_name(schema, table));
    for (size_t i = 0; i < set_columns.size(); ++i) {
        if (i > 0) stmt.sql += ", ";
        stmt.sql += std::format("{} = ${}", quote_ident(set_columns[i]), i + 1);
    }
    stmt.sql += std::format(" WHERE {} = ${}", quote_ident(where_column), set_columns.size() + 1);

    stmt.params = set_values;
    stmt.params.push_back(where_value);
    return stmt;
}

Statement build_upsert(const UpsertRequest& request) {
    if (request.columns.size() != request.values.size()) {
        throw ArityMismatchError(std::format(
            "Upsert into {}.{}: {} columns but {} values",
            request.schema, request.table, request.columns.size(), request.values.size()));
    }
    if (request.columns.empty()) {
        throw ArityMismatchError(std::format(
            "Upsert into {}.{} has no columns", request.schema, request.table));
    }

    Statement stmt;
    stmt.sql = std::format("INSERT INTO {} ({}) VALUES ({})",
        qualified_name(request.schema, request.table),
        join_idents(request.columns),
        placeholders(1, request.columns.size()));
    stmt.params = request.values;

    switch (request.strategy) {
        case ConflictStrategy::NONE:
            break;

        case ConflictStrategy::IGNORE:
            if (request.conflict_target.empty()) {
                stmt.sql += " ON CONFLICT DO NOTHING";
            } else {
                stmt.sql += std::format(" ON CONFLICT ({}) DO NOTHING",
                                        join_idents(request.conflict_target));
            }
            break;

        case ConflictStrategy::OVERWRITE: {
            if (request.conflict_target.empty()) {
                throw MalformedRuleError(std::format(
                    "Upsert into {}.{}: overwrite requires a conflict target",
                    request.schema, request.table));
            }
            std::string assignments;
            for (const auto& col : request.columns) {
                const bool is_key = std::find(request.conflict_target.begin(),
                                              request.conflict_target.end(),
                                              col) != request.conflict_target.end();
                if (is_key) continue;
                if (!assignments.empty()) assignments += ", ";
                assignments += std::format("{0} = EXCLUDED.{0}", quote_ident(col));
            }
            if (assignments.empty()) {
                stmt.sql += std::format(" ON CONFLICT ({}) DO NOTHING",
                                        join_idents(request.conflict_target));
            } else {
                stmt.sql += std::format(" ON CONFLICT ({}) DO UPDATE SET {}",
                                        join_idents(request.conflict_target), assignments);
            }
            break;
        }
    }

    return stmt;
}

Statement build_insert_ignore(const std::string& schema,
                              const std::string& table,
                              const std::vector<std::string>& columns,
                              const std::vector<std::vector<SqlValue>>& rows) {
    if (columns.empty() || rows.empty()) {
        throw ArityMismatchError(std::format(
            "Batch insert into {}.{} needs columns and at least one row", schema, table));
    }

    Statement stmt;
    stmt.sql = std::format("INSERT INTO {} ({}) VALUES ",
                           qualified_name(schema, table), join_idents(columns));
    stmt.params.reserve(columns.size() * rows.size());

    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != columns.size()) {
            throw ArityMismatchError(std::format(
                "Batch insert into {}.{}: row {} has {} values, expected {}",
                schema, table, r, rows[r].size(), columns.size()));
        }
        if (r > 0) stmt.sql += ", ";
        stmt.sql += "(" + placeholders(stmt.params.size() + 1, columns.size()) + ")";
        stmt.params.insert(stmt.params.end(), rows[r].begin(), rows[r].end());
    }

    stmt.sql += " ON CONFLICT DO NOTHING";
    return stmt;
}

} // namespace relsync
