#pragma once

#include "core/types.hpp"
#include "query/filter.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relsync {

/**
 * @brief SQL text plus the values for its $1..$n placeholders
 */
struct Statement {
    std::string sql;
    std::vector<SqlValue> params;

    [[nodiscard]] std::vector<SqlParam> wire_params() const {
        std::vector<SqlParam> out;
        out.reserve(params.size());
        for (const auto& p : params) out.push_back(to_param(p));
        return out;
    }
};

struct SortSpec {
    std::string column;
    bool descending = true;
    bool nulls_last = true;
};

struct SelectOptions {
    std::vector<std::string> columns;  // empty = *
    std::optional<SortSpec> sort;
    std::optional<int64_t> limit;      // >= 1
    std::optional<int64_t> offset;     // >= 0
};

enum class ConflictStrategy : uint8_t {
    OVERWRITE,  // DO UPDATE SET every non-key column from EXCLUDED
    IGNORE,     // DO NOTHING
    NONE        // plain INSERT; a conflict is a hard error
};

[[nodiscard]] const char* conflict_strategy_to_string(ConflictStrategy strategy);

// @throws MalformedRuleError for names other than overwrite/ignore/none
[[nodiscard]] ConflictStrategy parse_conflict_strategy(const std::string& name);

struct UpsertRequest {
    std::string schema;
    std::string table;
    std::vector<std::string> columns;
    std::vector<SqlValue> values;
    std::vector<std::string> conflict_target;
    ConflictStrategy strategy = ConflictStrategy::OVERWRITE;
};

// ============================================================================
// Statement builders
// ============================================================================
//
// Identifiers are always quoted; values always travel as parameters.

[[nodiscard]] Statement build_select(const std::string& schema,
                                     const std::string& table,
                                     const std::vector<FilterGroup>& groups,
                                     const std::optional<SortSpec>& sort = std::nullopt);

/**
 * @throws MalformedRuleError if limit < 1 or offset < 0
 */
[[nodiscard]] Statement build_select(const std::string& schema,
                                     const std::string& table,
                                     const std::vector<FilterGroup>& groups,
                                     const SelectOptions& options);

// SELECT * ... WHERE "column" = ANY($1)
[[nodiscard]] Statement build_select_in(const std::string& schema,
                                        const std::string& table,
                                        const std::string& column,
                                        const std::vector<std::string>& values);

/**
 * @brief DELETE matching every (column = value) pair
 * @throws ArityMismatchError on length mismatch
 * @throws MalformedRuleError on an empty column list
 */
[[nodiscard]] Statement build_delete_where(const std::string& schema,
                                           const std::string& table,
                                           const std::vector<std::string>& columns,
                                           const std::vector<SqlValue>& values);

// @throws ArityMismatchError on length mismatch or an empty SET list
[[nodiscard]] Statement build_update_where(const std::string& schema,
                                           const std::string& table,
                                           const std::vector<std::string>& set_columns,
                                           const std::vector<SqlValue>& set_values,
                                           const std::string& where_column,
                                           const SqlValue& where_value);

/**
 * @brief INSERT ... ON CONFLICT per the request's strategy
 *
 * OVERWRITE degrades to DO NOTHING when every column is part of the
 * conflict target.
 *
 * @throws ArityMismatchError if columns and values differ in length
 * @throws MalformedRuleError if OVERWRITE has no conflict target
 */
[[nodiscard]] Statement build_upsert(const UpsertRequest& request);

/**
 * @brief Multi-row INSERT ... ON CONFLICT DO NOTHING
 * @throws ArityMismatchError if any row's width differs from columns
 */
[[nodiscard]] Statement build_insert_ignore(const std::string& schema,
                                            const std::string& table,
                                            const std::vector<std::string>& columns,
                                            const std::vector<std::vector<SqlValue>>& rows);

} // namespace relsync
