#pragma once

#include "core/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relsync {

// ============================================================================
// Filter vocabulary
// ============================================================================

// CONTAINS/NOT_CONTAINS pass a value holding % through as the caller's own
// ILIKE pattern (where _ is a wildcard too). Any other value, and every
// STARTS_WITH/ENDS_WITH value, is matched literally: % _ and \ are escaped.
enum class FilterOperator : uint8_t {
    EQUALS,
    NOT_EQUALS,
    GREATER_THAN,
    LESS_THAN,
    GREATER_OR_EQUAL,
    LESS_OR_EQUAL,
    CONTAINS,
    NOT_CONTAINS,
    STARTS_WITH,
    ENDS_WITH,
    IS_NULL,
    IS_NOT_NULL,
    IS_EMPTY,
    IS_NOT_EMPTY
};

[[nodiscard]] const char* filter_operator_to_string(FilterOperator op);

/**
 * @brief Parse an operator name (case-insensitive)
 *
 * Accepts the canonical names plus does_not_contain,
 * greater_than_or_equal_to and less_than_or_equal_to.
 *
 * @throws UnsupportedOperatorError for anything else
 */
[[nodiscard]] FilterOperator parse_filter_operator(const std::string& name);

// is_null / is_not_null / is_empty / is_not_empty take no value
[[nodiscard]] bool operator_takes_value(FilterOperator op);

enum class Logic : uint8_t { AND, OR };

[[nodiscard]] const char* logic_to_string(Logic logic);

// @throws MalformedRuleError unless "AND" or "OR" (case-insensitive)
[[nodiscard]] Logic parse_logic(const std::string& name);

/**
 * @brief One predicate on one column
 *
 * value holds a scalar, or a string list for equals/not_equals
 * (rendered as = ANY / <> ALL).
 */
struct FilterRule {
    std::string property;
    FilterOperator op = FilterOperator::EQUALS;
    std::optional<SqlValue> value;
};

/**
 * @brief Rules joined by one connective
 *
 * logic also joins this group to the previous rendered group; the first
 * rendered group's logic is ignored.
 */
struct FilterGroup {
    Logic logic = Logic::AND;
    std::vector<FilterRule> rules;
};

/**
 * @brief Rendered WHERE body (without the WHERE keyword) and its parameters
 */
struct WhereClause {
    std::string sql;
    std::vector<SqlValue> params;

    [[nodiscard]] bool empty() const { return sql.empty(); }
};

/**
 * @brief Render filter groups into a parameterized predicate
 *
 * Every non-empty group is parenthesized. Groups without rules are skipped;
 * an empty or all-empty list renders to an empty clause.
 *
 * @param groups Ordered filter groups
 * @param first_param Number of the first positional placeholder ($n)
 * @throws MalformedRuleError on an empty property, a missing value or a
 *         list value with an operator other than equals/not_equals
 */
[[nodiscard]] WhereClause render_where(const std::vector<FilterGroup>& groups,
                                       size_t first_param = 1);

/**
 * @brief Parse the JSON filter form
 *
 * [{"logic": "AND", "rules": [{"property": "x", "operator": "equals", "value": 1}]}]
 *
 * @throws MalformedRuleError on structural problems
 * @throws UnsupportedOperatorError on an unknown operator
 */
[[nodiscard]] std::vector<FilterGroup> parse_filter_groups(const nlohmann::json& filters);

} // namespace relsync
