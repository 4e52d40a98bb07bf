#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace relsync {

// ============================================================================
// Values
// ============================================================================

/**
 * @brief A value bound to a positional parameter
 *
 * monostate is SQL NULL. String arrays map to PostgreSQL TEXT[] columns
 * (multi_select, people, files).
 */
using SqlValue = std::variant<
    std::monostate,
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>>;

// Text-format wire parameter; nullopt is NULL
using SqlParam = std::optional<std::string>;

[[nodiscard]] inline bool is_null(const SqlValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

/**
 * @brief Render a value in PostgreSQL text input format
 */
[[nodiscard]] SqlParam to_param(const SqlValue& value);

/**
 * @brief Render a string list as a PostgreSQL array literal: {"a","b\"c"}
 */
[[nodiscard]] std::string to_array_literal(const std::vector<std::string>& items);

// Human-readable rendering for logs
[[nodiscard]] std::string to_display(const SqlValue& value);

// ============================================================================
// Rows
// ============================================================================

/**
 * @brief One result row keyed by column name; nullopt is SQL NULL
 */
using Record = std::unordered_map<std::string, std::optional<std::string>>;

[[nodiscard]] inline std::optional<std::string> field(const Record& record,
                                                      const std::string& column) {
    const auto it = record.find(column);
    if (it == record.end()) return std::nullopt;
    return it->second;
}

} // namespace relsync
