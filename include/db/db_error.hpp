#pragma once

#include "db/idb_connection.hpp"
#include <string>

namespace relsync {

/**
 * @brief Components of a foreign-key violation DETAIL line
 *
 * Parsed from `Key (col)=(value) is not present in table "t".`
 */
struct ForeignKeyDetail {
    std::string column;
    std::string value;
    std::string table;
};

[[nodiscard]] bool parse_foreign_key_detail(const std::string& detail, ForeignKeyDetail& out);

/**
 * @brief Throw the typed error matching a failed result's SQLSTATE
 *
 * 08xxx -> ConnectionError, 42P01/3F000 -> UndefinedTableError,
 * 42703 -> UndefinedColumnError, 23503 -> ForeignKeyViolationError,
 * anything else -> DatabaseError.
 *
 * @param result Failed result (success == false)
 * @param context Prefix for the error message (statement kind, table)
 */
[[noreturn]] void throw_db_error(const DbResultSet& result, const std::string& context);

/**
 * @brief Throw via throw_db_error() when result.success is false
 */
inline const DbResultSet& check_result(const DbResultSet& result, const std::string& context) {
    if (!result.success) {
        throw_db_error(result, context);
    }
    return result;
}

} // namespace relsync
