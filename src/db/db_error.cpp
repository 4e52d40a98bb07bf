#include "db/db_error.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <regex>

namespace relsync {

bool parse_foreign_key_detail(const std::string& detail, ForeignKeyDetail& out) {
    // Key (col)=(value) is not present in table "t".
    static const std::regex kPattern(
        R"re(Key \(([^)]+)\)=\(([^)]*)\) is not present in table "([^"]+)")re");

    std::smatch match;
    if (!std::regex_search(detail, match, kPattern)) {
        return false;
    }
    out.column = match[1].str();
    out.value = match[2].str();
    out.table = match[3].str();
    return true;
}

void throw_db_error(const DbResultSet& result, const std::string& context) {
    const std::string& state = result.sqlstate;
    const std::string message = context.empty()
        ? result.error_message
        : std::format("{}: {}", context, utils::trim(result.error_message));

    if (state.starts_with("08")) {
        throw ConnectionError(message);
    }
    if (state == "42P01" || state == "3F000") {
        throw UndefinedTableError(message, state);
    }
    if (state == "42703") {
        throw UndefinedColumnError(message, state);
    }
    if (state == "23503") {
        ForeignKeyDetail fk;
        if (!parse_foreign_key_detail(result.error_detail, fk)) {
            utils::log::warn(std::format("Unparseable foreign key detail: '{}'", result.error_detail));
        }
        throw ForeignKeyViolationError(message, fk.column, fk.value, fk.table);
    }
    throw DatabaseError(message, state);
}

} // namespace relsync
