#pragma once

#include <string>
#include <string_view>

namespace relsync {

/**
 * @brief Quote an identifier: wrap in double quotes, double embedded quotes
 */
[[nodiscard]] inline std::string quote_ident(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (const char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// "schema"."table"
[[nodiscard]] inline std::string qualified_name(std::string_view schema, std::string_view table) {
    return quote_ident(schema) + "." + quote_ident(table);
}

} // namespace relsync
