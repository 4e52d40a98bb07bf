#include "core/types.hpp"

#include <format>
#include <type_traits>

namespace relsync {

std::string to_array_literal(const std::vector<std::string>& items) {
    std::string out = "{";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        for (const char c : items[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

SqlParam to_param(const SqlValue& value) {
    return std::visit([](const auto& v) -> SqlParam {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return std::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return to_array_literal(v);
        }
    }, value);
}

std::string to_display(const SqlValue& value) {
    if (is_null(value)) return "NULL";
    return *to_param(value);
}

} // namespace relsync
