#include "query/filter.hpp"
#include "query/sql_identifier.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <unordered_map>

namespace relsync {

// ============================================================================
// Vocabulary
// ============================================================================

const char* filter_operator_to_string(FilterOperator op) {
    switch (op) {
        case FilterOperator::EQUALS:           return "equals";
        case FilterOperator::NOT_EQUALS:       return "not_equals";
        case FilterOperator::GREATER_THAN:     return "greater_than";
        case FilterOperator::LESS_THAN:        return "less_than";
        case FilterOperator::GREATER_OR_EQUAL: return "greater_or_equal";
        case FilterOperator::LESS_OR_EQUAL:    return "less_or_equal";
        case FilterOperator::CONTAINS:         return "contains";
        case FilterOperator::NOT_CONTAINS:     return "not_contains";
        case FilterOperator::STARTS_WITH:      return "starts_with";
        case FilterOperator::ENDS_WITH:        return "ends_with";
        case FilterOperator::IS_NULL:          return "is_null";
        case FilterOperator::IS_NOT_NULL:      return "is_not_null";
        case FilterOperator::IS_EMPTY:         return "is_empty";
        case FilterOperator::IS_NOT_EMPTY:     return "is_not_empty";
    }
    return "unknown";
}

FilterOperator parse_filter_operator(const std::string& name) {
    static const std::unordered_map<std::string, FilterOperator> lookup = {
        {"equals",                   FilterOperator::EQUALS},
        {"not_equals",               FilterOperator::NOT_EQUALS},
        {"greater_than",             FilterOperator::GREATER_THAN},
        {"less_than",                FilterOperator::LESS_THAN},
        {"greater_or_equal",         FilterOperator::GREATER_OR_EQUAL},
        {"greater_than_or_equal_to", FilterOperator::GREATER_OR_EQUAL},
        {"less_or_equal",            FilterOperator::LESS_OR_EQUAL},
        {"less_than_or_equal_to",    FilterOperator::LESS_OR_EQUAL},
        {"contains",                 FilterOperator::CONTAINS},
        {"not_contains",             FilterOperator::NOT_CONTAINS},
        {"does_not_contain",         FilterOperator::NOT_CONTAINS},
        {"starts_with",              FilterOperator::STARTS_WITH},
        {"ends_with",                FilterOperator::ENDS_WITH},
        {"is_null",                  FilterOperator::IS_NULL},
        {"is_not_null",              FilterOperator::IS_NOT_NULL},
        {"is_empty",                 FilterOperator::IS_EMPTY},
        {"is_not_empty",             FilterOperator::IS_NOT_EMPTY},
    };

    const auto it = lookup.find(utils::to_lower(name));
    if (it == lookup.end()) {
        throw UnsupportedOperatorError(name);
    }
    return it->second;
}

bool operator_takes_value(FilterOperator op) {
    switch (op) {
        case FilterOperator::IS_NULL:
        case FilterOperator::IS_NOT_NULL:
        case FilterOperator::IS_EMPTY:
        case FilterOperator::IS_NOT_EMPTY:
            return false;
        default:
            return true;
    }
}

const char* logic_to_string(Logic logic) {
    return logic == Logic::OR ? "OR" : "AND";
}

Logic parse_logic(const std::string& name) {
    const std::string upper = utils::to_upper(name);
    if (upper == "AND") return Logic::AND;
    if (upper == "OR") return Logic::OR;
    throw MalformedRuleError(std::format("Group logic must be 'AND' or 'OR', got '{}'", name));
}

// ============================================================================
// Rendering
// ============================================================================

namespace {

bool is_list(const SqlValue& v) {
    return std::holds_alternative<std::vector<std::string>>(v);
}

// Pattern text for the ILIKE family
std::string pattern_text(const FilterRule& rule) {
    const SqlValue& v = *rule.value;
    if (is_list(v)) {
        throw MalformedRuleError(std::format(
            "Operator '{}' on '{}' does not accept a list value",
            filter_operator_to_string(rule.op), rule.property));
    }
    return *to_param(v);
}

// Backslash is the default LIKE escape character
std::string escape_like(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        if (c == '%' || c == '_' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

class RuleRenderer {
public:
    RuleRenderer(size_t first_param, std::vector<SqlValue>& params)
        : next_(first_param), params_(params) {}

    std::string render(const FilterRule& rule) {
        if (rule.property.empty()) {
            throw MalformedRuleError("Filter rule is missing 'property'");
        }

        const std::string col = quote_ident(rule.property);

        if (operator_takes_value(rule.op) && (!rule.value || is_null(*rule.value))) {
            throw MalformedRuleError(std::format(
                "Operator '{}' on '{}' requires a value",
                filter_operator_to_string(rule.op), rule.property));
        }

        switch (rule.op) {
            case FilterOperator::EQUALS:
                if (is_list(*rule.value)) return std::format("{} = ANY({})", col, bind(*rule.value));
                return std::format("{} = {}", col, bind(*rule.value));
            case FilterOperator::NOT_EQUALS:
                if (is_list(*rule.value)) return std::format("{} <> ALL({})", col, bind(*rule.value));
                return std::format("{} <> {}", col, bind(*rule.value));
            case FilterOperator::GREATER_THAN:
                return comparison(rule, col, ">");
            case FilterOperator::LESS_THAN:
                return comparison(rule, col, "<");
            case FilterOperator::GREATER_OR_EQUAL:
                return comparison(rule, col, ">=");
            case FilterOperator::LESS_OR_EQUAL:
                return comparison(rule, col, "<=");
            case FilterOperator::CONTAINS:
            case FilterOperator::NOT_CONTAINS: {
                std::string text = pattern_text(rule);
                // A value with % is the caller's own pattern; anything else matches literally
                if (text.find('%') == std::string::npos) {
                    text = "%" + escape_like(text) + "%";
                }
                const char* op = rule.op == FilterOperator::CONTAINS ? "ILIKE" : "NOT ILIKE";
                return std::format("{} {} {}", col, op, bind(SqlValue{std::move(text)}));
            }
            case FilterOperator::STARTS_WITH:
                return std::format("{} ILIKE {}", col, bind(SqlValue{escape_like(pattern_text(rule)) + "%"}));
            case FilterOperator::ENDS_WITH:
                return std::format("{} ILIKE {}", col, bind(SqlValue{"%" + escape_like(pattern_text(rule))}));
            case FilterOperator::IS_NULL:
                return std::format("{} IS NULL", col);
            case FilterOperator::IS_NOT_NULL:
                return std::format("{} IS NOT NULL", col);
            case FilterOperator::IS_EMPTY:
                return std::format("({0} IS NULL OR {0} = '')", col);
            case FilterOperator::IS_NOT_EMPTY:
                return std::format("({0} IS NOT NULL AND {0} <> '')", col);
        }
        throw UnsupportedOperatorError(std::to_string(static_cast<int>(rule.op)));
    }

private:
    std::string bind(SqlValue value) {
        params_.push_back(std::move(value));
        return std::format("${}", next_++);
    }

    std::string comparison(const FilterRule& rule, const std::string& col, const char* op) {
        if (is_list(*rule.value)) {
            throw MalformedRuleError(std::format(
                "Operator '{}' on '{}' does not accept a list value",
                filter_operator_to_string(rule.op), rule.property));
        }
        return std::format("{} {} {}", col, op, bind(*rule.value));
    }

    size_t next_;
    std::vector<SqlValue>& params_;
};

} // anonymous namespace

WhereClause render_where(const std::vector<FilterGroup>& groups, size_t first_param) {
    WhereClause where;
    RuleRenderer renderer(first_param, where.params);

    for (const auto& group : groups) {
        if (group.rules.empty()) {
            continue;
        }

        std::string body;
        const std::string joiner = std::format(" {} ", logic_to_string(group.logic));
        for (size_t i = 0; i < group.rules.size(); ++i) {
            if (i > 0) body += joiner;
            body += renderer.render(group.rules[i]);
        }

        if (!where.sql.empty()) {
            where.sql += joiner;
        }
        where.sql += "(" + body + ")";
    }

    return where;
}

// ============================================================================
// JSON form
// ============================================================================

namespace {

SqlValue json_to_value(const nlohmann::json& j, const std::string& property) {
    if (j.is_null()) return std::monostate{};
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number_integer()) return j.get<int64_t>();
    if (j.is_number_float()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    if (j.is_array()) {
        std::vector<std::string> items;
        items.reserve(j.size());
        for (const auto& item : j) {
            if (item.is_string()) {
                items.push_back(item.get<std::string>());
            } else if (item.is_number() || item.is_boolean()) {
                items.push_back(item.dump());
            } else {
                throw MalformedRuleError(std::format(
                    "List value for '{}' may only hold strings, numbers or booleans", property));
            }
        }
        return items;
    }
    throw MalformedRuleError(std::format("Unsupported value type for '{}'", property));
}

FilterRule parse_rule(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw MalformedRuleError("Filter rule must be an object");
    }
    const auto prop = j.find("property");
    const auto op = j.find("operator");
    if (prop == j.end() || !prop->is_string() || op == j.end() || !op->is_string()) {
        throw MalformedRuleError("Each rule must have 'property' and 'operator' keys");
    }

    FilterRule rule;
    rule.property = prop->get<std::string>();
    rule.op = parse_filter_operator(op->get<std::string>());
    if (const auto value = j.find("value"); value != j.end() && operator_takes_value(rule.op)) {
        rule.value = json_to_value(*value, rule.property);
    }
    return rule;
}

} // anonymous namespace

std::vector<FilterGroup> parse_filter_groups(const nlohmann::json& filters) {
    if (!filters.is_array()) {
        throw MalformedRuleError("Filters must be an array of groups");
    }

    std::vector<FilterGroup> groups;
    groups.reserve(filters.size());
    for (const auto& g : filters) {
        if (!g.is_object()) {
            throw MalformedRuleError("Filter group must be an object");
        }
        FilterGroup group;
        if (const auto logic = g.find("logic"); logic != g.end()) {
            if (!logic->is_string()) {
                throw MalformedRuleError("Group logic must be a string");
            }
            group.logic = parse_logic(logic->get<std::string>());
        }
        if (const auto rules = g.find("rules"); rules != g.end()) {
            if (!rules->is_array()) {
                throw MalformedRuleError("Group rules must be an array");
            }
            for (const auto& r : *rules) {
                group.rules.push_back(parse_rule(r));
            }
        }
        groups.push_back(std::move(group));
    }
    return groups;
}

} // namespace relsync
