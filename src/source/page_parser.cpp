#include "source/page_parser.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>

namespace relsync {

namespace {

using json = nlohmann::json;

std::optional<std::string> string_at(const json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

// "" when absent, not a string, or obj is not an object
std::string type_of(const json& obj) {
    return string_at(obj, "type").value_or("");
}

std::string concat_plain_text(const json& fragments) {
    std::string out;
    if (!fragments.is_array()) return out;
    for (const auto& f : fragments) {
        if (auto text = string_at(f, "plain_text")) out += *text;
    }
    return out;
}

std::vector<std::string> names_of(const json& items) {
    std::vector<std::string> out;
    if (!items.is_array()) return out;
    for (const auto& item : items) {
        if (auto name = string_at(item, "name")) out.push_back(std::move(*name));
    }
    return out;
}

// Person objects carry a name for members, only an id for bots/guests
std::optional<std::string> person_label(const json& person) {
    if (auto name = string_at(person, "name")) return name;
    return string_at(person, "id");
}

std::optional<std::string> file_url(const json& file) {
    for (const char* kind : {"file", "external"}) {
        if (file.is_object() && file.contains(kind)) {
            if (auto url = string_at(file[kind], "url")) return url;
        }
    }
    return string_at(file, "name");
}

SqlValue optional_string(std::optional<std::string> s) {
    if (!s) return std::monostate{};
    return std::move(*s);
}

} // anonymous namespace

PageParser::PageParser(std::string primary_key_column, size_t max_text_length)
    : pk_column_(std::move(primary_key_column)),
      max_text_length_(max_text_length) {}

std::string PageParser::sql_type_for(const std::string& property_type) {
    static const std::unordered_map<std::string, std::string> type_map = {
        {"title",            "VARCHAR(255)"},
        {"select",           "VARCHAR(255)"},
        {"email",            "VARCHAR(255)"},
        {"phone_number",     "VARCHAR(255)"},
        {"rich_text",        "TEXT"},
        {"url",              "TEXT"},
        {"formula",          "TEXT"},
        {"created_by",       "TEXT"},
        {"last_edited_by",   "TEXT"},
        {"number",           "FLOAT"},
        {"checkbox",         "BOOLEAN"},
        {"date",             "TIMESTAMP"},
        {"created_time",     "TIMESTAMP"},
        {"last_edited_time", "TIMESTAMP"},
        {"multi_select",     "TEXT[]"},
        {"people",           "TEXT[]"},
        {"files",            "TEXT[]"},
        {"relation",         ""},
        {"rollup",           ""},
    };

    const auto it = type_map.find(property_type);
    return it == type_map.end() ? std::string("TEXT") : it->second;
}

SqlValue PageParser::property_value(const json& property) const {
    const std::string type = type_of(property);
    if (type.empty() || !property.contains(type)) {
        return std::monostate{};
    }
    const json& data = property[type];
    if (data.is_null()) {
        return std::monostate{};
    }

    auto bounded = [this](std::string s) -> SqlValue {
        return utils::truncate_utf8(s, max_text_length_);
    };

    if (type == "title") {
        return bounded(concat_plain_text(data));
    }
    if (type == "rich_text") {
        return concat_plain_text(data);
    }
    if (type == "select") {
        auto name = string_at(data, "name");
        if (!name) return std::monostate{};
        return bounded(std::move(*name));
    }
    if (type == "status") {
        return optional_string(string_at(data, "name"));
    }
    if (type == "email" || type == "phone_number") {
        if (!data.is_string()) return std::monostate{};
        return bounded(data.get<std::string>());
    }
    if (type == "url" || type == "created_time" || type == "last_edited_time") {
        if (!data.is_string()) return std::monostate{};
        return data.get<std::string>();
    }
    if (type == "number") {
        if (!data.is_number()) return std::monostate{};
        return data.get<double>();
    }
    if (type == "checkbox") {
        if (!data.is_boolean()) return std::monostate{};
        return data.get<bool>();
    }
    if (type == "date") {
        return optional_string(string_at(data, "start"));
    }
    if (type == "multi_select") {
        return names_of(data);
    }
    if (type == "people") {
        std::vector<std::string> people;
        if (data.is_array()) {
            for (const auto& p : data) {
                if (auto label = person_label(p)) people.push_back(std::move(*label));
            }
        }
        return people;
    }
    if (type == "files") {
        std::vector<std::string> urls;
        if (data.is_array()) {
            for (const auto& f : data) {
                if (auto url = file_url(f)) urls.push_back(std::move(*url));
            }
        }
        return urls;
    }
    if (type == "created_by" || type == "last_edited_by") {
        return optional_string(person_label(data));
    }
    if (type == "unique_id") {
        const auto number = data.find("number");
        if (number == data.end() || !number->is_number_integer()) return std::monostate{};
        const auto prefix = string_at(data, "prefix");
        const auto n = number->get<int64_t>();
        if (!prefix || prefix->empty()) return std::to_string(n);
        return std::format("{}_{}", *prefix, n);
    }
    if (type == "formula") {
        const std::string inner = type_of(data);
        if (inner.empty() || !data.contains(inner) || data[inner].is_null()) {
            return std::monostate{};
        }
        const json& result = data[inner];
        if (inner == "date") return optional_string(string_at(result, "start"));
        if (result.is_string()) return result.get<std::string>();
        if (result.is_boolean()) return result.get<bool>();
        if (result.is_number()) return result.get<double>();
        return result.dump();
    }

    // Unknown types are stored as text
    if (data.is_string()) return data.get<std::string>();
    return data.dump();
}

PageRow PageParser::parse_page(const json& page) const {
    const auto id = string_at(page, "id");
    if (!id || id->empty()) {
        throw SourceError("Page payload has no id");
    }

    PageRow row;
    row.id = utils::normalize_id(*id);
    row.database_id = parent_database_id(page).value_or("");
    row.columns.push_back(pk_column_);
    row.values.emplace_back(row.id);

    const auto props = page.find("properties");
    if (props == page.end() || !props->is_object()) {
        return row;
    }

    for (const auto& [name, prop] : props->items()) {
        // null or scalar in place of a property object
        if (!prop.is_object()) {
            continue;
        }
        const std::string type = type_of(prop);
        if (type == "rollup") {
            continue;
        }

        if (type == "relation") {
            auto& edges = row.relations[name];
            const auto rel = prop.find("relation");
            if (rel != prop.end() && rel->is_array()) {
                for (const auto& item : *rel) {
                    const auto related = string_at(item, "id");
                    if (related && !related->empty()) {
                        edges.push_back({row.id, utils::normalize_id(*related)});
                    }
                }
            }
            // Null, empty and unreadable relations all clear the record's rows
            if (edges.empty()) {
                edges.push_back({row.id, std::nullopt});
            }
            continue;
        }

        if (name == pk_column_) {
            continue;
        }
        row.columns.push_back(name);
        row.values.push_back(property_value(prop));
    }

    return row;
}

TableSpec PageParser::table_spec(const json& database,
                                 const std::string& schema,
                                 const std::string& table) const {
    TableSpec spec;
    spec.schema = schema;
    spec.table = table;
    spec.columns.push_back({pk_column_, "UUID", true});

    const auto props = database.find("properties");
    if (props == database.end() || !props->is_object()) {
        return spec;
    }

    for (const auto& [name, prop] : props->items()) {
        if (!prop.is_object()) continue;
        const std::string sql_type = sql_type_for(type_of(prop));
        if (sql_type.empty() || name == pk_column_) {
            continue;
        }
        spec.columns.push_back({name, sql_type, false});
    }
    return spec;
}

std::optional<std::string> PageParser::database_title(const json& database) {
    if (!database.is_object()) return std::nullopt;
    const auto title = database.find("title");
    if (title == database.end()) return std::nullopt;
    std::string text = concat_plain_text(*title);
    if (text.empty()) return std::nullopt;
    return text;
}

std::optional<std::string> PageParser::parent_database_id(const json& page) {
    if (!page.is_object()) return std::nullopt;
    const auto parent = page.find("parent");
    if (parent == page.end()) return std::nullopt;
    auto db_id = string_at(*parent, "database_id");
    if (!db_id || db_id->empty()) return std::nullopt;
    return utils::normalize_id(*db_id);
}

std::map<std::string, std::string> PageParser::relation_targets(const json& database) {
    std::map<std::string, std::string> targets;
    const auto props = database.find("properties");
    if (props == database.end() || !props->is_object()) {
        return targets;
    }
    for (const auto& [name, prop] : props->items()) {
        if (type_of(prop) != "relation") continue;
        const auto rel = prop.find("relation");
        if (rel == prop.end()) continue;
        if (auto db_id = string_at(*rel, "database_id"); db_id && !db_id->empty()) {
            targets.emplace(name, utils::normalize_id(*db_id));
        }
    }
    return targets;
}

} // namespace relsync
