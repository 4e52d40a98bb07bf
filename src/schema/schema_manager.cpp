#include "schema/schema_manager.hpp"
#include "query/sql_identifier.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace relsync {

namespace {

void require_identifier(const std::string& value, const char* what) {
    if (utils::trim(value).empty()) {
        throw SchemaDefinitionError(std::format("{} must not be empty", what));
    }
}

std::string foreign_key_column(const std::string& column,
                               const std::string& schema,
                               const std::string& table,
                               const std::string& pk_column) {
    return std::format("{} UUID NOT NULL REFERENCES {} ({}) ON DELETE CASCADE",
                       quote_ident(column), qualified_name(schema, table), quote_ident(pk_column));
}

} // anonymous namespace

bool SchemaManager::is_valid_type(const std::string& type) {
    if (utils::trim(type).empty()) return false;
    return std::all_of(type.begin(), type.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '_' || c == ' ' || c == '(' || c == ')' ||
               c == '[' || c == ']' || c == ',';
    });
}

void SchemaManager::validate(const TableSpec& spec) {
    require_identifier(spec.schema, "Schema name");
    require_identifier(spec.table, "Table name");
    if (spec.columns.empty()) {
        throw SchemaDefinitionError(std::format(
            "Table {}.{} must declare at least one column", spec.schema, spec.table));
    }

    std::unordered_set<std::string> seen;
    for (const auto& col : spec.columns) {
        require_identifier(col.name, "Column name");
        if (!seen.insert(col.name).second) {
            throw SchemaDefinitionError(std::format(
                "Duplicate column '{}' in {}.{}", col.name, spec.schema, spec.table));
        }
        if (!is_valid_type(col.type)) {
            throw SchemaDefinitionError(std::format(
                "Invalid type '{}' for column '{}' in {}.{}", col.type, col.name, spec.schema, spec.table));
        }
    }
}

std::vector<std::string> SchemaManager::table_ddl(const TableSpec& spec) {
    validate(spec);

    const std::string table = qualified_name(spec.schema, spec.table);
    std::vector<std::string> ddl;
    ddl.reserve(spec.columns.size() + 2);

    ddl.push_back(std::format("CREATE SCHEMA IF NOT EXISTS {}", quote_ident(spec.schema)));

    std::string body;
    for (const auto& col : spec.columns) {
        if (!body.empty()) body += ", ";
        body += std::format("{} {}", quote_ident(col.name), col.type);
    }
    const auto keys = spec.primary_key_columns();
    if (!keys.empty()) {
        std::string key_list;
        for (const auto& k : keys) {
            if (!key_list.empty()) key_list += ", ";
            key_list += quote_ident(k);
        }
        body += std::format(", PRIMARY KEY ({})", key_list);
    }
    ddl.push_back(std::format("CREATE TABLE IF NOT EXISTS {} ({})", table, body));

    for (const auto& col : spec.columns) {
        if (col.primary_key) continue;
        ddl.push_back(std::format("ALTER TABLE {} ADD COLUMN IF NOT EXISTS {} {}",
                                  table, quote_ident(col.name), col.type));
    }
    return ddl;
}

std::vector<std::string> SchemaManager::join_table_ddl(const JoinTableSpec& spec,
                                                       const std::string& pk_column) {
    require_identifier(spec.table_name, "Join table name");
    require_identifier(spec.schema, "Entity schema name");
    require_identifier(spec.join_schema, "Join schema name");
    require_identifier(spec.column1_name, "Join column 1");
    require_identifier(spec.column2_name, "Join column 2");
    require_identifier(spec.column1_table, "Join column 1 table");
    require_identifier(spec.column2_table, "Join column 2 table");
    require_identifier(pk_column, "Primary key column");
    if (spec.column1_name == spec.column2_name) {
        throw SchemaDefinitionError(std::format(
            "Join table {} has two columns named '{}'", spec.table_name, spec.column1_name));
    }

    std::vector<std::string> ddl;
    ddl.push_back(std::format("CREATE SCHEMA IF NOT EXISTS {}", quote_ident(spec.join_schema)));
    ddl.push_back(std::format(
        "CREATE TABLE IF NOT EXISTS {} ({}, {}, PRIMARY KEY ({}, {}))",
        qualified_name(spec.join_schema, spec.table_name),
        foreign_key_column(spec.column1_name, spec.schema, spec.column1_table, pk_column),
        foreign_key_column(spec.column2_name, spec.schema, spec.column2_table, pk_column),
        quote_ident(spec.column1_name),
        quote_ident(spec.column2_name)));
    return ddl;
}

Statement SchemaManager::list_tables_query(const std::string& schema) {
    Statement stmt;
    stmt.sql =
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema = $1 AND table_type = 'BASE TABLE' "
        "ORDER BY table_name";
    stmt.params.emplace_back(schema);
    return stmt;
}

Statement SchemaManager::table_columns_query(const std::string& schema, const std::string& table) {
    Statement stmt;
    stmt.sql =
        "SELECT column_name, data_type, is_nullable FROM information_schema.columns "
        "WHERE table_schema = $1 AND table_name = $2 "
        "ORDER BY ordinal_position";
    stmt.params.emplace_back(schema);
    stmt.params.emplace_back(table);
    return stmt;
}

// ============================================================================
// Loose table-name matching
// ============================================================================

namespace {

std::string squash(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (const char c : utils::to_lower(name)) {
        if (c != ' ' && c != '_') out += c;
    }
    return out;
}

std::unordered_set<std::string> tokens(const std::string& name) {
    std::unordered_set<std::string> out;
    for (auto& t : utils::split(utils::to_lower(name), ' ')) {
        if (!t.empty()) out.insert(std::move(t));
    }
    return out;
}

} // anonymous namespace

std::optional<std::string> find_table_name(const std::string& key,
                                           const std::vector<std::string>& tables) {
    if (std::find(tables.begin(), tables.end(), key) != tables.end()) {
        return key;
    }

    const std::string squashed_key = squash(key);
    for (const auto& table : tables) {
        if (squash(table) == squashed_key) return table;
    }

    if (!squashed_key.empty()) {
        for (const auto& table : tables) {
            const std::string t = squash(table);
            if (t.empty()) continue;
            if (t.find(squashed_key) != std::string::npos ||
                squashed_key.find(t) != std::string::npos) {
                return table;
            }
        }
    }

    const auto key_tokens = tokens(key);
    for (const auto& table : tables) {
        for (const auto& t : tokens(table)) {
            if (key_tokens.contains(t)) return table;
        }
    }

    return std::nullopt;
}

} // namespace relsync
