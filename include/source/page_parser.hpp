#pragma once

#include "core/types.hpp"
#include "schema/schema_types.hpp"
#include "sync/sync_types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relsync {

/**
 * @brief A page flattened into one entity row plus its relation edges
 */
struct PageRow {
    std::string id;            // normalized page id
    std::string database_id;   // normalized parent database id, empty if none
    std::vector<std::string> columns;
    std::vector<SqlValue> values;
    std::map<std::string, std::vector<RelationEdge>> relations;
};

/**
 * @brief Translate Notion-shaped payloads into rows and table specs
 *
 * Property type to column type:
 *   title, select, email, phone_number      VARCHAR(255)
 *   number                                  FLOAT
 *   checkbox                                BOOLEAN
 *   date, created_time, last_edited_time    TIMESTAMP
 *   multi_select, people, files             TEXT[]
 *   relation, rollup                        (no column)
 *   anything else                           TEXT
 */
class PageParser {
public:
    explicit PageParser(std::string primary_key_column = "primary_key_id",
                        size_t max_text_length = 255);

    /**
     * @throws SourceError if the page has no id
     */
    [[nodiscard]] PageRow parse_page(const nlohmann::json& page) const;

    /**
     * @brief Table spec for a database descriptor
     *
     * Primary key column (UUID) first, then one column per stored
     * property. Property names colliding with the key column are dropped.
     */
    [[nodiscard]] TableSpec table_spec(const nlohmann::json& database,
                                       const std::string& schema,
                                       const std::string& table) const;

    // Value of a single page property in its column representation
    [[nodiscard]] SqlValue property_value(const nlohmann::json& property) const;

    // Empty for relation and rollup
    [[nodiscard]] static std::string sql_type_for(const std::string& property_type);

    // Concatenated title[].plain_text; nullopt if absent or empty
    [[nodiscard]] static std::optional<std::string> database_title(const nlohmann::json& database);

    [[nodiscard]] static std::optional<std::string> parent_database_id(const nlohmann::json& page);

    // Relation property name -> normalized target database id
    [[nodiscard]] static std::map<std::string, std::string> relation_targets(const nlohmann::json& database);

    [[nodiscard]] const std::string& primary_key_column() const { return pk_column_; }

private:
    std::string pk_column_;
    size_t max_text_length_;
};

} // namespace relsync
