#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace relsync {

/**
 * @brief External source of truth for entity records and table descriptors
 *
 * Payloads follow the Notion shape: a page is
 * {"id", "parent": {"database_id"}, "properties": {...}} and a database
 * descriptor is {"id", "title": [{"plain_text"}], "properties": {...}}.
 */
class IPageSource {
public:
    virtual ~IPageSource() = default;

    /**
     * @return The page, or nullopt if the source has no such page
     * @throws SourceError if the source cannot be read
     */
    [[nodiscard]] virtual std::optional<nlohmann::json> get_page(const std::string& page_id) = 0;

    /**
     * @return The database descriptor, or nullopt if unknown
     * @throws SourceError if the source cannot be read
     */
    [[nodiscard]] virtual std::optional<nlohmann::json> get_database(const std::string& database_id) = 0;
};

} // namespace relsync
