#pragma once

#include "source/ipage_source.hpp"

#include <filesystem>
#include <string>

namespace relsync {

/**
 * @brief IPageSource over a snapshot directory
 *
 * Layout: <root>/pages/<id>.json and <root>/databases/<id>.json, where
 * <id> is the normalized (dashless, lower-case) id.
 */
class FilePageSource : public IPageSource {
public:
    explicit FilePageSource(std::filesystem::path root);

    std::optional<nlohmann::json> get_page(const std::string& page_id) override;
    std::optional<nlohmann::json> get_database(const std::string& database_id) override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::optional<nlohmann::json> load(const char* kind, const std::string& id) const;

    std::filesystem::path root_;
};

} // namespace relsync
