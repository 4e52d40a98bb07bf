#include "source/file_page_source.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>

namespace relsync {

FilePageSource::FilePageSource(std::filesystem::path root)
    : root_(std::move(root)) {}

std::optional<nlohmann::json> FilePageSource::get_page(const std::string& page_id) {
    return load("pages", page_id);
}

std::optional<nlohmann::json> FilePageSource::get_database(const std::string& database_id) {
    return load("databases", database_id);
}

std::optional<nlohmann::json> FilePageSource::load(const char* kind, const std::string& id) const {
    const std::string key = utils::normalize_id(id);
    if (key.empty()) {
        return std::nullopt;
    }

    const auto path = root_ / kind / (key + ".json");
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        utils::log::debug(std::format("No {} snapshot for {} at {}", kind, key, path.string()));
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in) {
        throw SourceError(std::format("Cannot open {}", path.string()));
    }

    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw SourceError(std::format("Invalid JSON in {}: {}", path.string(), e.what()));
    }
}

} // namespace relsync
