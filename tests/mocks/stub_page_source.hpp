#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"
#include "source/ipage_source.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <set>
#include <string>

namespace relsync::testing {

/**
 * @brief IPageSource serving canned payloads keyed by normalized id
 */
class StubPageSource : public IPageSource {
public:
    std::optional<nlohmann::json> get_page(const std::string& page_id) override {
        ++page_fetches;
        return lookup(pages_, page_id);
    }

    std::optional<nlohmann::json> get_database(const std::string& database_id) override {
        ++database_fetches;
        return lookup(databases_, database_id);
    }

    void add_page(const nlohmann::json& page) {
        pages_[utils::normalize_id(page.at("id").get<std::string>())] = page;
    }

    void add_database(const nlohmann::json& database) {
        databases_[utils::normalize_id(database.at("id").get<std::string>())] = database;
    }

    // Every fetch of id throws SourceError
    void fail_on(const std::string& id) {
        failing_.insert(utils::normalize_id(id));
    }

    uint64_t page_fetches = 0;
    uint64_t database_fetches = 0;

private:
    std::optional<nlohmann::json> lookup(const std::map<std::string, nlohmann::json>& store,
                                         const std::string& id) const {
        const std::string key = utils::normalize_id(id);
        if (failing_.contains(key)) {
            throw SourceError("Source unavailable for " + key);
        }
        const auto it = store.find(key);
        if (it == store.end()) return std::nullopt;
        return it->second;
    }

    std::map<std::string, nlohmann::json> pages_;
    std::map<std::string, nlohmann::json> databases_;
    std::set<std::string> failing_;
};

} // namespace relsync::testing
