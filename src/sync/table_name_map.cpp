#include "sync/table_name_map.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "schema/schema_evolution.hpp"
#include "source/page_parser.hpp"

#include <format>
#include <mutex>

namespace relsync {

namespace {

constexpr const char* kIdColumn = "db_id";
constexpr const char* kNameColumn = "table_name";

} // anonymous namespace

TableNameMap::TableNameMap(IRecordStore& store, IPageSource& source, SyncConfig config)
    : store_(store), source_(source), config_(std::move(config)) {}

std::string TableNameMap::resolve(const std::string& database_id) {
    const std::string key = utils::normalize_id(database_id);
    if (key.empty()) {
        throw SourceError("Cannot resolve a table name for an empty database id");
    }

    if (auto hit = cached(key)) {
        return *hit;
    }

    if (auto stored = load_stored(key)) {
        remember(key, *stored);
        return *stored;
    }

    const auto database = source_.get_database(key);
    if (!database) {
        throw SourceError(std::format("Database {} not found in source", key));
    }
    const auto title = PageParser::database_title(*database);
    if (!title) {
        throw SourceError(std::format("Database {} has no title", key));
    }

    store_mapping(key, *title);
    remember(key, *title);
    utils::log::info(std::format("Mapped database {} to table '{}'", key, *title));
    return *title;
}

std::optional<std::string> TableNameMap::cached(const std::string& database_id) const {
    const std::string key = utils::normalize_id(database_id);
    std::shared_lock lock(mutex_);
    const auto it = cache_.find(key);
    if (it == cache_.end()) return std::nullopt;
    return it->second;
}

void TableNameMap::remember(const std::string& database_id, const std::string& table_name) {
    std::unique_lock lock(mutex_);
    cache_[utils::normalize_id(database_id)] = table_name;
}

void TableNameMap::clear_cache() {
    std::unique_lock lock(mutex_);
    cache_.clear();
}

size_t TableNameMap::cache_size() const {
    std::shared_lock lock(mutex_);
    return cache_.size();
}

TableSpec TableNameMap::map_table_spec() const {
    TableSpec spec;
    spec.schema = config_.name_map_schema;
    spec.table = config_.name_map_table;
    spec.columns = {
        {kIdColumn, "TEXT", true},
        {kNameColumn, "TEXT", false},
    };
    return spec;
}

std::optional<std::string> TableNameMap::load_stored(const std::string& key) {
    const std::vector<FilterGroup> groups = {
        {Logic::AND, {{kIdColumn, FilterOperator::EQUALS, SqlValue{key}}}}
    };
    SelectOptions options;
    options.limit = 1;

    const auto rows = retry_on_schema_drift(
        [&] { return store_.select(config_.name_map_schema, config_.name_map_table, groups, options); },
        [&] { store_.ensure_table(map_table_spec()); });

    if (rows.empty()) {
        return std::nullopt;
    }
    auto name = field(rows.front(), kNameColumn);
    if (!name || name->empty()) {
        return std::nullopt;
    }
    return name;
}

void TableNameMap::store_mapping(const std::string& key, const std::string& table_name) {
    UpsertRequest request;
    request.schema = config_.name_map_schema;
    request.table = config_.name_map_table;
    request.columns = {kIdColumn, kNameColumn};
    request.values = {SqlValue{key}, SqlValue{table_name}};
    request.conflict_target = {kIdColumn};
    request.strategy = ConflictStrategy::OVERWRITE;

    retry_on_schema_drift(
        [&] { return store_.upsert(request); },
        [&] { store_.ensure_table(map_table_spec()); });
}

} // namespace relsync
