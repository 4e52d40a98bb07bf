#pragma once

#include "config/config_types.hpp"
#include "schema/schema_types.hpp"
#include "source/ipage_source.hpp"
#include "store/irecord_store.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace relsync {

/**
 * @brief Database id -> entity table name
 *
 * Lookups go cache -> persistent map table -> source database title.
 * A title fetched from the source is written back to the map table
 * before it is returned. Ids are normalized before every step.
 *
 * Thread-safe: the cache is guarded by a shared_mutex. The store and
 * source are only touched on a cache miss.
 */
class TableNameMap {
public:
    TableNameMap(IRecordStore& store, IPageSource& source, SyncConfig config);

    /**
     * @throws SourceError if the id is empty, the database is unknown to
     *         the source, or its descriptor carries no title
     */
    [[nodiscard]] std::string resolve(const std::string& database_id);

    [[nodiscard]] std::optional<std::string> cached(const std::string& database_id) const;

    // Seed the cache without touching the store
    void remember(const std::string& database_id, const std::string& table_name);

    void clear_cache();

    [[nodiscard]] size_t cache_size() const;

    // (db_id TEXT PRIMARY KEY, table_name TEXT)
    [[nodiscard]] TableSpec map_table_spec() const;

private:
    std::optional<std::string> load_stored(const std::string& key);
    void store_mapping(const std::string& key, const std::string& table_name);

    IRecordStore& store_;
    IPageSource& source_;
    SyncConfig config_;

    std::unordered_map<std::string, std::string> cache_;
    mutable std::shared_mutex mutex_;
};

} // namespace relsync
