#pragma once

#include "core/error.hpp"
#include "schema/schema_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relsync {

/**
 * @brief One (record, related record) pair of a relation property
 *
 * record_id always belongs to the entity being synchronized. A missing or
 * empty related_id is a purge signal: the record should have no rows.
 */
struct RelationEdge {
    std::string record_id;
    std::optional<std::string> related_id;

    [[nodiscard]] bool is_purge() const { return !related_id || related_id->empty(); }
};

/**
 * @brief Join rows waiting for the insert pass
 *
 * Pairs are oriented (column1 value, column2 value) and deduplicated.
 */
struct PendingJoin {
    JoinTableSpec spec;
    std::string related_database_id;   // source database of the related table
    std::vector<std::pair<std::string, std::string>> pending_values;
};

// Join-table name -> pending rows; ordered so flushes are deterministic
using SyncState = std::map<std::string, PendingJoin>;

enum class PropertyStatus : uint8_t {
    SYNCED,
    FAILED,
    SKIPPED
};

[[nodiscard]] inline const char* property_status_to_string(PropertyStatus s) {
    switch (s) {
        case PropertyStatus::SYNCED:  return "SYNCED";
        case PropertyStatus::FAILED:  return "FAILED";
        case PropertyStatus::SKIPPED: return "SKIPPED";
        default:                      return "UNKNOWN";
    }
}

/**
 * @brief Outcome of reconciling one relation property
 */
struct PropertySyncResult {
    std::string property;
    std::string join_table;
    PropertyStatus status = PropertyStatus::SYNCED;
    std::string error;
    std::optional<ErrorKind> error_kind;

    uint64_t purged = 0;      // rows removed by purge signals
    uint64_t deleted = 0;     // rows removed by the diff pass
    uint64_t untouched = 0;   // existing rows already desired
    uint64_t queued = 0;      // pairs handed to the insert pass
};

/**
 * @brief Outcome of one insert pass over a join table
 */
struct FlushResult {
    std::string join_table;
    bool success = true;
    std::string error;
    std::optional<ErrorKind> error_kind;

    uint64_t attempted = 0;
    uint64_t inserted = 0;
    std::vector<std::string> healed;   // referents materialized from the source
};

} // namespace relsync
