#pragma once

#include "config/config_types.hpp"
#include "source/ipage_source.hpp"
#include "source/page_parser.hpp"
#include "store/irecord_store.hpp"
#include "sync/join_table.hpp"
#include "sync/sync_types.hpp"
#include "sync/table_name_map.hpp"

#include <set>
#include <string>
#include <vector>

namespace relsync {

/**
 * @brief Reconciles relation properties into join tables
 *
 * Work is split in two phases:
 *
 *   stage()  purge pass, then diff pass, then queue the missing pairs
 *   flush()  insert pass per join table, with foreign-key self-heal
 *
 * Rows already present and still desired are never deleted or reinserted.
 * A foreign-key violation on insert fetches the missing referent from the
 * source, upserts it into its entity table and retries. Each violating
 * value is healed at most once per join table; a repeat is fatal for that
 * table only.
 *
 * Not thread-safe: one synchronizer per ingestion run.
 */
class RelationSynchronizer {
public:
    RelationSynchronizer(IRecordStore& store,
                         IPageSource& source,
                         TableNameMap& names,
                         const PageParser& parser,
                         SyncConfig config);

    /**
     * @brief Resolve and register the join table for a relation
     *
     * @param schema Entity schema of both tables
     * @param current_table Table of the records being synchronized
     * @param target_database_id Source database the relation points at
     */
    const PendingJoin& register_relation(const std::string& schema,
                                         const std::string& current_table,
                                         const std::string& target_database_id);

    /**
     * @brief Purge and diff one relation property; queue the new pairs
     *
     * Purge edges delete every row of their record. For every other record
     * the rows whose related id is not in the incoming set are deleted.
     * If staging fails, the pairs this call queued are withdrawn.
     *
     * @throws Error subclasses on store or name-resolution failure
     */
    PropertySyncResult stage(const std::string& property,
                             const std::string& schema,
                             const std::string& current_table,
                             const std::string& target_database_id,
                             const std::vector<RelationEdge>& edges);

    // Insert pass over every staged join table; clears the state
    std::vector<FlushResult> flush();

    // Insert pass over one join table; removes it from the state
    FlushResult flush_table(const std::string& join_table);

    // stage() followed by flush_table(); never throws Error
    PropertySyncResult sync_property(const std::string& property,
                                     const std::string& schema,
                                     const std::string& current_table,
                                     const std::string& target_database_id,
                                     const std::vector<RelationEdge>& edges);

    [[nodiscard]] const SyncState& state() const { return state_; }

    void reset() { state_.clear(); }

private:
    PendingJoin& pending_for(const std::string& schema,
                             const std::string& current_table,
                             const std::string& target_database_id);

    PropertySyncResult stage_into(PendingJoin& pending,
                                  const std::string& property,
                                  const std::string& current_table,
                                  const std::vector<RelationEdge>& edges);

    void insert_pending(const PendingJoin& pending, FlushResult& result);

    uint64_t insert_batch(const PendingJoin& pending,
                          const std::vector<std::vector<SqlValue>>& rows,
                          std::set<std::string>& healed,
                          FlushResult& result);

    // Materialize the entity row for a missing referent
    void heal(const JoinTableSpec& spec, const std::string& key_value);

    // Join table plus, on drift, the related entity table it references
    void ensure_join_storage(const PendingJoin& pending);

    IRecordStore& store_;
    IPageSource& source_;
    TableNameMap& names_;
    const PageParser& parser_;
    SyncConfig config_;
    SyncState state_;
};

} // namespace relsync
