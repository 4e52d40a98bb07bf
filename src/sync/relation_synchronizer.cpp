#include "sync/relation_synchronizer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "schema/schema_evolution.hpp"

#include <algorithm>
#include <format>
#include <map>

namespace relsync {

RelationSynchronizer::RelationSynchronizer(IRecordStore& store,
                                           IPageSource& source,
                                           TableNameMap& names,
                                           const PageParser& parser,
                                           SyncConfig config)
    : store_(store),
      source_(source),
      names_(names),
      parser_(parser),
      config_(std::move(config)) {}

const PendingJoin& RelationSynchronizer::register_relation(const std::string& schema,
                                                           const std::string& current_table,
                                                           const std::string& target_database_id) {
    return pending_for(schema, current_table, target_database_id);
}

PendingJoin& RelationSynchronizer::pending_for(const std::string& schema,
                                               const std::string& current_table,
                                               const std::string& target_database_id) {
    const std::string related_table = names_.resolve(target_database_id);
    JoinTableSpec spec = derive_join_spec(schema, config_.join_schema, current_table, related_table);

    auto [it, inserted] = state_.try_emplace(spec.table_name);
    if (inserted) {
        it->second.spec = std::move(spec);
        it->second.related_database_id = utils::normalize_id(target_database_id);
        utils::log::debug(std::format("Registered join table {} ({} <-> {})",
            it->first, current_table, related_table));
    }
    return it->second;
}

// ============================================================================
// Purge and diff
// ============================================================================

PropertySyncResult RelationSynchronizer::stage(const std::string& property,
                                               const std::string& schema,
                                               const std::string& current_table,
                                               const std::string& target_database_id,
                                               const std::vector<RelationEdge>& edges) {
    const size_t tables_before = state_.size();
    PendingJoin& pending = pending_for(schema, current_table, target_database_id);
    const size_t queued_before = pending.pending_values.size();

    try {
        return stage_into(pending, property, current_table, edges);
    } catch (const Error&) {
        // Pairs queued by a failed property never reach the insert pass
        pending.pending_values.resize(queued_before);
        if (state_.size() > tables_before && pending.pending_values.empty()) {
            const std::string table_name = pending.spec.table_name;
            state_.erase(table_name);
        }
        throw;
    }
}

PropertySyncResult RelationSynchronizer::stage_into(PendingJoin& pending,
                                                    const std::string& property,
                                                    const std::string& current_table,
                                                    const std::vector<RelationEdge>& edges) {
    PropertySyncResult result;
    result.property = property;

    const JoinTableSpec& spec = pending.spec;
    result.join_table = spec.table_name;

    const JoinOrientation orientation = orient(spec, current_table);
    const std::string& record_col = orientation.record_column;
    const std::string& related_col = orientation.related_column;
    auto evolve = [&] { ensure_join_storage(pending); };

    // Classify
    std::set<std::string> purge_ids;
    std::map<std::string, std::set<std::string>> desired;
    for (const auto& edge : edges) {
        const std::string record = utils::normalize_id(edge.record_id);
        if (record.empty()) {
            utils::log::warn(std::format("Relation {}: edge without a record id skipped", property));
            continue;
        }
        const std::string related = edge.related_id ? utils::normalize_id(*edge.related_id) : "";
        if (related.empty()) {
            purge_ids.insert(record);
        } else {
            desired[record].insert(related);
        }
    }

    // Purge
    for (const auto& record : purge_ids) {
        const uint64_t n = retry_on_schema_drift(
            [&] {
                return store_.delete_where(spec.join_schema, spec.table_name,
                                           {record_col}, {SqlValue{record}});
            },
            evolve);
        if (n > 0) {
            utils::log::debug(std::format("Purged {} rows of {} from {}", n, record, spec.table_name));
        }
        result.purged += n;
    }

    // Diff
    for (const auto& entry : desired) {
        const std::string& record = entry.first;
        const std::set<std::string>& wanted = entry.second;
        const auto rows = retry_on_schema_drift(
            [&] {
                return store_.get_records(spec.join_schema, spec.table_name, record_col, {record});
            },
            evolve);

        std::set<std::string> present;
        for (const auto& row : rows) {
            const auto value = field(row, related_col);
            if (!value) continue;
            const std::string related = utils::normalize_id(*value);
            if (related.empty()) continue;

            if (wanted.contains(related)) {
                if (present.insert(related).second) {
                    ++result.untouched;
                }
                continue;
            }
            result.deleted += store_.delete_where(
                spec.join_schema, spec.table_name,
                {record_col, related_col},
                {SqlValue{record}, SqlValue{related}});
        }

        for (const auto& related : wanted) {
            if (present.contains(related)) continue;
            auto pair = oriented_pair(spec, current_table, record, related);
            auto& queue = pending.pending_values;
            if (std::find(queue.begin(), queue.end(), pair) == queue.end()) {
                queue.push_back(std::move(pair));
                ++result.queued;
            }
        }
    }

    utils::log::debug(std::format(
        "Relation {} -> {}: purged={} deleted={} untouched={} queued={}",
        property, spec.table_name, result.purged, result.deleted,
        result.untouched, result.queued));
    return result;
}

// ============================================================================
// Insert pass
// ============================================================================

std::vector<FlushResult> RelationSynchronizer::flush() {
    std::vector<std::string> tables;
    tables.reserve(state_.size());
    for (const auto& [name, pending] : state_) {
        tables.push_back(name);
    }

    std::vector<FlushResult> results;
    results.reserve(tables.size());
    for (const auto& name : tables) {
        results.push_back(flush_table(name));
    }
    state_.clear();
    return results;
}

FlushResult RelationSynchronizer::flush_table(const std::string& join_table) {
    FlushResult result;
    result.join_table = join_table;

    const auto it = state_.find(join_table);
    if (it == state_.end()) {
        return result;
    }

    try {
        insert_pending(it->second, result);
    } catch (const Error& e) {
        result.success = false;
        result.error = e.what();
        result.error_kind = e.kind();
        utils::log::error(std::format("Insert pass on {} failed: {}", join_table, e.what()));
    }

    state_.erase(it);
    return result;
}

void RelationSynchronizer::insert_pending(const PendingJoin& pending, FlushResult& result) {
    const auto& values = pending.pending_values;
    result.attempted = values.size();
    if (values.empty()) {
        return;
    }

    ensure_join_storage(pending);

    std::set<std::string> healed;
    const size_t batch_size = std::max<size_t>(1, config_.insert_batch_size);
    for (size_t start = 0; start < values.size(); start += batch_size) {
        const size_t end = std::min(values.size(), start + batch_size);
        std::vector<std::vector<SqlValue>> rows;
        rows.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            rows.push_back({SqlValue{values[i].first}, SqlValue{values[i].second}});
        }
        result.inserted += insert_batch(pending, rows, healed, result);
    }

    utils::log::info(std::format("Inserted {} of {} pairs into {}.{}",
        result.inserted, result.attempted, pending.spec.join_schema, pending.spec.table_name));
}

uint64_t RelationSynchronizer::insert_batch(const PendingJoin& pending,
                                            const std::vector<std::vector<SqlValue>>& rows,
                                            std::set<std::string>& healed,
                                            FlushResult& result) {
    const auto& spec = pending.spec;
    const std::vector<std::string> columns = {spec.column1_name, spec.column2_name};

    while (true) {
        try {
            return store_.insert_ignore(spec.join_schema, spec.table_name, columns, rows);
        } catch (const ForeignKeyViolationError& e) {
            const std::string value = utils::normalize_id(e.key_value());
            if (value.empty()) {
                utils::log::error(std::format("Unparseable foreign key violation on {}: {}",
                    spec.table_name, e.what()));
                throw;
            }
            if (healed.contains(value)) {
                utils::log::error(std::format("Referent {} still missing from {} after heal",
                    value, spec.table_name));
                throw;
            }

            utils::log::warn(std::format("Missing referent {} for {}, fetching from source",
                value, spec.table_name));
            heal(spec, value);
            healed.insert(value);
            result.healed.push_back(value);
        }
    }
}

void RelationSynchronizer::heal(const JoinTableSpec& spec, const std::string& key_value) {
    try {
        const auto page = source_.get_page(key_value);
        if (!page) {
            throw UnresolvableForeignKeyError(
                std::format("Missing referent {} not found in source", key_value), key_value);
        }

        const auto database_id = PageParser::parent_database_id(*page);
        if (!database_id) {
            throw UnresolvableForeignKeyError(
                std::format("Missing referent {} has no parent database", key_value), key_value);
        }

        const std::string table = names_.resolve(*database_id);
        const PageRow row = parser_.parse_page(*page);

        UpsertRequest request;
        request.schema = spec.schema;
        request.table = table;
        request.columns = row.columns;
        request.values = row.values;
        request.conflict_target = {parser_.primary_key_column()};
        request.strategy = ConflictStrategy::OVERWRITE;

        retry_on_schema_drift(
            [&] { return store_.upsert(request); },
            [&] {
                const auto database = source_.get_database(*database_id);
                if (!database) {
                    throw UnresolvableForeignKeyError(
                        std::format("Database {} of referent {} not found in source",
                            *database_id, key_value),
                        key_value);
                }
                store_.ensure_table(parser_.table_spec(*database, spec.schema, table));
            });

        utils::log::info(std::format("Materialized referent {} into {}.{}",
            key_value, spec.schema, table));
    } catch (const SourceError& e) {
        throw UnresolvableForeignKeyError(
            std::format("Cannot fetch missing referent {}: {}", key_value, e.what()), key_value);
    }
}

void RelationSynchronizer::ensure_join_storage(const PendingJoin& pending) {
    retry_on_schema_drift(
        [&] { store_.ensure_join_table(pending.spec, parser_.primary_key_column()); },
        [&] {
            const std::string table = names_.resolve(pending.related_database_id);
            const auto database = source_.get_database(pending.related_database_id);
            if (!database) {
                throw SourceError(std::format("Database {} not found in source",
                    pending.related_database_id));
            }
            store_.ensure_table(parser_.table_spec(*database, pending.spec.schema, table));
        });
}

// ============================================================================
// Single-property convenience
// ============================================================================

PropertySyncResult RelationSynchronizer::sync_property(const std::string& property,
                                                       const std::string& schema,
                                                       const std::string& current_table,
                                                       const std::string& target_database_id,
                                                       const std::vector<RelationEdge>& edges) {
    PropertySyncResult result;
    try {
        result = stage(property, schema, current_table, target_database_id, edges);
    } catch (const Error& e) {
        result.property = property;
        result.status = PropertyStatus::FAILED;
        result.error = e.what();
        result.error_kind = e.kind();
        utils::log::error(std::format("Relation {} failed: {}", property, e.what()));
        return result;
    }

    const FlushResult flushed = flush_table(result.join_table);
    if (!flushed.success) {
        result.status = PropertyStatus::FAILED;
        result.error = flushed.error;
        result.error_kind = flushed.error_kind;
    }
    return result;
}

} // namespace relsync
