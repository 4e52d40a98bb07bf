#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "source/ipage_source.hpp"
#include "source/page_parser.hpp"
#include "store/irecord_store.hpp"
#include "sync/relation_synchronizer.hpp"
#include "sync/sync_types.hpp"
#include "sync/table_name_map.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relsync {

/**
 * @brief Outcome of ingesting one page
 */
struct IngestReport {
    std::string page_id;
    std::string schema;
    std::string table;

    bool success = false;          // entity row written
    std::string error;
    std::optional<ErrorKind> error_kind;

    uint64_t rows_written = 0;
    std::vector<PropertySyncResult> properties;
    std::vector<FlushResult> flushes;

    [[nodiscard]] size_t failed_properties() const;
};

// Webhook envelopes carry the page under "data"; bare pages pass through
[[nodiscard]] const nlohmann::json& unwrap_page_payload(const nlohmann::json& payload);

/**
 * @brief Writes a page into its entity table and reconciles its relations
 *
 * Steps per page: fetch the parent database descriptor, ensure the entity
 * table, upsert the row (overwrite on the primary key) and stage every
 * relation property. The insert pass runs once per ingest() call, or once
 * for a whole ingest_batch(). A failed relation property is logged and
 * reported; sibling properties continue.
 *
 * Relation properties that point at the same table share one join table
 * and are staged together.
 */
class RecordIngestor {
public:
    RecordIngestor(IRecordStore& store,
                   IPageSource& source,
                   TableNameMap& names,
                   SyncConfig config);

    /**
     * @throws SourceError if the page or its parent descriptor is unusable
     * @throws Error subclasses if the entity row cannot be written
     */
    IngestReport ingest(const nlohmann::json& page,
                        const std::string& schema,
                        const std::string& table);

    /**
     * @brief Write and stage every page, then run a single insert pass
     *
     * Never throws Error: a failed page is reported and the rest continue.
     * A join table whose insert pass fails marks the matching property of
     * every page that staged into it as failed.
     */
    std::vector<IngestReport> ingest_batch(const std::vector<nlohmann::json>& pages,
                                           const std::string& schema,
                                           const std::string& table);

    [[nodiscard]] const PageParser& parser() const { return parser_; }

private:
    uint64_t write_row(const PageRow& row,
                       const TableSpec& spec,
                       const std::string& database_id);

    // Parse, ensure the table, write the row and stage relations; no insert pass
    IngestReport stage_page(const nlohmann::json& page,
                            const std::string& schema,
                            const std::string& table);

    void stage_relations(const PageRow& row,
                         const nlohmann::json& database,
                         IngestReport& report);

    static IngestReport failed_page(const nlohmann::json& page,
                                    const std::string& schema,
                                    const std::string& table,
                                    std::string error,
                                    ErrorKind kind);

    // Attach the flushes of the join tables the report staged into
    static void apply_flushes(const std::vector<FlushResult>& flushes, IngestReport& report);

    IRecordStore& store_;
    IPageSource& source_;
    SyncConfig config_;
    PageParser parser_;
    RelationSynchronizer sync_;
};

} // namespace relsync
