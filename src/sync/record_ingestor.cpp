#include "sync/record_ingestor.hpp"
#include "core/utils.hpp"
#include "schema/schema_evolution.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <set>

namespace relsync {

size_t IngestReport::failed_properties() const {
    return static_cast<size_t>(std::count_if(properties.begin(), properties.end(),
        [](const PropertySyncResult& p) { return p.status == PropertyStatus::FAILED; }));
}

const nlohmann::json& unwrap_page_payload(const nlohmann::json& payload) {
    if (payload.is_object()) {
        const auto data = payload.find("data");
        if (data != payload.end() && data->is_object()) {
            return *data;
        }
    }
    return payload;
}

RecordIngestor::RecordIngestor(IRecordStore& store,
                               IPageSource& source,
                               TableNameMap& names,
                               SyncConfig config)
    : store_(store),
      source_(source),
      config_(std::move(config)),
      parser_(config_.primary_key_column, config_.max_text_length),
      sync_(store, source, names, parser_, config_) {}

IngestReport RecordIngestor::ingest(const nlohmann::json& page,
                                    const std::string& schema,
                                    const std::string& table) {
    utils::Timer timer;

    IngestReport report = stage_page(page, schema, table);
    apply_flushes(sync_.flush(), report);

    utils::log::info(std::format(
        "Ingested page {} into {}.{}: {} relation(s), {} failed, {}ms",
        report.page_id, schema, table, report.properties.size(),
        report.failed_properties(), timer.elapsed_ms().count()));
    return report;
}

std::vector<IngestReport> RecordIngestor::ingest_batch(const std::vector<nlohmann::json>& pages,
                                                       const std::string& schema,
                                                       const std::string& table) {
    utils::Timer timer;

    std::vector<IngestReport> reports;
    reports.reserve(pages.size());

    for (const auto& page : pages) {
        try {
            reports.push_back(stage_page(page, schema, table));
            continue;
        } catch (const Error& e) {
            reports.push_back(failed_page(page, schema, table, e.what(), e.kind()));
        } catch (const nlohmann::json::exception& e) {
            reports.push_back(failed_page(page, schema, table, e.what(), ErrorKind::SOURCE));
        }
        const auto& failed = reports.back();
        utils::log::error(std::format("Page {} failed: {}",
            failed.page_id.empty() ? "<no id>" : failed.page_id, failed.error));
    }

    // One insert pass for everything the batch staged
    const auto flushes = sync_.flush();
    size_t failed_pages = 0;
    for (auto& report : reports) {
        if (report.success) {
            apply_flushes(flushes, report);
        } else {
            ++failed_pages;
        }
    }

    utils::log::info(std::format(
        "Ingested {} page(s) into {}.{}: {} failed, {} join table(s) flushed, {}ms",
        pages.size(), schema, table, failed_pages, flushes.size(),
        timer.elapsed_ms().count()));
    return reports;
}

IngestReport RecordIngestor::stage_page(const nlohmann::json& page,
                                        const std::string& schema,
                                        const std::string& table) {
    IngestReport report;
    report.schema = schema;
    report.table = table;

    const PageRow row = parser_.parse_page(page);
    report.page_id = row.id;
    if (row.database_id.empty()) {
        throw SourceError(std::format("Page {} has no parent database", row.id));
    }

    const auto database = source_.get_database(row.database_id);
    if (!database) {
        throw SourceError(std::format("Database {} of page {} not found in source",
            row.database_id, row.id));
    }

    const TableSpec spec = parser_.table_spec(*database, schema, table);
    store_.ensure_table(spec);

    report.rows_written = write_row(row, spec, row.database_id);
    report.success = true;

    stage_relations(row, *database, report);
    return report;
}

IngestReport RecordIngestor::failed_page(const nlohmann::json& page,
                                         const std::string& schema,
                                         const std::string& table,
                                         std::string error,
                                         ErrorKind kind) {
    IngestReport failed;
    failed.schema = schema;
    failed.table = table;
    if (page.is_object()) {
        const auto id = page.find("id");
        if (id != page.end() && id->is_string()) {
            failed.page_id = utils::normalize_id(id->get<std::string>());
        }
    }
    failed.error = std::move(error);
    failed.error_kind = kind;
    return failed;
}

void RecordIngestor::apply_flushes(const std::vector<FlushResult>& flushes, IngestReport& report) {
    for (const auto& flushed : flushes) {
        bool touched = false;
        for (auto& p : report.properties) {
            if (p.join_table != flushed.join_table) continue;
            touched = true;
            if (!flushed.success && p.status == PropertyStatus::SYNCED) {
                p.status = PropertyStatus::FAILED;
                p.error = flushed.error;
                p.error_kind = flushed.error_kind;
            }
        }
        if (touched) {
            report.flushes.push_back(flushed);
        }
    }
}

uint64_t RecordIngestor::write_row(const PageRow& row,
                                   const TableSpec& spec,
                                   const std::string& database_id) {
    UpsertRequest request;
    request.schema = spec.schema;
    request.table = spec.table;
    request.columns = row.columns;
    request.values = row.values;
    request.conflict_target = {parser_.primary_key_column()};
    request.strategy = ConflictStrategy::OVERWRITE;

    return retry_on_schema_drift(
        [&] { return store_.upsert(request); },
        [&] {
            // The descriptor may have gained properties since ensure_table ran
            const auto database = source_.get_database(database_id);
            if (!database) {
                throw SourceError(std::format("Database {} not found in source", database_id));
            }
            store_.ensure_table(parser_.table_spec(*database, spec.schema, spec.table));
        });
}

void RecordIngestor::stage_relations(const PageRow& row,
                                    const nlohmann::json& database,
                                    IngestReport& report) {
    struct TargetGroup {
        std::vector<std::string> properties;
        std::vector<RelationEdge> edges;
    };

    const auto targets = PageParser::relation_targets(database);
    std::map<std::string, TargetGroup> groups;

    for (const auto& [property, edges] : row.relations) {
        const auto target = targets.find(property);
        if (target == targets.end()) {
            utils::log::warn(std::format("Relation {} has no target database, skipped", property));
            PropertySyncResult skipped;
            skipped.property = property;
            skipped.status = PropertyStatus::SKIPPED;
            skipped.error = "no target database in descriptor";
            report.properties.push_back(std::move(skipped));
            continue;
        }
        auto& group = groups[target->second];
        group.properties.push_back(property);
        group.edges.insert(group.edges.end(), edges.begin(), edges.end());
    }

    for (auto& [target_id, group] : groups) {
        // A purge from one property must not clear pairs another property keeps
        std::set<std::string> linked;
        for (const auto& e : group.edges) {
            if (!e.is_purge()) linked.insert(utils::normalize_id(e.record_id));
        }
        std::erase_if(group.edges, [&](const RelationEdge& e) {
            return e.is_purge() && linked.contains(utils::normalize_id(e.record_id));
        });

        std::string label;
        for (const auto& p : group.properties) {
            if (!label.empty()) label += ", ";
            label += p;
        }

        try {
            report.properties.push_back(
                sync_.stage(label, report.schema, report.table, target_id, group.edges));
        } catch (const Error& e) {
            utils::log::error(std::format("Relation {} of page {} failed: {}",
                label, row.id, e.what()));
            PropertySyncResult failed;
            failed.property = label;
            failed.status = PropertyStatus::FAILED;
            failed.error = e.what();
            failed.error_kind = e.kind();
            report.properties.push_back(std::move(failed));
        }
    }
}

} // namespace relsync
