#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/connection_manager.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "source/file_page_source.hpp"
#include "store/pg_record_store.hpp"
#include "sync/record_ingestor.hpp"
#include "sync/table_name_map.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>

using namespace relsync;

namespace {

void print_usage(const char* argv0) {
    std::cerr << std::format("Usage: {} <config.toml> <page.json> <schema> <table>\n", argv0);
}

nlohmann::json read_payload(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw SourceError(std::format("Cannot open {}", path));
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw SourceError(std::format("Invalid JSON in {}: {}", path, e.what()));
    }
}

void log_report(const IngestReport& report) {
    for (const auto& p : report.properties) {
        const std::string line = std::format(
            "  {} [{}] {}: purged={} deleted={} untouched={} queued={}{}",
            p.property, property_status_to_string(p.status), p.join_table,
            p.purged, p.deleted, p.untouched, p.queued,
            p.error.empty() ? "" : " error=" + p.error);
        if (p.status == PropertyStatus::FAILED) {
            utils::log::error(line);
        } else {
            utils::log::info(line);
        }
    }
    for (const auto& f : report.flushes) {
        if (!f.healed.empty()) {
            utils::log::info(std::format("  {}: healed {} missing referent(s)",
                f.join_table, f.healed.size()));
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc != 5) {
        print_usage(argv[0]);
        return 2;
    }

    const std::string config_file = argv[1];
    const std::string page_file = argv[2];
    const std::string schema = argv[3];
    const std::string table = argv[4];

    try {
        utils::log::info(std::format("Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(std::format("Config error: {}", config_result.error_message));
            return 1;
        }
        const auto& cfg = config_result.config;

        if (auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        const auto payload = read_payload(page_file);

        ConnectionManager manager(cfg.database, cfg.pool,
                                  std::make_shared<PgConnectionFactory>());
        PgRecordStore store(manager);
        FilePageSource source(cfg.source.snapshot_dir);
        TableNameMap names(store, source, cfg.sync);
        RecordIngestor ingestor(store, source, names, cfg.sync);

        const auto report = ingestor.ingest(unwrap_page_payload(payload), schema, table);
        log_report(report);

        if (auto stats = manager.pool_stats()) {
            utils::log::debug(std::format("Pool: {} acquires, {} failed, {} recycled",
                stats->acquires, stats->failed_acquires, stats->expired_replaced));
        }
        manager.shutdown();

        if (report.failed_properties() > 0) {
            utils::log::warn(std::format("Page {}: {} relation(s) failed",
                report.page_id, report.failed_properties()));
            return 3;
        }
        utils::log::info(std::format("Page {} synchronized", report.page_id));

    } catch (const Error& e) {
        utils::log::error(std::format("Fatal ({}): {}", error_kind_to_string(e.kind()), e.what()));
        return 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
