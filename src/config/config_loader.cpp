#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string_view>
#include <utility>

using namespace std::string_literals;

namespace relsync {

// ============================================================================
// ${VAR} substitution
// ============================================================================

namespace {

// Unset variables expand to the empty string
std::string substitute_env(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t open = text.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));
        const size_t close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        const std::string name(text.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
    return out;
}

void substitute_env_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = substitute_env(str->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) {
            substitute_env_in(child);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) {
            substitute_env_in(child);
        }
    }
}

// Negative counts read as 0; negative_counts() reports them
size_t count_or(toml::node_view<const toml::node> node, int64_t fallback) {
    const int64_t value = node.value_or(fallback);
    return value < 0 ? 0 : static_cast<size_t>(value);
}

std::vector<std::string> negative_counts(const toml::table& root) {
    static constexpr std::pair<std::string_view, std::string_view> kCounts[] = {
        {"pool", "min_connections"},
        {"pool", "max_connections"},
        {"pool", "acquire_timeout_ms"},
        {"pool", "idle_timeout_ms"},
        {"pool", "max_lifetime_s"},
        {"sync", "insert_batch_size"},
        {"sync", "max_text_length"},
    };
    std::vector<std::string> errors;
    for (const auto& [section, key] : kCounts) {
        const auto value = root[section][key].value<int64_t>();
        if (value && *value < 0) {
            errors.push_back(std::format("{}.{} must not be negative (got {})", section, key, *value));
        }
    }
    return errors;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.host = d["host"].value_or("localhost"s);
    // Out-of-range ports become 0 so validation reports them
    const auto port = d["port"].value_or(int64_t{5432});
    cfg.port = (port > 0 && port <= 65535) ? static_cast<uint16_t>(port) : 0;
    cfg.dbname = d["dbname"].value_or("db"s);
    cfg.user = d["user"].value_or(""s);
    cfg.password = d["password"].value_or(""s);
    cfg.sslmode = d["sslmode"].value_or("prefer"s);
    cfg.connect_timeout_s = d["connect_timeout_s"].value_or(10);
    cfg.statement_timeout = std::chrono::milliseconds(d["statement_timeout_ms"].value_or(30000));
    return cfg;
}

PoolSettings ConfigLoader::extract_pool(const toml::table& root) {
    PoolSettings cfg;
    const auto* pool = root["pool"].as_table();
    if (!pool) return cfg;
    const auto& p = *pool;

    cfg.enabled = p["enabled"].value_or(false);
    cfg.min_connections = count_or(p["min_connections"], 1);
    cfg.max_connections = count_or(p["max_connections"], 5);
    cfg.acquire_timeout = std::chrono::milliseconds(count_or(p["acquire_timeout_ms"], 5000));
    cfg.idle_timeout = std::chrono::milliseconds(count_or(p["idle_timeout_ms"], 300000));
    cfg.max_lifetime = std::chrono::seconds(count_or(p["max_lifetime_s"], 3600));
    cfg.health_check_query = p["health_check_query"].value_or("SELECT 1"s);
    return cfg;
}

SyncConfig ConfigLoader::extract_sync(const toml::table& root) {
    SyncConfig cfg;
    const auto* sync = root["sync"].as_table();
    if (!sync) return cfg;
    const auto& s = *sync;

    cfg.join_schema = s["join_schema"].value_or(cfg.join_schema);
    cfg.primary_key_column = s["primary_key_column"].value_or(cfg.primary_key_column);
    cfg.name_map_schema = s["name_map_schema"].value_or(cfg.name_map_schema);
    cfg.name_map_table = s["name_map_table"].value_or(cfg.name_map_table);
    cfg.insert_batch_size = count_or(s["insert_batch_size"], 100);
    cfg.max_text_length = count_or(s["max_text_length"], 255);
    return cfg;
}

SourceConfig ConfigLoader::extract_source(const toml::table& root) {
    SourceConfig cfg;
    const auto* source = root["source"].as_table();
    if (!source) return cfg;

    cfg.snapshot_dir = (*source)["snapshot_dir"].value_or(cfg.snapshot_dir);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

RelsyncConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    RelsyncConfig config;
    config.database = extract_database(tbl);
    config.pool = extract_pool(tbl);
    config.sync = extract_sync(tbl);
    config.source = extract_source(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::finish(toml::table tbl) {
    substitute_env_in(tbl);
    auto config = extract_all_sections(tbl);

    auto errors = negative_counts(tbl);
    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (errors.empty()) {
        return LoadResult::ok(std::move(config));
    }
    std::string combined = "Config validation failed:";
    for (const auto& err : errors) {
        combined += std::format("\n  - {}", err);
    }
    return LoadResult::error(std::move(combined));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        return finish(toml::parse_file(config_path));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        return finish(toml::parse(toml_content));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RelsyncConfig& config) {
    std::vector<std::string> errors;

    if (config.database.port == 0) {
        errors.push_back("database.port must be 1-65535");
    }

    if (config.database.dbname.empty()) {
        errors.push_back("database.dbname must not be empty");
    }

    if (config.pool.min_connections > config.pool.max_connections) {
        errors.push_back(std::format(
            "pool.min_connections ({}) > max_connections ({})",
            config.pool.min_connections, config.pool.max_connections));
    }

    if (config.pool.enabled && config.pool.max_connections == 0) {
        errors.push_back("pool.max_connections must be > 0 when the pool is enabled");
    }

    // Two bind parameters per row; PostgreSQL allows 65535 per statement
    if (config.sync.insert_batch_size == 0 || config.sync.insert_batch_size > kMaxInsertBatchSize) {
        errors.push_back(std::format("sync.insert_batch_size must be 1-{}", kMaxInsertBatchSize));
    }

    if (config.sync.join_schema.empty()) {
        errors.push_back("sync.join_schema must not be empty");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
                                     config.logging.level));
    }

    return errors;
}

} // namespace relsync
