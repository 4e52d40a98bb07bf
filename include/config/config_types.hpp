#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace relsync {

// ============================================================================
// Configuration Types
// ============================================================================

struct DatabaseConfig {
    std::string host;
    uint16_t port;
    std::string dbname;
    std::string user;
    std::string password;
    std::string sslmode;
    int connect_timeout_s;
    std::chrono::milliseconds statement_timeout;  // 0 = server default

    DatabaseConfig()
        : host("localhost"),
          port(5432),
          dbname("db"),
          sslmode("prefer"),
          connect_timeout_s(10),
          statement_timeout(30000) {}
};

struct PoolSettings {
    bool enabled = false;
    size_t min_connections = 1;
    size_t max_connections = 5;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};
    std::chrono::seconds max_lifetime{3600};
    std::string health_check_query{"SELECT 1"};
};

struct SyncConfig {
    std::string join_schema = "Join";
    std::string primary_key_column = "primary_key_id";
    std::string name_map_schema = "meta";
    std::string name_map_table = "notion_table_namemap";
    size_t insert_batch_size = 100;
    size_t max_text_length = 255;
};

struct SourceConfig {
    std::string snapshot_dir = "snapshot";
};

struct LoggingConfig {
    std::string level = "info";
};

struct RelsyncConfig {
    DatabaseConfig database;
    PoolSettings pool;
    SyncConfig sync;
    SourceConfig source;
    LoggingConfig logging;
};

} // namespace relsync
