#include "db/connection_manager.hpp"
#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"

#include <format>

namespace relsync {

namespace {

std::string quote_value(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

void append_kv(std::string& out, const char* key, const std::string& value) {
    if (value.empty()) return;
    if (!out.empty()) out += ' ';
    out += key;
    out += '=';
    out += quote_value(value);
}

} // anonymous namespace

std::string build_connection_string(const DatabaseConfig& config) {
    std::string conninfo;
    append_kv(conninfo, "host", config.host);
    append_kv(conninfo, "port", std::to_string(config.port));
    append_kv(conninfo, "dbname", config.dbname);
    append_kv(conninfo, "user", config.user);
    append_kv(conninfo, "password", config.password);
    append_kv(conninfo, "sslmode", config.sslmode);
    if (config.connect_timeout_s > 0) {
        append_kv(conninfo, "connect_timeout", std::to_string(config.connect_timeout_s));
    }
    if (config.statement_timeout.count() > 0) {
        append_kv(conninfo, "options",
                  std::format("-c statement_timeout={}", config.statement_timeout.count()));
    }
    return conninfo;
}

ConnectionManager::ConnectionManager(const DatabaseConfig& db_config,
                                     const PoolSettings& pool_settings,
                                     std::shared_ptr<IConnectionFactory> factory)
    : connection_string_(build_connection_string(db_config)),
      target_(std::format("{}:{}/{}", db_config.host, db_config.port, db_config.dbname)),
      acquire_timeout_(pool_settings.acquire_timeout),
      factory_(std::move(factory)) {

    if (pool_settings.enabled) {
        pool_ = std::make_unique<GenericConnectionPool>(target_, connection_string_, pool_settings, factory_);
    }
}

ConnectionManager::~ConnectionManager() = default;

std::optional<PoolStats> ConnectionManager::pool_stats() const {
    if (!pool_) return std::nullopt;
    return pool_->stats();
}

void ConnectionManager::shutdown() {
    if (pool_) {
        pool_->drain();
    }
}

std::unique_ptr<IDbConnection> ConnectionManager::open_adhoc() {
    auto conn = factory_->create(connection_string_);
    if (!conn) {
        throw ConnectionError(std::format("Failed to connect to {}", target_));
    }
    utils::log::debug(std::format("Opened connection to {}", target_));
    return conn;
}

std::unique_ptr<PooledConnection> ConnectionManager::acquire_pooled() {
    auto pooled = pool_->acquire(acquire_timeout_);
    if (!pooled || !pooled->is_valid()) {
        throw ConnectionError(std::format(
            "No connection available for {} within {}ms", target_, acquire_timeout_.count()));
    }
    return pooled;
}

} // namespace relsync
