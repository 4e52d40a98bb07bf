#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace relsync {

/**
 * @brief libpq keyword/value connection string for a DatabaseConfig
 *
 * Values are single-quoted with ' and \ escaped. A non-zero statement
 * timeout is applied through the `options` keyword so every session,
 * pooled or ad-hoc, starts with it.
 */
[[nodiscard]] std::string build_connection_string(const DatabaseConfig& config);

/**
 * @brief Scoped acquisition of database connections
 *
 * with_connection() runs a unit of work against a connection and
 * guarantees the connection is released on every exit path. With pooling
 * enabled the connection comes from a GenericConnectionPool; otherwise an
 * ad-hoc connection is opened and closed per call.
 *
 * Thread-safe: the only shared state is the internally locked pool.
 */
class ConnectionManager {
public:
    ConnectionManager(const DatabaseConfig& db_config,
                      const PoolSettings& pool_settings,
                      std::shared_ptr<IConnectionFactory> factory);

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Run work(IDbConnection&) against a live connection
     *
     * A connected explicit_handle is reused and left open; the caller keeps
     * ownership. A null or closed handle falls back to a managed connection.
     *
     * @throws ConnectionError if no connection can be obtained
     */
    template<typename Work>
    std::invoke_result_t<Work&, IDbConnection&> with_connection(
        Work&& work, IDbConnection* explicit_handle = nullptr) {

        if (explicit_handle && explicit_handle->is_connected()) {
            return std::invoke(work, *explicit_handle);
        }

        if (pool_) {
            auto pooled = acquire_pooled();
            try {
                return std::invoke(work, pooled->session());
            } catch (const ConnectionError&) {
                // Lost transport: never hand this session out again
                pooled->discard();
                throw;
            }
        }

        auto conn = open_adhoc();
        CloseOnExit closer{*conn};
        return std::invoke(work, *conn);
    }

    [[nodiscard]] bool pooled() const { return pool_ != nullptr; }

    [[nodiscard]] std::optional<PoolStats> pool_stats() const;

    /**
     * @brief Close idle pooled connections; further acquisitions fail
     */
    void shutdown();

private:
    struct CloseOnExit {
        IDbConnection& conn;
        ~CloseOnExit() { conn.close(); }
    };

    [[nodiscard]] std::unique_ptr<IDbConnection> open_adhoc();
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire_pooled();

    std::string connection_string_;
    std::string target_;  // host:port/dbname, for messages
    std::chrono::milliseconds acquire_timeout_;
    std::shared_ptr<IConnectionFactory> factory_;
    std::unique_ptr<IConnectionPool> pool_;
};

} // namespace relsync
