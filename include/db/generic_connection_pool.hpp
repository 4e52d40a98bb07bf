#pragma once

#include "config/config_types.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace relsync {

/**
 * @brief Connection pool over any IConnectionFactory
 *
 * - At most max_connections sessions are checked out (counting_semaphore)
 * - min_connections are opened up front, the rest on demand
 * - A session older than max_lifetime is replaced on checkout
 * - A session idle longer than idle_timeout is probed with
 *   health_check_query on checkout and replaced if the probe fails
 * - Closed sessions coming back (PooledConnection::discard) are dropped
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param target host:port/dbname, for log lines
     * @param conninfo Connection string handed to the factory
     */
    GenericConnectionPool(std::string target,
                          std::string conninfo,
                          const PoolSettings& settings,
                          std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    // Waits up to the configured acquire_timeout
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire() { return acquire(settings_.acquire_timeout); }

    std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout) override;

    PoolStats stats() const override;

    void drain() override;

private:
    struct Session {
        std::chrono::steady_clock::time_point opened;
        std::chrono::steady_clock::time_point last_used;
    };

    std::unique_ptr<IDbConnection> open_session();

    // Close conn and open a fresh session in its place (nullptr on failure)
    std::unique_ptr<IDbConnection> replace(std::unique_ptr<IDbConnection> conn);

    void close_session(std::unique_ptr<IDbConnection> conn);

    void release(std::unique_ptr<IDbConnection> conn);

    std::string target_;
    std::string conninfo_;
    PoolSettings settings_;
    std::shared_ptr<IConnectionFactory> factory_;

    mutable std::mutex mutex_;
    std::deque<std::unique_ptr<IDbConnection>> idle_;
    std::unordered_map<const IDbConnection*, Session> sessions_;  // guarded by mutex_

    std::counting_semaphore<> slots_;

    std::atomic<size_t> open_{0};
    std::atomic<size_t> acquires_{0};
    std::atomic<size_t> releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> expired_replaced_{0};
    std::atomic<size_t> unhealthy_replaced_{0};
    std::atomic<bool> draining_{false};
};

} // namespace relsync
