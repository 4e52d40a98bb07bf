#pragma once

#include "db/pooled_connection.hpp"
#include <chrono>
#include <cstddef>
#include <memory>

namespace relsync {

// Point-in-time counters; open/idle/in_use are gauges, the rest cumulative
struct PoolStats {
    size_t open = 0;
    size_t idle = 0;
    size_t in_use = 0;
    size_t acquires = 0;
    size_t releases = 0;
    size_t failed_acquires = 0;     // timeouts and factory failures
    size_t expired_replaced = 0;    // past max_lifetime
    size_t unhealthy_replaced = 0;  // failed the idle probe
};

/**
 * @brief Bounded set of reusable sessions
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    // nullptr if no session frees up within timeout or none can be opened
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual PoolStats stats() const = 0;

    // Close idle sessions; every later acquire fails
    virtual void drain() = 0;
};

} // namespace relsync
