#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace relsync {

GenericConnectionPool::GenericConnectionPool(std::string target,
                                             std::string conninfo,
                                             const PoolSettings& settings,
                                             std::shared_ptr<IConnectionFactory> factory)
    : target_(std::move(target)),
      conninfo_(std::move(conninfo)),
      settings_(settings),
      factory_(std::move(factory)),
      slots_(static_cast<std::ptrdiff_t>(settings.max_connections)) {

    for (size_t i = 0; i < settings_.min_connections; ++i) {
        auto conn = open_session();
        if (!conn) {
            utils::log::warn(std::format("Pool for {}: could not open session {} of {}",
                target_, i + 1, settings_.min_connections));
            continue;
        }
        std::lock_guard lock(mutex_);
        idle_.push_back(std::move(conn));
    }

    utils::log::info(std::format("Pool for {} ready: {} open (min={}, max={})",
        target_, open_.load(), settings_.min_connections, settings_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(std::chrono::milliseconds timeout) {
    if (draining_.load(std::memory_order_acquire) || !slots_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    // drain() may have run while we waited for a slot
    if (draining_.load(std::memory_order_acquire)) {
        slots_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    std::unique_ptr<IDbConnection> conn;
    Session session{};
    {
        std::lock_guard lock(mutex_);
        if (!idle_.empty()) {
            conn = std::move(idle_.front());
            idle_.pop_front();
            session = sessions_.at(conn.get());
        }
    }

    if (conn) {
        const auto now = std::chrono::steady_clock::now();
        if (settings_.max_lifetime.count() > 0 && now - session.opened > settings_.max_lifetime) {
            expired_replaced_.fetch_add(1, std::memory_order_relaxed);
            conn = replace(std::move(conn));
        } else if (now - session.last_used > settings_.idle_timeout &&
                   !conn->is_healthy(settings_.health_check_query)) {
            unhealthy_replaced_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Pool for {}: idle session failed its probe", target_));
            conn = replace(std::move(conn));
        }
    } else {
        conn = open_session();
    }

    if (!conn) {
        slots_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    acquires_.fetch_add(1, std::memory_order_relaxed);
    return std::make_unique<PooledConnection>(std::move(conn),
        [this](std::unique_ptr<IDbConnection> c) { release(std::move(c)); });
}

PoolStats GenericConnectionPool::stats() const {
    PoolStats s;
    {
        std::lock_guard lock(mutex_);
        s.idle = idle_.size();
    }
    s.open = open_.load(std::memory_order_relaxed);
    s.in_use = s.open > s.idle ? s.open - s.idle : 0;
    s.acquires = acquires_.load(std::memory_order_relaxed);
    s.releases = releases_.load(std::memory_order_relaxed);
    s.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    s.expired_replaced = expired_replaced_.load(std::memory_order_relaxed);
    s.unhealthy_replaced = unhealthy_replaced_.load(std::memory_order_relaxed);
    return s;
}

void GenericConnectionPool::drain() {
    if (draining_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::deque<std::unique_ptr<IDbConnection>> idle;
    {
        std::lock_guard lock(mutex_);
        idle.swap(idle_);
    }
    for (auto& conn : idle) {
        close_session(std::move(conn));
    }

    utils::log::info(std::format("Pool for {} drained", target_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::open_session() {
    auto conn = factory_->create(conninfo_);
    if (!conn) {
        return nullptr;
    }
    open_.fetch_add(1, std::memory_order_relaxed);

    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(mutex_);
    sessions_[conn.get()] = Session{now, now};
    return conn;
}

std::unique_ptr<IDbConnection> GenericConnectionPool::replace(std::unique_ptr<IDbConnection> conn) {
    close_session(std::move(conn));
    return open_session();
}

void GenericConnectionPool::close_session(std::unique_ptr<IDbConnection> conn) {
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(conn.get());
    }
    conn->close();
    open_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::release(std::unique_ptr<IDbConnection> conn) {
    releases_.fetch_add(1, std::memory_order_relaxed);

    if (draining_.load(std::memory_order_acquire) || !conn->is_connected()) {
        close_session(std::move(conn));
    } else {
        std::lock_guard lock(mutex_);
        sessions_.at(conn.get()).last_used = std::chrono::steady_clock::now();
        idle_.push_back(std::move(conn));
    }
    slots_.release();
}

} // namespace relsync
