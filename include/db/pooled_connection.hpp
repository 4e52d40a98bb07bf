#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace relsync {

/**
 * @brief Checked-out pool session; hands the session back when destroyed
 *
 * Neither copyable nor movable: the pool returns it as a unique_ptr and
 * the holder's scope is the checkout.
 */
class PooledConnection {
public:
    using Release = std::function<void(std::unique_ptr<IDbConnection>)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, Release release);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    [[nodiscard]] IDbConnection& session() const { return *conn_; }

    [[nodiscard]] bool is_valid() const { return conn_ && conn_->is_connected(); }

    /**
     * @brief Close the session and give up the checkout now
     *
     * For sessions left in an unknown state (lost transport, failed
     * rollback). The pool drops closed sessions instead of recycling them.
     */
    void discard();

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    Release release_;
};

} // namespace relsync
