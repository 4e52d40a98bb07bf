#pragma once

#include "db/idb_connection.hpp"

#include <string>

namespace relsync {

/**
 * Transaction RAII guard.
 * Issues BEGIN on construction and rolls back if not explicitly committed.
 */
class TransactionGuard {
public:
    // Throws the classified error if BEGIN fails
    explicit TransactionGuard(IDbConnection& conn);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    void commit();
    void rollback();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    IDbConnection& conn_;
    bool active_ = false;
};

/**
 * Savepoint RAII guard for work inside a transaction someone else owns.
 * Issues SAVEPOINT on construction; unless released, the destructor rolls
 * back to the savepoint so the enclosing transaction stays usable.
 */
class SavepointGuard {
public:
    // Throws the classified error if SAVEPOINT fails
    SavepointGuard(IDbConnection& conn, std::string name);
    ~SavepointGuard();

    SavepointGuard(const SavepointGuard&) = delete;
    SavepointGuard& operator=(const SavepointGuard&) = delete;

    // Keep the work; it commits or rolls back with the enclosing transaction
    void release();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    IDbConnection& conn_;
    std::string name_;
    bool active_ = false;
};

} // namespace relsync
