#include "db/transaction_guard.hpp"
#include "db/db_error.hpp"
#include "core/utils.hpp"

#include <format>

namespace relsync {

TransactionGuard::TransactionGuard(IDbConnection& conn)
    : conn_(conn) {
    check_result(conn_.execute("BEGIN"), "BEGIN");
    active_ = true;
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        rollback();
    }
}

void TransactionGuard::commit() {
    if (!active_) {
        return;
    }
    // A failed COMMIT ends the transaction server-side either way
    active_ = false;
    check_result(conn_.execute("COMMIT"), "COMMIT");
}

void TransactionGuard::rollback() {
    if (!active_) {
        return;
    }
    active_ = false;
    const auto result = conn_.execute("ROLLBACK");
    if (!result.success) {
        utils::log::warn(std::format("ROLLBACK failed: {}", result.error_message));
    }
}

SavepointGuard::SavepointGuard(IDbConnection& conn, std::string name)
    : conn_(conn), name_(std::move(name)) {
    check_result(conn_.execute(std::format("SAVEPOINT {}", name_)), "SAVEPOINT");
    active_ = true;
}

SavepointGuard::~SavepointGuard() {
    if (!active_) {
        return;
    }
    active_ = false;
    const auto undo = conn_.execute(std::format("ROLLBACK TO SAVEPOINT {}", name_));
    if (!undo.success) {
        utils::log::warn(std::format("ROLLBACK TO SAVEPOINT {} failed: {}", name_, undo.error_message));
        return;
    }
    const auto drop = conn_.execute(std::format("RELEASE SAVEPOINT {}", name_));
    if (!drop.success) {
        utils::log::warn(std::format("RELEASE SAVEPOINT {} failed: {}", name_, drop.error_message));
    }
}

void SavepointGuard::release() {
    if (!active_) {
        return;
    }
    active_ = false;
    check_result(conn_.execute(std::format("RELEASE SAVEPOINT {}", name_)), "RELEASE SAVEPOINT");
}

} // namespace relsync
