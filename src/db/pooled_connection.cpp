#include "db/pooled_connection.hpp"

namespace relsync {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, Release release)
    : conn_(std::move(conn)), release_(std::move(release)) {}

PooledConnection::~PooledConnection() {
    give_back();
}

void PooledConnection::discard() {
    if (conn_) {
        conn_->close();
    }
    give_back();
}

void PooledConnection::give_back() {
    if (!conn_) {
        return;
    }
    if (release_) {
        release_(std::move(conn_));
    }
    conn_.reset();
}

} // namespace relsync
