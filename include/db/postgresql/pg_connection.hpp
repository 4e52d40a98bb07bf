#pragma once

#include "db/idb_connection.hpp"
#include <libpq-fe.h>
#include <string>

namespace relsync {

/**
 * @brief libpq session
 *
 * Parameters go through PQexecParams in text format. A failed statement
 * reports the server's SQLSTATE and DETAIL; a statement lost to a broken
 * transport reports SQLSTATE 08006.
 */
class PgConnection : public IDbConnection {
public:
    // Takes ownership of conn
    explicit PgConnection(PGconn* conn);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute(const std::string& sql, const std::vector<SqlParam>& params) override;
    bool is_healthy(const std::string& probe_sql) override;
    bool is_connected() const override;
    bool in_transaction() const override;
    void close() override;

private:
    // Consumes res
    DbResultSet collect(PGresult* res) const;

    PGconn* conn_;
};

// PQconnectdb; logs and returns nullptr when the server refuses
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& conninfo) override;
};

} // namespace relsync
