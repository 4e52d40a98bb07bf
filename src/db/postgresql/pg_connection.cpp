#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace relsync {

namespace {

constexpr const char* kConnectionFailure = "08006";

std::string diag(const PGresult* res, int field) {
    const char* value = PQresultErrorField(res, field);
    return value ? std::string(value) : std::string{};
}

DbResultSet from_tuples(const PGresult* res) {
    DbResultSet out;
    out.success = true;
    out.has_rows = true;

    const int ncols = PQnfields(res);
    for (int c = 0; c < ncols; ++c) {
        out.column_names.emplace_back(PQfname(res, c));
    }

    const int nrows = PQntuples(res);
    out.rows.resize(static_cast<size_t>(nrows));
    for (int r = 0; r < nrows; ++r) {
        auto& row = out.rows[static_cast<size_t>(r)];
        row.reserve(static_cast<size_t>(ncols));
        for (int c = 0; c < ncols; ++c) {
            if (PQgetisnull(res, r, c)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, r, c),
                                             static_cast<size_t>(PQgetlength(res, r, c))));
            }
        }
    }
    out.affected_rows = static_cast<uint64_t>(nrows);
    return out;
}

DbResultSet from_command(PGresult* res) {
    DbResultSet out;
    out.success = true;
    // Empty for DDL and transaction control
    const char* tuples = PQcmdTuples(res);
    if (tuples && std::strlen(tuples) > 0) {
        out.affected_rows = std::stoull(tuples);
    }
    return out;
}

} // anonymous namespace

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    return execute(sql, {});
}

DbResultSet PgConnection::execute(const std::string& sql, const std::vector<SqlParam>& params) {
    if (!conn_) {
        DbResultSet closed;
        closed.error_message = "Connection is closed";
        closed.sqlstate = kConnectionFailure;
        return closed;
    }

    if (params.empty()) {
        return collect(PQexec(conn_, sql.c_str()));
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }
    return collect(PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                nullptr, values.data(), nullptr, nullptr, 0));
}

bool PgConnection::is_healthy(const std::string& probe_sql) {
    if (!is_connected()) {
        return false;
    }
    return execute(probe_sql).success;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::in_transaction() const {
    if (!conn_) {
        return false;
    }
    const auto status = PQtransactionStatus(conn_);
    return status == PQTRANS_INTRANS || status == PQTRANS_INERROR;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::collect(PGresult* res) const {
    DbResultSet out;
    if (!res) {
        out.error_message = PQerrorMessage(conn_);
        if (PQstatus(conn_) != CONNECTION_OK) {
            out.sqlstate = kConnectionFailure;
        }
        return out;
    }

    switch (PQresultStatus(res)) {
        case PGRES_TUPLES_OK:
            out = from_tuples(res);
            break;
        case PGRES_COMMAND_OK:
        case PGRES_EMPTY_QUERY:
            out = from_command(res);
            break;
        default:
            out.error_message = diag(res, PG_DIAG_MESSAGE_PRIMARY);
            if (out.error_message.empty()) {
                out.error_message = PQerrorMessage(conn_);
            }
            out.sqlstate = diag(res, PG_DIAG_SQLSTATE);
            out.error_detail = diag(res, PG_DIAG_MESSAGE_DETAIL);
            if (out.sqlstate.empty() && PQstatus(conn_) != CONNECTION_OK) {
                out.sqlstate = kConnectionFailure;
            }
            break;
    }
    PQclear(res);
    return out;
}

std::unique_ptr<IDbConnection> PgConnectionFactory::create(const std::string& conninfo) {
    PGconn* conn = PQconnectdb(conninfo.c_str());
    if (!conn) {
        utils::log::error("libpq could not allocate a connection");
        return nullptr;
    }
    if (PQstatus(conn) != CONNECTION_OK) {
        // PQerrorMessage ends with a newline
        std::string reason = PQerrorMessage(conn);
        while (!reason.empty() && (reason.back() == '\n' || reason.back() == ' ')) {
            reason.pop_back();
        }
        utils::log::error(std::format("Connection refused: {}", reason));
        PQfinish(conn);
        return nullptr;
    }
    return std::make_unique<PgConnection>(conn);
}

} // namespace relsync
