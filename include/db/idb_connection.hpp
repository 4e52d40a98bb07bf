#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relsync {

/**
 * @brief Outcome of one statement, copied out of the driver's result
 *
 * On failure sqlstate and error_detail carry the server's SQLSTATE and
 * DETAIL line; db_error.hpp turns them into typed errors.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sqlstate;
    std::string error_detail;

    bool has_rows = false;                // SELECT / RETURNING
    std::vector<std::string> column_names;
    std::vector<std::vector<SqlParam>> rows;

    uint64_t affected_rows = 0;           // rows returned, or rows touched by DML

    // Rows keyed by column name
    [[nodiscard]] std::vector<Record> records() const {
        std::vector<Record> out;
        out.reserve(rows.size());
        for (const auto& row : rows) {
            Record rec;
            for (size_t i = 0; i < column_names.size() && i < row.size(); ++i) {
                rec.emplace(column_names[i], row[i]);
            }
            out.push_back(std::move(rec));
        }
        return out;
    }
};

/**
 * @brief One database session
 *
 * Not thread-safe: a session serves one unit of work at a time. Statement
 * failures are returned in the DbResultSet, never thrown.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    // Unparameterized text: DDL, BEGIN/COMMIT/ROLLBACK
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    // $1..$n placeholders bound as text; nullopt binds NULL
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql,
                                              const std::vector<SqlParam>& params) = 0;

    // Runs probe_sql; false if the session cannot answer it
    [[nodiscard]] virtual bool is_healthy(const std::string& probe_sql) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    // An explicit transaction is open (possibly failed) on this session
    [[nodiscard]] virtual bool in_transaction() const = 0;

    // Idempotent
    virtual void close() = 0;
};

/**
 * @brief Opens sessions from a libpq keyword/value connection string
 *
 * Returns nullptr when the server cannot be reached; callers decide
 * whether that is a ConnectionError or a pool miss.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(const std::string& conninfo) = 0;
};

} // namespace relsync
