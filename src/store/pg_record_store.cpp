#include "store/pg_record_store.hpp"
#include "db/db_error.hpp"
#include "db/transaction_guard.hpp"
#include "schema/schema_manager.hpp"
#include "core/utils.hpp"

#include <format>
#include <type_traits>

namespace relsync {

namespace {

constexpr const char* kWriteSavepoint = "relsync_write";

// Inside an open transaction the caller commits; a failed statement only
// unwinds to the savepoint. Otherwise the work gets its own transaction.
template<typename Work>
std::invoke_result_t<Work&> atomically(IDbConnection& conn, Work&& work) {
    if (conn.in_transaction()) {
        SavepointGuard savepoint(conn, kWriteSavepoint);
        auto result = work();
        savepoint.release();
        return result;
    }
    TransactionGuard tx(conn);
    auto result = work();
    tx.commit();
    return result;
}

} // anonymous namespace

PgRecordStore::PgRecordStore(ConnectionManager& manager, IDbConnection* bound)
    : manager_(manager), bound_(bound) {}

// ============================================================================
// Execution helpers
// ============================================================================

DbResultSet PgRecordStore::query(const Statement& stmt, const std::string& context) {
    return manager_.with_connection([&](IDbConnection& conn) {
        auto result = conn.execute(stmt.sql, stmt.wire_params());
        check_result(result, context);
        return result;
    }, bound_);
}

DbResultSet PgRecordStore::write(const Statement& stmt, const std::string& context) {
    return manager_.with_connection([&](IDbConnection& conn) {
        return atomically(conn, [&] {
            auto result = conn.execute(stmt.sql, stmt.wire_params());
            check_result(result, context);
            return result;
        });
    }, bound_);
}

void PgRecordStore::write_all(const std::vector<std::string>& statements, const std::string& context) {
    manager_.with_connection([&](IDbConnection& conn) {
        return atomically(conn, [&] {
            for (const auto& sql : statements) {
                utils::log::debug(sql);
                check_result(conn.execute(sql), context);
            }
            return statements.size();
        });
    }, bound_);
}

// ============================================================================
// Reads
// ============================================================================

std::vector<Record> PgRecordStore::select(const std::string& schema,
                                          const std::string& table,
                                          const std::vector<FilterGroup>& groups,
                                          const SelectOptions& options) {
    const auto stmt = build_select(schema, table, groups, options);
    return query(stmt, std::format("SELECT from {}.{}", schema, table)).records();
}

std::vector<Record> PgRecordStore::get_records(const std::string& schema,
                                               const std::string& table,
                                               const std::string& column,
                                               const std::vector<std::string>& values) {
    if (values.empty()) {
        return {};
    }
    const auto stmt = build_select_in(schema, table, column, values);
    return query(stmt, std::format("SELECT from {}.{}", schema, table)).records();
}

// ============================================================================
// Writes
// ============================================================================

uint64_t PgRecordStore::delete_where(const std::string& schema,
                                     const std::string& table,
                                     const std::vector<std::string>& columns,
                                     const std::vector<SqlValue>& values) {
    const auto stmt = build_delete_where(schema, table, columns, values);
    return write(stmt, std::format("DELETE from {}.{}", schema, table)).affected_rows;
}

uint64_t PgRecordStore::update_where(const std::string& schema,
                                     const std::string& table,
                                     const std::vector<std::string>& set_columns,
                                     const std::vector<SqlValue>& set_values,
                                     const std::string& where_column,
                                     const SqlValue& where_value) {
    const auto stmt = build_update_where(schema, table, set_columns, set_values,
                                         where_column, where_value);
    return write(stmt, std::format("UPDATE {}.{}", schema, table)).affected_rows;
}

uint64_t PgRecordStore::upsert(const UpsertRequest& request) {
    const auto stmt = build_upsert(request);
    return write(stmt, std::format("Upsert into {}.{} ({})",
                                   request.schema, request.table,
                                   conflict_strategy_to_string(request.strategy))).affected_rows;
}

uint64_t PgRecordStore::insert_ignore(const std::string& schema,
                                      const std::string& table,
                                      const std::vector<std::string>& columns,
                                      const std::vector<std::vector<SqlValue>>& rows) {
    if (rows.empty()) {
        return 0;
    }
    const auto stmt = build_insert_ignore(schema, table, columns, rows);
    return write(stmt, std::format("INSERT into {}.{}", schema, table)).affected_rows;
}

// ============================================================================
// Schema
// ============================================================================

void PgRecordStore::ensure_table(const TableSpec& spec) {
    write_all(SchemaManager::table_ddl(spec),
              std::format("Ensure table {}.{}", spec.schema, spec.table));
}

void PgRecordStore::ensure_join_table(const JoinTableSpec& spec, const std::string& pk_column) {
    write_all(SchemaManager::join_table_ddl(spec, pk_column),
              std::format("Ensure join table {}.{}", spec.join_schema, spec.table_name));
}

std::vector<std::string> PgRecordStore::list_tables(const std::string& schema) {
    const auto result = query(SchemaManager::list_tables_query(schema),
                              std::format("List tables in {}", schema));
    std::vector<std::string> tables;
    tables.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        if (!row.empty() && row[0]) {
            tables.push_back(*row[0]);
        }
    }
    return tables;
}

std::vector<ColumnInfo> PgRecordStore::table_columns(const std::string& schema,
                                                     const std::string& table) {
    const auto result = query(SchemaManager::table_columns_query(schema, table),
                              std::format("List columns of {}.{}", schema, table));
    std::vector<ColumnInfo> columns;
    columns.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        if (row.size() < 3 || !row[0]) continue;
        ColumnInfo info;
        info.name = *row[0];
        info.data_type = row[1].value_or("");
        info.nullable = row[2].value_or("YES") == "YES";
        columns.push_back(std::move(info));
    }
    return columns;
}

} // namespace relsync
