#pragma once

#include "core/types.hpp"
#include "query/filter.hpp"
#include "query/sql_builder.hpp"
#include "schema/schema_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace relsync {

/**
 * @brief Abstract relational store used by the synchronizer
 *
 * Every operation is its own unit of work: writes run in a transaction that
 * is rolled back before any error propagates. Failures are reported as the
 * typed errors in core/error.hpp (UndefinedTableError for schema drift,
 * ForeignKeyViolationError for missing referents, ...).
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    // ---- Reads -------------------------------------------------------------

    [[nodiscard]] virtual std::vector<Record> select(
        const std::string& schema,
        const std::string& table,
        const std::vector<FilterGroup>& groups,
        const SelectOptions& options) = 0;

    // Rows whose column matches any of values
    [[nodiscard]] virtual std::vector<Record> get_records(
        const std::string& schema,
        const std::string& table,
        const std::string& column,
        const std::vector<std::string>& values) = 0;

    // ---- Writes (return affected row counts) -------------------------------

    virtual uint64_t delete_where(
        const std::string& schema,
        const std::string& table,
        const std::vector<std::string>& columns,
        const std::vector<SqlValue>& values) = 0;

    virtual uint64_t update_where(
        const std::string& schema,
        const std::string& table,
        const std::vector<std::string>& set_columns,
        const std::vector<SqlValue>& set_values,
        const std::string& where_column,
        const SqlValue& where_value) = 0;

    virtual uint64_t upsert(const UpsertRequest& request) = 0;

    // Multi-row insert; rows that conflict are skipped
    virtual uint64_t insert_ignore(
        const std::string& schema,
        const std::string& table,
        const std::vector<std::string>& columns,
        const std::vector<std::vector<SqlValue>>& rows) = 0;

    // ---- Schema ------------------------------------------------------------

    virtual void ensure_table(const TableSpec& spec) = 0;

    virtual void ensure_join_table(const JoinTableSpec& spec, const std::string& pk_column) = 0;

    [[nodiscard]] virtual std::vector<std::string> list_tables(const std::string& schema) = 0;

    [[nodiscard]] virtual std::vector<ColumnInfo> table_columns(const std::string& schema,
                                                                const std::string& table) = 0;
};

} // namespace relsync
