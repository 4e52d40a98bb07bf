#pragma once

#include "db/connection_manager.hpp"
#include "store/irecord_store.hpp"

#include <string>
#include <vector>

namespace relsync {

/**
 * @brief IRecordStore over PostgreSQL through a ConnectionManager
 *
 * With a bound connection every call reuses it (caller keeps ownership);
 * otherwise each call acquires and releases its own connection. Writes on a
 * session with an open transaction run under a savepoint and are committed
 * by whoever owns that transaction; otherwise each write commits itself.
 */
class PgRecordStore : public IRecordStore {
public:
    explicit PgRecordStore(ConnectionManager& manager, IDbConnection* bound = nullptr);

    std::vector<Record> select(const std::string& schema,
                               const std::string& table,
                               const std::vector<FilterGroup>& groups,
                               const SelectOptions& options) override;

    std::vector<Record> get_records(const std::string& schema,
                                    const std::string& table,
                                    const std::string& column,
                                    const std::vector<std::string>& values) override;

    uint64_t delete_where(const std::string& schema,
                          const std::string& table,
                          const std::vector<std::string>& columns,
                          const std::vector<SqlValue>& values) override;

    uint64_t update_where(const std::string& schema,
                          const std::string& table,
                          const std::vector<std::string>& set_columns,
                          const std::vector<SqlValue>& set_values,
                          const std::string& where_column,
                          const SqlValue& where_value) override;

    uint64_t upsert(const UpsertRequest& request) override;

    uint64_t insert_ignore(const std::string& schema,
                           const std::string& table,
                           const std::vector<std::string>& columns,
                           const std::vector<std::vector<SqlValue>>& rows) override;

    void ensure_table(const TableSpec& spec) override;

    void ensure_join_table(const JoinTableSpec& spec, const std::string& pk_column) override;

    std::vector<std::string> list_tables(const std::string& schema) override;

    std::vector<ColumnInfo> table_columns(const std::string& schema,
                                          const std::string& table) override;

private:
    // Single statement outside an explicit transaction
    DbResultSet query(const Statement& stmt, const std::string& context);

    // Single statement, atomic on its own
    DbResultSet write(const Statement& stmt, const std::string& context);

    // Statement list, atomic as a whole
    void write_all(const std::vector<std::string>& statements, const std::string& context);

    ConnectionManager& manager_;
    IDbConnection* bound_;
};

} // namespace relsync
