#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace roomsync {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// database - one SQLite connection
// ============================================================================
//
// Opened in serialized threading mode; every failing call throws db_error.

class database {
public:
    using row_t = std::unordered_map<std::string, column_value_t>;
    using values_t = std::vector<std::pair<std::string, column_value_t>>;

    /// ":memory:" opens a private in-memory database.
    explicit database(const std::string& path);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    /// CREATE TABLE IF NOT EXISTS from the schema.
    void ensure_table(const table_schema& schema);
    void ensure_index(const std::string& table, const std::string& column);

    /// Insert, or update every non-key column when key_column already exists.
    void upsert(const std::string& table, const std::string& key_column, const values_t& values);

    /// Returns the number of rows changed.
    int update(const std::string& table,
               const std::string& key_column,
               const column_value_t& key,
               const values_t& values);

    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    // BEGIN IMMEDIATE takes the write lock up front
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    const std::string& path() const { return path_; }
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    [[noreturn]] void fail(const std::string& what, const std::string& sql) const;
};

// RAII transaction guard, rolls back unless committed
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace roomsync

#endif // __cplusplus
