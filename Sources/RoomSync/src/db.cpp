#include "roomsync/db.hpp"
#include "roomsync/log.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>
#include <type_traits>

namespace roomsync {

namespace {

constexpr int busy_timeout_ms = 5000;
constexpr int max_begin_attempts = 12;

const char* sql_type(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
    }
    return "TEXT";
}

// Prepared statement, finalized on scope exit
class statement {
public:
    statement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string error = sqlite3_errmsg(db_);
            LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
            throw db_error("Failed to prepare statement: " + error);
        }
    }

    ~statement() { sqlite3_finalize(stmt_); }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    void bind(int index, const column_value_t& value) {
        int rc = std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt_, index, v);
            } else {
                return sqlite3_bind_text(stmt_, index, v.c_str(), -1, SQLITE_TRANSIENT);
            }
        }, value);
        if (rc != SQLITE_OK) {
            throw db_error("Failed to bind parameter " + std::to_string(index) + ": " + sqlite3_errmsg(db_));
        }
    }

    void bind_all(const std::vector<column_value_t>& params) {
        int index = 1;
        for (const auto& param : params) bind(index++, param);
    }

    /// true while rows are available, false when done.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "%s in %s", error.c_str(), sql_.c_str());
        throw db_error("Statement failed: " + error);
    }

    database::row_t row() const {
        database::row_t row;
        int count = sqlite3_column_count(stmt_);
        for (int i = 0; i < count; ++i) {
            row[sqlite3_column_name(stmt_, i)] = cell(i);
        }
        return row;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;

    column_value_t cell(int index) const {
        switch (sqlite3_column_type(stmt_, index)) {
            case SQLITE_INTEGER:
                return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt_, index);
            case SQLITE_TEXT:
            case SQLITE_BLOB: {
                auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
                return std::string(text ? text : "", static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
            }
            default:
                return nullptr;
        }
    }
};

} // namespace

database::database(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);

    // WAL lets the UI read while a sync batch is being written
    if (path != ":memory:") {
        execute("PRAGMA journal_mode = WAL");
    }
}

database::~database() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

void database::fail(const std::string& what, const std::string& sql) const {
    std::string error = sqlite3_errmsg(db_);
    LOG_ERROR("db", "%s: %s (SQL: %s)", what.c_str(), error.c_str(), sql.c_str());
    throw db_error(what + ": " + error);
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "%s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error);
        }
        return;
    }

    statement stmt(db_, sql);
    stmt.bind_all(params);
    while (stmt.step()) {}
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind_all(params);

    std::vector<row_t> rows;
    while (stmt.step()) {
        rows.push_back(stmt.row());
    }
    return rows;
}

void database::ensure_table(const table_schema& schema) {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << schema.name << " (";
    for (size_t i = 0; i < schema.columns.size(); ++i) {
        const auto& col = schema.columns[i];
        if (i > 0) sql << ", ";
        sql << col.name << " " << sql_type(col.type);
        if (col.is_primary_key) {
            sql << " PRIMARY KEY";
        } else if (!col.nullable) {
            sql << " NOT NULL";
        }
    }
    sql << ")";
    execute(sql.str());
}

void database::ensure_index(const std::string& table, const std::string& column) {
    execute("CREATE INDEX IF NOT EXISTS idx_" + table + "_" + column +
            " ON " + table + "(" + column + ")");
}

void database::upsert(const std::string& table, const std::string& key_column, const values_t& values) {
    std::ostringstream columns, placeholders, assignments;
    for (size_t i = 0; i < values.size(); ++i) {
        const auto& name = values[i].first;
        columns << (i ? ", " : "") << name;
        placeholders << (i ? ", " : "") << "?";
        if (name != key_column) {
            if (assignments.tellp() > 0) assignments << ", ";
            assignments << name << " = excluded." << name;
        }
    }

    std::ostringstream sql;
    sql << "INSERT INTO " << table << " (" << columns.str() << ") VALUES (" << placeholders.str() << ")"
        << " ON CONFLICT(" << key_column << ") ";
    if (assignments.tellp() > 0) {
        sql << "DO UPDATE SET " << assignments.str();
    } else {
        sql << "DO NOTHING";
    }

    statement stmt(db_, sql.str());
    int index = 1;
    for (const auto& [_, value] : values) stmt.bind(index++, value);
    stmt.step();
}

int database::update(const std::string& table,
                     const std::string& key_column,
                     const column_value_t& key,
                     const values_t& values) {
    if (values.empty()) return 0;

    std::ostringstream sql;
    sql << "UPDATE " << table << " SET ";
    for (size_t i = 0; i < values.size(); ++i) {
        sql << (i ? ", " : "") << values[i].first << " = ?";
    }
    sql << " WHERE " << key_column << " = ?";

    statement stmt(db_, sql.str());
    int index = 1;
    for (const auto& [_, value] : values) stmt.bind(index++, value);
    stmt.bind(index, key);
    stmt.step();
    return sqlite3_changes(db_);
}

void database::begin_transaction() {
    // busy_timeout covers ordinary contention; SQLite still returns BUSY at
    // once when waiting could deadlock, so back off and retry.
    auto delay = std::chrono::milliseconds(1);
    for (int attempt = 1;; ++attempt) {
        int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
        if (rc == SQLITE_OK) return;
        if ((rc != SQLITE_BUSY && rc != SQLITE_LOCKED) || attempt >= max_begin_attempts) {
            fail("Failed to begin transaction", "BEGIN IMMEDIATE");
        }
        LOG_DEBUG("db", "Write lock busy, retrying in %lld ms", static_cast<long long>(delay.count()));
        std::this_thread::sleep_for(delay);
        delay = std::min(delay * 2, std::chrono::milliseconds(500));
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (completed_ || !db_.is_in_transaction()) return;
    try {
        db_.rollback();
    } catch (const db_error& e) {
        LOG_WARN("db", "Rollback in transaction guard failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace roomsync
