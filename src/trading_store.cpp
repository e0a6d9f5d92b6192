#include "trading_store.hpp"
#include "errors.hpp"

#include <sqlite3.h>

#include <iostream>
#include <utility>

//////////////////////////////////////////////////////////////////////////
// SqliteConnection
//////////////////////////////////////////////////////////////////////////

SqliteConnection::SqliteConnection(const StoreConfig& config) {
    int rc = sqlite3_open_v2(config.database_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw PersistenceError("cannot open '" + config.database_path + "': " + message);
    }
    sqlite3_busy_timeout(db_, static_cast<int>(config.busy_timeout.count()));
}

SqliteConnection::~SqliteConnection() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

void SqliteConnection::execute(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw PersistenceError(std::string(sql) + ": " + message);
    }
}

SqliteStatement SqliteConnection::prepare(const char* sql) {
    return SqliteStatement(*this, sql);
}

int SqliteConnection::changes() const {
    return sqlite3_changes(db_);
}

std::string SqliteConnection::last_error() const {
    return sqlite3_errmsg(db_);
}

//////////////////////////////////////////////////////////////////////////
// SqliteStatement
//////////////////////////////////////////////////////////////////////////

SqliteStatement::SqliteStatement(SqliteConnection& connection, const char* sql)
    : connection_(&connection) {
    int rc = sqlite3_prepare_v2(connection.handle(), sql, -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw PersistenceError("prepare failed: " + connection.last_error());
    }
}

SqliteStatement::~SqliteStatement() {
    sqlite3_finalize(stmt_);
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : connection_(other.connection_), stmt_(std::exchange(other.stmt_, nullptr)) {}

void SqliteStatement::bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value), "bind");
}

void SqliteStatement::bind(int index, std::string_view value) {
    check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT), "bind");
}

void SqliteStatement::bind_optional(int index, const std::optional<std::string>& value) {
    if (value) {
        bind(index, std::string_view(*value));
    } else {
        bind_null(index);
    }
}

void SqliteStatement::bind_null(int index) {
    check(sqlite3_bind_null(stmt_, index), "bind");
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw PersistenceError("step failed: " + connection_->last_error());
}

void SqliteStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t SqliteStatement::column_int64(int index) {
    return sqlite3_column_int64(stmt_, index);
}

void SqliteStatement::check(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        throw PersistenceError(std::string(what) + " failed: " + connection_->last_error());
    }
}

//////////////////////////////////////////////////////////////////////////
// SqliteTransaction
//////////////////////////////////////////////////////////////////////////

SqliteTransaction::SqliteTransaction(SqliteConnection& connection)
    : connection_(connection) {
    connection_.execute("BEGIN IMMEDIATE");
    active_ = true;
}

SqliteTransaction::~SqliteTransaction() {
    if (!active_) {
        return;
    }
    char* err = nullptr;
    if (sqlite3_exec(connection_.handle(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[SqliteTransaction] Rollback failed: " << (err ? err : "unknown error") << std::endl;
    }
    sqlite3_free(err);
}

void SqliteTransaction::commit() {
    connection_.execute("COMMIT");
    active_ = false;
}

//////////////////////////////////////////////////////////////////////////
// Startup probe
//////////////////////////////////////////////////////////////////////////

void verify_trading_store(const StoreConfig& config) {
    try {
        SqliteConnection connection(config);
        SqliteStatement stmt = connection.prepare(
            "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name IN ('Item', 'StationItem', 'System')");
        if (!stmt.step() || stmt.column_int64(0) != 3) {
            throw StartupError("'" + config.database_path + "' lacks the Item, StationItem or System table");
        }
    } catch (const PersistenceError& e) {
        throw StartupError(e.what());
    }
}
