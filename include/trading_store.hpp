#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"

struct sqlite3;
struct sqlite3_stmt;

class SqliteStatement;

/**
 * @class SqliteConnection
 * @brief One connection to the trading store, opened read-write (never created).
 *
 * Connections are scoped to a single message and never shared between threads.
 * @throws PersistenceError when the database cannot be opened.
 */
class SqliteConnection {
public:
    explicit SqliteConnection(const StoreConfig& config);
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    void execute(const char* sql);
    SqliteStatement prepare(const char* sql);

    sqlite3* handle() { return db_; }
    // Rows touched by the most recent INSERT, UPDATE or DELETE.
    int changes() const;
    std::string last_error() const;

private:
    sqlite3* db_ = nullptr;
};

class SqliteStatement {
public:
    SqliteStatement(SqliteConnection& connection, const char* sql);
    ~SqliteStatement();

    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&&) = delete;
    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    // Parameters are 1-based, as in SQLite.
    void bind(int index, int64_t value);
    void bind(int index, std::string_view value);
    void bind_optional(int index, const std::optional<std::string>& value);
    void bind_null(int index);

    // Returns true while a row is available.
    bool step();
    void reset();

    int64_t column_int64(int index);

private:
    void check(int rc, const char* what);

    SqliteConnection* connection_;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @class SqliteTransaction
 * @brief Scope guard: BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit() was called.
 */
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteConnection& connection);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteConnection& connection_;
    bool active_ = false;
};

/**
 * @brief Startup check that the store is reachable and has the Item, StationItem and System tables.
 * @throws StartupError otherwise.
 */
void verify_trading_store(const StoreConfig& config);
