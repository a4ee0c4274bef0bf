// Copyright 2026 Kai Wang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bulkload/config.hpp"
#include "bulkload/database.hpp"
#include <sqlite3.h>
#include <asio/awaitable.hpp>
#include <memory>
#include <string>

namespace bulkload {

struct SqliteConfig {
    std::string path;
    PragmaConfig pragmas;
    int busy_timeout_ms = 5000;
};

// Shared connection state so statements that outlive SqliteDatabase can
// detect the close. Statements check `valid` before touching db.
struct SqliteConnectionState {
    sqlite3* db = nullptr;
    bool valid = false;
    bool operation_in_flight = false;  // Detects overlapping operations
};

class SqliteStatement : public IStatement {
public:
    SqliteStatement(std::shared_ptr<SqliteConnectionState> state, sqlite3_stmt* stmt);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    asio::awaitable<ExecResult> run(std::span<const Value> params) override;
    asio::awaitable<std::unique_ptr<IRow>> get(std::span<const Value> params) override;
    asio::awaitable<void> finalize() override;

private:
    void check_valid() const;

    std::shared_ptr<SqliteConnectionState> state_;
    sqlite3_stmt* stmt_;
};

class SqliteDatabase : public IDatabase {
public:
    explicit SqliteDatabase(const SqliteConfig& config);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    // Open the file (creating it if needed), set the busy timeout and apply
    // the configured pragmas. Throws std::runtime_error on failure.
    asio::awaitable<void> connect();

    asio::awaitable<QueryResult> query(std::string_view sql,
                                       std::span<const Value> params = {}) override;
    asio::awaitable<void> execute(std::string_view sql) override;
    asio::awaitable<std::unique_ptr<IStatement>> prepare(std::string_view sql) override;

    bool is_connected() const override;
    void close() override;

private:
    asio::awaitable<void> apply_pragmas();
    void check_no_operation_in_flight() const;

    SqliteConfig config_;
    std::shared_ptr<SqliteConnectionState> state_;
};

// Construct and connect. ConnectionError is left to the caller to classify.
asio::awaitable<std::unique_ptr<IDatabase>> open_sqlite(SqliteConfig config);

}  // namespace bulkload
