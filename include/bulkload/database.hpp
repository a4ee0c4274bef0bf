// Copyright 2026 Kai Wang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bulkload/value.hpp"
#include <asio/awaitable.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bulkload {

// Query result row
class IRow {
public:
    virtual ~IRow() = default;

    virtual std::size_t size() const = 0;
    virtual std::string_view column_name(std::size_t col) const = 0;
    virtual Value get(std::size_t col) const = 0;
    virtual bool is_null(std::size_t col) const = 0;

    // Index of the first column named `name`, if any
    std::optional<std::size_t> find(std::string_view name) const {
        for (std::size_t i = 0; i < size(); ++i) {
            if (column_name(i) == name) return i;
        }
        return std::nullopt;
    }
};

// Query result set
class QueryResult {
public:
    QueryResult() = default;
    explicit QueryResult(std::vector<std::unique_ptr<IRow>> rows)
        : rows_(std::move(rows)) {}

    bool empty() const { return rows_.empty(); }
    std::size_t size() const { return rows_.size(); }

    const IRow& operator[](std::size_t i) const { return *rows_[i]; }

    auto begin() const { return rows_.begin(); }
    auto end() const { return rows_.end(); }

private:
    std::vector<std::unique_ptr<IRow>> rows_;
};

// Effect of a statement that returns no rows.
// last_insert_id is set only when the statement itself inserted a row.
struct ExecResult {
    int64_t changes = 0;
    std::optional<int64_t> last_insert_id;
};

// A compiled statement, reusable with fresh parameters on every call
class IStatement {
public:
    virtual ~IStatement() = default;

    // Execute to completion, discarding any rows
    virtual asio::awaitable<ExecResult> run(std::span<const Value> params) = 0;

    // Execute and return the first row, or nullptr when none was produced
    virtual asio::awaitable<std::unique_ptr<IRow>> get(std::span<const Value> params) = 0;

    // Release the statement; further calls throw
    virtual asio::awaitable<void> finalize() = 0;
};

// Database interface
class IDatabase {
public:
    virtual ~IDatabase() = default;

    virtual asio::awaitable<QueryResult> query(std::string_view sql,
                                               std::span<const Value> params = {}) = 0;
    virtual asio::awaitable<void> execute(std::string_view sql) = 0;
    virtual asio::awaitable<std::unique_ptr<IStatement>> prepare(std::string_view sql) = 0;

    virtual bool is_connected() const = 0;
    virtual void close() = 0;
};

}  // namespace bulkload
