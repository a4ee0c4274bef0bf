// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/database.hpp"
#include "bulkload/statement_builder.hpp"
#include <asio/awaitable.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <variant>

namespace bulkload {

// Native path report: the row echoed by RETURNING, nullptr when nothing was written
struct CapturedRow {
    std::unique_ptr<IRow> row;
};

// Fallback path report: the engine's change counters, plus the id recovered
// by key lookup for an upsert that updated
struct ChangeReport {
    ExecResult exec;
    std::optional<Value> recovered_id;
};

using PathOutcome = std::variant<CapturedRow, ChangeReport>;

// How each row is executed and observed. Chosen once per run.
//
// execute() throws std::runtime_error when the row's statement fails; the
// caller decides whether that is tolerated.
class IExecutionPath {
public:
    virtual ~IExecutionPath() = default;

    virtual std::string_view name() const = 0;

    virtual asio::awaitable<void> prepare(IDatabase& db, std::string_view sql) = 0;
    virtual asio::awaitable<PathOutcome> execute(std::span<const Value> params) = 0;
    virtual asio::awaitable<void> finalize() = 0;
};

// Uses INSERT ... RETURNING and reads back the written row
class NativeCapturePath : public IExecutionPath {
public:
    std::string_view name() const override { return "native"; }

    asio::awaitable<void> prepare(IDatabase& db, std::string_view sql) override;
    asio::awaitable<PathOutcome> execute(std::span<const Value> params) override;
    asio::awaitable<void> finalize() override;

private:
    std::unique_ptr<IStatement> stmt_;
};

// Runs the statement without a result row and reads changes / last insert id.
// For an upsert that updated, optionally recovers the id with one lookup by
// the conflict keys.
class FallbackPath : public IExecutionPath {
public:
    explicit FallbackPath(InsertPlan plan);

    std::string_view name() const override { return "fallback"; }

    asio::awaitable<void> prepare(IDatabase& db, std::string_view sql) override;
    asio::awaitable<PathOutcome> execute(std::span<const Value> params) override;
    asio::awaitable<void> finalize() override;

private:
    bool wants_id_recovery() const;
    asio::awaitable<std::optional<Value>> lookup_id(std::span<const Value> params);

    InsertPlan plan_;
    std::string lookup_sql_;
    std::vector<std::size_t> key_indexes_;  // positions of conflict keys in params
    IDatabase* db_ = nullptr;
    std::unique_ptr<IStatement> stmt_;
};

std::unique_ptr<IExecutionPath> make_execution_path(bool native, const InsertPlan& plan);

}  // namespace bulkload
