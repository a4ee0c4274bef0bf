// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/config.hpp"
#include "bulkload/database.hpp"
#include "bulkload/execution_path.hpp"
#include "bulkload/reconciler.hpp"
#include "bulkload/session.hpp"
#include "bulkload/statement_builder.hpp"
#include "bulkload/summary.hpp"
#include <rapidjson/document.h>
#include <asio/awaitable.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bulkload {

struct ExecutorConfig {
    InsertPlan plan;
    TransactionPolicy transaction;
};

// Record -> ordered statement parameters
using RowMapper = std::function<std::vector<Value>(const rapidjson::Value&)>;

// Applies the insert statement to every record under the transaction policy.
//
//   Idle -> PreHook -> Running -> PostHook -> Done
//                                  (Failed on any abort)
//
// Row failures are counted. They are tolerated when continue_on_error is
// set; otherwise the active transaction rolls back and run() throws
// BulkLoadError(ChunkAbortError) carrying the summary of committed work.
// Chunks that committed before the failure stay committed.
//
// IMPORTANT: the session must stay open until run() completes. The executor
// does not close it; the caller owns the connection's lifetime.
class BatchExecutor {
public:
    enum class State { Idle, PreHook, Running, PostHook, Done, Failed };

    // Validates the plan. Throws BulkLoadError (InvalidIdentifier or
    // ConfigurationError) before any database work.
    explicit BatchExecutor(ExecutorConfig config);

    BatchExecutor(const BatchExecutor&) = delete;
    BatchExecutor& operator=(const BatchExecutor&) = delete;

    asio::awaitable<ExecutionSummary> run(Session& session,
                                          std::span<const rapidjson::Value> rows,
                                          const RowMapper& mapper);

    State state() const { return state_; }
    const ExecutorConfig& config() const { return config_; }

private:
    asio::awaitable<ExecutionSummary> run_states(Session& session,
                                                 std::span<const rapidjson::Value> rows,
                                                 const RowMapper& mapper);

    asio::awaitable<void> run_bracket(IDatabase& db, const std::string& sql,
                                      std::string_view which);

    // Executes rows into `tally`. Returns the abort message when a row fails
    // and errors are not tolerated.
    asio::awaitable<std::optional<std::string>> run_rows(IExecutionPath& path,
                                                         std::span<const rapidjson::Value> rows,
                                                         std::size_t offset,
                                                         const RowMapper& mapper,
                                                         OutcomeTally& tally);

    // One transaction around `rows`. Merges into `committed` on commit.
    asio::awaitable<void> run_transaction(IDatabase& db, IExecutionPath& path,
                                          std::span<const rapidjson::Value> rows,
                                          std::size_t offset, const RowMapper& mapper,
                                          OutcomeTally& committed);

    asio::awaitable<void> rollback(IDatabase& db);

    [[noreturn]] void abort_run(const std::string& message, const OutcomeTally& committed);

    ExecutorConfig config_;
    ResultReconciler reconciler_;
    State state_ = State::Idle;

    // Set while running for partial summaries
    std::string table_;
    int64_t total_ = 0;
};

std::string_view executor_state_name(BatchExecutor::State state);

}  // namespace bulkload
