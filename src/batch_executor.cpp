// SPDX-License-Identifier: MIT

#include "bulkload/batch_executor.hpp"
#include "bulkload/error.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <utility>

namespace bulkload {

namespace {

using Clock = std::chrono::steady_clock;

int64_t elapsed_ms(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

bool is_blank(std::string_view sql) {
    return sql.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

}  // namespace

std::string_view executor_state_name(BatchExecutor::State state) {
    switch (state) {
        case BatchExecutor::State::Idle: return "Idle";
        case BatchExecutor::State::PreHook: return "PreHook";
        case BatchExecutor::State::Running: return "Running";
        case BatchExecutor::State::PostHook: return "PostHook";
        case BatchExecutor::State::Done: return "Done";
        case BatchExecutor::State::Failed: return "Failed";
    }
    return "Unknown";
}

BatchExecutor::BatchExecutor(ExecutorConfig config)
    : config_(std::move(config))
    , reconciler_(config_.plan) {
    validate_plan(config_.plan);
    if (config_.transaction.mode == TransactionMode::Chunked &&
        config_.transaction.chunk_size == 0) {
        throw BulkLoadError(ErrorCode::ConfigurationError, "Chunk size must be positive");
    }
}

asio::awaitable<ExecutionSummary> BatchExecutor::run(Session& session,
                                                     std::span<const rapidjson::Value> rows,
                                                     const RowMapper& mapper) {
    try {
        co_return co_await run_states(session, rows, mapper);
    } catch (...) {
        state_ = State::Failed;
        throw;
    }
}

asio::awaitable<ExecutionSummary> BatchExecutor::run_states(
        Session& session, std::span<const rapidjson::Value> rows, const RowMapper& mapper) {
    const auto& plan = config_.plan;
    const auto& tx = config_.transaction;
    auto& db = session.db();

    auto start_total = Clock::now();
    table_ = plan.table;
    total_ = static_cast<int64_t>(rows.size());

    state_ = State::PreHook;
    co_await run_bracket(db, tx.pre_sql, "preSQL");

    bool native = false;
    if (plan.returning.mode != ReturnMode::None) {
        native = co_await session.supports_returning();
    }
    auto sql = build_insert_sql(plan, native);
    auto path = make_execution_path(native, plan);
    spdlog::debug("bulk insert into {} via {} path: {}", plan.table, path->name(), sql);

    state_ = State::Running;
    auto start_exec = Clock::now();

    std::string prepare_error;
    try {
        co_await path->prepare(db, sql);
    } catch (const std::exception& e) {
        prepare_error = e.what();
    }
    if (!prepare_error.empty()) {
        throw BulkLoadError(ErrorCode::ConnectionError,
                            fmt::format("Failed to prepare insert: {}", prepare_error));
    }

    OutcomeTally committed(plan.returning.mode != ReturnMode::None);

    switch (tx.mode) {
        case TransactionMode::None: {
            // Each row autocommits, so everything counted is durable
            auto abort = co_await run_rows(*path, rows, 0, mapper, committed);
            if (abort) abort_run(*abort, committed);
            break;
        }
        case TransactionMode::Single:
            co_await run_transaction(db, *path, rows, 0, mapper, committed);
            break;
        case TransactionMode::Chunked:
            for (std::size_t offset = 0; offset < rows.size(); offset += tx.chunk_size) {
                auto n = std::min(tx.chunk_size, rows.size() - offset);
                co_await run_transaction(db, *path, rows.subspan(offset, n), offset, mapper,
                                         committed);
            }
            break;
    }

    co_await path->finalize();

    ExecutionSummary summary;
    summary.table = plan.table;
    summary.counts.total = total_;
    committed.apply_to(summary);
    summary.timings.exec_ms = elapsed_ms(start_exec);

    state_ = State::PostHook;
    co_await run_bracket(db, tx.post_sql, "postSQL");

    summary.timings.total_ms = elapsed_ms(start_total);
    state_ = State::Done;
    co_return summary;
}

asio::awaitable<void> BatchExecutor::run_bracket(IDatabase& db, const std::string& sql,
                                                 std::string_view which) {
    if (is_blank(sql)) co_return;

    std::string error;
    try {
        co_await db.execute(sql);
    } catch (const std::exception& e) {
        error = e.what();
    }
    if (!error.empty()) {
        throw BulkLoadError(ErrorCode::BracketStatementError,
                            fmt::format("{} failed: {}", which, error));
    }
}

asio::awaitable<std::optional<std::string>> BatchExecutor::run_rows(
        IExecutionPath& path, std::span<const rapidjson::Value> rows, std::size_t offset,
        const RowMapper& mapper, OutcomeTally& tally) {
    for (std::size_t i = 0; i < rows.size(); ++i) {
        auto params = mapper(rows[i]);

        std::optional<PathOutcome> outcome;
        std::string error;
        try {
            outcome = co_await path.execute(params);
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (outcome) {
            tally.add(reconciler_.reconcile(*outcome, params));
            continue;
        }

        auto row_number = offset + i + 1;
        tally.add(reconciler_.failed(params, error));
        if (!config_.transaction.continue_on_error) {
            co_return fmt::format("Row {} failed: {}", row_number, error);
        }
        spdlog::debug("row {} of {} failed, continuing: {}", row_number, table_, error);
    }
    co_return std::nullopt;
}

asio::awaitable<void> BatchExecutor::run_transaction(IDatabase& db, IExecutionPath& path,
                                                     std::span<const rapidjson::Value> rows,
                                                     std::size_t offset,
                                                     const RowMapper& mapper,
                                                     OutcomeTally& committed) {
    OutcomeTally scope(committed.collects_rows());
    std::optional<std::string> row_abort;
    std::string control_error;
    bool control_failed = false;

    try {
        co_await db.execute("BEGIN");
        row_abort = co_await run_rows(path, rows, offset, mapper, scope);
        if (!row_abort) co_await db.execute("COMMIT");
    } catch (const std::exception& e) {
        // Cannot co_await in a catch block; roll back below
        control_failed = true;
        control_error = e.what();
    }

    if (!row_abort && !control_failed) {
        committed.merge(std::move(scope));
        co_return;
    }

    co_await rollback(db);

    if (row_abort) {
        committed.add_errors(static_cast<std::size_t>(scope.counts().errors));
        abort_run(*row_abort, committed);
    }

    // Nothing in the scope was written
    committed.add_errors(rows.size());
    auto message = fmt::format("Transaction for rows {}-{} failed: {}", offset + 1,
                               offset + rows.size(), control_error);
    if (!config_.transaction.continue_on_error) {
        abort_run(message, committed);
    }
    spdlog::warn("{}; rolled back, continuing", message);
}

asio::awaitable<void> BatchExecutor::rollback(IDatabase& db) {
    try {
        co_await db.execute("ROLLBACK");
    } catch (const std::exception& e) {
        spdlog::warn("rollback failed: {}", e.what());
    }
}

void BatchExecutor::abort_run(const std::string& message, const OutcomeTally& committed) {
    auto partial = std::make_shared<ExecutionSummary>();
    partial->table = table_;
    partial->counts.total = total_;
    committed.apply_to(*partial);
    throw BulkLoadError(ErrorCode::ChunkAbortError, message, std::move(partial));
}

}  // namespace bulkload
