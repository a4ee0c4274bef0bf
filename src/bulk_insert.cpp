// SPDX-License-Identifier: MIT

#include "bulkload/bulk_insert.hpp"
#include "bulkload/batch_executor.hpp"
#include "bulkload/error.hpp"
#include "bulkload/json_path.hpp"
#include "bulkload/row_resolver.hpp"
#include "bulkload/session.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>
#include <exception>
#include <span>
#include <utility>

namespace bulkload {

namespace {

using Clock = std::chrono::steady_clock;

int64_t elapsed_ms(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

// Array of records: null/absent -> [], a single value -> [value]
rapidjson::Document normalize_records(std::optional<rapidjson::Document> resolved) {
    if (resolved && resolved->IsArray()) {
        return std::move(*resolved);
    }

    rapidjson::Document records;
    records.SetArray();
    if (resolved && !resolved->IsNull()) {
        auto& alloc = records.GetAllocator();
        records.PushBack(rapidjson::Value(*resolved, alloc), alloc);
    }
    return records;
}

}  // namespace

std::string_view status_fill_name(StatusFill fill) {
    switch (fill) {
        case StatusFill::Green: return "green";
        case StatusFill::Yellow: return "yellow";
        case StatusFill::Red: return "red";
    }
    return "unknown";
}

DatabaseOpener default_database_opener() {
    return [](const SqliteConfig& config) { return open_sqlite(config); };
}

Status status_for(const Counts& counts) {
    Status status;
    if (counts.errors > 0) {
        status.fill = StatusFill::Red;
    } else if (counts.updated > 0) {
        status.fill = StatusFill::Yellow;
    }
    status.text = fmt::format("I:{} U:{} S:{} E:{}", counts.inserted, counts.updated,
                              counts.skipped, counts.errors);
    return status;
}

BulkInsertNode::BulkInsertNode(NodeConfig config, ContextStore& flow, ContextStore& global,
                               const IExpressionEvaluator& evaluator, DatabaseOpener opener)
    : config_(std::move(config))
    , flow_(flow)
    , global_(global)
    , evaluator_(evaluator)
    , opener_(std::move(opener)) {}

void BulkInsertNode::report(Status status) {
    if (status_handler_) status_handler_(status);
}

asio::awaitable<ExecutionSummary> BulkInsertNode::handle(rapidjson::Document& msg) {
    try {
        co_return co_await invoke(msg);
    } catch (const std::exception& e) {
        report(Status{StatusFill::Red, e.what()});
        throw;
    }
}

asio::awaitable<ExecutionSummary> BulkInsertNode::invoke(rapidjson::Document& msg) {
    InvocationContext ctx{msg, flow_, global_, evaluator_};
    TypedValueResolver resolver(ctx);

    auto db_path = resolver.resolve(config_.database.kind, config_.database.value);
    if (!db_path || !db_path->IsString() || db_path->GetStringLength() == 0) {
        throw BulkLoadError(ErrorCode::ConfigurationError, "Invalid database path");
    }

    auto resolved = resolver.resolve(config_.source.kind, config_.source.value);
    if ((!resolved || resolved->IsNull()) && config_.source.kind == SourceKind::Message) {
        if (const auto* payload = find_path(msg, "payload")) {
            rapidjson::Document copy;
            copy.CopyFrom(*payload, copy.GetAllocator());
            resolved = std::move(copy);
        }
    }
    auto records = normalize_records(std::move(resolved));

    auto mapping = config_.auto_map ? auto_map_columns(records) : config_.mapping;
    if (mapping.empty()) {
        throw BulkLoadError(ErrorCode::ConfigurationError, "No columns configured");
    }

    RowResolver row_resolver(resolver, std::move(mapping));
    BatchExecutor executor(ExecutorConfig{
        .plan = InsertPlan{
            .table = config_.table,
            .columns = row_resolver.columns(),
            .conflict = config_.conflict,
            .returning = config_.returning,
        },
        .transaction = config_.transaction,
    });

    SqliteConfig sqlite_config{
        .path = std::string(db_path->GetString(), db_path->GetStringLength()),
        .pragmas = config_.pragmas,
        .busy_timeout_ms = busy_timeout_ms_,
    };

    auto start_open = Clock::now();
    std::unique_ptr<IDatabase> db;
    std::string open_error;
    try {
        db = co_await opener_(sqlite_config);
    } catch (const std::exception& e) {
        open_error = e.what();
    }
    if (!db) {
        throw BulkLoadError(ErrorCode::ConnectionError,
                            fmt::format("Failed to open {}: {}", sqlite_config.path,
                                        open_error.empty() ? "no connection" : open_error));
    }
    auto open_ms = elapsed_ms(start_open);

    // Closed on every exit path by its destructor
    Session session(std::move(db));

    std::span<const rapidjson::Value> rows(records.Begin(), records.Size());
    auto summary = co_await executor.run(session, rows, [&](const rapidjson::Value& row) {
        return row_resolver.map_row(row);
    });
    session.close();

    summary.timings.open_ms = open_ms;
    summary.timings.total_ms = elapsed_ms(start_open);

    TypedValueWriter writer(ctx);
    {
        rapidjson::Document out;
        auto json = to_json(summary, out.GetAllocator());
        writer.write(config_.summary_target, json);
    }
    if (config_.returning.mode != ReturnMode::None) {
        rapidjson::Document out;
        auto json = to_json(summary.returned_rows, out.GetAllocator());
        writer.write(config_.returning.target, json);
    }

    const auto& c = summary.counts;
    spdlog::info("{}: {} rows into {} (inserted {}, updated {}, skipped {}, errors {}) in {} ms",
                 config_.name.empty() ? "bulkload" : config_.name, c.total, summary.table,
                 c.inserted, c.updated, c.skipped, c.errors, summary.timings.total_ms);
    report(status_for(c));
    co_return summary;
}

}  // namespace bulkload
