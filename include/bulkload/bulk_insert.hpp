// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/config.hpp"
#include "bulkload/context.hpp"
#include "bulkload/database.hpp"
#include "bulkload/expression.hpp"
#include "bulkload/sqlite.hpp"
#include "bulkload/summary.hpp"
#include <rapidjson/document.h>
#include <asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <string>

namespace bulkload {

enum class StatusFill { Green, Yellow, Red };

std::string_view status_fill_name(StatusFill fill);

// Short status shown after each invocation
struct Status {
    StatusFill fill = StatusFill::Green;
    std::string text;
};

using StatusHandler = std::function<void(const Status&)>;

// Opens and configures a connection. Replaceable for tests.
using DatabaseOpener =
    std::function<asio::awaitable<std::unique_ptr<IDatabase>>(const SqliteConfig&)>;

DatabaseOpener default_database_opener();

// Status for a completed run: red with errors, yellow with updates, else
// green; text "I:<n> U:<n> S:<n> E:<n>".
Status status_for(const Counts& counts);

// One configured bulk insert. Each handle() call is one independent run:
// resolve the database path and records, derive the columns, open the
// connection, execute, write the summary (and returned rows) back, report
// status, and close the connection.
//
// Failures are reported as a red status and rethrown as BulkLoadError.
// Identifier and configuration errors are raised before the database is
// opened.
//
// IMPORTANT: not reentrant. Await each handle() before starting the next.
class BulkInsertNode {
public:
    BulkInsertNode(NodeConfig config, ContextStore& flow, ContextStore& global,
                   const IExpressionEvaluator& evaluator,
                   DatabaseOpener opener = default_database_opener());

    BulkInsertNode(const BulkInsertNode&) = delete;
    BulkInsertNode& operator=(const BulkInsertNode&) = delete;

    void on_status(StatusHandler handler) { status_handler_ = std::move(handler); }

    void set_busy_timeout(int ms) { busy_timeout_ms_ = ms; }

    asio::awaitable<ExecutionSummary> handle(rapidjson::Document& msg);

    const NodeConfig& config() const { return config_; }

private:
    asio::awaitable<ExecutionSummary> invoke(rapidjson::Document& msg);
    void report(Status status);

    NodeConfig config_;
    ContextStore& flow_;
    ContextStore& global_;
    const IExpressionEvaluator& evaluator_;
    DatabaseOpener opener_;
    StatusHandler status_handler_;
    int busy_timeout_ms_ = SqliteConfig{}.busy_timeout_ms;
};

}  // namespace bulkload
