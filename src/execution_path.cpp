// SPDX-License-Identifier: MIT

#include "bulkload/execution_path.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace bulkload {

asio::awaitable<void> NativeCapturePath::prepare(IDatabase& db, std::string_view sql) {
    stmt_ = co_await db.prepare(sql);
}

asio::awaitable<PathOutcome> NativeCapturePath::execute(std::span<const Value> params) {
    if (!stmt_) {
        throw std::runtime_error("execute() called before prepare()");
    }
    auto row = co_await stmt_->get(params);
    co_return PathOutcome{CapturedRow{std::move(row)}};
}

asio::awaitable<void> NativeCapturePath::finalize() {
    if (stmt_) {
        co_await stmt_->finalize();
        stmt_.reset();
    }
}

FallbackPath::FallbackPath(InsertPlan plan) : plan_(std::move(plan)) {
    if (wants_id_recovery()) {
        lookup_sql_ = build_id_lookup_sql(plan_);
        for (const auto& key : plan_.conflict.keys) {
            auto it = std::find(plan_.columns.begin(), plan_.columns.end(), key);
            if (it == plan_.columns.end()) {
                // Key not mapped: nothing to look it up by
                lookup_sql_.clear();
                key_indexes_.clear();
                break;
            }
            key_indexes_.push_back(static_cast<std::size_t>(it - plan_.columns.begin()));
        }
    }
}

bool FallbackPath::wants_id_recovery() const {
    return plan_.conflict.strategy == ConflictStrategy::Upsert &&
           plan_.returning.mode == ReturnMode::Affected &&
           !plan_.conflict.keys.empty();
}

asio::awaitable<void> FallbackPath::prepare(IDatabase& db, std::string_view sql) {
    db_ = &db;
    stmt_ = co_await db.prepare(sql);
}

asio::awaitable<PathOutcome> FallbackPath::execute(std::span<const Value> params) {
    if (!stmt_) {
        throw std::runtime_error("execute() called before prepare()");
    }

    ChangeReport report;
    report.exec = co_await stmt_->run(params);

    // Upsert that changed a row without generating a rowid took the UPDATE branch
    bool updated = plan_.conflict.strategy == ConflictStrategy::Upsert &&
                   report.exec.changes > 0 && !report.exec.last_insert_id;
    if (updated && !lookup_sql_.empty()) {
        report.recovered_id = co_await lookup_id(params);
    }
    co_return PathOutcome{std::move(report)};
}

asio::awaitable<std::optional<Value>> FallbackPath::lookup_id(std::span<const Value> params) {
    std::vector<Value> keys;
    keys.reserve(key_indexes_.size());
    for (auto idx : key_indexes_) keys.push_back(params[idx]);

    std::optional<Value> id;
    try {
        auto result = co_await db_->query(lookup_sql_, keys);
        if (!result.empty() && !result[0].is_null(0)) {
            id = result[0].get(0);
        }
    } catch (const std::exception& e) {
        spdlog::warn("id lookup after upsert failed: {}", e.what());
    }
    co_return id;
}

asio::awaitable<void> FallbackPath::finalize() {
    if (stmt_) {
        co_await stmt_->finalize();
        stmt_.reset();
    }
}

std::unique_ptr<IExecutionPath> make_execution_path(bool native, const InsertPlan& plan) {
    if (native) return std::make_unique<NativeCapturePath>();
    return std::make_unique<FallbackPath>(plan);
}

}  // namespace bulkload
