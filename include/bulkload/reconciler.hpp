// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/execution_path.hpp"
#include "bulkload/statement_builder.hpp"
#include "bulkload/summary.hpp"
#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace bulkload {

struct ReconciledRow {
    RowOutcome outcome;
    bool reportable = false;  // belongs in returned rows
};

// Turns either path's report into a uniform RowOutcome.
//
// Native: no row is a skip; a row is an insert, or an update for upsert
// (RETURNING cannot tell the two apart). Fallback: zero changes is a skip; an
// upsert without a generated rowid is an update; anything else is an insert.
class ResultReconciler {
public:
    explicit ResultReconciler(const InsertPlan& plan) : plan_(plan) {}

    ReconciledRow reconcile(const PathOutcome& outcome, std::span<const Value> params) const;
    ReconciledRow failed(std::span<const Value> params, std::string message) const;

private:
    ReconciledRow from_row(const IRow* row, std::span<const Value> params) const;
    ReconciledRow from_changes(const ChangeReport& report, std::span<const Value> params) const;
    std::vector<std::pair<std::string, Value>> bound_data(std::span<const Value> params) const;

    const InsertPlan& plan_;
};

// Counts, id range and returned rows of one scope (a chunk or the whole run).
// Rolled-back scopes are dropped; committed ones are merged into the run's tally.
class OutcomeTally {
public:
    explicit OutcomeTally(bool collect_rows) : collect_rows_(collect_rows) {}

    void add(ReconciledRow row);
    void add_errors(std::size_t n) { counts_.errors += static_cast<int64_t>(n); }
    void merge(OutcomeTally&& other);

    const Counts& counts() const { return counts_; }
    bool collects_rows() const { return collect_rows_; }

    // Copy counts (except total), id range and rows into `summary`
    void apply_to(ExecutionSummary& summary) const;

private:
    bool collect_rows_;
    Counts counts_;
    std::optional<Value> first_id_;
    std::optional<Value> last_id_;
    std::vector<RowOutcome> rows_;
};

}  // namespace bulkload
