// SPDX-License-Identifier: MIT

#include "bulkload/reconciler.hpp"
#include <iterator>
#include <utility>

namespace bulkload {

ReconciledRow ResultReconciler::reconcile(const PathOutcome& outcome,
                                          std::span<const Value> params) const {
    if (auto* captured = std::get_if<CapturedRow>(&outcome)) {
        return from_row(captured->row.get(), params);
    }
    return from_changes(std::get<ChangeReport>(outcome), params);
}

ReconciledRow ResultReconciler::failed(std::span<const Value> params,
                                       std::string message) const {
    ReconciledRow r;
    r.outcome.action = RowAction::Errored;
    r.outcome.data = bound_data(params);
    r.outcome.error = std::move(message);
    return r;
}

ReconciledRow ResultReconciler::from_row(const IRow* row, std::span<const Value> params) const {
    ReconciledRow r;
    if (!row) {
        r.outcome.action = RowAction::Skipped;
        return r;
    }

    r.outcome.action = plan_.conflict.strategy == ConflictStrategy::Upsert
                           ? RowAction::Updated
                           : RowAction::Inserted;

    if (auto idx = row->find(kReturnedIdAlias); idx && !row->is_null(*idx)) {
        r.outcome.id = row->get(*idx);
    }

    // Only the id is taken from the echoed row; SQLite applies column affinity
    // to the stored values, so data reports what was bound.
    r.outcome.data = bound_data(params);
    r.reportable = true;
    return r;
}

ReconciledRow ResultReconciler::from_changes(const ChangeReport& report,
                                             std::span<const Value> params) const {
    ReconciledRow r;
    if (report.exec.changes == 0) {
        r.outcome.action = RowAction::Skipped;
        return r;
    }

    r.outcome.data = bound_data(params);

    if (plan_.conflict.strategy == ConflictStrategy::Upsert && !report.exec.last_insert_id) {
        r.outcome.action = RowAction::Updated;
        if (report.recovered_id && !is_nullish(*report.recovered_id)) {
            r.outcome.id = *report.recovered_id;
            r.reportable = true;
        }
        return r;
    }

    r.outcome.action = RowAction::Inserted;
    if (report.exec.last_insert_id) {
        r.outcome.id = Value{*report.exec.last_insert_id};
    }
    r.reportable = true;
    return r;
}

std::vector<std::pair<std::string, Value>> ResultReconciler::bound_data(
        std::span<const Value> params) const {
    std::vector<std::pair<std::string, Value>> data;
    data.reserve(plan_.columns.size());
    for (std::size_t i = 0; i < plan_.columns.size(); ++i) {
        data.emplace_back(plan_.columns[i], i < params.size() ? params[i] : Value{Undefined{}});
    }
    return data;
}

void OutcomeTally::add(ReconciledRow row) {
    auto& outcome = row.outcome;
    switch (outcome.action) {
        case RowAction::Inserted: ++counts_.inserted; break;
        case RowAction::Updated: ++counts_.updated; break;
        case RowAction::Skipped: ++counts_.skipped; break;
        case RowAction::Errored: ++counts_.errors; break;
    }

    if (outcome.id && !is_nullish(*outcome.id)) {
        if (!first_id_) first_id_ = *outcome.id;
        last_id_ = *outcome.id;
    }

    if (collect_rows_ && row.reportable) {
        rows_.push_back(std::move(outcome));
    }
}

void OutcomeTally::merge(OutcomeTally&& other) {
    counts_.inserted += other.counts_.inserted;
    counts_.updated += other.counts_.updated;
    counts_.skipped += other.counts_.skipped;
    counts_.errors += other.counts_.errors;

    if (!first_id_) first_id_ = std::move(other.first_id_);
    if (other.last_id_) last_id_ = std::move(other.last_id_);

    rows_.insert(rows_.end(), std::make_move_iterator(other.rows_.begin()),
                 std::make_move_iterator(other.rows_.end()));
    other.rows_.clear();
}

void OutcomeTally::apply_to(ExecutionSummary& summary) const {
    summary.counts.inserted = counts_.inserted;
    summary.counts.updated = counts_.updated;
    summary.counts.skipped = counts_.skipped;
    summary.counts.errors = counts_.errors;
    summary.first_id = first_id_;
    summary.last_id = last_id_;
    summary.returned_rows = rows_;
}

}  // namespace bulkload
