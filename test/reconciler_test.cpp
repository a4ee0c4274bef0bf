// SPDX-License-Identifier: MIT

#include "bulkload/reconciler.hpp"
#include "test_database.hpp"
#include <gtest/gtest.h>

namespace bulkload {
namespace {

using testing::TestRow;

InsertPlan plan_for(ConflictStrategy strategy) {
    InsertPlan plan;
    plan.table = "people";
    plan.columns = {"email", "name"};
    plan.conflict.strategy = strategy;
    if (strategy == ConflictStrategy::Upsert) plan.conflict.keys = {"email"};
    plan.returning.mode = ReturnMode::Affected;
    return plan;
}

const std::vector<Value> kParams = {Value{std::string("a@x")}, Value{std::string("Ada")}};

PathOutcome captured(std::unique_ptr<IRow> row) {
    return PathOutcome{CapturedRow{std::move(row)}};
}

PathOutcome changes(int64_t n, std::optional<int64_t> rowid,
                    std::optional<Value> recovered = std::nullopt) {
    return PathOutcome{ChangeReport{ExecResult{n, rowid}, std::move(recovered)}};
}

TEST(ReconcilerTest, NativeInsertReportsBoundValues) {
    auto plan = plan_for(ConflictStrategy::None);
    ResultReconciler reconciler(plan);

    // Column affinity changes what comes back; data still reports the params
    auto r = reconciler.reconcile(
        captured(std::make_unique<TestRow>(
            std::vector<std::string>{"__id", "email", "name"},
            std::vector<Value>{Value{int64_t{7}}, Value{int64_t{42}}, Value{int64_t{1}}})),
        kParams);

    EXPECT_EQ(r.outcome.action, RowAction::Inserted);
    EXPECT_EQ(r.outcome.id, Value{int64_t{7}});
    ASSERT_EQ(r.outcome.data.size(), 2u);
    EXPECT_EQ(r.outcome.data[0].first, "email");
    EXPECT_EQ(r.outcome.data[0].second, kParams[0]);
    EXPECT_EQ(r.outcome.data[1].first, "name");
    EXPECT_EQ(r.outcome.data[1].second, kParams[1]);
    EXPECT_TRUE(r.reportable);
}

TEST(ReconcilerTest, NativeNullIdLeavesIdUnset) {
    auto plan = plan_for(ConflictStrategy::None);
    ResultReconciler reconciler(plan);

    auto r = reconciler.reconcile(
        captured(std::make_unique<TestRow>(std::vector<std::string>{"__id"},
                                           std::vector<Value>{Value{nullptr}})),
        kParams);
    EXPECT_FALSE(r.outcome.id.has_value());
    EXPECT_EQ(r.outcome.data[0].second, kParams[0]);
}

TEST(ReconcilerTest, NativeUpsertReportsUpdated) {
    auto plan = plan_for(ConflictStrategy::Upsert);
    ResultReconciler reconciler(plan);

    auto r = reconciler.reconcile(
        captured(std::make_unique<TestRow>(std::vector<std::string>{"__id"},
                                           std::vector<Value>{Value{int64_t{3}}})),
        kParams);
    EXPECT_EQ(r.outcome.action, RowAction::Updated);
    EXPECT_EQ(r.outcome.id, Value{int64_t{3}});
}

TEST(ReconcilerTest, NativeNoRowIsSkip) {
    auto plan = plan_for(ConflictStrategy::Ignore);
    ResultReconciler reconciler(plan);
    auto r = reconciler.reconcile(captured(nullptr), kParams);
    EXPECT_EQ(r.outcome.action, RowAction::Skipped);
    EXPECT_FALSE(r.reportable);
}

TEST(ReconcilerTest, FallbackClassification) {
    auto ignore = plan_for(ConflictStrategy::Ignore);
    ResultReconciler plain(ignore);

    auto skipped = plain.reconcile(changes(0, std::nullopt), kParams);
    EXPECT_EQ(skipped.outcome.action, RowAction::Skipped);
    EXPECT_FALSE(skipped.reportable);

    auto inserted = plain.reconcile(changes(1, 12), kParams);
    EXPECT_EQ(inserted.outcome.action, RowAction::Inserted);
    EXPECT_EQ(inserted.outcome.id, Value{int64_t{12}});
    EXPECT_EQ(inserted.outcome.data.size(), 2u);
    EXPECT_TRUE(inserted.reportable);

    auto upsert = plan_for(ConflictStrategy::Upsert);
    ResultReconciler up(upsert);

    auto updated = up.reconcile(changes(1, std::nullopt), kParams);
    EXPECT_EQ(updated.outcome.action, RowAction::Updated);
    EXPECT_FALSE(updated.outcome.id.has_value());
    EXPECT_FALSE(updated.reportable);

    auto recovered = up.reconcile(changes(1, std::nullopt, Value{int64_t{5}}), kParams);
    EXPECT_EQ(recovered.outcome.action, RowAction::Updated);
    EXPECT_EQ(recovered.outcome.id, Value{int64_t{5}});
    EXPECT_TRUE(recovered.reportable);

    auto fresh = up.reconcile(changes(1, 9), kParams);
    EXPECT_EQ(fresh.outcome.action, RowAction::Inserted);
}

TEST(ReconcilerTest, FailedRowCarriesError) {
    auto plan = plan_for(ConflictStrategy::None);
    ResultReconciler reconciler(plan);
    auto r = reconciler.failed(kParams, "UNIQUE constraint failed");
    EXPECT_EQ(r.outcome.action, RowAction::Errored);
    EXPECT_EQ(r.outcome.error, "UNIQUE constraint failed");
    EXPECT_FALSE(r.reportable);
}

TEST(OutcomeTallyTest, CountsAndIdRange) {
    auto plan = plan_for(ConflictStrategy::Upsert);
    ResultReconciler reconciler(plan);
    OutcomeTally tally(true);

    tally.add(reconciler.reconcile(changes(1, 4), kParams));
    tally.add(reconciler.reconcile(changes(0, std::nullopt), kParams));
    tally.add(reconciler.reconcile(changes(1, std::nullopt), kParams));
    tally.add(reconciler.reconcile(changes(1, 8), kParams));
    tally.add(reconciler.failed(kParams, "boom"));

    EXPECT_EQ(tally.counts().inserted, 2);
    EXPECT_EQ(tally.counts().updated, 1);
    EXPECT_EQ(tally.counts().skipped, 1);
    EXPECT_EQ(tally.counts().errors, 1);

    ExecutionSummary summary;
    summary.counts.total = 5;
    tally.apply_to(summary);
    EXPECT_TRUE(summary.counts.balanced());
    EXPECT_EQ(summary.first_id, Value{int64_t{4}});
    EXPECT_EQ(summary.last_id, Value{int64_t{8}});
    EXPECT_EQ(summary.returned_rows.size(), 2u);
}

TEST(OutcomeTallyTest, RowsNotCollectedWhenDisabled) {
    auto plan = plan_for(ConflictStrategy::None);
    ResultReconciler reconciler(plan);
    OutcomeTally tally(false);
    tally.add(reconciler.reconcile(changes(1, 1), kParams));

    ExecutionSummary summary;
    tally.apply_to(summary);
    EXPECT_EQ(summary.counts.inserted, 1);
    EXPECT_TRUE(summary.returned_rows.empty());
    EXPECT_EQ(summary.first_id, Value{int64_t{1}});
}

TEST(OutcomeTallyTest, MergeKeepsOrder) {
    auto plan = plan_for(ConflictStrategy::None);
    ResultReconciler reconciler(plan);
    OutcomeTally run(true);
    OutcomeTally first(true);
    OutcomeTally second(true);

    first.add(reconciler.reconcile(changes(1, 1), kParams));
    second.add(reconciler.reconcile(changes(1, 2), kParams));
    second.add(reconciler.reconcile(changes(1, 3), kParams));
    run.merge(std::move(first));
    run.merge(std::move(second));
    run.add_errors(2);

    ExecutionSummary summary;
    run.apply_to(summary);
    EXPECT_EQ(summary.counts.inserted, 3);
    EXPECT_EQ(summary.counts.errors, 2);
    EXPECT_EQ(summary.first_id, Value{int64_t{1}});
    EXPECT_EQ(summary.last_id, Value{int64_t{3}});
    ASSERT_EQ(summary.returned_rows.size(), 3u);
    EXPECT_EQ(summary.returned_rows[2].id, Value{int64_t{3}});
}

}  // namespace
}  // namespace bulkload
