// SPDX-License-Identifier: MIT

#include "bulkload/statement_builder.hpp"
#include <gtest/gtest.h>
#include <optional>

namespace bulkload {
namespace {

InsertPlan people_plan() {
    InsertPlan plan;
    plan.table = "people";
    plan.columns = {"email", "name"};
    return plan;
}

std::optional<ErrorCode> validation_error(const InsertPlan& plan) {
    try {
        validate_plan(plan);
    } catch (const BulkLoadError& e) {
        return e.code();
    }
    return std::nullopt;
}

TEST(StatementBuilderTest, PlainInsert) {
    EXPECT_EQ(build_insert_sql(people_plan(), true),
              R"(INSERT INTO "people" ("email", "name") VALUES (?, ?))");
}

TEST(StatementBuilderTest, IgnoreAndReplaceVerbs) {
    auto plan = people_plan();
    plan.conflict.strategy = ConflictStrategy::Ignore;
    EXPECT_EQ(build_insert_sql(plan, false),
              R"(INSERT OR IGNORE INTO "people" ("email", "name") VALUES (?, ?))");

    plan.conflict.strategy = ConflictStrategy::Replace;
    EXPECT_EQ(build_insert_sql(plan, false),
              R"(INSERT OR REPLACE INTO "people" ("email", "name") VALUES (?, ?))");
}

TEST(StatementBuilderTest, UpsertUpdatesMappedColumnsOnly) {
    auto plan = people_plan();
    plan.conflict = {ConflictStrategy::Upsert, {"email"}, {"name", "unmapped"}};
    EXPECT_EQ(build_insert_sql(plan, false),
              R"(INSERT INTO "people" ("email", "name") VALUES (?, ?))"
              R"( ON CONFLICT("email") DO UPDATE SET "name"=excluded."name")");
    EXPECT_EQ(effective_update_columns(plan), std::vector<std::string>{"name"});
}

TEST(StatementBuilderTest, UpsertWithoutUpdateColumnsSelfAssignsKey) {
    auto plan = people_plan();
    plan.conflict = {ConflictStrategy::Upsert, {"email", "name"}, {}};
    EXPECT_EQ(build_insert_sql(plan, false),
              R"(INSERT INTO "people" ("email", "name") VALUES (?, ?))"
              R"( ON CONFLICT("email","name") DO UPDATE SET "email"="email")");
}

TEST(StatementBuilderTest, ReturningClause) {
    auto plan = people_plan();
    plan.returning.mode = ReturnMode::Inserted;
    EXPECT_EQ(build_insert_sql(plan, true),
              R"(INSERT INTO "people" ("email", "name") VALUES (?, ?))"
              R"( RETURNING "id" AS __id, "email", "name")");

    plan.returning.id_column.clear();
    EXPECT_EQ(build_insert_sql(plan, true),
              R"(INSERT INTO "people" ("email", "name") VALUES (?, ?))"
              R"( RETURNING rowid AS __id, "email", "name")");
}

TEST(StatementBuilderTest, NoReturningWithoutSupportOrMode) {
    auto plan = people_plan();
    plan.returning.mode = ReturnMode::Affected;
    EXPECT_EQ(build_insert_sql(plan, false),
              R"(INSERT INTO "people" ("email", "name") VALUES (?, ?))");

    plan.returning.mode = ReturnMode::None;
    EXPECT_EQ(build_insert_sql(plan, true),
              R"(INSERT INTO "people" ("email", "name") VALUES (?, ?))");
}

TEST(StatementBuilderTest, IdLookup) {
    auto plan = people_plan();
    plan.conflict = {ConflictStrategy::Upsert, {"email", "name"}, {}};
    EXPECT_EQ(build_id_lookup_sql(plan),
              R"(SELECT "id" AS id FROM "people" WHERE "email"=? AND "name"=? LIMIT 1)");

    plan.returning.id_column.clear();
    EXPECT_EQ(build_id_lookup_sql(plan),
              R"(SELECT rowid AS id FROM "people" WHERE "email"=? AND "name"=? LIMIT 1)");
}

TEST(StatementBuilderTest, ValidationErrors) {
    auto plan = people_plan();
    plan.table.clear();
    EXPECT_EQ(validation_error(plan), ErrorCode::ConfigurationError);

    plan = people_plan();
    plan.columns.clear();
    EXPECT_EQ(validation_error(plan), ErrorCode::ConfigurationError);

    plan = people_plan();
    plan.columns.push_back("email");
    EXPECT_EQ(validation_error(plan), ErrorCode::ConfigurationError);

    plan = people_plan();
    plan.conflict.strategy = ConflictStrategy::Upsert;
    EXPECT_EQ(validation_error(plan), ErrorCode::ConfigurationError);

    // Would shadow the returned id alias
    plan = people_plan();
    plan.columns.push_back("__id");
    EXPECT_EQ(validation_error(plan), ErrorCode::ConfigurationError);
}

TEST(StatementBuilderTest, RejectsMalformedNamesEverywhere) {
    auto plan = people_plan();
    plan.table = "1bad";
    EXPECT_EQ(validation_error(plan), ErrorCode::InvalidIdentifier);

    plan = people_plan();
    plan.columns.push_back("first name");
    EXPECT_EQ(validation_error(plan), ErrorCode::InvalidIdentifier);

    plan = people_plan();
    plan.conflict = {ConflictStrategy::Upsert, {"email;"}, {}};
    EXPECT_EQ(validation_error(plan), ErrorCode::InvalidIdentifier);

    plan = people_plan();
    plan.conflict = {ConflictStrategy::Upsert, {"email"}, {"x y"}};
    EXPECT_EQ(validation_error(plan), ErrorCode::InvalidIdentifier);

    plan = people_plan();
    plan.returning.id_column = "id)--";
    EXPECT_EQ(validation_error(plan), ErrorCode::InvalidIdentifier);

    EXPECT_THROW(build_insert_sql(plan, true), BulkLoadError);
}

}  // namespace
}  // namespace bulkload
