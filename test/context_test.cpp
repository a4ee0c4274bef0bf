// SPDX-License-Identifier: MIT

#include "bulkload/context.hpp"
#include "bulkload/error.hpp"
#include "bulkload/json_path.hpp"
#include "test_database.hpp"
#include <gtest/gtest.h>
#include <cstdlib>

namespace bulkload {
namespace {

using ::testing::_;

TEST(ContextStoreTest, SetAndGetNestedKeys) {
    ContextStore store;
    EXPECT_EQ(store.get("a.b"), nullptr);

    rapidjson::Document v;
    v.Parse(R"({"n": 1})");
    store.set("a.b", v);

    auto* got = store.get("a.b.n");
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->GetInt(), 1);
    EXPECT_EQ(to_json_string(store.data()), R"({"a":{"b":{"n":1}}})");
}

TEST(ContextStoreTest, SetCopiesTheValue) {
    ContextStore store;
    rapidjson::Document v;
    v.Parse(R"("before")");
    store.set("k", v);
    v.SetString("after");
    EXPECT_STREQ(store.get("k")->GetString(), "before");
}

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        message_.Parse(R"({"payload": [{"a": 1}], "db": "/tmp/x.db", "deep": {"n": 2.5}})");
        row_.Parse(R"({"name": "ada", "nested": {"id": 9}, "list": [1, 2]})");
        rapidjson::Document v;
        v.Parse(R"({"path": "/data/flow.db"})");
        flow_.set("cfg", v);
        v.Parse("true");
        global_.set("enabled", v);
    }

    std::string resolved(SourceKind kind, std::string_view spec) const {
        TypedValueResolver resolver(ctx_);
        auto doc = resolver.resolve(kind, spec);
        return doc ? to_json_string(*doc) : "<none>";
    }

    Value for_row(SourceKind kind, std::string_view spec) const {
        TypedValueResolver resolver(ctx_);
        return resolver.resolve_for_row(kind, spec, row_);
    }

    rapidjson::Document message_;
    rapidjson::Document row_;
    ContextStore flow_;
    ContextStore global_;
    PathExpressionEvaluator evaluator_;
    InvocationContext ctx_{message_, flow_, global_, evaluator_};
};

TEST_F(ResolverTest, Literals) {
    EXPECT_EQ(resolved(SourceKind::String, "hello"), R"("hello")");
    EXPECT_EQ(resolved(SourceKind::String, ""), R"("")");
    EXPECT_EQ(resolved(SourceKind::Number, "12"), "12");
    EXPECT_EQ(resolved(SourceKind::Number, " 1.5 "), "1.5");
    EXPECT_EQ(resolved(SourceKind::Number, "abc"), "<none>");
    EXPECT_EQ(resolved(SourceKind::Boolean, "true"), "true");
    EXPECT_EQ(resolved(SourceKind::Boolean, "yes"), "false");
    EXPECT_EQ(resolved(SourceKind::Json, R"({"x":[1]})"), R"({"x":[1]})");
    EXPECT_EQ(resolved(SourceKind::Json, "{broken"), "<none>");
}

TEST_F(ResolverTest, Environment) {
    ::setenv("BULKLOAD_CONTEXT_TEST_VAR", "/var/db.sqlite", 1);
    EXPECT_EQ(resolved(SourceKind::Env, "BULKLOAD_CONTEXT_TEST_VAR"), R"("/var/db.sqlite")");
    ::unsetenv("BULKLOAD_CONTEXT_TEST_VAR");
    EXPECT_EQ(resolved(SourceKind::Env, "BULKLOAD_CONTEXT_TEST_VAR"), R"("")");
}

TEST_F(ResolverTest, MessageAndContextStores) {
    EXPECT_EQ(resolved(SourceKind::Message, "db"), R"("/tmp/x.db")");
    EXPECT_EQ(resolved(SourceKind::Message, "payload"), R"([{"a":1}])");
    EXPECT_EQ(resolved(SourceKind::Message, "missing"), "<none>");
    EXPECT_EQ(resolved(SourceKind::Flow, "cfg.path"), R"("/data/flow.db")");
    EXPECT_EQ(resolved(SourceKind::Global, "enabled"), "true");
    EXPECT_EQ(resolved(SourceKind::Global, "cfg"), "<none>");
}

TEST_F(ResolverTest, ExpressionSeesMessage) {
    EXPECT_EQ(resolved(SourceKind::Expression, "deep.n"), "2.5");
    EXPECT_EQ(resolved(SourceKind::Expression, "'db:' & db"), R"("db:/tmp/x.db")");
}

TEST_F(ResolverTest, PathHasNoRowAtNodeLevel) {
    EXPECT_EQ(resolved(SourceKind::Path, "payload"), "<none>");
}

TEST_F(ResolverTest, RowPaths) {
    EXPECT_EQ(for_row(SourceKind::Path, "name"), Value{std::string("ada")});
    EXPECT_EQ(for_row(SourceKind::Path, "nested.id"), Value{int64_t{9}});
    EXPECT_EQ(for_row(SourceKind::Path, "list"), Value{std::string("[1,2]")});
    EXPECT_TRUE(is_undefined(for_row(SourceKind::Path, "nope")));
}

TEST_F(ResolverTest, RowExpressionsSeeRowAndMessage) {
    EXPECT_EQ(for_row(SourceKind::Expression, "row.name & '@' & db"),
              Value{std::string("ada@/tmp/x.db")});
    EXPECT_EQ(for_row(SourceKind::Message, "deep.n"), Value{2.5});
    EXPECT_EQ(for_row(SourceKind::String, "const"), Value{std::string("const")});
}

TEST_F(ResolverTest, ExpressionErrorsYieldUndefined) {
    EXPECT_TRUE(is_undefined(for_row(SourceKind::Expression, "row.name &")));
    EXPECT_EQ(resolved(SourceKind::Expression, "(("), "<none>");
}

TEST_F(ResolverTest, EvaluatorFailuresAreContained) {
    testing::MockExpressionEvaluator mock;
    EXPECT_CALL(mock, evaluate(_, _))
        .WillOnce([](std::string_view, const Scope&) -> std::optional<rapidjson::Document> {
            throw BulkLoadError(ErrorCode::ExpressionError, "boom");
        });
    InvocationContext ctx{message_, flow_, global_, mock};
    TypedValueResolver resolver(ctx);
    EXPECT_TRUE(is_undefined(resolver.resolve_for_row(SourceKind::Expression, "x", row_)));
}

TEST_F(ResolverTest, WriterTargetsEachScope) {
    TypedValueWriter writer(ctx_);
    rapidjson::Document v;
    v.Parse(R"({"ok":true})");

    writer.write({OutputScope::Message, "sqlite.summary"}, v);
    writer.write({OutputScope::Flow, "last"}, v);
    writer.write({OutputScope::Global, "runs.latest"}, v);
    writer.write({OutputScope::Message, ""}, v);

    ASSERT_NE(find_path(message_, "sqlite.summary.ok"), nullptr);
    EXPECT_TRUE(find_path(message_, "sqlite.summary.ok")->GetBool());
    EXPECT_NE(flow_.get("last.ok"), nullptr);
    EXPECT_NE(global_.get("runs.latest.ok"), nullptr);
    EXPECT_EQ(find_path(message_, "payload.0.a")->GetInt(), 1);
}

}  // namespace
}  // namespace bulkload
