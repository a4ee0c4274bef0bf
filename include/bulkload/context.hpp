// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/config.hpp"
#include "bulkload/expression.hpp"
#include "bulkload/value.hpp"
#include <rapidjson/document.h>
#include <optional>
#include <string_view>

namespace bulkload {

// Key/value state shared across invocations (the "flow" and "global" scopes).
// Keys are dotted paths into one JSON object.
class ContextStore {
public:
    ContextStore() { doc_.SetObject(); }

    ContextStore(const ContextStore&) = delete;
    ContextStore& operator=(const ContextStore&) = delete;

    const rapidjson::Value* get(std::string_view path) const;
    void set(std::string_view path, const rapidjson::Value& value);

    const rapidjson::Document& data() const { return doc_; }

private:
    rapidjson::Document doc_;
};

// Everything one invocation can read from or write to
struct InvocationContext {
    rapidjson::Document& message;
    ContextStore& flow;
    ContextStore& global;
    const IExpressionEvaluator& evaluator;
};

// Reads configured values from literals, the environment, the message, the
// context stores, or expressions. Missing keys yield no value; expression
// errors are logged and also yield no value.
class TypedValueResolver {
public:
    explicit TypedValueResolver(const InvocationContext& ctx) : ctx_(ctx) {}

    // Node-level lookup; expressions see the message.
    std::optional<rapidjson::Document> resolve(SourceKind kind, std::string_view spec) const;

    // Scalar lookup while mapping `row`; expressions also see `row`.
    // Path sources are resolved against the row itself.
    Value resolve_for_row(SourceKind kind, std::string_view spec,
                          const rapidjson::Value& row) const;

private:
    template <typename F>
    auto with_resolved(SourceKind kind, std::string_view spec, const Scope& scope,
                       const rapidjson::Value* row, F&& fn) const;

    const InvocationContext& ctx_;
};

// Stores values for downstream consumers in the message or a context store.
class TypedValueWriter {
public:
    explicit TypedValueWriter(InvocationContext& ctx) : ctx_(ctx) {}

    // No-op when the target path is empty.
    void write(const OutputTarget& target, const rapidjson::Value& value);

private:
    InvocationContext& ctx_;
};

}  // namespace bulkload
