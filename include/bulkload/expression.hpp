// SPDX-License-Identifier: MIT

#pragma once

#include <rapidjson/document.h>
#include <optional>
#include <string_view>

namespace bulkload {

// Names visible to an expression: the message's top-level properties, plus
// `row` bound to the current record while mapping rows.
class Scope {
public:
    explicit Scope(const rapidjson::Value& message, const rapidjson::Value* row = nullptr)
        : message_(message), row_(row) {}

    // nullptr when the name is not bound
    const rapidjson::Value* find(std::string_view name) const;

    const rapidjson::Value& message() const { return message_; }
    const rapidjson::Value* row() const { return row_; }

private:
    const rapidjson::Value& message_;
    const rapidjson::Value* row_;
};

// Expression language used by "jsonata" sources
class IExpressionEvaluator {
public:
    virtual ~IExpressionEvaluator() = default;

    // Returns nullopt when the expression yields no value.
    // Throws BulkLoadError(ExpressionError) when the text does not parse.
    virtual std::optional<rapidjson::Document> evaluate(
        std::string_view expression, const Scope& scope) const = 0;
};

// Path expressions with literals and string concatenation:
//
//   expr := term ('&' term)*
//   term := path | 'text' | "text" | number | true | false | null | '(' expr ')'
//   path := name ('.' name | '[' index ']')*
//   name := [A-Za-z_$][A-Za-z0-9_$]* | `any text`
//
// A lone term yields the referenced value unchanged. '&' joins the string
// forms of its operands; a missing operand contributes "".
class PathExpressionEvaluator : public IExpressionEvaluator {
public:
    std::optional<rapidjson::Document> evaluate(
        std::string_view expression, const Scope& scope) const override;
};

}  // namespace bulkload
