// SPDX-License-Identifier: MIT

#include "bulkload/context.hpp"
#include "bulkload/json_path.hpp"
#include "bulkload/transform.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include <string>

namespace bulkload {

const rapidjson::Value* ContextStore::get(std::string_view path) const {
    return find_path(doc_, path);
}

void ContextStore::set(std::string_view path, const rapidjson::Value& value) {
    auto& alloc = doc_.GetAllocator();
    set_path(doc_, path, rapidjson::Value(value, alloc), alloc);
}

template <typename F>
auto TypedValueResolver::with_resolved(SourceKind kind, std::string_view spec,
                                       const Scope& scope, const rapidjson::Value* row,
                                       F&& fn) const {
    rapidjson::Document literal;
    auto& alloc = literal.GetAllocator();

    switch (kind) {
        case SourceKind::Path:
            return fn(row ? find_path(*row, spec) : nullptr);

        case SourceKind::Expression: {
            std::optional<rapidjson::Document> result;
            try {
                result = ctx_.evaluator.evaluate(spec, scope);
            } catch (const std::exception& e) {
                spdlog::debug("expression '{}' yielded no value: {}", spec, e.what());
            }
            return fn(result ? &*result : nullptr);
        }

        case SourceKind::String:
            literal.SetString(spec.data(), static_cast<rapidjson::SizeType>(spec.size()), alloc);
            return fn(&literal);

        case SourceKind::Number: {
            auto n = apply_transform(std::string(spec), Transform::Number);
            if (auto* i = std::get_if<int64_t>(&n)) {
                literal.SetInt64(*i);
            } else if (auto* d = std::get_if<double>(&n)) {
                literal.SetDouble(*d);
            } else {
                return fn(nullptr);
            }
            return fn(&literal);
        }

        case SourceKind::Boolean:
            literal.SetBool(spec == "true");
            return fn(&literal);

        case SourceKind::Env: {
            const char* env = std::getenv(std::string(spec).c_str());
            std::string_view text = env ? env : "";
            literal.SetString(text.data(), static_cast<rapidjson::SizeType>(text.size()), alloc);
            return fn(&literal);
        }

        case SourceKind::Message:
            return fn(find_path(ctx_.message, spec));

        case SourceKind::Flow:
            return fn(ctx_.flow.get(spec));

        case SourceKind::Global:
            return fn(ctx_.global.get(spec));

        case SourceKind::Json:
            literal.Parse(spec.data(), spec.size());
            if (literal.HasParseError()) return fn(nullptr);
            return fn(&literal);
    }
    return fn(nullptr);
}

std::optional<rapidjson::Document> TypedValueResolver::resolve(
        SourceKind kind, std::string_view spec) const {
    Scope scope(ctx_.message);
    return with_resolved(kind, spec, scope, nullptr,
        [](const rapidjson::Value* v) -> std::optional<rapidjson::Document> {
            if (!v) return std::nullopt;
            rapidjson::Document doc;
            doc.CopyFrom(*v, doc.GetAllocator());
            return std::optional<rapidjson::Document>(std::move(doc));
        });
}

Value TypedValueResolver::resolve_for_row(SourceKind kind, std::string_view spec,
                                          const rapidjson::Value& row) const {
    Scope scope(ctx_.message, &row);
    return with_resolved(kind, spec, scope, &row,
        [](const rapidjson::Value* v) { return from_json(v); });
}

void TypedValueWriter::write(const OutputTarget& target, const rapidjson::Value& value) {
    if (target.path.empty()) return;
    switch (target.scope) {
        case OutputScope::Message: {
            auto& alloc = ctx_.message.GetAllocator();
            set_path(ctx_.message, target.path, rapidjson::Value(value, alloc), alloc);
            break;
        }
        case OutputScope::Flow:
            ctx_.flow.set(target.path, value);
            break;
        case OutputScope::Global:
            ctx_.global.set(target.path, value);
            break;
    }
}

}  // namespace bulkload
