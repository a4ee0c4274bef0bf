// Copyright 2026 Kai Wang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <rapidjson/document.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace bulkload {

// Marker for "no value": a missing path, a failed expression, an unset source.
// Binds as SQL NULL but is kept distinct from null until then.
struct Undefined {
    bool operator==(const Undefined&) const = default;
};

// Scalar carried from resolution through transforms into statement parameters
using Value = std::variant<Undefined, std::nullptr_t, bool, int64_t, double, std::string>;

inline bool is_undefined(const Value& v) {
    return std::holds_alternative<Undefined>(v);
}

// True for undefined and null
inline bool is_nullish(const Value& v) {
    return is_undefined(v) || std::holds_alternative<std::nullptr_t>(v);
}

// String form: strings as-is, booleans as true/false, numbers in shortest
// round-trip form, null as "null", undefined as "undefined".
std::string to_string(const Value& v);

// Convert a JSON node. nullptr yields undefined; objects and arrays are
// carried as compact JSON text.
Value from_json(const rapidjson::Value* json);

// Convert to JSON. Undefined becomes null.
rapidjson::Value to_json(const Value& v, rapidjson::Document::AllocatorType& alloc);

// Compact JSON text of a node
std::string to_json_string(const rapidjson::Value& json);

}  // namespace bulkload
