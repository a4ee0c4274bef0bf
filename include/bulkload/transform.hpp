// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/value.hpp"
#include <optional>
#include <string_view>

namespace bulkload {

// Normalization applied to a resolved value before it is bound
enum class Transform {
    None,         // passthrough
    Trim,         // string form, surrounding whitespace removed
    Upper,        // string form, upper-cased
    Lower,        // string form, lower-cased
    NullIfBlank,  // null for blank, "NA" or "N/A"
    Bool01,       // 1 for true-ish values, else 0
    Number,       // parsed number or null
    String,       // string form or null
};

// Parse a configuration name ("none", "trim", "upper", "lower", "nz",
// "bool01", "number", "string"). Unknown names yield nullopt.
std::optional<Transform> parse_transform(std::string_view name);

std::string_view transform_name(Transform kind);

// Total over every input: never throws, degrades unexpected input to null.
Value apply_transform(const Value& value, Transform kind);

}  // namespace bulkload
