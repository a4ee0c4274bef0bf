// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/error.hpp"
#include <cctype>
#include <string>
#include <string_view>

namespace bulkload {

// Letters, digits and underscore, not starting with a digit
inline bool is_valid_identifier(std::string_view ident) {
    if (ident.empty()) return false;
    auto first = static_cast<unsigned char>(ident.front());
    if (!std::isalpha(first) && first != '_') return false;
    for (char c : ident) {
        auto u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && u != '_') return false;
    }
    return true;
}

// Throws BulkLoadError(InvalidIdentifier) unless `ident` is a plain identifier
inline void require_identifier(std::string_view ident) {
    if (!is_valid_identifier(ident)) {
        throw BulkLoadError(ErrorCode::InvalidIdentifier,
                            "Invalid identifier: " + std::string(ident));
    }
}

// Quote an identifier for interpolation into SQL text.
// This is the only way names reach statement text; values are always bound.
inline std::string quote_identifier(std::string_view ident) {
    require_identifier(ident);
    std::string result;
    result.reserve(ident.size() + 2);
    result += '"';
    result += ident;
    result += '"';
    return result;
}

}  // namespace bulkload
