// SPDX-License-Identifier: MIT

#include "bulkload/transform.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>

namespace bulkload {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::string ascii_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string ascii_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "NA" or "N/A", any case
bool is_not_available(std::string_view s) {
    auto upper = ascii_upper(std::string(s));
    return upper == "NA" || upper == "N/A";
}

// Parse the whole of `text` as a number. Integers stay integral.
Value parse_number(std::string_view text) {
    text = trim_view(text);
    if (text.empty()) return nullptr;
    if (text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-' || text.front() == '+') return nullptr;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();

    int64_t i = 0;
    auto [iend, iec] = std::from_chars(first, last, i);
    if (iec == std::errc{} && iend == last) return i;

    double d = 0;
    auto [dend, dec] = std::from_chars(first, last, d, std::chars_format::general);
    if (dec == std::errc{} && dend == last && std::isfinite(d)) return d;

    return nullptr;
}

}  // namespace

std::optional<Transform> parse_transform(std::string_view name) {
    if (name.empty() || name == "none") return Transform::None;
    if (name == "trim") return Transform::Trim;
    if (name == "upper") return Transform::Upper;
    if (name == "lower") return Transform::Lower;
    if (name == "nz") return Transform::NullIfBlank;
    if (name == "bool01") return Transform::Bool01;
    if (name == "number") return Transform::Number;
    if (name == "string") return Transform::String;
    return std::nullopt;
}

std::string_view transform_name(Transform kind) {
    switch (kind) {
        case Transform::None: return "none";
        case Transform::Trim: return "trim";
        case Transform::Upper: return "upper";
        case Transform::Lower: return "lower";
        case Transform::NullIfBlank: return "nz";
        case Transform::Bool01: return "bool01";
        case Transform::Number: return "number";
        case Transform::String: return "string";
    }
    return "none";
}

Value apply_transform(const Value& value, Transform kind) {
    switch (kind) {
        case Transform::None:
            return value;

        case Transform::Trim:
            if (is_nullish(value)) return value;
            return std::string(trim_view(to_string(value)));

        case Transform::Upper:
            if (is_nullish(value)) return value;
            return ascii_upper(to_string(value));

        case Transform::Lower:
            if (is_nullish(value)) return value;
            return ascii_lower(to_string(value));

        case Transform::NullIfBlank: {
            if (is_nullish(value)) return nullptr;
            auto text = to_string(value);
            auto trimmed = trim_view(text);
            if (trimmed.empty() || is_not_available(trimmed)) return nullptr;
            return value;
        }

        case Transform::Bool01: {
            if (auto* b = std::get_if<bool>(&value)) return int64_t{*b ? 1 : 0};
            if (auto* i = std::get_if<int64_t>(&value)) return int64_t{*i == 1 ? 1 : 0};
            if (auto* d = std::get_if<double>(&value)) return int64_t{*d == 1.0 ? 1 : 0};
            if (auto* s = std::get_if<std::string>(&value)) {
                return int64_t{ascii_lower(*s) == "true" ? 1 : 0};
            }
            return int64_t{0};
        }

        case Transform::Number: {
            if (is_nullish(value)) return nullptr;
            if (auto* b = std::get_if<bool>(&value)) return int64_t{*b ? 1 : 0};
            if (std::holds_alternative<int64_t>(value)) return value;
            if (auto* d = std::get_if<double>(&value)) {
                if (!std::isfinite(*d)) return nullptr;
                return value;
            }
            return parse_number(std::get<std::string>(value));
        }

        case Transform::String:
            if (is_nullish(value)) return nullptr;
            return to_string(value);
    }
    return value;
}

}  // namespace bulkload
