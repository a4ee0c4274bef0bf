// SPDX-License-Identifier: MIT

#include "bulkload/value.hpp"
#include <fmt/format.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <cmath>

namespace bulkload {

std::string to_string(const Value& v) {
    struct Visitor {
        std::string operator()(Undefined) const { return "undefined"; }
        std::string operator()(std::nullptr_t) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return fmt::format("{}", i); }
        std::string operator()(double d) const {
            if (std::isnan(d)) return "NaN";
            if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
            // Integral doubles print without a fraction, like 5 rather than 5.0
            if (d == std::trunc(d) && std::fabs(d) < 1e21) {
                return fmt::format("{:.0f}", d);
            }
            return fmt::format("{}", d);
        }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(Visitor{}, v);
}

Value from_json(const rapidjson::Value* json) {
    if (json == nullptr) return Undefined{};
    switch (json->GetType()) {
        case rapidjson::kNullType:
            return nullptr;
        case rapidjson::kFalseType:
            return false;
        case rapidjson::kTrueType:
            return true;
        case rapidjson::kStringType:
            return std::string(json->GetString(), json->GetStringLength());
        case rapidjson::kNumberType:
            if (json->IsInt64()) return json->GetInt64();
            return json->GetDouble();
        case rapidjson::kObjectType:
        case rapidjson::kArrayType:
            return to_json_string(*json);
    }
    return Undefined{};
}

rapidjson::Value to_json(const Value& v, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value out;
    if (auto* b = std::get_if<bool>(&v)) {
        out.SetBool(*b);
    } else if (auto* i = std::get_if<int64_t>(&v)) {
        out.SetInt64(*i);
    } else if (auto* d = std::get_if<double>(&v)) {
        if (std::isfinite(*d)) out.SetDouble(*d);
    } else if (auto* s = std::get_if<std::string>(&v)) {
        out.SetString(s->data(), static_cast<rapidjson::SizeType>(s->size()), alloc);
    }
    return out;
}

std::string to_json_string(const rapidjson::Value& json) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    json.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace bulkload
