// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/config.hpp"
#include "bulkload/context.hpp"
#include "bulkload/value.hpp"
#include <rapidjson/document.h>
#include <string>
#include <vector>

namespace bulkload {

// Maps one input record to the ordered parameter tuple of the insert
// statement: per column, resolve the raw value and apply its transform.
class RowResolver {
public:
    RowResolver(const TypedValueResolver& resolver, std::vector<ColumnMapping> mapping)
        : resolver_(resolver), mapping_(std::move(mapping)) {}

    // Raw value for one column, before its transform
    Value resolve(const rapidjson::Value& row, const ColumnMapping& mapping) const;

    std::vector<Value> map_row(const rapidjson::Value& row) const;

    std::vector<std::string> columns() const;
    const std::vector<ColumnMapping>& mapping() const { return mapping_; }

private:
    const TypedValueResolver& resolver_;
    std::vector<ColumnMapping> mapping_;
};

// One path mapping per key of the first object record, in key order
std::vector<ColumnMapping> auto_map_columns(const rapidjson::Value& records);

}  // namespace bulkload
