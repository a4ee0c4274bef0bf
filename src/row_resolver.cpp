// SPDX-License-Identifier: MIT

#include "bulkload/row_resolver.hpp"
#include "bulkload/transform.hpp"

namespace bulkload {

Value RowResolver::resolve(const rapidjson::Value& row, const ColumnMapping& mapping) const {
    if (mapping.source_kind == SourceKind::Path && mapping.source.empty()) {
        return Undefined{};
    }
    return resolver_.resolve_for_row(mapping.source_kind, mapping.source, row);
}

std::vector<Value> RowResolver::map_row(const rapidjson::Value& row) const {
    std::vector<Value> params;
    params.reserve(mapping_.size());
    for (const auto& m : mapping_) {
        params.push_back(apply_transform(resolve(row, m), m.transform));
    }
    return params;
}

std::vector<std::string> RowResolver::columns() const {
    std::vector<std::string> out;
    out.reserve(mapping_.size());
    for (const auto& m : mapping_) out.push_back(m.column);
    return out;
}

std::vector<ColumnMapping> auto_map_columns(const rapidjson::Value& records) {
    std::vector<ColumnMapping> mapping;
    if (!records.IsArray()) return mapping;

    for (const auto& record : records.GetArray()) {
        if (!record.IsObject()) continue;
        for (const auto& member : record.GetObject()) {
            std::string key(member.name.GetString(), member.name.GetStringLength());
            mapping.push_back(ColumnMapping{
                .column = key,
                .source_kind = SourceKind::Path,
                .source = key,
                .transform = Transform::None,
            });
        }
        break;
    }
    return mapping;
}

}  // namespace bulkload
