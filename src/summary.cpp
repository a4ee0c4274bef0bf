// SPDX-License-Identifier: MIT

#include "bulkload/summary.hpp"

namespace bulkload {

namespace {

rapidjson::Value string_value(std::string_view s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.data(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

rapidjson::Value optional_id(const std::optional<Value>& id,
                             rapidjson::Document::AllocatorType& alloc) {
    if (!id) return rapidjson::Value(rapidjson::kNullType);
    return to_json(*id, alloc);
}

}  // namespace

std::string_view row_action_name(RowAction action) {
    switch (action) {
        case RowAction::Inserted: return "inserted";
        case RowAction::Updated: return "updated";
        case RowAction::Skipped: return "skipped";
        case RowAction::Errored: return "errored";
    }
    return "unknown";
}

rapidjson::Value to_json(const ExecutionSummary& summary,
                         rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value counts(rapidjson::kObjectType);
    counts.AddMember("inserted", summary.counts.inserted, alloc);
    counts.AddMember("updated", summary.counts.updated, alloc);
    counts.AddMember("skipped", summary.counts.skipped, alloc);
    counts.AddMember("errors", summary.counts.errors, alloc);
    counts.AddMember("total", summary.counts.total, alloc);

    rapidjson::Value timings(rapidjson::kObjectType);
    timings.AddMember("msOpen", summary.timings.open_ms, alloc);
    timings.AddMember("msExec", summary.timings.exec_ms, alloc);
    timings.AddMember("msTotal", summary.timings.total_ms, alloc);

    rapidjson::Value out(rapidjson::kObjectType);
    out.AddMember("ok", summary.ok(), alloc);
    out.AddMember("table", string_value(summary.table, alloc), alloc);
    out.AddMember("counts", counts, alloc);
    out.AddMember("firstInsertId", optional_id(summary.first_id, alloc), alloc);
    out.AddMember("lastInsertId", optional_id(summary.last_id, alloc), alloc);
    out.AddMember("timings", timings, alloc);
    return out;
}

rapidjson::Value to_json(const std::vector<RowOutcome>& rows,
                         rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value out(rapidjson::kArrayType);
    out.Reserve(static_cast<rapidjson::SizeType>(rows.size()), alloc);
    for (const auto& row : rows) {
        rapidjson::Value data(rapidjson::kObjectType);
        for (const auto& [column, value] : row.data) {
            data.AddMember(string_value(column, alloc), to_json(value, alloc), alloc);
        }

        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("action", string_value(row_action_name(row.action), alloc), alloc);
        entry.AddMember("id", optional_id(row.id, alloc), alloc);
        entry.AddMember("data", data, alloc);
        out.PushBack(entry, alloc);
    }
    return out;
}

}  // namespace bulkload
