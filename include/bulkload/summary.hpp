// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/value.hpp"
#include <rapidjson/document.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bulkload {

enum class RowAction { Inserted, Updated, Skipped, Errored };

std::string_view row_action_name(RowAction action);

// What happened to one input row
struct RowOutcome {
    RowAction action = RowAction::Skipped;
    std::optional<Value> id;
    std::vector<std::pair<std::string, Value>> data;  // column -> value written
    std::string error;                                 // set for Errored
};

struct Counts {
    int64_t inserted = 0;
    int64_t updated = 0;
    int64_t skipped = 0;
    int64_t errors = 0;
    int64_t total = 0;

    // Holds for every completed run
    bool balanced() const { return inserted + updated + skipped + errors == total; }
};

// Wall-clock milliseconds
struct Timings {
    int64_t open_ms = 0;
    int64_t exec_ms = 0;
    int64_t total_ms = 0;
};

struct ExecutionSummary {
    std::string table;
    Counts counts;
    std::optional<Value> first_id;
    std::optional<Value> last_id;
    std::vector<RowOutcome> returned_rows;
    Timings timings;

    bool ok() const { return counts.errors == 0; }
};

// {ok, table, counts{...}, firstInsertId, lastInsertId, timings{msOpen, msExec, msTotal}}
rapidjson::Value to_json(const ExecutionSummary& summary,
                         rapidjson::Document::AllocatorType& alloc);

// [{action, id, data{column: value}}]
rapidjson::Value to_json(const std::vector<RowOutcome>& rows,
                         rapidjson::Document::AllocatorType& alloc);

}  // namespace bulkload
