// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/config.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace bulkload {

// Alias under which RETURNING reports the id column
inline constexpr std::string_view kReturnedIdAlias = "__id";

// What one run inserts: the target, its ordered columns and the policies that
// shape the statement.
struct InsertPlan {
    std::string table;
    std::vector<std::string> columns;
    ConflictPolicy conflict;
    ReturnPolicy returning;
};

// Check everything the statement text will contain.
// Throws BulkLoadError: ConfigurationError for a missing table, no columns,
// duplicate columns or an upsert without keys; InvalidIdentifier for any name
// that is not a plain identifier.
void validate_plan(const InsertPlan& plan);

// The single parameterized statement used for every row of a run:
//
//   INSERT [OR IGNORE|OR REPLACE] INTO "t" ("a", "b") VALUES (?, ?)
//     [ON CONFLICT("k") DO UPDATE SET "a"=excluded."a", ...]
//     [RETURNING <id> AS __id, "a", "b"]
//
// RETURNING is emitted only when a return mode is set and the connection
// supports it.
std::string build_insert_sql(const InsertPlan& plan, bool supports_returning);

// SELECT <id> AS id FROM "t" WHERE "k1"=? AND ... LIMIT 1
// Used to recover the id of a row updated by an upsert without RETURNING.
std::string build_id_lookup_sql(const InsertPlan& plan);

// Update columns that are also mapped, in configured order
std::vector<std::string> effective_update_columns(const InsertPlan& plan);

}  // namespace bulkload
