// SPDX-License-Identifier: MIT

#include "bulkload/statement_builder.hpp"
#include "bulkload/identifier.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace bulkload {

namespace {

// Empty id column selects SQLite's implicit rowid
std::string id_expression(const ReturnPolicy& returning) {
    if (returning.id_column.empty()) return "rowid";
    return quote_identifier(returning.id_column);
}

std::string quoted_list(const std::vector<std::string>& names, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += sep;
        out += quote_identifier(names[i]);
    }
    return out;
}

std::string_view insert_verb(ConflictStrategy strategy) {
    switch (strategy) {
        case ConflictStrategy::Ignore: return "INSERT OR IGNORE";
        case ConflictStrategy::Replace: return "INSERT OR REPLACE";
        case ConflictStrategy::None:
        case ConflictStrategy::Upsert:
            return "INSERT";
    }
    return "INSERT";
}

}  // namespace

void validate_plan(const InsertPlan& plan) {
    if (plan.table.empty()) {
        throw BulkLoadError(ErrorCode::ConfigurationError, "Table name is required");
    }
    if (plan.columns.empty()) {
        throw BulkLoadError(ErrorCode::ConfigurationError, "No columns configured");
    }
    if (plan.conflict.strategy == ConflictStrategy::Upsert && plan.conflict.keys.empty()) {
        throw BulkLoadError(ErrorCode::ConfigurationError,
                            "Upsert requires at least one conflict key");
    }

    require_identifier(plan.table);

    std::unordered_set<std::string_view> seen;
    for (const auto& col : plan.columns) {
        require_identifier(col);
        if (col == kReturnedIdAlias) {
            throw BulkLoadError(ErrorCode::ConfigurationError,
                                fmt::format("Column name '{}' is reserved", col));
        }
        if (!seen.insert(col).second) {
            throw BulkLoadError(ErrorCode::ConfigurationError,
                                "Column '" + col + "' is mapped more than once");
        }
    }
    for (const auto& key : plan.conflict.keys) require_identifier(key);
    for (const auto& col : plan.conflict.update_columns) require_identifier(col);
    if (!plan.returning.id_column.empty()) require_identifier(plan.returning.id_column);
}

std::vector<std::string> effective_update_columns(const InsertPlan& plan) {
    std::vector<std::string> out;
    std::copy_if(plan.conflict.update_columns.begin(), plan.conflict.update_columns.end(),
                 std::back_inserter(out), [&](const std::string& c) {
                     return std::find(plan.columns.begin(), plan.columns.end(), c) !=
                            plan.columns.end();
                 });
    return out;
}

std::string build_insert_sql(const InsertPlan& plan, bool supports_returning) {
    validate_plan(plan);

    auto columns = quoted_list(plan.columns, ", ");

    std::string placeholders;
    for (std::size_t i = 0; i < plan.columns.size(); ++i) {
        placeholders += i > 0 ? ", ?" : "?";
    }

    auto sql = fmt::format("{} INTO {} ({}) VALUES ({})",
                           insert_verb(plan.conflict.strategy),
                           quote_identifier(plan.table), columns, placeholders);

    if (plan.conflict.strategy == ConflictStrategy::Upsert) {
        std::string set_clause;
        for (const auto& col : effective_update_columns(plan)) {
            if (!set_clause.empty()) set_clause += ", ";
            auto quoted = quote_identifier(col);
            set_clause += fmt::format("{}=excluded.{}", quoted, quoted);
        }
        // No update columns: self-assign the first key so the clause is a no-op
        if (set_clause.empty()) {
            auto key = quote_identifier(plan.conflict.keys.front());
            set_clause = fmt::format("{}={}", key, key);
        }
        sql += fmt::format(" ON CONFLICT({}) DO UPDATE SET {}",
                           quoted_list(plan.conflict.keys, ","), set_clause);
    }

    if (plan.returning.mode != ReturnMode::None && supports_returning) {
        sql += fmt::format(" RETURNING {} AS {}, {}",
                           id_expression(plan.returning), kReturnedIdAlias, columns);
    }
    return sql;
}

std::string build_id_lookup_sql(const InsertPlan& plan) {
    std::string where;
    for (const auto& key : plan.conflict.keys) {
        if (!where.empty()) where += " AND ";
        where += quote_identifier(key) + "=?";
    }
    return fmt::format("SELECT {} AS id FROM {} WHERE {} LIMIT 1",
                       id_expression(plan.returning), quote_identifier(plan.table), where);
}

}  // namespace bulkload
