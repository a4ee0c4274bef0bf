// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/error.hpp"
#include "bulkload/transform.hpp"
#include <rapidjson/document.h>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bulkload {

/// Where a value is read from.
enum class SourceKind {
    Path,        ///< Dotted path into the current row
    Expression,  ///< Expression evaluated against the message (and row)
    String,      ///< Literal string
    Number,      ///< Literal number
    Boolean,     ///< Literal boolean ("true")
    Env,         ///< Environment variable
    Message,     ///< Dotted path into the message
    Flow,        ///< Dotted path into the flow context store
    Global,      ///< Dotted path into the global context store
    Json,        ///< Literal JSON text
};

/// Parse a source kind name ("path", "jsonata", "expression", "str", "num",
/// "bool", "env", "msg", "flow", "global", "json").
std::optional<SourceKind> parse_source_kind(std::string_view name);
std::string_view source_kind_name(SourceKind kind);

/// A configured value: its kind plus the literal, path or expression text.
struct TypedSource {
    SourceKind kind = SourceKind::String;
    std::string value;
};

/// One target column and where its value comes from.
struct ColumnMapping {
    std::string column;
    SourceKind source_kind = SourceKind::Path;
    std::string source;
    Transform transform = Transform::None;
};

enum class ConflictStrategy {
    None,     ///< Plain INSERT; a conflict is a row error
    Ignore,   ///< INSERT OR IGNORE; a conflict skips the row
    Replace,  ///< INSERT OR REPLACE
    Upsert,   ///< ON CONFLICT(keys) DO UPDATE
};

std::optional<ConflictStrategy> parse_conflict_strategy(std::string_view name);
std::string_view conflict_strategy_name(ConflictStrategy strategy);

struct ConflictPolicy {
    ConflictStrategy strategy = ConflictStrategy::None;
    std::vector<std::string> keys;            ///< Conflict target, required for Upsert
    std::vector<std::string> update_columns;  ///< Columns refreshed on conflict
};

enum class TransactionMode {
    Single,   ///< "all": one transaction for the whole run
    Chunked,  ///< "chunk": one transaction per chunk_size rows
    None,     ///< "off": no transaction, each row autocommits
};

std::optional<TransactionMode> parse_transaction_mode(std::string_view name);
std::string_view transaction_mode_name(TransactionMode mode);

struct TransactionPolicy {
    static constexpr std::size_t kDefaultChunkSize = 500;

    TransactionMode mode = TransactionMode::Single;
    std::size_t chunk_size = kDefaultChunkSize;
    bool continue_on_error = false;
    std::string pre_sql;   ///< Run once before the batch
    std::string post_sql;  ///< Run once after the batch
};

enum class OutputScope { Message, Flow, Global };

std::optional<OutputScope> parse_output_scope(std::string_view name);

/// Destination for a value written back after the run.
struct OutputTarget {
    OutputScope scope = OutputScope::Message;
    std::string path;
};

enum class ReturnMode {
    None,      ///< No per-row results
    Inserted,  ///< Rows written by the statement
    Affected,  ///< Also recover ids of rows updated by an upsert
};

std::optional<ReturnMode> parse_return_mode(std::string_view name);
std::string_view return_mode_name(ReturnMode mode);

struct ReturnPolicy {
    ReturnMode mode = ReturnMode::None;
    std::string id_column = "id";  ///< Empty selects the implicit rowid
    OutputTarget target{OutputScope::Message, "sqlite.rows"};
};

/// Connection settings applied right after open.
struct PragmaConfig {
    bool wal = false;         ///< PRAGMA journal_mode=WAL
    std::string synchronous;  ///< PRAGMA synchronous=<value> when non-empty
    std::string extra;        ///< ';'-separated statements
};

/// Complete configuration of one bulk insert node.
struct NodeConfig {
    std::string name;
    TypedSource database{SourceKind::String, ""};
    PragmaConfig pragmas;
    TypedSource source{SourceKind::Message, "payload"};
    std::string table;
    bool auto_map = false;
    std::vector<ColumnMapping> mapping;
    ConflictPolicy conflict;
    TransactionPolicy transaction;
    OutputTarget summary_target{OutputScope::Message, "sqlite"};
    ReturnPolicy returning;
};

/// Parse a node configuration object. Missing keys take their defaults;
/// unknown enum values and malformed shapes are rejected.
std::expected<NodeConfig, Error> parse_node_config(const rapidjson::Value& json);
std::expected<NodeConfig, Error> parse_node_config(std::string_view json_text);

}  // namespace bulkload
