// SPDX-License-Identifier: MIT

#include "bulkload/config.hpp"
#include <rapidjson/error/en.h>
#include <cctype>
#include <charconv>
#include <unordered_set>

namespace bulkload {

namespace {

std::string fmt_key(const char* key) {
    return std::string("'") + key + "'";
}

[[noreturn]] void config_error(const std::string& message) {
    throw BulkLoadError(ErrorCode::ConfigurationError, "Invalid configuration: " + message);
}

const rapidjson::Value* member(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) return nullptr;
    return &it->value;
}

const rapidjson::Value* object_member(const rapidjson::Value& obj, const char* key) {
    auto* v = member(obj, key);
    if (v && !v->IsObject()) config_error(fmt_key(key) + " must be an object");
    return v;
}

std::string get_string(const rapidjson::Value& obj, const char* key, std::string fallback) {
    auto* v = member(obj, key);
    if (!v) return fallback;
    if (v->IsString()) return std::string(v->GetString(), v->GetStringLength());
    // Editors sometimes store numeric fields as numbers
    if (v->IsInt64()) return std::to_string(v->GetInt64());
    config_error(fmt_key(key) + " must be a string");
}

bool get_bool(const rapidjson::Value& obj, const char* key, bool fallback) {
    auto* v = member(obj, key);
    if (!v) return fallback;
    if (!v->IsBool()) config_error(fmt_key(key) + " must be a boolean");
    return v->GetBool();
}

std::vector<std::string> get_string_list(const rapidjson::Value& obj, const char* key) {
    std::vector<std::string> out;
    auto* v = member(obj, key);
    if (!v) return out;
    if (!v->IsArray()) config_error(fmt_key(key) + " must be an array of strings");
    for (const auto& item : v->GetArray()) {
        if (!item.IsString()) config_error(fmt_key(key) + " must be an array of strings");
        if (item.GetStringLength() == 0) continue;
        out.emplace_back(item.GetString(), item.GetStringLength());
    }
    return out;
}

std::size_t get_chunk_size(const rapidjson::Value& obj) {
    auto* v = member(obj, "chunkSize");
    if (!v) return TransactionPolicy::kDefaultChunkSize;

    int64_t n = 0;
    if (v->IsInt64()) {
        n = v->GetInt64();
    } else if (v->IsString()) {
        std::string_view s(v->GetString(), v->GetStringLength());
        if (s.empty()) return TransactionPolicy::kDefaultChunkSize;
        auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
        if (ec != std::errc{} || end != s.data() + s.size()) {
            config_error("'chunkSize' must be a positive integer");
        }
    } else {
        config_error("'chunkSize' must be a positive integer");
    }
    if (n <= 0) config_error("'chunkSize' must be a positive integer");
    return static_cast<std::size_t>(n);
}

template <typename Enum>
Enum parse_enum(std::optional<Enum> parsed, const char* key, const std::string& name) {
    if (!parsed) config_error("unknown " + fmt_key(key) + " value '" + name + "'");
    return *parsed;
}

bool valid_synchronous(std::string_view value) {
    std::string upper(value);
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return upper == "OFF" || upper == "NORMAL" || upper == "FULL" || upper == "EXTRA" ||
           upper == "0" || upper == "1" || upper == "2" || upper == "3";
}

TypedSource parse_typed(const rapidjson::Value& obj, const char* type_key, const char* value_key,
                        TypedSource fallback) {
    TypedSource out;
    auto type = get_string(obj, type_key, std::string(source_kind_name(fallback.kind)));
    out.kind = parse_enum(parse_source_kind(type), type_key, type);
    if (out.kind == SourceKind::Path) {
        config_error(fmt_key(type_key) + " cannot be 'path' outside a column mapping");
    }
    out.value = get_string(obj, value_key, fallback.value);
    return out;
}

OutputTarget parse_output(const rapidjson::Value* obj, OutputTarget fallback) {
    if (!obj) return fallback;
    OutputTarget out;
    auto scope = get_string(*obj, "pathType", "msg");
    out.scope = parse_enum(parse_output_scope(scope), "pathType", scope);
    out.path = get_string(*obj, "path", fallback.path);
    return out;
}

ColumnMapping parse_mapping_entry(const rapidjson::Value& entry) {
    if (!entry.IsObject()) config_error("'mapping' entries must be objects");
    ColumnMapping m;
    m.column = get_string(entry, "column", "");
    if (m.column.empty()) config_error("mapping entry without 'column'");
    auto kind = get_string(entry, "srcType", "path");
    m.source_kind = parse_enum(parse_source_kind(kind), "srcType", kind);
    m.source = get_string(entry, "src", "");
    auto transform = get_string(entry, "transform", "none");
    m.transform = parse_enum(parse_transform(transform), "transform", transform);
    return m;
}

NodeConfig parse_node(const rapidjson::Value& json) {
    if (!json.IsObject()) config_error("node configuration must be an object");

    NodeConfig cfg;
    cfg.name = get_string(json, "name", "");
    cfg.database = parse_typed(json, "dbPathType", "dbPath", {SourceKind::String, ""});

    if (auto* p = object_member(json, "pragmas")) {
        cfg.pragmas.wal = get_bool(*p, "wal", false);
        cfg.pragmas.synchronous = get_string(*p, "sync", "");
        cfg.pragmas.extra = get_string(*p, "extra", "");
        if (!cfg.pragmas.synchronous.empty() && !valid_synchronous(cfg.pragmas.synchronous)) {
            config_error("unknown 'sync' value '" + cfg.pragmas.synchronous + "'");
        }
    }

    cfg.source = parse_typed(json, "sourceType", "source", {SourceKind::Message, "payload"});
    cfg.table = get_string(json, "table", "");
    cfg.auto_map = get_bool(json, "autoMap", false);

    if (auto* mapping = member(json, "mapping")) {
        if (!mapping->IsArray()) config_error("'mapping' must be an array");
        std::unordered_set<std::string> seen;
        for (const auto& entry : mapping->GetArray()) {
            auto m = parse_mapping_entry(entry);
            if (!seen.insert(m.column).second) {
                config_error("column '" + m.column + "' is mapped more than once");
            }
            cfg.mapping.push_back(std::move(m));
        }
    }

    if (auto* c = object_member(json, "conflict")) {
        auto strategy = get_string(*c, "strategy", "none");
        cfg.conflict.strategy = parse_enum(parse_conflict_strategy(strategy), "strategy", strategy);
        cfg.conflict.keys = get_string_list(*c, "keys");
        cfg.conflict.update_columns = get_string_list(*c, "updateCols");
    }
    if (cfg.conflict.strategy == ConflictStrategy::Upsert && cfg.conflict.keys.empty()) {
        config_error("upsert requires at least one conflict key");
    }

    if (auto* tx = object_member(json, "tx")) {
        auto mode = get_string(*tx, "mode", "all");
        cfg.transaction.mode = parse_enum(parse_transaction_mode(mode), "mode", mode);
        cfg.transaction.chunk_size = get_chunk_size(*tx);
        cfg.transaction.continue_on_error = get_bool(*tx, "continueOnError", false);
        cfg.transaction.pre_sql = get_string(*tx, "preSQL", "");
        cfg.transaction.post_sql = get_string(*tx, "postSQL", "");
    }

    cfg.summary_target = parse_output(object_member(json, "out"),
                                      {OutputScope::Message, "sqlite"});

    if (auto* r = object_member(json, "ret")) {
        auto mode = get_string(*r, "mode", "none");
        cfg.returning.mode = parse_enum(parse_return_mode(mode), "mode", mode);
        cfg.returning.id_column = get_string(*r, "idCol", "id");
        cfg.returning.target = parse_output(r, {OutputScope::Message, "sqlite.rows"});
    }
    return cfg;
}

}  // namespace

std::optional<SourceKind> parse_source_kind(std::string_view name) {
    if (name == "path") return SourceKind::Path;
    if (name == "jsonata" || name == "expression") return SourceKind::Expression;
    if (name == "str") return SourceKind::String;
    if (name == "num") return SourceKind::Number;
    if (name == "bool") return SourceKind::Boolean;
    if (name == "env") return SourceKind::Env;
    if (name == "msg") return SourceKind::Message;
    if (name == "flow") return SourceKind::Flow;
    if (name == "global") return SourceKind::Global;
    if (name == "json") return SourceKind::Json;
    return std::nullopt;
}

std::string_view source_kind_name(SourceKind kind) {
    switch (kind) {
        case SourceKind::Path: return "path";
        case SourceKind::Expression: return "jsonata";
        case SourceKind::String: return "str";
        case SourceKind::Number: return "num";
        case SourceKind::Boolean: return "bool";
        case SourceKind::Env: return "env";
        case SourceKind::Message: return "msg";
        case SourceKind::Flow: return "flow";
        case SourceKind::Global: return "global";
        case SourceKind::Json: return "json";
    }
    return "str";
}

std::optional<ConflictStrategy> parse_conflict_strategy(std::string_view name) {
    if (name.empty() || name == "none") return ConflictStrategy::None;
    if (name == "ignore") return ConflictStrategy::Ignore;
    if (name == "replace") return ConflictStrategy::Replace;
    if (name == "upsert") return ConflictStrategy::Upsert;
    return std::nullopt;
}

std::string_view conflict_strategy_name(ConflictStrategy strategy) {
    switch (strategy) {
        case ConflictStrategy::None: return "none";
        case ConflictStrategy::Ignore: return "ignore";
        case ConflictStrategy::Replace: return "replace";
        case ConflictStrategy::Upsert: return "upsert";
    }
    return "none";
}

std::optional<TransactionMode> parse_transaction_mode(std::string_view name) {
    if (name.empty() || name == "all") return TransactionMode::Single;
    if (name == "chunk") return TransactionMode::Chunked;
    if (name == "off") return TransactionMode::None;
    return std::nullopt;
}

std::string_view transaction_mode_name(TransactionMode mode) {
    switch (mode) {
        case TransactionMode::Single: return "all";
        case TransactionMode::Chunked: return "chunk";
        case TransactionMode::None: return "off";
    }
    return "all";
}

std::optional<OutputScope> parse_output_scope(std::string_view name) {
    if (name.empty() || name == "msg") return OutputScope::Message;
    if (name == "flow") return OutputScope::Flow;
    if (name == "global") return OutputScope::Global;
    return std::nullopt;
}

std::optional<ReturnMode> parse_return_mode(std::string_view name) {
    if (name.empty() || name == "none") return ReturnMode::None;
    if (name == "inserted") return ReturnMode::Inserted;
    if (name == "affected") return ReturnMode::Affected;
    return std::nullopt;
}

std::string_view return_mode_name(ReturnMode mode) {
    switch (mode) {
        case ReturnMode::None: return "none";
        case ReturnMode::Inserted: return "inserted";
        case ReturnMode::Affected: return "affected";
    }
    return "none";
}

std::expected<NodeConfig, Error> parse_node_config(const rapidjson::Value& json) {
    try {
        return parse_node(json);
    } catch (const BulkLoadError& e) {
        return std::unexpected(e.error());
    }
}

std::expected<NodeConfig, Error> parse_node_config(std::string_view json_text) {
    rapidjson::Document doc;
    doc.Parse(json_text.data(), json_text.size());
    if (doc.HasParseError()) {
        return std::unexpected(Error{
            ErrorCode::ConfigurationError,
            std::string("Invalid configuration: ") +
                rapidjson::GetParseError_En(doc.GetParseError()) +
                " at offset " + std::to_string(doc.GetErrorOffset())});
    }
    return parse_node_config(doc);
}

}  // namespace bulkload
