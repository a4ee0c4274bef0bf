// SPDX-License-Identifier: MIT

#include "bulkload/sqlite.hpp"
#include <spdlog/spdlog.h>
#include <climits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace bulkload {

namespace {

// Concrete IRow implementation backed by copied column data
class SqliteRow : public IRow {
public:
    SqliteRow(std::shared_ptr<const std::vector<std::string>> names, std::vector<Value> values)
        : names_(std::move(names)), values_(std::move(values)) {}

    std::size_t size() const override { return values_.size(); }

    std::string_view column_name(std::size_t col) const override {
        if (col >= names_->size()) return {};
        return (*names_)[col];
    }

    Value get(std::size_t col) const override {
        if (col >= values_.size()) return Undefined{};
        return values_[col];
    }

    bool is_null(std::size_t col) const override {
        return col >= values_.size() || is_nullish(values_[col]);
    }

private:
    std::shared_ptr<const std::vector<std::string>> names_;
    std::vector<Value> values_;
};

std::shared_ptr<const std::vector<std::string>> column_names(sqlite3_stmt* stmt) {
    auto names = std::make_shared<std::vector<std::string>>();
    int ncols = sqlite3_column_count(stmt);
    names->reserve(static_cast<std::size_t>(ncols));
    for (int c = 0; c < ncols; ++c) {
        const char* name = sqlite3_column_name(stmt, c);
        names->emplace_back(name ? name : "");
    }
    return names;
}

Value column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_TEXT: {
            auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            int len = sqlite3_column_bytes(stmt, col);
            return std::string(text ? text : "", static_cast<std::size_t>(len));
        }
        case SQLITE_BLOB: {
            auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            int len = sqlite3_column_bytes(stmt, col);
            return std::string(blob ? blob : "", blob ? static_cast<std::size_t>(len) : 0);
        }
        default:
            return nullptr;
    }
}

std::unique_ptr<IRow> read_row(sqlite3_stmt* stmt,
                               const std::shared_ptr<const std::vector<std::string>>& names) {
    std::vector<Value> values;
    values.reserve(names->size());
    for (std::size_t c = 0; c < names->size(); ++c) {
        values.push_back(column_value(stmt, static_cast<int>(c)));
    }
    return std::make_unique<SqliteRow>(names, std::move(values));
}

// Undefined and null bind as NULL; booleans as 0/1
void bind_params(sqlite3* db, sqlite3_stmt* stmt, std::span<const Value> params) {
    int expected = sqlite3_bind_parameter_count(stmt);
    if (params.size() != static_cast<std::size_t>(expected)) {
        throw std::runtime_error("Parameter count mismatch: statement expects " +
                                 std::to_string(expected) + ", got " +
                                 std::to_string(params.size()));
    }

    for (std::size_t i = 0; i < params.size(); ++i) {
        int idx = static_cast<int>(i) + 1;
        int rc = std::visit([&](const auto& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Undefined> || std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt, idx);
            } else if constexpr (std::is_same_v<T, bool>) {
                return sqlite3_bind_int(stmt, idx, v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt, idx, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt, idx, v);
            } else {
                if (v.size() > static_cast<std::size_t>(INT_MAX)) {
                    throw std::runtime_error("String parameter exceeds maximum size");
                }
                return sqlite3_bind_text(stmt, idx, v.data(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            }
        }, params[i]);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Bind failed: " + std::string(sqlite3_errmsg(db)));
        }
    }
}

// Resets the statement and clears bindings on scope exit
struct ResetGuard {
    sqlite3_stmt* stmt;
    ~ResetGuard() {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
};

struct OperationGuard {
    bool& flag;
    explicit OperationGuard(bool& f) : flag(f) { flag = true; }
    ~OperationGuard() { flag = false; }
};

}  // namespace

// SqliteStatement implementation
//
// The statement holds a shared_ptr to the connection state. sqlite3_close_v2
// defers the real close until every statement is finalized, so finalizing
// after SqliteDatabase::close() is safe; executing is not, and throws.

SqliteStatement::SqliteStatement(std::shared_ptr<SqliteConnectionState> state,
                                 sqlite3_stmt* stmt)
    : state_(std::move(state)), stmt_(stmt) {}

SqliteStatement::~SqliteStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

void SqliteStatement::check_valid() const {
    if (!state_->valid) {
        throw std::runtime_error("Connection closed - database was closed");
    }
    if (!stmt_) {
        throw std::runtime_error("Statement already finalized");
    }
}

asio::awaitable<ExecResult> SqliteStatement::run(std::span<const Value> params) {
    check_valid();
    ResetGuard reset{stmt_};
    sqlite3* db = state_->db;

    bind_params(db, stmt_, params);

    // Zero marks "no row inserted by this statement"
    sqlite3_set_last_insert_rowid(db, 0);

    int rc;
    while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }

    ExecResult result;
    result.changes = sqlite3_changes(db);
    if (auto rowid = sqlite3_last_insert_rowid(db); rowid != 0) {
        result.last_insert_id = rowid;
    }
    co_return result;
}

asio::awaitable<std::unique_ptr<IRow>> SqliteStatement::get(std::span<const Value> params) {
    check_valid();
    ResetGuard reset{stmt_};
    sqlite3* db = state_->db;

    bind_params(db, stmt_, params);

    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE) {
        co_return nullptr;
    }
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }

    auto row = read_row(stmt_, column_names(stmt_));

    // Run to completion so the write is finished before the next row
    while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    co_return std::move(row);
}

asio::awaitable<void> SqliteStatement::finalize() {
    if (stmt_) {
        int rc = sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        // finalize repeats the last step error, which the caller has already seen
        if (rc != SQLITE_OK) {
            spdlog::debug("sqlite3_finalize returned {}", sqlite3_errstr(rc));
        }
    }
    co_return;
}

// SqliteDatabase implementation
//
// Not thread-safe. All operations must be serialized on one thread; the
// in-flight flag only catches accidental overlap.

SqliteDatabase::SqliteDatabase(const SqliteConfig& config)
    : config_(config)
    , state_(std::make_shared<SqliteConnectionState>()) {}

SqliteDatabase::~SqliteDatabase() {
    close();
}

asio::awaitable<void> SqliteDatabase::connect() {
    if (config_.path.empty()) {
        throw std::runtime_error("Connection failed: empty database path");
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(config_.path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close_v2(db);
        throw std::runtime_error("Connection failed: " + err);
    }

    if (config_.busy_timeout_ms > 0) {
        sqlite3_busy_timeout(db, config_.busy_timeout_ms);
    }

    // Populate shared state - statements can use this connection now
    state_->db = db;
    state_->valid = true;
    spdlog::debug("opened sqlite database {} (sqlite {})", config_.path, sqlite3_libversion());

    co_await apply_pragmas();
}

asio::awaitable<void> SqliteDatabase::apply_pragmas() {
    const auto& pragmas = config_.pragmas;
    if (pragmas.wal) {
        co_await execute("PRAGMA journal_mode=WAL");
    }
    if (!pragmas.synchronous.empty()) {
        co_await execute("PRAGMA synchronous=" + pragmas.synchronous);
    }

    std::string_view extra = pragmas.extra;
    while (!extra.empty()) {
        auto end = extra.find(';');
        auto stmt = extra.substr(0, end);
        extra = end == std::string_view::npos ? std::string_view{} : extra.substr(end + 1);

        auto first = stmt.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) continue;
        auto last = stmt.find_last_not_of(" \t\r\n");
        co_await execute(stmt.substr(first, last - first + 1));
    }
}

asio::awaitable<QueryResult> SqliteDatabase::query(std::string_view sql,
                                                   std::span<const Value> params) {
    if (!is_connected()) {
        throw std::runtime_error("Not connected to database");
    }
    check_no_operation_in_flight();
    OperationGuard guard{state_->operation_in_flight};

    sqlite3* db = state_->db;
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, nullptr) !=
        SQLITE_OK) {
        throw std::runtime_error("Query failed: " + std::string(sqlite3_errmsg(db)));
    }
    if (!raw) {
        throw std::runtime_error("Query failed: empty statement");
    }
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt(raw, &sqlite3_finalize);

    bind_params(db, stmt.get(), params);

    auto names = column_names(stmt.get());
    std::vector<std::unique_ptr<IRow>> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        rows.push_back(read_row(stmt.get(), names));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Query failed: " + std::string(sqlite3_errmsg(db)));
    }
    co_return QueryResult{std::move(rows)};
}

asio::awaitable<void> SqliteDatabase::execute(std::string_view sql) {
    if (!is_connected()) {
        throw std::runtime_error("Not connected to database");
    }
    check_no_operation_in_flight();
    OperationGuard guard{state_->operation_in_flight};

    char* errmsg = nullptr;
    int rc = sqlite3_exec(state_->db, std::string(sql).c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string err = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        throw std::runtime_error("Execute failed: " + err);
    }
    co_return;
}

asio::awaitable<std::unique_ptr<IStatement>> SqliteDatabase::prepare(std::string_view sql) {
    if (!is_connected()) {
        throw std::runtime_error("Not connected to database");
    }
    check_no_operation_in_flight();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(state_->db, sql.data(), static_cast<int>(sql.size()), &stmt,
                           nullptr) != SQLITE_OK) {
        throw std::runtime_error("Prepare failed: " + std::string(sqlite3_errmsg(state_->db)));
    }
    if (!stmt) {
        throw std::runtime_error("Prepare failed: empty statement");
    }
    co_return std::make_unique<SqliteStatement>(state_, stmt);
}

bool SqliteDatabase::is_connected() const {
    return state_->valid && state_->db;
}

void SqliteDatabase::close() {
    // Mark connection as invalid BEFORE closing - statements check this flag
    state_->valid = false;
    if (state_->db) {
        sqlite3_close_v2(state_->db);
        state_->db = nullptr;
    }
}

void SqliteDatabase::check_no_operation_in_flight() const {
    if (state_->operation_in_flight) {
        throw std::runtime_error(
            "Concurrent database operation detected. SqliteDatabase only "
            "supports one operation at a time.");
    }
}

asio::awaitable<std::unique_ptr<IDatabase>> open_sqlite(SqliteConfig config) {
    auto db = std::make_unique<SqliteDatabase>(config);
    co_await db->connect();
    co_return std::unique_ptr<IDatabase>(std::move(db));
}

}  // namespace bulkload
