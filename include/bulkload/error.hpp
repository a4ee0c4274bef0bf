// SPDX-License-Identifier: MIT

// include/bulkload/error.hpp
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bulkload {

struct ExecutionSummary;

/// Error codes for configuration, connection and execution failures.
enum class ErrorCode {
    // Pre-execution
    InvalidIdentifier,       ///< Table or column name is not a plain SQL identifier
    ConfigurationError,      ///< Missing table, empty column set, unknown enum value

    // Connection
    ConnectionError,         ///< Database could not be opened, configured or prepared

    // Execution
    BracketStatementError,   ///< preSQL or postSQL failed
    RowExecutionError,       ///< One row's statement failed
    ChunkAbortError,         ///< Row or transaction failure that aborted the run

    // Resolution
    ExpressionError,         ///< Expression text could not be parsed
};

/// Error payload for expected-style returns.
struct Error {
    ErrorCode code;          ///< Classified error code
    std::string message;     ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "config", "execution").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidIdentifier:
        case ErrorCode::ConfigurationError:
            return "config";
        case ErrorCode::ConnectionError:
            return "connection";
        case ErrorCode::BracketStatementError:
        case ErrorCode::RowExecutionError:
        case ErrorCode::ChunkAbortError:
            return "execution";
        case ErrorCode::ExpressionError:
            return "expression";
    }
    return "unknown";
}

/// Return the enumerator name of an error code.
constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidIdentifier: return "InvalidIdentifier";
        case ErrorCode::ConfigurationError: return "ConfigurationError";
        case ErrorCode::ConnectionError: return "ConnectionError";
        case ErrorCode::BracketStatementError: return "BracketStatementError";
        case ErrorCode::RowExecutionError: return "RowExecutionError";
        case ErrorCode::ChunkAbortError: return "ChunkAbortError";
        case ErrorCode::ExpressionError: return "ExpressionError";
    }
    return "Unknown";
}

/// Exception thrown by the engine for every fatal condition.
///
/// Aborted runs attach the summary of the work that was durable when the
/// run stopped (committed rows plus the error count of the failed scope).
class BulkLoadError : public std::runtime_error {
public:
    BulkLoadError(ErrorCode code, const std::string& message,
                  std::shared_ptr<const ExecutionSummary> partial = nullptr)
        : std::runtime_error(message)
        , code_(code)
        , partial_(std::move(partial)) {}

    ErrorCode code() const { return code_; }
    Error error() const { return Error{code_, what()}; }

    /// Summary of durable work for aborted runs, nullptr otherwise.
    const ExecutionSummary* partial_summary() const { return partial_.get(); }

private:
    ErrorCode code_;
    std::shared_ptr<const ExecutionSummary> partial_;
};

}  // namespace bulkload
