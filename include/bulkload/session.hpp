// SPDX-License-Identifier: MIT

#pragma once

#include "bulkload/database.hpp"
#include <asio/awaitable.hpp>
#include <compare>
#include <memory>
#include <optional>
#include <string_view>

namespace bulkload {

struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;

    auto operator<=>(const Version&) const = default;
};

// First SQLite release with INSERT ... RETURNING
inline constexpr Version kMinReturningVersion{3, 35, 0};

// Parse "major.minor.patch". Missing or non-numeric components are 0;
// a component's leading digits are used ("35rc1" -> 35).
Version parse_version(std::string_view text);

// Query sqlite_version() and compare against kMinReturningVersion.
// Any failure is logged and reported as unsupported.
asio::awaitable<bool> detect_returning_support(IDatabase& db);

// One open connection owned by one run, plus what has been learned about it.
// The capability flag is set on first detection and cleared on close.
class Session {
public:
    explicit Session(std::unique_ptr<IDatabase> db) : db_(std::move(db)) {}
    ~Session() { close(); }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    IDatabase& db() { return *db_; }

    asio::awaitable<bool> supports_returning();
    bool capability_known() const { return supports_returning_.has_value(); }

    void close();

private:
    std::unique_ptr<IDatabase> db_;
    std::optional<bool> supports_returning_;
};

}  // namespace bulkload
