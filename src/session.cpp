// SPDX-License-Identifier: MIT

#include "bulkload/session.hpp"
#include <spdlog/spdlog.h>
#include <charconv>
#include <exception>
#include <string>
#include <variant>

namespace bulkload {

namespace {

int parse_component(std::string_view part) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
    if (ec != std::errc{} || ptr == part.data()) return 0;
    return value;
}

}  // namespace

Version parse_version(std::string_view text) {
    int parts[3] = {0, 0, 0};
    for (int& part : parts) {
        if (text.empty()) break;
        auto dot = text.find('.');
        part = parse_component(text.substr(0, dot));
        text = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
    }
    return Version{parts[0], parts[1], parts[2]};
}

asio::awaitable<bool> detect_returning_support(IDatabase& db) {
    std::string text;
    try {
        auto result = co_await db.query("select sqlite_version() v");
        if (!result.empty() && result[0].size() > 0) {
            auto v = result[0].get(0);
            if (auto* s = std::get_if<std::string>(&v)) text = *s;
        }
    } catch (const std::exception& e) {
        spdlog::warn("sqlite version detection failed, assuming no RETURNING: {}", e.what());
        co_return false;
    }

    auto version = parse_version(text);
    bool supported = version >= kMinReturningVersion;
    spdlog::debug("sqlite version '{}' -> {}.{}.{}, RETURNING {}", text, version.major,
                  version.minor, version.patch, supported ? "supported" : "unsupported");
    co_return supported;
}

asio::awaitable<bool> Session::supports_returning() {
    if (!supports_returning_) {
        supports_returning_ = co_await detect_returning_support(*db_);
    }
    co_return *supports_returning_;
}

void Session::close() {
    supports_returning_.reset();
    if (db_) db_->close();
}

}  // namespace bulkload
