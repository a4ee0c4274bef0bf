// SPDX-License-Identifier: MIT

#pragma once

#include <rapidjson/document.h>
#include <string_view>

namespace bulkload {

// Walk a dot-separated path. Objects are indexed by key, arrays by decimal
// index. A missing key or a non-container on the way yields nullptr.
const rapidjson::Value* find_path(const rapidjson::Value& root, std::string_view path);

// Store `value` at a dot-separated path, creating intermediate objects and
// replacing non-object intermediates. `root` becomes an object if it is not one.
void set_path(rapidjson::Value& root, std::string_view path, rapidjson::Value value,
              rapidjson::Document::AllocatorType& alloc);

}  // namespace bulkload
