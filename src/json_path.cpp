// SPDX-License-Identifier: MIT

#include "bulkload/json_path.hpp"
#include <charconv>
#include <cstddef>

namespace bulkload {

namespace {

const rapidjson::Value* step(const rapidjson::Value& node, std::string_view key) {
    if (node.IsObject()) {
        auto it = node.FindMember(
            rapidjson::Value(rapidjson::StringRef(key.data(), key.size())));
        return it == node.MemberEnd() ? nullptr : &it->value;
    }
    if (node.IsArray()) {
        std::size_t index = 0;
        auto [end, ec] = std::from_chars(key.data(), key.data() + key.size(), index);
        if (ec != std::errc{} || end != key.data() + key.size()) return nullptr;
        if (index >= node.Size()) return nullptr;
        return &node[static_cast<rapidjson::SizeType>(index)];
    }
    return nullptr;
}

}  // namespace

const rapidjson::Value* find_path(const rapidjson::Value& root, std::string_view path) {
    if (path.empty()) return nullptr;
    const rapidjson::Value* cur = &root;
    while (true) {
        auto dot = path.find('.');
        auto key = path.substr(0, dot);
        cur = step(*cur, key);
        if (!cur) return nullptr;
        if (dot == std::string_view::npos) return cur;
        path.remove_prefix(dot + 1);
    }
}

void set_path(rapidjson::Value& root, std::string_view path, rapidjson::Value value,
              rapidjson::Document::AllocatorType& alloc) {
    if (path.empty()) return;
    if (!root.IsObject()) root.SetObject();

    rapidjson::Value* cur = &root;
    while (true) {
        auto dot = path.find('.');
        auto key = path.substr(0, dot);
        auto it = cur->FindMember(
            rapidjson::Value(rapidjson::StringRef(key.data(), key.size())));

        if (dot == std::string_view::npos) {
            if (it != cur->MemberEnd()) {
                it->value = std::move(value);
            } else {
                cur->AddMember(rapidjson::Value(key.data(),
                                                static_cast<rapidjson::SizeType>(key.size()),
                                                alloc),
                               std::move(value), alloc);
            }
            return;
        }

        if (it == cur->MemberEnd()) {
            cur->AddMember(rapidjson::Value(key.data(),
                                            static_cast<rapidjson::SizeType>(key.size()),
                                            alloc),
                           rapidjson::Value(rapidjson::kObjectType), alloc);
            cur = &(cur->MemberEnd() - 1)->value;
        } else {
            if (!it->value.IsObject()) it->value.SetObject();
            cur = &it->value;
        }
        path.remove_prefix(dot + 1);
    }
}

}  // namespace bulkload
