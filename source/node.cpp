// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// node.cpp - Node equality and printing utilities

#include <configdiff/node.h>
#include <configdiff/serialization.h>

#include <algorithm>
#include <cmath>

namespace configdiff {

namespace {

bool numbers_equal(double a, double b) noexcept
{
    return a == b || (std::isnan(a) && std::isnan(b));
}

bool maps_equal(const NodeMap& a, const NodeMap& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    // O(1) identity check for shared structure
    if (a.impl().root == b.impl().root) {
        return true;
    }
    for (const auto& [key, box] : a) {
        auto* other = b.find(key);
        if (!other) {
            return false;
        }
        if (&box.get() != &other->get() && !(*box == **other)) {
            return false;
        }
    }
    return true;
}

bool vectors_equal(const NodeVector& a, const NodeVector& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        const auto& lhs = a[i];
        const auto& rhs = b[i];
        if (&lhs.get() != &rhs.get() && !(*lhs == *rhs)) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

bool operator==(const Node& a, const Node& b)
{
    if (a.kind() != b.kind()) {
        return false;
    }

    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, double>) {
            return numbers_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, NodeMap>) {
            return maps_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, NodeVector>) {
            return vectors_equal(lhs, rhs);
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

std::string_view kind_name(NodeKind kind) noexcept
{
    switch (kind) {
        case NodeKind::Null:   return "null";
        case NodeKind::Bool:   return "bool";
        case NodeKind::Number: return "number";
        case NodeKind::String: return "string";
        case NodeKind::Object: return "object";
        case NodeKind::Array:  return "array";
    }
    return "unknown";
}

std::vector<std::string> sorted_keys(const NodeMap& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [key, box] : map) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::string node_to_string(const Node& node)
{
    return std::visit([&](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            return to_json(node, true);
        } else if constexpr (std::is_same_v<T, NodeMap>) {
            return "{object:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, NodeVector>) {
            return "[array:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, node.data);
}

void print_node(const Node& node, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');

    std::visit(
        [&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, NodeMap>) {
                for (const auto& key : sorted_keys(arg)) {
                    std::cout << indent << prefix << key << ":\n";
                    print_node(arg.find(key)->get(), "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, NodeVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << indent << prefix << "[" << i << "]:\n";
                    print_node(*arg[i], "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, std::string>) {
                std::cout << indent << prefix << arg << "\n";
            } else {
                std::cout << indent << prefix << node_to_string(node) << "\n";
            }
        },
        node.data);
}

} // namespace configdiff
