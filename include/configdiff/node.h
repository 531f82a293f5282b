// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node.h
/// @brief Normalized, format-agnostic configuration tree.
///
/// Every parser produces a Node tree and the differ consumes nothing else.
/// A Node is exactly one of six kinds:
/// - Null
/// - Bool    (bool)
/// - Number  (double; integers and floats are not distinguished)
/// - String  (std::string)
/// - Object  (NodeMap: string key -> child, no inherent order)
/// - Array   (NodeVector: ordered children)
///
/// Containers are immer persistent structures, so copying a Node or a
/// subtree only bumps reference counts and trees can be shared freely
/// between threads once built.
///
/// "Absent" (no value at a path) is NOT a Node. APIs that need it take a
/// `const Node*` (nullptr) or a `std::optional<NodeBox>`.

#pragma once

#include "configdiff_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace configdiff {

namespace detail {

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CONFIGDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CONFIGDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

inline void log_path_note(
    std::string_view func,
    std::string_view path,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CONFIGDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] " << path << ": " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)path;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

/// Kind tag. The enumerator order matches the alternative order of
/// Node::data, so kind() is a direct read of the variant index.
enum class NodeKind : std::uint8_t {
    Null = 0,
    Bool,
    Number,
    String,
    Object,
    Array,
};

struct Node;

using node_memory_policy = immer::default_memory_policy;

using NodeBox    = immer::box<Node, node_memory_policy>;
using NodeMap    = immer::map<std::string,
                              NodeBox,
                              std::hash<std::string>,
                              std::equal_to<std::string>,
                              node_memory_policy>;
using NodeVector = immer::vector<NodeBox, node_memory_policy>;

struct CONFIGDIFF_API Node
{
    std::variant<std::monostate,
                 bool,
                 double,
                 std::string,
                 NodeMap,
                 NodeVector>
        data;

    constexpr Node() noexcept : data(std::monostate{}) {}
    constexpr Node(std::nullptr_t) noexcept : data(std::monostate{}) {}
    constexpr Node(bool v) noexcept : data(v) {}
    constexpr Node(double v) noexcept : data(v) {}

    /// All numeric sources collapse to double
    template <typename T>
        requires(std::integral<T> && !std::same_as<T, bool>) || std::same_as<T, float>
    constexpr Node(T v) noexcept : data(static_cast<double>(v)) {}

    Node(const std::string& v) : data(v) {}
    Node(std::string&& v) noexcept : data(std::move(v)) {}
    Node(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Node(const char* v) : data(std::in_place_type<std::string>, v) {}
    Node(NodeMap v) : data(std::move(v)) {}
    Node(NodeVector v) : data(std::move(v)) {}

    static Node object(std::initializer_list<std::pair<std::string, Node>> init) {
        auto t = NodeMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, NodeBox{val});
        }
        return Node{t.persistent()};
    }

    static Node array(std::initializer_list<Node> init) {
        auto t = NodeVector{}.transient();
        for (const auto& val : init) {
            t.push_back(NodeBox{val});
        }
        return Node{t.persistent()};
    }

    [[nodiscard]] NodeKind kind() const noexcept {
        return static_cast<NodeKind>(data.index());
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return kind() == NodeKind::Null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == NodeKind::Bool; }
    [[nodiscard]] bool is_number() const noexcept { return kind() == NodeKind::Number; }
    [[nodiscard]] bool is_string() const noexcept { return kind() == NodeKind::String; }
    [[nodiscard]] bool is_object() const noexcept { return kind() == NodeKind::Object; }
    [[nodiscard]] bool is_array() const noexcept { return kind() == NodeKind::Array; }
    [[nodiscard]] bool is_scalar() const noexcept {
        return is_bool() || is_number() || is_string();
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] NodeMap as_object(NodeMap default_val = {}) const {
        if (auto* p = get_if<NodeMap>()) return *p;
        return default_val;
    }

    [[nodiscard]] NodeVector as_array(NodeVector default_val = {}) const {
        if (auto* p = get_if<NodeVector>()) return *p;
        return default_val;
    }

    /// Member lookup without copying; nullptr when missing or not an object
    [[nodiscard]] const Node* find(const std::string& key) const {
        if (auto* m = get_if<NodeMap>()) {
            if (auto* found = m->find(key)) return &found->get();
        }
        return nullptr;
    }

    [[nodiscard]] Node at(const std::string& key) const {
        if (auto* found = find(key)) return *found;
        detail::log_key_error("Node::at", key, "not found or not an object");
        return Node{};
    }

    [[nodiscard]] Node at(std::size_t index) const {
        if (auto* v = get_if<NodeVector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Node::at", index, "out of range or not an array");
        return Node{};
    }

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<NodeMap>()) return m->size();
        if (auto* v = get_if<NodeVector>()) return v->size();
        return 0;
    }
};

static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(NodeKind::Object),
                                                        decltype(Node::data)>, NodeMap>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(NodeKind::Array),
                                                        decltype(Node::data)>, NodeVector>);

/// Deep structural equality. Numbers compare with ==, except that two NaNs
/// are equal so that every tree equals itself.
[[nodiscard]] CONFIGDIFF_API bool operator==(const Node& a, const Node& b);

// ============================================================
// Utility functions
// ============================================================

[[nodiscard]] CONFIGDIFF_API std::string_view kind_name(NodeKind kind) noexcept;

/// Keys of an object in ascending byte order
[[nodiscard]] CONFIGDIFF_API std::vector<std::string> sorted_keys(const NodeMap& map);

/// Short human-readable rendering ("42", "\"text\"", "{object:3}", "[array:2]")
[[nodiscard]] CONFIGDIFF_API std::string node_to_string(const Node& node);

/// Print a tree with indentation (object keys in sorted order)
CONFIGDIFF_API void print_node(const Node& node, const std::string& prefix = "", std::size_t depth = 0);

} // namespace configdiff
