// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// diff.cpp - Structural differ over Node trees

#include <configdiff/diff.h>
#include <configdiff/coercion.h>

#include <immer/algorithm.hpp>

#include <algorithm>
#include <iostream>
#include <unordered_map>
#include <utility>

namespace configdiff {

std::string_view change_type_name(ChangeType type) noexcept
{
    switch (type) {
        case ChangeType::Add:    return "add";
        case ChangeType::Remove: return "remove";
        case ChangeType::Modify: return "modify";
        case ChangeType::Move:   return "move";
    }
    return "unknown";
}

namespace {

/// Elements of one side of a keyed array, indexed by identity value
struct KeyedIndex {
    std::unordered_map<std::string, const NodeBox*> by_key;
    std::vector<std::string> order;  // first appearance
};

void index_keyed(const NodeVector& vec, const std::string& key_field,
                 const std::string& path, KeyedIndex& index)
{
    for (std::size_t i = 0; i < vec.size(); ++i) {
        const NodeBox& elem = vec[i];
        const Node* field = elem->find(key_field);
        const auto* key = field ? field->get_if<std::string>() : nullptr;
        if (!key || key->empty()) {
            detail::log_path_note("diff_keyed_array", join_index(path, i),
                                  "element has no string '" + key_field + "', excluded");
            continue;
        }

        const bool inserted = index.by_key.insert_or_assign(*key, &elem).second;
        if (inserted) {
            index.order.push_back(*key);
        } else {
            detail::log_path_note("diff_keyed_array", join_keyed(path, key_field, *key),
                                  "duplicate identity, last element wins");
        }
    }
}

} // anonymous namespace

// ============================================================
// DiffCollector
// ============================================================

DiffCollector::DiffCollector(DiffOptions options)
    : options_(std::move(options))
{
    options_.validate();
    ignore_ = PathMatcher(options_.ignore_paths);
}

void DiffCollector::diff(const Node* old_root, const Node* new_root)
{
    changes_.clear();

    std::optional<NodeBox> old_box;
    std::optional<NodeBox> new_box;
    if (old_root) {
        old_box.emplace(*old_root);
    }
    if (new_root) {
        new_box.emplace(*new_root);
    }

    std::string path{root_path};
    path.reserve(64);
    diff_node(old_box ? &*old_box : nullptr, new_box ? &*new_box : nullptr, path);

    if (options_.stable_order) {
        std::stable_sort(changes_.begin(), changes_.end(),
                         [](const Change& a, const Change& b) { return a.path < b.path; });
    }
}

void DiffCollector::diff(const Node& old_root, const Node& new_root)
{
    diff(&old_root, &new_root);
}

std::vector<Change> DiffCollector::take_changes()
{
    return std::exchange(changes_, {});
}

void DiffCollector::clear()
{
    changes_.clear();
}

void DiffCollector::print_changes(std::ostream& os) const
{
    configdiff::print_changes(changes_, os);
}

void DiffCollector::emit(ChangeType type, const std::string& path,
                         const NodeBox* old_box, const NodeBox* new_box)
{
    std::optional<NodeBox> old_value;
    std::optional<NodeBox> new_value;
    if (old_box) {
        old_value = *old_box;
    }
    if (new_box) {
        new_value = *new_box;
    }
    changes_.emplace_back(type, path, std::move(old_value), std::move(new_value));
}

void DiffCollector::diff_node(const NodeBox* old_box, const NodeBox* new_box, std::string& path)
{
    if (stop_at_first_ && !changes_.empty()) {
        return;
    }
    if (!ignore_.empty()) {
        if (ignore_.first_match(path)) {
            return;
        }
    }

    if (!old_box && !new_box) {
        return;
    }
    if (!old_box) {
        emit(ChangeType::Add, path, nullptr, new_box);
        return;
    }
    if (!new_box) {
        emit(ChangeType::Remove, path, old_box, nullptr);
        return;
    }

    // Shared subtree, nothing below can differ
    if (&old_box->get() == &new_box->get()) {
        return;
    }

    const Node& old_node = *old_box;
    const Node& new_node = *new_box;

    if (old_node.kind() != new_node.kind()) [[unlikely]] {
        if (!can_coerce(old_node, new_node, options_.coercions)) {
            emit(ChangeType::Modify, path, old_box, new_box);
        }
        return;
    }

    std::visit([&](const auto& old_arg) {
        using T = std::decay_t<decltype(old_arg)>;
        const auto& new_arg = std::get<T>(new_node.data);

        if constexpr (std::is_same_v<T, NodeMap>) {
            diff_object(old_arg, new_arg, path);
        } else if constexpr (std::is_same_v<T, NodeVector>) {
            if (const auto* key_field = options_.array_key_for(path)) {
                diff_keyed_array(old_arg, new_arg, *key_field, path);
            } else {
                diff_array(old_arg, new_arg, path);
            }
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            // Both null, no change
        } else {
            // Node equality treats NaN as equal to itself
            if (!(old_node == new_node)) {
                emit(ChangeType::Modify, path, old_box, new_box);
            }
        }
    }, old_node.data);
}

void DiffCollector::diff_object(const NodeMap& old_map, const NodeMap& new_map, std::string& path)
{
    const auto base_size = path.size();

    auto visit_key = [&](const std::string& key) {
        append_key(path, key);
        diff_node(old_map.find(key), new_map.find(key), path);
        path.resize(base_size);
    };

    if (options_.stable_order) {
        auto keys = sorted_keys(old_map);
        for (const auto& [key, box] : new_map) {
            if (!old_map.count(key)) {
                keys.push_back(key);
            }
        }
        std::sort(keys.begin(), keys.end());
        for (const auto& key : keys) {
            visit_key(key);
        }
        return;
    }

    auto map_differ = immer::make_differ(
        // added
        [&](const NodeMap::value_type& added_kv) {
            append_key(path, added_kv.first);
            diff_node(nullptr, &added_kv.second, path);
            path.resize(base_size);
        },
        // removed
        [&](const NodeMap::value_type& removed_kv) {
            append_key(path, removed_kv.first);
            diff_node(&removed_kv.second, nullptr, path);
            path.resize(base_size);
        },
        // changed (retained key)
        [&](const NodeMap::value_type& old_kv, const NodeMap::value_type& new_kv) {
            if (&old_kv.second.get() == &new_kv.second.get()) [[likely]] {
                return;
            }
            append_key(path, old_kv.first);
            diff_node(&old_kv.second, &new_kv.second, path);
            path.resize(base_size);
        }
    );

    immer::diff(old_map, new_map, map_differ);
}

void DiffCollector::diff_array(const NodeVector& old_vec, const NodeVector& new_vec, std::string& path)
{
    const auto base_size = path.size();
    const auto max_size = std::max(old_vec.size(), new_vec.size());

    for (std::size_t i = 0; i < max_size; ++i) {
        const NodeBox* old_elem = i < old_vec.size() ? &old_vec[i] : nullptr;
        const NodeBox* new_elem = i < new_vec.size() ? &new_vec[i] : nullptr;

        append_index(path, i);
        diff_node(old_elem, new_elem, path);
        path.resize(base_size);
    }
}

void DiffCollector::diff_keyed_array(const NodeVector& old_vec, const NodeVector& new_vec,
                                     const std::string& key_field, std::string& path)
{
    KeyedIndex old_index;
    KeyedIndex new_index;
    index_keyed(old_vec, key_field, path, old_index);
    index_keyed(new_vec, key_field, path, new_index);

    std::vector<std::string> keys = old_index.order;
    for (const auto& key : new_index.order) {
        if (!old_index.by_key.count(key)) {
            keys.push_back(key);
        }
    }

    if (options_.stable_order) {
        std::sort(keys.begin(), keys.end());
    }

    const auto base_size = path.size();
    for (const auto& key : keys) {
        auto old_it = old_index.by_key.find(key);
        auto new_it = new_index.by_key.find(key);
        const NodeBox* old_elem = old_it != old_index.by_key.end() ? old_it->second : nullptr;
        const NodeBox* new_elem = new_it != new_index.by_key.end() ? new_it->second : nullptr;

        append_keyed(path, key_field, key);
        diff_node(old_elem, new_elem, path);
        path.resize(base_size);
    }
}

// ============================================================
// Free functions
// ============================================================

std::vector<Change> diff(const Node* old_root, const Node* new_root, const DiffOptions& options)
{
    DiffCollector collector(options);
    collector.diff(old_root, new_root);
    return collector.take_changes();
}

std::vector<Change> diff(const Node& old_root, const Node& new_root, const DiffOptions& options)
{
    return diff(&old_root, &new_root, options);
}

bool DiffCollector::any_difference(const Node* old_root, const Node* new_root)
{
    stop_at_first_ = true;
    diff(old_root, new_root);
    stop_at_first_ = false;
    return has_changes();
}

bool has_any_difference(const Node& old_root, const Node& new_root, const DiffOptions& options)
{
    DiffCollector collector(options);
    return collector.any_difference(&old_root, &new_root);
}

void print_changes(const std::vector<Change>& changes, std::ostream& os)
{
    if (changes.empty()) {
        os << "(no changes)\n";
        return;
    }
    for (const auto& c : changes) {
        std::string_view label;
        switch (c.type) {
            case ChangeType::Add:    label = "ADD   "; break;
            case ChangeType::Remove: label = "REMOVE"; break;
            case ChangeType::Modify: label = "MODIFY"; break;
            case ChangeType::Move:   label = "MOVE  "; break;
        }
        os << label << " " << c.path;
        if (c.has_old() && c.has_new()) {
            os << ": " << node_to_string(c.get_old()) << " -> " << node_to_string(c.get_new());
        } else if (c.has_new()) {
            os << ": " << node_to_string(c.get_new());
        } else if (c.has_old()) {
            os << ": " << node_to_string(c.get_old());
        }
        os << "\n";
    }
}

} // namespace configdiff
