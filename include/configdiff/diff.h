// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Structural diff between two configuration trees.
///
/// The differ walks both trees in lock-step from the root path "/" and
/// emits one Change per difference:
///   - Add / Remove when only one side has a value at a path; the change
///     carries the whole subtree and nothing below it is visited
///   - Modify when two scalars differ, or when the kinds differ and no
///     enabled coercion proves them equal
///   - Objects and arrays never produce a change for themselves, only for
///     their differing children
///
/// Arrays are compared by position unless their exact path is listed in
/// DiffOptions::array_set_keys, in which case elements are matched by the
/// configured identity field. There is no LCS alignment and no move
/// detection: ChangeType::Move is reserved and never produced here.
///
/// Example:
/// @code
///   DiffOptions opts;
///   opts.ignore_paths = {"/status/*"};
///   opts.array_set_keys["/spec/containers"] = "name";
///   opts.stable_order = true;
///
///   for (const auto& change : diff(old_tree, new_tree, opts)) {
///       std::cout << change_type_name(change.type) << " " << change.path << "\n";
///   }
/// @endcode

#pragma once

#include "api.h"
#include "node.h"
#include "options.h"
#include "path.h"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace configdiff {

enum class ChangeType : std::uint8_t { Add, Remove, Modify, Move };

/// "add", "remove", "modify", "move"
[[nodiscard]] CONFIGDIFF_API std::string_view change_type_name(ChangeType type) noexcept;

struct Change {
    ChangeType type = ChangeType::Add;
    std::string path;
    std::optional<NodeBox> old_value;  ///< present for Remove and Modify
    std::optional<NodeBox> new_value;  ///< present for Add and Modify

    Change() = default;

    Change(ChangeType t, std::string p, std::optional<NodeBox> old_v, std::optional<NodeBox> new_v)
        : type(t), path(std::move(p)), old_value(std::move(old_v)), new_value(std::move(new_v)) {}

    [[nodiscard]] bool has_old() const noexcept { return old_value.has_value(); }
    [[nodiscard]] bool has_new() const noexcept { return new_value.has_value(); }

    [[nodiscard]] const Node& get_old() const {
        if (!old_value) throw std::runtime_error("Change: old_value not available at " + path);
        return old_value->get();
    }

    [[nodiscard]] const Node& get_new() const {
        if (!new_value) throw std::runtime_error("Change: new_value not available at " + path);
        return new_value->get();
    }

    /// The value the change is about: old for Remove, new otherwise
    [[nodiscard]] const Node& value() const {
        return (type == ChangeType::Remove) ? get_old() : get_new();
    }
};

// ============================================================
// DiffCollector - collects the changes of one comparison
//
// The options are validated on construction, so a collector that exists
// can always complete a traversal. The collector keeps the last result
// until the next diff() or clear().
// ============================================================

class CONFIGDIFF_API DiffCollector {
public:
    /// Throws OptionsError for malformed options
    explicit DiffCollector(DiffOptions options = {});

    /// Compare two possibly absent trees (nullptr = absent)
    void diff(const Node* old_root, const Node* new_root);
    void diff(const Node& old_root, const Node& new_root);

    /// Like diff(), but stops collecting at the first change.
    /// Returns true if one was found; get_changes() then holds only that change.
    [[nodiscard]] bool any_difference(const Node* old_root, const Node* new_root);

    [[nodiscard]] const std::vector<Change>& get_changes() const { return changes_; }
    [[nodiscard]] std::vector<Change> take_changes();
    [[nodiscard]] bool has_changes() const { return !changes_.empty(); }
    [[nodiscard]] const DiffOptions& options() const { return options_; }

    void clear();
    void print_changes(std::ostream& os) const;

private:
    void diff_node(const NodeBox* old_box, const NodeBox* new_box, std::string& path);
    void diff_object(const NodeMap& old_map, const NodeMap& new_map, std::string& path);
    void diff_array(const NodeVector& old_vec, const NodeVector& new_vec, std::string& path);
    void diff_keyed_array(const NodeVector& old_vec, const NodeVector& new_vec,
                          const std::string& key_field, std::string& path);
    void emit(ChangeType type, const std::string& path, const NodeBox* old_box, const NodeBox* new_box);

    DiffOptions options_;
    PathMatcher ignore_;
    std::vector<Change> changes_;
    bool stop_at_first_ = false;
};

/// Compare two trees. nullptr stands for an absent document.
/// Throws OptionsError for malformed options, before any traversal.
[[nodiscard]] CONFIGDIFF_API std::vector<Change> diff(const Node* old_root, const Node* new_root,
                                                     const DiffOptions& options = {});

[[nodiscard]] CONFIGDIFF_API std::vector<Change> diff(const Node& old_root, const Node& new_root,
                                                     const DiffOptions& options = {});

[[nodiscard]] CONFIGDIFF_API bool has_any_difference(const Node& old_root, const Node& new_root,
                                                    const DiffOptions& options = {});

/// One line per change: "ADD    /path: value", "MODIFY /path: old -> new"
CONFIGDIFF_API void print_changes(const std::vector<Change>& changes, std::ostream& os);

} // namespace configdiff
