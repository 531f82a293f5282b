// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief JSON-Patch-like operations derived from a change list.
///
/// Mapping from changes:
///   Add    -> "add"     with the new value
///   Remove -> "remove"  without value
///   Modify -> "replace" with the new value
///   Move   -> "replace" without value (move derivation is not implemented)
///
/// A Null node carried by a change becomes "no value" on the operation.
///
/// Serialized form:
/// @code
///   {"operations": [{"op": "replace", "path": "/replicas", "value": 3}]}
/// @endcode

#pragma once

#include "api.h"
#include "diff.h"
#include "node.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace configdiff {

struct CONFIGDIFF_API Operation {
    std::string op;                 ///< add, remove, replace, move, copy, test
    std::string path;
    std::optional<Node> value;      ///< add / replace / test
    std::string from;               ///< move / copy

    /// Throws PatchError when the operation breaks the rules for its op
    void validate() const;

    bool operator==(const Operation&) const = default;
};

class CONFIGDIFF_API Patch {
public:
    std::vector<Operation> operations;

    [[nodiscard]] static Patch from_changes(const std::vector<Change>& changes);

    /// Throws ParseError for malformed JSON and PatchError for a document
    /// that is not shaped like a patch
    [[nodiscard]] static Patch from_json(std::string_view json_text);

    [[nodiscard]] std::string to_json(bool compact = false) const;
    [[nodiscard]] Node to_node() const;

    [[nodiscard]] bool empty() const noexcept { return operations.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return operations.size(); }

    /// Number of operations per op name
    [[nodiscard]] std::map<std::string, std::size_t> summary() const;

    /// Validate every operation; the PatchError names the failing index
    void validate() const;

    bool operator==(const Patch&) const = default;
};

} // namespace configdiff
