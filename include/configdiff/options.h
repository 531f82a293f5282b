// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file options.h
/// @brief DiffOptions: the immutable configuration of one diff invocation.
///
/// | Option                     | Effect                                           |
/// |----------------------------|--------------------------------------------------|
/// | ignore_paths               | suppress comparison at matching paths            |
/// | array_set_keys             | compare the named arrays by identity field       |
/// | coercions.numeric_strings  | "42" equals 42                                   |
/// | coercions.bool_strings     | "true"/"false" equal true/false                  |
/// | stable_order               | sorted visitation and a final sort by path       |
///
/// Options can also be read from a JSON options document:
/// @code
///   {
///     "ignore_paths": ["/metadata/*"],
///     "array_keys": {"/spec/containers": "name"},
///     "numeric_strings": true,
///     "bool_strings": false,
///     "stable_order": true
///   }
/// @endcode

#pragma once

#include "api.h"
#include "node.h"

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace configdiff {

struct Coercions {
    bool numeric_strings = false;
    bool bool_strings = false;

    bool operator==(const Coercions&) const = default;
};

struct CONFIGDIFF_API DiffOptions {
    /// Glob-like patterns, checked in order
    std::vector<std::string> ignore_paths;

    /// Exact array path -> name of the identity field of its elements
    std::map<std::string, std::string, std::less<>> array_set_keys;

    Coercions coercions;

    bool stable_order = false;

    /// Throws OptionsError if an array_set_keys entry has an empty path
    /// or an empty key field name
    void validate() const;

    /// Identity field configured for @p path, or nullptr for positional arrays
    [[nodiscard]] const std::string* array_key_for(std::string_view path) const;

    bool operator==(const DiffOptions&) const = default;
};

/// Parse a "path=field" array key spec, splitting at the last '='.
/// Throws OptionsError when either side is empty or '=' is missing.
[[nodiscard]] CONFIGDIFF_API std::pair<std::string, std::string> parse_array_key(std::string_view spec);

/// Build options from an options document (see file comment).
/// Throws OptionsError on unknown keys, wrong value kinds or invalid entries.
[[nodiscard]] CONFIGDIFF_API DiffOptions options_from_node(const Node& config);

/// Parse an options document from JSON text.
/// Throws ParseError for malformed JSON and OptionsError for bad content.
[[nodiscard]] CONFIGDIFF_API DiffOptions options_from_json(std::string_view json_text);

/// Inverse of options_from_node
[[nodiscard]] CONFIGDIFF_API Node options_to_node(const DiffOptions& options);

} // namespace configdiff
