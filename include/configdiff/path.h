// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Change paths and ignore-pattern matching.
///
/// Path syntax produced by the differ:
///   "/"                      root
///   "/spec/replicas"         object member access appends "/<key>"
///   "/items[2]"              positional array access appends "[<index>]"
///   "/containers[name=web]"  keyed-set array access appends "[<field>=<value>]"
///
/// Keys are not escaped. A key containing '/' therefore produces extra
/// segments when the path is split for pattern matching.
///
/// Ignore patterns are matched segment by segment after trimming leading
/// and trailing '/' and splitting on '/':
///   - a pattern without any '*' must equal the path exactly
///   - a trailing "*" segment matches zero or more remaining segments
///     ("/status/*" matches "/status", "/status/x", "/status/x/y")
///   - an embedded "*" segment matches one or more segments, with
///     backtracking ("/a/*/c" matches "/a/b/c" and "/a/b/b2/c")

#pragma once

#include "api.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace configdiff {

inline constexpr std::string_view root_path = "/";

// ============================================================
// Path construction
// ============================================================

/// Append "/<key>" in place (no doubled slash at the root)
CONFIGDIFF_API void append_key(std::string& path, std::string_view key);

/// Append "[<index>]" in place
CONFIGDIFF_API void append_index(std::string& path, std::size_t index);

/// Append "[<key_field>=<key_value>]" in place
CONFIGDIFF_API void append_keyed(std::string& path, std::string_view key_field, std::string_view key_value);

[[nodiscard]] CONFIGDIFF_API std::string join_key(std::string_view parent, std::string_view key);
[[nodiscard]] CONFIGDIFF_API std::string join_index(std::string_view parent, std::size_t index);
[[nodiscard]] CONFIGDIFF_API std::string join_keyed(std::string_view parent,
                                                    std::string_view key_field,
                                                    std::string_view key_value);

/// Portion of a path before its first array accessor ("/a/b[0]/c" -> "/a/b")
[[nodiscard]] CONFIGDIFF_API std::string_view base_path(std::string_view path) noexcept;

/// Trim leading/trailing '/' and split on '/'.
/// The root path yields a single empty segment.
[[nodiscard]] CONFIGDIFF_API std::vector<std::string_view> split_segments(std::string_view path);

// ============================================================
// Pattern matching
// ============================================================

/// Match one path against one pattern (see file comment for the rules)
[[nodiscard]] CONFIGDIFF_API bool match_path(std::string_view path, std::string_view pattern);

/// A pattern split once up front so repeated matching does not re-split it
class CONFIGDIFF_API PathPattern {
public:
    explicit PathPattern(std::string pattern);

    [[nodiscard]] bool matches(std::string_view path) const;
    [[nodiscard]] bool has_wildcard() const noexcept { return has_wildcard_; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    std::string text_;
    std::vector<std::string> segments_;
    bool has_wildcard_ = false;
};

/// Ordered set of patterns; a path is matched when any pattern matches
class CONFIGDIFF_API PathMatcher {
public:
    PathMatcher() = default;
    explicit PathMatcher(const std::vector<std::string>& patterns);

    [[nodiscard]] bool matches(std::string_view path) const;

    /// First pattern matching @p path, or nullptr
    [[nodiscard]] const PathPattern* first_match(std::string_view path) const;

    [[nodiscard]] bool empty() const noexcept { return patterns_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return patterns_.size(); }

private:
    std::vector<PathPattern> patterns_;
};

} // namespace configdiff
