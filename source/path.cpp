// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// path.cpp - Change path construction and ignore-pattern matching

#include <configdiff/path.h>

#include <span>

namespace configdiff {

namespace {

constexpr std::string_view wildcard = "*";

std::string_view trim_slashes(std::string_view path) noexcept
{
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    return path;
}

template <typename Seg>
bool match_segments(std::span<const std::string_view> path, std::span<const Seg> pattern)
{
    if (pattern.empty()) {
        return path.empty();
    }

    if (path.empty()) {
        // Only wildcards may be left over
        for (const auto& seg : pattern) {
            if (std::string_view{seg} != wildcard) {
                return false;
            }
        }
        return true;
    }

    if (std::string_view{pattern.front()} == wildcard) {
        if (pattern.size() == 1) {
            return true;
        }
        return match_segments(path.subspan(1), pattern.subspan(1)) ||
               match_segments(path.subspan(1), pattern);
    }

    if (path.front() != std::string_view{pattern.front()}) {
        return false;
    }
    return match_segments(path.subspan(1), pattern.subspan(1));
}

} // anonymous namespace

// ============================================================
// Path construction
// ============================================================

void append_key(std::string& path, std::string_view key)
{
    if (path != root_path) {
        path += '/';
    }
    path += key;
}

void append_index(std::string& path, std::size_t index)
{
    path += '[';
    path += std::to_string(index);
    path += ']';
}

void append_keyed(std::string& path, std::string_view key_field, std::string_view key_value)
{
    path += '[';
    path += key_field;
    path += '=';
    path += key_value;
    path += ']';
}

std::string join_key(std::string_view parent, std::string_view key)
{
    std::string result{parent};
    append_key(result, key);
    return result;
}

std::string join_index(std::string_view parent, std::size_t index)
{
    std::string result{parent};
    append_index(result, index);
    return result;
}

std::string join_keyed(std::string_view parent, std::string_view key_field, std::string_view key_value)
{
    std::string result{parent};
    append_keyed(result, key_field, key_value);
    return result;
}

std::string_view base_path(std::string_view path) noexcept
{
    auto pos = path.find('[');
    if (pos == std::string_view::npos) {
        return path;
    }
    return path.substr(0, pos);
}

std::vector<std::string_view> split_segments(std::string_view path)
{
    path = trim_slashes(path);

    std::vector<std::string_view> segments;
    std::size_t start = 0;
    while (true) {
        auto pos = path.find('/', start);
        if (pos == std::string_view::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return segments;
}

// ============================================================
// Pattern matching
// ============================================================

bool match_path(std::string_view path, std::string_view pattern)
{
    if (pattern.find('*') == std::string_view::npos) {
        return trim_slashes(path) == trim_slashes(pattern);
    }

    auto path_segs = split_segments(path);
    auto pattern_segs = split_segments(pattern);
    return match_segments(std::span<const std::string_view>{path_segs},
                          std::span<const std::string_view>{pattern_segs});
}

PathPattern::PathPattern(std::string pattern)
    : text_(std::move(pattern))
    , has_wildcard_(text_.find('*') != std::string::npos)
{
    for (auto seg : split_segments(text_)) {
        segments_.emplace_back(seg);
    }
}

bool PathPattern::matches(std::string_view path) const
{
    if (!has_wildcard_) {
        return trim_slashes(path) == trim_slashes(text_);
    }
    auto path_segs = split_segments(path);
    return match_segments(std::span<const std::string_view>{path_segs},
                          std::span<const std::string>{segments_});
}

PathMatcher::PathMatcher(const std::vector<std::string>& patterns)
{
    patterns_.reserve(patterns.size());
    for (const auto& p : patterns) {
        patterns_.emplace_back(p);
    }
}

bool PathMatcher::matches(std::string_view path) const
{
    return first_match(path) != nullptr;
}

const PathPattern* PathMatcher::first_match(std::string_view path) const
{
    for (const auto& pattern : patterns_) {
        if (pattern.matches(path)) {
            return &pattern;
        }
    }
    return nullptr;
}

} // namespace configdiff
