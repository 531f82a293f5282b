// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file report.h
/// @brief Plain-text renderers for change lists.
///
/// Renderers only read the change list; paths are taken verbatim from
/// Change::path and the trees are never walked again.

#pragma once

#include "api.h"
#include "diff.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace configdiff {

enum class ReportFormat : std::uint8_t {
    Report,      ///< summary plus one line per change
    Stat,        ///< git diff --stat style
    GitDiff,     ///< git diff driver style
    SideBySide,  ///< old and new values in two columns
    Patch,       ///< indented JSON patch
};

struct ReportOptions {
    std::size_t max_value_length = 0;  ///< 0 = no truncation
    std::string old_file = "old";
    std::string new_file = "new";
};

struct ChangeSummary {
    std::size_t added = 0;
    std::size_t removed = 0;
    std::size_t modified = 0;
    std::size_t moved = 0;

    [[nodiscard]] std::size_t total() const noexcept { return added + removed + modified + moved; }
};

[[nodiscard]] CONFIGDIFF_API ChangeSummary summarize_changes(const std::vector<Change>& changes);

/// "+2 added, -1 removed, ~3 modified" (zero counts omitted)
[[nodiscard]] CONFIGDIFF_API std::string format_summary(const ChangeSummary& summary);

/// Compact JSON for a value, "(none)" when absent, truncated with "..."
/// when longer than @p max_length (0 = no limit)
[[nodiscard]] CONFIGDIFF_API std::string format_value(const std::optional<NodeBox>& value,
                                                     std::size_t max_length = 0);

[[nodiscard]] CONFIGDIFF_API std::string generate_report(const std::vector<Change>& changes,
                                                        const ReportOptions& options = {});
[[nodiscard]] CONFIGDIFF_API std::string generate_stat(const std::vector<Change>& changes);
[[nodiscard]] CONFIGDIFF_API std::string generate_git_diff(const std::vector<Change>& changes,
                                                          std::string_view old_file,
                                                          std::string_view new_file);
[[nodiscard]] CONFIGDIFF_API std::string generate_side_by_side(const std::vector<Change>& changes,
                                                              const ReportOptions& options = {});

[[nodiscard]] CONFIGDIFF_API std::string render(const std::vector<Change>& changes,
                                               ReportFormat format,
                                               const ReportOptions& options = {});

/// "report", "stat", "git", "side-by-side", "patch"
[[nodiscard]] CONFIGDIFF_API std::optional<ReportFormat> report_format_from_name(std::string_view name);

} // namespace configdiff
