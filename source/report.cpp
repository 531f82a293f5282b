// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// report.cpp - Plain-text change renderers

#include <configdiff/report.h>
#include <configdiff/patch.h>
#include <configdiff/serialization.h>

#include <algorithm>
#include <map>
#include <sstream>

namespace configdiff {

namespace {

constexpr std::string_view no_changes = "No changes detected.\n";
constexpr std::string_view arrow = "→";
constexpr std::string_view rule_char = "─";

constexpr std::size_t stat_bar_width = 40;
constexpr std::size_t stat_path_width = 60;
constexpr std::size_t side_path_width = 76;
constexpr std::size_t rule_width = 80;

/// Keep the tail of an over-long path, prefixed with "..."
std::string shorten_path(const std::string& path, std::size_t width)
{
    if (path.size() <= width) {
        return path;
    }
    return "..." + path.substr(path.size() - (width - 3));
}

std::string pad_right(std::string_view text, std::size_t width)
{
    std::string result{text};
    if (result.size() < width) {
        result.append(width - result.size(), ' ');
    }
    return result;
}

std::string rule()
{
    std::string result;
    result.reserve(rule_width * rule_char.size() + 1);
    for (std::size_t i = 0; i < rule_width; ++i) {
        result += rule_char;
    }
    result += '\n';
    return result;
}

struct PathStat {
    std::size_t additions = 0;
    std::size_t deletions = 0;
    std::size_t modifications = 0;
    std::size_t moves = 0;

    std::size_t total() const { return additions + deletions + modifications + moves; }
};

} // anonymous namespace

ChangeSummary summarize_changes(const std::vector<Change>& changes)
{
    ChangeSummary summary;
    for (const auto& c : changes) {
        switch (c.type) {
            case ChangeType::Add:    ++summary.added; break;
            case ChangeType::Remove: ++summary.removed; break;
            case ChangeType::Modify: ++summary.modified; break;
            case ChangeType::Move:   ++summary.moved; break;
        }
    }
    return summary;
}

std::string format_summary(const ChangeSummary& summary)
{
    if (summary.total() == 0) {
        return "no changes";
    }

    std::vector<std::string> parts;
    if (summary.added > 0) {
        parts.push_back("+" + std::to_string(summary.added) + " added");
    }
    if (summary.removed > 0) {
        parts.push_back("-" + std::to_string(summary.removed) + " removed");
    }
    if (summary.modified > 0) {
        parts.push_back("~" + std::to_string(summary.modified) + " modified");
    }
    if (summary.moved > 0) {
        parts.push_back(std::string{arrow} + std::to_string(summary.moved) + " moved");
    }

    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += ", ";
        result += parts[i];
    }
    return result;
}

std::string format_value(const std::optional<NodeBox>& value, std::size_t max_length)
{
    if (!value) {
        return "(none)";
    }
    std::string text = to_json(value->get(), true);
    if (max_length > 0 && text.size() > max_length) {
        if (max_length <= 3) {
            return text.substr(0, max_length);
        }
        text.resize(max_length - 3);
        text += "...";
    }
    return text;
}

// ============================================================
// Renderers
// ============================================================

std::string generate_report(const std::vector<Change>& changes, const ReportOptions& options)
{
    if (changes.empty()) {
        return std::string{no_changes};
    }

    std::ostringstream oss;
    oss << "Summary: " << format_summary(summarize_changes(changes)) << "\n\n";

    const auto max_len = options.max_value_length;
    for (const auto& c : changes) {
        switch (c.type) {
            case ChangeType::Add:
                oss << "+ " << c.path << ": " << format_value(c.new_value, max_len) << "\n";
                break;
            case ChangeType::Remove:
                oss << "- " << c.path << ": " << format_value(c.old_value, max_len) << "\n";
                break;
            case ChangeType::Modify:
                oss << "~ " << c.path << ": " << format_value(c.old_value, max_len)
                    << " " << arrow << " " << format_value(c.new_value, max_len) << "\n";
                break;
            case ChangeType::Move:
                oss << arrow << " " << c.path << ": " << format_value(c.old_value, max_len)
                    << " " << arrow << " " << format_value(c.new_value, max_len) << "\n";
                break;
        }
    }
    return oss.str();
}

std::string generate_stat(const std::vector<Change>& changes)
{
    if (changes.empty()) {
        return std::string{no_changes};
    }

    // std::map keeps paths sorted
    std::map<std::string, PathStat> paths;
    for (const auto& c : changes) {
        auto& stat = paths[c.path];
        switch (c.type) {
            case ChangeType::Add:    ++stat.additions; break;
            case ChangeType::Remove: ++stat.deletions; break;
            case ChangeType::Modify: ++stat.modifications; break;
            case ChangeType::Move:   ++stat.moves; break;
        }
    }

    std::size_t path_width = 0;
    for (const auto& [path, stat] : paths) {
        path_width = std::max(path_width, path.size());
    }
    path_width = std::min(path_width, stat_path_width);

    std::ostringstream oss;
    for (const auto& [path, stat] : paths) {
        std::string bar;
        const auto total = stat.total();
        if (total > 0) {
            bar.append(stat.additions * stat_bar_width / total, '+');
            bar.append(stat.deletions * stat_bar_width / total, '-');
            bar.append(stat.modifications * stat_bar_width / total, '~');
            if (bar.size() > stat_bar_width) {
                bar.resize(stat_bar_width);
            }
        }
        oss << " " << pad_right(shorten_path(path, stat_path_width), path_width) << " | " << bar << "\n";
    }

    const auto summary = summarize_changes(changes);
    oss << " " << paths.size() << " paths changed";
    if (summary.added > 0) {
        oss << ", " << summary.added << " additions(+)";
    }
    if (summary.removed > 0) {
        oss << ", " << summary.removed << " deletions(-)";
    }
    if (summary.modified > 0) {
        oss << ", " << summary.modified << " modifications(~)";
    }
    if (summary.moved > 0) {
        oss << ", " << summary.moved << " moves(" << arrow << ")";
    }
    oss << "\n";
    return oss.str();
}

std::string generate_git_diff(const std::vector<Change>& changes,
                              std::string_view old_file,
                              std::string_view new_file)
{
    if (changes.empty()) {
        return {};
    }

    std::ostringstream oss;
    oss << "diff --configdiff a/" << old_file << " b/" << new_file << "\n";
    oss << "--- a/" << old_file << "\n";
    oss << "+++ b/" << new_file << "\n";

    // Groups in order of first appearance
    std::vector<std::string_view> bases;
    std::map<std::string_view, std::vector<const Change*>> groups;
    for (const auto& c : changes) {
        auto base = base_path(c.path);
        auto& group = groups[base];
        if (group.empty()) {
            bases.push_back(base);
        }
        group.push_back(&c);
    }

    for (auto base : bases) {
        oss << "@@ " << base << " @@\n";
        for (const Change* c : groups[base]) {
            switch (c->type) {
                case ChangeType::Add:
                    oss << "+" << c->path << ": " << format_value(c->new_value) << "\n";
                    break;
                case ChangeType::Remove:
                    oss << "-" << c->path << ": " << format_value(c->old_value) << "\n";
                    break;
                case ChangeType::Modify:
                    oss << "-" << c->path << ": " << format_value(c->old_value) << "\n";
                    oss << "+" << c->path << ": " << format_value(c->new_value) << "\n";
                    break;
                case ChangeType::Move:
                    oss << "~" << c->path << ": " << format_value(c->old_value)
                        << " " << arrow << " " << format_value(c->new_value) << "\n";
                    break;
            }
        }
    }
    return oss.str();
}

std::string generate_side_by_side(const std::vector<Change>& changes, const ReportOptions& options)
{
    if (changes.empty()) {
        return std::string{no_changes};
    }

    std::ostringstream oss;
    oss << "Summary: " << format_summary(summarize_changes(changes)) << "\n";
    oss << rule();
    oss << pad_right("Old Value", 38) << " | " << pad_right("New Value", 38) << "\n";
    oss << rule();

    const auto max_len = options.max_value_length;
    for (const auto& c : changes) {
        oss << shorten_path(c.path, side_path_width) << "\n";

        switch (c.type) {
            case ChangeType::Add:
                oss << "  " << pad_right("(none)", 36) << " | "
                    << format_value(c.new_value, max_len) << "\n";
                break;
            case ChangeType::Remove:
                oss << "  " << pad_right(format_value(c.old_value, max_len), 36) << " | "
                    << "(removed)" << "\n";
                break;
            case ChangeType::Modify:
                oss << "  " << pad_right(format_value(c.old_value, max_len), 36) << " | "
                    << format_value(c.new_value, max_len) << "\n";
                break;
            case ChangeType::Move:
                oss << "  " << pad_right(format_value(c.old_value, max_len), 36) << " " << arrow << " "
                    << format_value(c.new_value, max_len) << "\n";
                break;
        }
        oss << "\n";
    }
    return oss.str();
}

std::string render(const std::vector<Change>& changes, ReportFormat format, const ReportOptions& options)
{
    switch (format) {
        case ReportFormat::Report:     return generate_report(changes, options);
        case ReportFormat::Stat:       return generate_stat(changes);
        case ReportFormat::GitDiff:    return generate_git_diff(changes, options.old_file, options.new_file);
        case ReportFormat::SideBySide: return generate_side_by_side(changes, options);
        case ReportFormat::Patch:      return Patch::from_changes(changes).to_json() + "\n";
    }
    return {};
}

std::optional<ReportFormat> report_format_from_name(std::string_view name)
{
    if (name == "report") return ReportFormat::Report;
    if (name == "stat") return ReportFormat::Stat;
    if (name == "git") return ReportFormat::GitDiff;
    if (name == "side-by-side") return ReportFormat::SideBySide;
    if (name == "patch") return ReportFormat::Patch;
    return std::nullopt;
}

} // namespace configdiff
