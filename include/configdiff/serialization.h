// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON reading/writing for Node trees and document format dispatch.
///
/// JSON is the one format parsed in this library. YAML, HCL and TOML
/// documents are recognised by name and extension so callers can route
/// them, but their parsers live outside configdiff and parse_document()
/// rejects them with ParseError.
///
/// Usage:
/// @code
///   Node tree = from_json(R"({"replicas": 3, "tags": ["a", "b"]})");
///   std::string text = to_json(tree, true);   // {"replicas":3,"tags":["a","b"]}
/// @endcode

#pragma once

#include "api.h"
#include "node.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace configdiff {

// ============================================================
// JSON
// ============================================================

/// Serialize a tree as JSON.
/// - object keys are written in sorted order
/// - numbers use the shortest round-trip form; integral values have no
///   fraction ("3", not "3.0"); NaN and infinities are written as null
/// @param compact If true, no whitespace; otherwise two-space indentation
[[nodiscard]] CONFIGDIFF_API std::string to_json(const Node& node, bool compact = false);

/// Parse JSON text into a tree.
/// All numbers become Number nodes. A repeated object key keeps the last value.
/// @throws ParseError on malformed input or trailing content
[[nodiscard]] CONFIGDIFF_API Node from_json(std::string_view json_text);

// ============================================================
// Document formats
// ============================================================

enum class Format : std::uint8_t { Json, Yaml, Hcl, Toml };

[[nodiscard]] CONFIGDIFF_API std::string_view format_name(Format format) noexcept;

/// "json", "yaml"/"yml", "hcl"/"tf", "toml" (case-insensitive)
[[nodiscard]] CONFIGDIFF_API std::optional<Format> format_from_name(std::string_view name);

/// Format from a file name's extension, e.g. "deploy.yaml" -> Format::Yaml
[[nodiscard]] CONFIGDIFF_API std::optional<Format> format_from_extension(std::string_view filename);

/// Parse document text of the given format.
/// @throws ParseError for malformed input or a format without a parser here
[[nodiscard]] CONFIGDIFF_API Node parse_document(std::string_view text, Format format);

} // namespace configdiff
