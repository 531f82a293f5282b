// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file coercion.h
/// @brief Equivalence rules between scalars of different kinds.
///
/// Coercion is only consulted when two nodes have different kinds. It is
/// symmetric: (String, Number) and (Number, String) behave the same.

#pragma once

#include "api.h"
#include "node.h"
#include "options.h"

#include <optional>
#include <string_view>

namespace configdiff {

/// Parse a complete floating-point literal ("42", "-1.5e3", "+7", "inf",
/// "0x1p4"). Hex literals need a binary exponent. Literals too small for a
/// double read as zero or a subnormal; literals too large are rejected.
/// Returns std::nullopt for anything else, including surrounding spaces.
[[nodiscard]] CONFIGDIFF_API std::optional<double> parse_number_literal(std::string_view text);

/// "true" -> true, "false" -> false, anything else -> std::nullopt
[[nodiscard]] CONFIGDIFF_API std::optional<bool> parse_bool_literal(std::string_view text) noexcept;

/// True when the enabled coercions prove @p a and @p b equal.
/// Nodes of the same kind are never coercible; compare them directly.
[[nodiscard]] CONFIGDIFF_API bool can_coerce(const Node& a, const Node& b, const Coercions& coercions);

} // namespace configdiff
