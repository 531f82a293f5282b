// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// coercion.cpp - Cross-kind scalar equivalence

#include <configdiff/coercion.h>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <system_error>

namespace configdiff {

std::optional<double> parse_number_literal(std::string_view text)
{
    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty() || text.front() == '+' || text.front() == '-') {
        return std::nullopt;
    }

    auto format = std::chars_format::general;
    std::string_view digits = text;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        // Hex literals must carry a 'p' exponent
        if (text.find_first_of("pP") == std::string_view::npos) {
            return std::nullopt;
        }
        format = std::chars_format::hex;
        digits.remove_prefix(2);
        if (digits.front() == '+' || digits.front() == '-') {
            return std::nullopt;
        }
    }

    double value = 0.0;
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), last, value, format);
    if (ptr != last) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        // from_chars leaves value untouched; strtod tells underflow from overflow
        const std::string literal{text};
        value = std::strtod(literal.c_str(), nullptr);
        if (std::isinf(value)) {
            return std::nullopt;
        }
    } else if (ec != std::errc{}) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

std::optional<bool> parse_bool_literal(std::string_view text) noexcept
{
    if (text == "true") {
        return true;
    }
    if (text == "false") {
        return false;
    }
    return std::nullopt;
}

namespace {

bool string_equals_number(const std::string& str, double number)
{
    auto parsed = parse_number_literal(str);
    return parsed && *parsed == number;
}

bool string_equals_bool(const std::string& str, bool flag)
{
    auto parsed = parse_bool_literal(str);
    return parsed && *parsed == flag;
}

} // anonymous namespace

bool can_coerce(const Node& a, const Node& b, const Coercions& coercions)
{
    if (a.kind() == b.kind()) {
        return false;
    }

    if (coercions.numeric_strings) {
        if (a.is_string() && b.is_number()) {
            return string_equals_number(*a.get_if<std::string>(), *b.get_if<double>());
        }
        if (a.is_number() && b.is_string()) {
            return string_equals_number(*b.get_if<std::string>(), *a.get_if<double>());
        }
    }

    if (coercions.bool_strings) {
        if (a.is_string() && b.is_bool()) {
            return string_equals_bool(*a.get_if<std::string>(), *b.get_if<bool>());
        }
        if (a.is_bool() && b.is_string()) {
            return string_equals_bool(*b.get_if<std::string>(), *a.get_if<bool>());
        }
    }

    return false;
}

} // namespace configdiff
