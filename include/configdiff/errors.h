// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types thrown by configdiff.
///
/// The differ itself never fails on well-formed trees. Exceptions are
/// reserved for configuration and collaborator failures:
/// - OptionsError: malformed DiffOptions (raised before traversal)
/// - ParseError:   malformed document text handed to a parser
/// - PatchError:   a patch operation that violates the patch rules

#pragma once

#include "api.h"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace configdiff {

class CONFIGDIFF_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CONFIGDIFF_API OptionsError : public Error {
public:
    using Error::Error;
};

class CONFIGDIFF_API ParseError : public Error {
public:
    ParseError(const std::string& message, std::size_t position)
        : Error(message + " at position " + std::to_string(position))
        , position_(position) {}

    explicit ParseError(const std::string& message)
        : Error(message) {}

    /// Byte offset into the input where parsing failed (0 if unknown)
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_ = 0;
};

class CONFIGDIFF_API PatchError : public Error {
public:
    using Error::Error;
};

} // namespace configdiff
