// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file configdiff.h
/// @brief Umbrella header and document-level entry point.
///
/// @code
///   DiffOptions opts;
///   opts.stable_order = true;
///   auto result = diff_documents(old_text, Format::Json, new_text, Format::Json, opts);
///   std::cout << generate_report(result.changes);
///   std::cout << result.patch.to_json();
/// @endcode

#pragma once

#include "api.h"
#include "builders.h"
#include "coercion.h"
#include "diff.h"
#include "errors.h"
#include "node.h"
#include "options.h"
#include "patch.h"
#include "path.h"
#include "report.h"
#include "serialization.h"

#include <string_view>
#include <vector>

namespace configdiff {

struct DiffResult {
    std::vector<Change> changes;
    Patch patch;

    [[nodiscard]] bool has_changes() const noexcept { return !changes.empty(); }
};

/// Parse both documents and diff them.
/// Options are validated before either document is parsed.
/// @throws OptionsError, ParseError
[[nodiscard]] CONFIGDIFF_API DiffResult diff_documents(std::string_view old_text, Format old_format,
                                                      std::string_view new_text, Format new_format,
                                                      const DiffOptions& options = {});

} // namespace configdiff
