// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// configdiff.cpp - Document-level entry point

#include <configdiff/configdiff.h>

namespace configdiff {

DiffResult diff_documents(std::string_view old_text, Format old_format,
                          std::string_view new_text, Format new_format,
                          const DiffOptions& options)
{
    options.validate();

    const Node old_tree = parse_document(old_text, old_format);
    const Node new_tree = parse_document(new_text, new_format);

    DiffResult result;
    result.changes = diff(old_tree, new_tree, options);
    result.patch = Patch::from_changes(result.changes);
    return result;
}

} // namespace configdiff
