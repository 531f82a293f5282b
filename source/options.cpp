// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// options.cpp - DiffOptions validation and options documents

#include <configdiff/options.h>
#include <configdiff/builders.h>
#include <configdiff/errors.h>
#include <configdiff/serialization.h>

namespace configdiff {

void DiffOptions::validate() const
{
    for (const auto& [path, field] : array_set_keys) {
        if (path.empty()) {
            throw OptionsError("array_set_keys: empty array path (key field '" + field + "')");
        }
        if (field.empty()) {
            throw OptionsError("array_set_keys: empty key field for path '" + path + "'");
        }
    }
}

const std::string* DiffOptions::array_key_for(std::string_view path) const
{
    auto it = array_set_keys.find(path);
    return it == array_set_keys.end() ? nullptr : &it->second;
}

std::pair<std::string, std::string> parse_array_key(std::string_view spec)
{
    auto pos = spec.rfind('=');
    if (pos == std::string_view::npos) {
        throw OptionsError("array key '" + std::string{spec} + "': expected path=field");
    }
    auto path = spec.substr(0, pos);
    auto field = spec.substr(pos + 1);
    if (path.empty() || field.empty()) {
        throw OptionsError("array key '" + std::string{spec} + "': path and field must be non-empty");
    }
    return {std::string{path}, std::string{field}};
}

// ============================================================
// Options documents
// ============================================================

namespace {

bool read_flag(const std::string& key, const Node& value)
{
    if (auto* b = value.get_if<bool>()) {
        return *b;
    }
    throw OptionsError("option '" + key + "' must be a boolean, got " + std::string{kind_name(value.kind())});
}

std::vector<std::string> read_ignore_paths(const Node& value)
{
    auto* arr = value.get_if<NodeVector>();
    if (!arr) {
        throw OptionsError("option 'ignore_paths' must be an array of strings");
    }
    std::vector<std::string> result;
    result.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        auto* str = (*arr)[i]->get_if<std::string>();
        if (!str) {
            throw OptionsError("option 'ignore_paths' entry " + std::to_string(i) + " is not a string");
        }
        result.push_back(*str);
    }
    return result;
}

std::map<std::string, std::string, std::less<>> read_array_keys(const Node& value)
{
    auto* obj = value.get_if<NodeMap>();
    if (!obj) {
        throw OptionsError("option 'array_keys' must be an object of path -> field");
    }
    std::map<std::string, std::string, std::less<>> result;
    for (const auto& [path, box] : *obj) {
        auto* field = box->get_if<std::string>();
        if (!field) {
            throw OptionsError("option 'array_keys' entry '" + path + "' is not a string");
        }
        result.emplace(path, *field);
    }
    return result;
}

} // anonymous namespace

DiffOptions options_from_node(const Node& config)
{
    auto* obj = config.get_if<NodeMap>();
    if (!obj) {
        throw OptionsError("options document must be an object");
    }

    DiffOptions options;
    for (const auto& [key, box] : *obj) {
        const Node& value = *box;
        if (key == "ignore_paths") {
            options.ignore_paths = read_ignore_paths(value);
        } else if (key == "array_keys") {
            options.array_set_keys = read_array_keys(value);
        } else if (key == "numeric_strings") {
            options.coercions.numeric_strings = read_flag(key, value);
        } else if (key == "bool_strings") {
            options.coercions.bool_strings = read_flag(key, value);
        } else if (key == "stable_order") {
            options.stable_order = read_flag(key, value);
        } else {
            throw OptionsError("unknown option '" + key + "'");
        }
    }

    options.validate();
    return options;
}

DiffOptions options_from_json(std::string_view json_text)
{
    return options_from_node(from_json(json_text));
}

Node options_to_node(const DiffOptions& options)
{
    ArrayBuilder ignore;
    for (const auto& pattern : options.ignore_paths) {
        ignore.push_back(pattern);
    }

    ObjectBuilder keys;
    for (const auto& [path, field] : options.array_set_keys) {
        keys.set(path, field);
    }

    return ObjectBuilder()
        .set("ignore_paths", ignore.finish())
        .set("array_keys", keys.finish())
        .set("numeric_strings", options.coercions.numeric_strings)
        .set("bool_strings", options.coercions.bool_strings)
        .set("stable_order", options.stable_order)
        .finish();
}

} // namespace configdiff
