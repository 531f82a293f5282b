// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// patch.cpp - Patch derivation, validation and JSON form

#include <configdiff/patch.h>
#include <configdiff/builders.h>
#include <configdiff/errors.h>
#include <configdiff/serialization.h>

#include <array>
#include <algorithm>

namespace configdiff {

namespace {

constexpr std::array<std::string_view, 6> valid_ops = {
    "add", "remove", "replace", "move", "copy", "test",
};

/// A Null node is carried as "no value"
std::optional<Node> value_of(const std::optional<NodeBox>& box)
{
    if (!box || box->get().is_null()) {
        return std::nullopt;
    }
    return box->get();
}

Operation operation_from_change(const Change& change)
{
    Operation op;
    op.path = change.path;
    switch (change.type) {
        case ChangeType::Add:
            op.op = "add";
            op.value = value_of(change.new_value);
            break;
        case ChangeType::Remove:
            op.op = "remove";
            break;
        case ChangeType::Modify:
            op.op = "replace";
            op.value = value_of(change.new_value);
            break;
        case ChangeType::Move:
            // No source path is tracked for moves
            op.op = "replace";
            break;
    }
    return op;
}

const std::string& read_string_field(const NodeMap& obj, const std::string& key, std::size_t index)
{
    static const std::string empty;
    auto* box = obj.find(key);
    if (!box) {
        return empty;
    }
    auto* str = box->get().get_if<std::string>();
    if (!str) {
        throw PatchError("operation " + std::to_string(index) + ": field '" + key + "' must be a string");
    }
    return *str;
}

} // anonymous namespace

void Operation::validate() const
{
    if (std::find(valid_ops.begin(), valid_ops.end(), op) == valid_ops.end()) {
        throw PatchError("invalid operation type: " + op);
    }
    if (path.empty()) {
        throw PatchError("path is required");
    }
    if (op == "remove") {
        if (value) {
            throw PatchError("remove operation should not have a value");
        }
        if (!from.empty()) {
            throw PatchError("remove operation should not have a from field");
        }
    } else if (op == "move" || op == "copy") {
        if (from.empty()) {
            throw PatchError(op + " operation requires a from field");
        }
    }
}

Patch Patch::from_changes(const std::vector<Change>& changes)
{
    Patch patch;
    patch.operations.reserve(changes.size());
    for (const auto& change : changes) {
        patch.operations.push_back(operation_from_change(change));
    }
    return patch;
}

Patch Patch::from_json(std::string_view json_text)
{
    const Node doc = configdiff::from_json(json_text);
    auto* root = doc.get_if<NodeMap>();
    if (!root) {
        throw PatchError("patch document must be an object");
    }

    Patch patch;
    auto* ops_box = root->find("operations");
    if (!ops_box || ops_box->get().is_null()) {
        return patch;
    }
    auto* ops = ops_box->get().get_if<NodeVector>();
    if (!ops) {
        throw PatchError("'operations' must be an array");
    }

    patch.operations.reserve(ops->size());
    for (std::size_t i = 0; i < ops->size(); ++i) {
        auto* obj = (*ops)[i]->get_if<NodeMap>();
        if (!obj) {
            throw PatchError("operation " + std::to_string(i) + ": must be an object");
        }
        Operation op;
        op.op = read_string_field(*obj, "op", i);
        op.path = read_string_field(*obj, "path", i);
        op.from = read_string_field(*obj, "from", i);
        if (auto* value = obj->find("value"); value && !value->get().is_null()) {
            op.value = value->get();
        }
        patch.operations.push_back(std::move(op));
    }
    return patch;
}

Node Patch::to_node() const
{
    ArrayBuilder ops;
    for (const auto& op : operations) {
        ObjectBuilder obj;
        obj.set("op", op.op).set("path", op.path);
        if (op.value) {
            obj.set("value", *op.value);
        }
        if (!op.from.empty()) {
            obj.set("from", op.from);
        }
        ops.push_back(obj.finish());
    }
    return ObjectBuilder().set("operations", ops.finish()).finish();
}

std::string Patch::to_json(bool compact) const
{
    return configdiff::to_json(to_node(), compact);
}

std::map<std::string, std::size_t> Patch::summary() const
{
    std::map<std::string, std::size_t> counts;
    for (const auto& op : operations) {
        ++counts[op.op];
    }
    return counts;
}

void Patch::validate() const
{
    for (std::size_t i = 0; i < operations.size(); ++i) {
        try {
            operations[i].validate();
        } catch (const PatchError& e) {
            throw PatchError("operation " + std::to_string(i) + ": " + e.what());
        }
    }
}

} // namespace configdiff
