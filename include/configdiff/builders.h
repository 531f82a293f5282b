// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of Node containers.
///
/// Parsers use these to assemble objects and arrays through immer
/// transients instead of re-creating a persistent container per insert.
///
/// Usage:
/// @code
///   Node server = ObjectBuilder()
///       .set("host", "localhost")
///       .set("port", 8080)
///       .finish();
///
///   Node tags = ArrayBuilder()
///       .push_back("blue")
///       .push_back("green")
///       .finish();
/// @endcode

#pragma once

#include "node.h"

namespace configdiff {

class ObjectBuilder {
public:
    using transient_type = NodeMap::transient_type;

    ObjectBuilder() : transient_(NodeMap{}.transient()) {}
    explicit ObjectBuilder(const NodeMap& existing) : transient_(existing.transient()) {}

    ObjectBuilder(ObjectBuilder&&) noexcept = default;
    ObjectBuilder& operator=(ObjectBuilder&&) noexcept = default;

    // Transients must not be shared
    ObjectBuilder(const ObjectBuilder&) = delete;
    ObjectBuilder& operator=(const ObjectBuilder&) = delete;

    /// Set a member; a repeated key replaces the earlier value
    ObjectBuilder& set(const std::string& key, Node val) {
        transient_.set(key, NodeBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish building and return the Node.
    /// The builder must not be used afterwards.
    [[nodiscard]] Node finish() {
        return Node{transient_.persistent()};
    }

private:
    transient_type transient_;
};

class ArrayBuilder {
public:
    using transient_type = NodeVector::transient_type;

    ArrayBuilder() : transient_(NodeVector{}.transient()) {}
    explicit ArrayBuilder(const NodeVector& existing) : transient_(existing.transient()) {}

    ArrayBuilder(ArrayBuilder&&) noexcept = default;
    ArrayBuilder& operator=(ArrayBuilder&&) noexcept = default;

    ArrayBuilder(const ArrayBuilder&) = delete;
    ArrayBuilder& operator=(const ArrayBuilder&) = delete;

    ArrayBuilder& push_back(Node val) {
        transient_.push_back(NodeBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Node finish() {
        return Node{transient_.persistent()};
    }

private:
    transient_type transient_;
};

} // namespace configdiff
