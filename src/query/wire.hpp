/*
 * Copyright 2025 Warden Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Warden Query Engine - Wire format
// Parses request JSON into typed queries:
//   leaf:     {"field": "user_id", "operator": "EQUALS", "value": "..."}
//   compound: {"operator": "AND", "queries": [ ... ]}

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "query.hpp"

namespace warden::query {

/// Nesting and fan-out limits for caller-supplied queries
inline constexpr size_t kMaxQueryDepth = 16;
inline constexpr size_t kMaxCompoundChildren = 256;

/// Builds an entity leaf from (field, operator, value). Errors carry a field
/// path relative to the leaf ("field", "value").
template <typename Leaf>
using LeafParser =
    std::function<core::Result<Leaf>(std::string_view field, LogicalOperator op,
                                     const nlohmann::json& value)>;

[[nodiscard]] core::Result<LogicalOperator> parse_logical_operator(std::string_view value);
[[nodiscard]] core::Result<CompoundOperator> parse_compound_operator(std::string_view value);

/// Validation error for an unknown field, with a "did you mean" hint
[[nodiscard]] core::Error unknown_field(std::string_view field,
                                        const std::vector<std::string_view>& known);

/// Typed value extraction (error field "value")
[[nodiscard]] core::Result<std::string> expect_string(const nlohmann::json& value,
                                                      bool allow_empty = false);

namespace detail {

template <typename Leaf>
core::Result<Query<Leaf>> parse_node(const nlohmann::json& j, const LeafParser<Leaf>& parse_leaf,
                                     size_t depth) {
    using core::Error;
    using core::ValidationReason;

    if (!j.is_object()) {
        return Error::validation("", ValidationReason::InvalidValue, "query must be an object");
    }

    if (depth > kMaxQueryDepth) {
        return Error::validation("", ValidationReason::TooManyItems, "query nested too deeply");
    }

    if (!j.contains("operator") || !j["operator"].is_string()) {
        return Error::validation("operator", ValidationReason::EmptyField);
    }
    const auto op_name = j["operator"].get<std::string>();

    // Compound node
    if (j.contains("queries")) {
        auto op = parse_compound_operator(op_name);
        if (!op) {
            return std::move(op).error();
        }

        const auto& children = j["queries"];
        if (!children.is_array()) {
            return Error::validation("queries", ValidationReason::InvalidValue);
        }
        if (children.empty()) {
            return Error::validation("queries", ValidationReason::EmptyField);
        }
        if (children.size() > kMaxCompoundChildren) {
            return Error::validation("queries", ValidationReason::TooManyItems);
        }

        std::vector<Query<Leaf>> queries;
        queries.reserve(children.size());
        for (size_t i = 0; i < children.size(); ++i) {
            auto child = parse_node<Leaf>(children[i], parse_leaf, depth + 1);
            if (!child) {
                return child.error().with_context("queries[" + std::to_string(i) + "]");
            }
            queries.push_back(std::move(child).value());
        }
        return Query<Leaf>::compound(*op, std::move(queries));
    }

    // Leaf node
    if (!j.contains("field") || !j["field"].is_string() ||
        j["field"].get_ref<const std::string&>().empty()) {
        return Error::validation("field", ValidationReason::EmptyField);
    }
    if (!j.contains("value")) {
        return Error::validation("value", ValidationReason::EmptyField);
    }

    auto op = parse_logical_operator(op_name);
    if (!op) {
        return std::move(op).error();
    }

    auto leaf = parse_leaf(j["field"].get<std::string>(), *op, j["value"]);
    if (!leaf) {
        return std::move(leaf).error();
    }
    return Query<Leaf>(std::move(leaf).value());
}

}  // namespace detail

/// Parse a wire query. Error field paths are rooted at `path`
/// (e.g. "query.queries[1].operator").
template <typename Leaf>
[[nodiscard]] core::Result<Query<Leaf>> parse_query(const nlohmann::json& j,
                                                    const LeafParser<Leaf>& parse_leaf,
                                                    std::string_view path = "query") {
    auto result = detail::parse_node<Leaf>(j, parse_leaf, 0);
    if (!result) {
        return result.error().with_context(path);
    }
    return result;
}

}  // namespace warden::query
