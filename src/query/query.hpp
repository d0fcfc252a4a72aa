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

// Warden Query Engine - Header
// Typed AND/OR predicate trees rendered to parameterized SQL filters
//
// A query over an entity is Query<Leaf>, where Leaf is a std::variant of the
// leaf predicates that entity supports. Column names come only from Field
// types known at compile time; every caller value becomes a bind parameter.
//
//   struct NameField {
//       static constexpr std::string_view column = "o.name";
//       using Item = std::string;
//   };
//   using Leaf = std::variant<LogicalQuery<NameField>>;
//   auto q = Query<Leaf>::all_of({LogicalQuery<NameField>::equals("x"), ...});
//   auto filter = render(q);  // "(o.name = ? AND ...)", binds {"x", ...}

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "../core/error.hpp"

namespace warden::query {

/// Typed bind parameter
using BindValue = std::variant<std::nullptr_t, int64_t, std::string, bool>;

/// Rendered filter: the Nth '?' in expression binds to binds[N]
struct Filter {
    std::string expression;
    std::vector<BindValue> binds;

    /// Append a placeholder and its value
    void bind(BindValue value) {
        expression += '?';
        binds.push_back(std::move(value));
    }

    /// Append raw SQL (column names and operators only, never caller data)
    void append(std::string_view sql) { expression += sql; }
};

enum class LogicalOperator {
    Equals,
    NotEquals
};

enum class CompoundOperator {
    And,
    Or
};

[[nodiscard]] std::string_view logical_operator_sql(LogicalOperator op) noexcept;
[[nodiscard]] std::string_view compound_operator_sql(CompoundOperator op) noexcept;

/// Convert a field item into a bind value
[[nodiscard]] inline BindValue to_bind(const std::string& v) { return v; }
[[nodiscard]] inline BindValue to_bind(bool v) { return v; }
[[nodiscard]] inline BindValue to_bind(int64_t v) { return v; }

/// Leaf comparison: `column = ?` / `column != ?`
///
/// Field requirements: `static constexpr std::string_view column` and `using Item`.
template <typename Field>
struct LogicalQuery {
    using Item = typename Field::Item;

    LogicalOperator op = LogicalOperator::Equals;
    Item value{};

    [[nodiscard]] static LogicalQuery equals(Item v) {
        return LogicalQuery{LogicalOperator::Equals, std::move(v)};
    }

    [[nodiscard]] static LogicalQuery not_equals(Item v) {
        return LogicalQuery{LogicalOperator::NotEquals, std::move(v)};
    }

    void render(Filter& out) const {
        out.append(Field::column);
        out.append(" ");
        out.append(logical_operator_sql(op));
        out.append(" ");
        out.bind(to_bind(value));
    }
};

/// Set membership: `column IN (?, ?, ...)`. An empty set matches nothing.
template <typename Field>
struct InQuery {
    using Item = typename Field::Item;

    std::vector<Item> values;

    void render(Filter& out) const {
        if (values.empty()) {
            out.append("0");
            return;
        }

        out.append(Field::column);
        out.append(" IN (");
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                out.append(", ");
            }
            out.bind(to_bind(values[i]));
        }
        out.append(")");
    }
};

/// Recursive predicate tree over the leaves in Leaf
template <typename Leaf>
class Query {
public:
    struct Compound {
        CompoundOperator op = CompoundOperator::And;
        std::vector<Query> queries;
    };

    /// Leaf node (any type the Leaf variant accepts)
    template <typename L,
              typename = std::enable_if_t<
                  std::conjunction_v<std::negation<std::is_same<std::decay_t<L>, Query>>,
                                     std::negation<std::is_same<std::decay_t<L>, Compound>>,
                                     std::is_constructible<Leaf, L&&>>>>
    Query(L&& leaf) : node_(std::in_place_index<0>, std::forward<L>(leaf)) {}

    explicit Query(Compound compound) : node_(std::in_place_index<1>, std::move(compound)) {}

    [[nodiscard]] static Query compound(CompoundOperator op, std::vector<Query> queries) {
        return Query(Compound{op, std::move(queries)});
    }

    [[nodiscard]] static Query all_of(std::vector<Query> queries) {
        return compound(CompoundOperator::And, std::move(queries));
    }

    [[nodiscard]] static Query any_of(std::vector<Query> queries) {
        return compound(CompoundOperator::Or, std::move(queries));
    }

    [[nodiscard]] bool is_compound() const noexcept { return node_.index() == 1; }
    [[nodiscard]] const Leaf& leaf() const { return std::get<0>(node_); }
    [[nodiscard]] const Compound& as_compound() const { return std::get<1>(node_); }

private:
    std::variant<Leaf, Compound> node_;
};

namespace detail {

template <typename T>
void render_leaf(const T& leaf, Filter& out) {
    leaf.render(out);
}

template <typename... Ts>
void render_leaf(const std::variant<Ts...>& leaf, Filter& out) {
    std::visit([&out](const auto& alternative) { render_leaf(alternative, out); }, leaf);
}

template <typename Leaf>
void render_node(const Query<Leaf>& query, Filter& out) {
    if (!query.is_compound()) {
        render_leaf(query.leaf(), out);
        return;
    }

    const auto& compound = query.as_compound();
    out.append("(");
    for (size_t i = 0; i < compound.queries.size(); ++i) {
        if (i > 0) {
            out.append(" ");
            out.append(compound_operator_sql(compound.op));
            out.append(" ");
        }
        render_node(compound.queries[i], out);
    }
    out.append(")");
}

}  // namespace detail

/// Reject empty compounds. The error field is the path of the offending node,
/// e.g. "query.queries[1].queries".
template <typename Leaf>
[[nodiscard]] core::Status validate(const Query<Leaf>& query, std::string_view path = "query") {
    if (!query.is_compound()) {
        return core::Status::success();
    }

    const auto& compound = query.as_compound();
    if (compound.queries.empty()) {
        return core::Error::validation(std::string(path) + ".queries",
                                       core::ValidationReason::EmptyField);
    }

    for (size_t i = 0; i < compound.queries.size(); ++i) {
        std::string child = std::string(path) + ".queries[" + std::to_string(i) + "]";
        auto status = validate(compound.queries[i], child);
        if (!status) {
            return status;
        }
    }
    return core::Status::success();
}

/// Validate, then render to a filter expression and ordered binds
template <typename Leaf>
[[nodiscard]] core::Result<Filter> render(const Query<Leaf>& query) {
    auto status = validate(query);
    if (!status) {
        return std::move(status).error();
    }

    Filter filter;
    detail::render_node(query, filter);
    return filter;
}

/// Render an optional query as a WHERE clause suffix (" WHERE ..." or "")
template <typename Leaf>
[[nodiscard]] core::Result<Filter> render_where(const Query<Leaf>* query) {
    if (!query) {
        return Filter{};
    }

    auto filter = render(*query);
    if (!filter) {
        return filter;
    }
    filter->expression = " WHERE " + filter->expression;
    return filter;
}

}  // namespace warden::query
