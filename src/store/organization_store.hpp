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

// Warden Store - Organizations

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "database.hpp"

namespace warden::store {

struct Organization {
    std::string id;  // Empty on upsert: insert with a fresh id
    std::string name;

    bool operator==(const Organization&) const = default;
};

struct OrganizationIdField {
    static constexpr std::string_view column = "o.id";
    using Item = std::string;
};

struct OrganizationNameField {
    static constexpr std::string_view column = "o.name";
    using Item = std::string;
};

/// Organizations the user may read (ServerAdmin, or an organization role on it)
struct OrganizationReadableBy {
    std::string user_id;

    void render(query::Filter& out) const;
};

using OrganizationLeaf =
    std::variant<query::LogicalQuery<OrganizationIdField>,
                 query::LogicalQuery<OrganizationNameField>, query::InQuery<OrganizationIdField>,
                 OrganizationReadableBy>;
using OrganizationQuery = query::Query<OrganizationLeaf>;

/// Wire query over organizations (fields "id", "name")
[[nodiscard]] Result<OrganizationQuery> parse_organization_query(const nlohmann::json& j);

class OrganizationStore {
public:
    explicit OrganizationStore(std::shared_ptr<Database> db) : db_(std::move(db)) {}

    /// Insert organizations with an empty id, update the rest (which must exist).
    /// Returns the stored organizations in input order.
    [[nodiscard]] Result<std::vector<Organization>> upsert(std::vector<Organization> organizations);

    [[nodiscard]] Result<std::vector<Organization>> query(const OrganizationQuery* query);

    /// Delete by id (every id must exist). Events and permissions cascade.
    [[nodiscard]] Status remove(const std::vector<std::string>& ids);

private:
    std::shared_ptr<Database> db_;
};

}  // namespace warden::store
