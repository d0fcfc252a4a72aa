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

// Warden Permission Model - Header
// Roles, capabilities, and authorization expressed as permission queries

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "../query/query.hpp"
#include "error.hpp"

namespace warden::core {

// ============================================================================
// Roles
// ============================================================================

struct ServerAdmin {
    bool operator==(const ServerAdmin&) const = default;
};

struct OrganizationAdmin {
    std::string organization_id;
    bool operator==(const OrganizationAdmin&) const = default;
};

struct OrganizationViewer {
    std::string organization_id;
    bool operator==(const OrganizationViewer&) const = default;
};

struct EventAdmin {
    std::string event_id;
    bool operator==(const EventAdmin&) const = default;
};

struct EventEditor {
    std::string event_id;
    bool operator==(const EventEditor&) const = default;
};

struct EventViewer {
    std::string event_id;
    bool operator==(const EventViewer&) const = default;
};

/// Closed role set. Anything not listed grants nothing.
using Role = std::variant<ServerAdmin, OrganizationAdmin, OrganizationViewer, EventAdmin,
                          EventEditor, EventViewer>;

/// Persisted role name ("SERVER_ADMIN", "ORGANIZATION_ADMIN", ...)
[[nodiscard]] std::string_view role_name(const Role& role) noexcept;

/// Organization scope of an organization role (empty otherwise)
[[nodiscard]] std::string_view role_organization(const Role& role) noexcept;

/// Event scope of an event role (empty otherwise)
[[nodiscard]] std::string_view role_event(const Role& role) noexcept;

/// Rebuild a role from its persisted columns (nullopt if inconsistent)
[[nodiscard]] std::optional<Role> make_role(std::string_view name,
                                            std::string_view organization_id,
                                            std::string_view event_id);

/// {"name": "EVENT_ADMIN", "event_id": "..."} (scope key only where the role has one)
[[nodiscard]] nlohmann::json role_to_json(const Role& role);
[[nodiscard]] Result<Role> role_from_json(const nlohmann::json& j);

/// Permission record: user holds role
struct Permission {
    std::string id;  // Empty for a permission not yet persisted
    std::string user_id;
    Role role;

    bool operator==(const Permission&) const = default;
};

/// Reject empty user/resource ids (field paths relative to the permission)
[[nodiscard]] Status validate_permission(const Permission& permission);

// ============================================================================
// Capabilities
// ============================================================================

enum class Action {
    Read,
    Edit,
    Admin
};

[[nodiscard]] std::string_view action_to_string(Action action) noexcept;
[[nodiscard]] std::optional<Action> parse_action(std::string_view value) noexcept;

struct ServerResource {};

struct OrganizationResource {
    std::string organization_id;
};

struct EventResource {
    std::string event_id;
};

using Resource = std::variant<ServerResource, OrganizationResource, EventResource>;

/// Required action on a resource
struct Capability {
    Action action = Action::Read;
    Resource resource = ServerResource{};

    [[nodiscard]] static Capability server(Action action) { return {action, ServerResource{}}; }
    [[nodiscard]] static Capability organization(Action action, std::string id) {
        return {action, OrganizationResource{std::move(id)}};
    }
    [[nodiscard]] static Capability event(Action action, std::string id) {
        return {action, EventResource{std::move(id)}};
    }

    /// Same resource, read access
    [[nodiscard]] Capability as_read() const { return {Action::Read, resource}; }

    /// Resource id for NotFound reporting (empty for the server)
    [[nodiscard]] std::string resource_id() const;

    [[nodiscard]] std::string describe() const;
};

/// Capability the acting user needs to grant or revoke a permission with this role
[[nodiscard]] Capability required_capability(const Role& role);

/// Capability needed to see a permission with this role in query results
[[nodiscard]] Capability visibility_capability(const Role& role);

// ============================================================================
// Permission queries (rendered against "permissions p")
// ============================================================================

struct PermissionIdField {
    static constexpr std::string_view column = "p.id";
    using Item = std::string;
};

struct PermissionUserField {
    static constexpr std::string_view column = "p.user";
    using Item = std::string;
};

/// Role match (or its negation) including the role's resource scope
struct RoleQuery {
    Role role;
    bool negate = false;

    void render(query::Filter& out) const;
};

/// Organization role held on the organization that owns an event
struct EventOrganizationRoleQuery {
    std::vector<std::string> role_names;  // e.g. {"ORGANIZATION_ADMIN"}
    std::string event_id;

    void render(query::Filter& out) const;
};

/// Permission rows whose resource the user may read
struct PermissionVisibleTo {
    std::string user_id;

    void render(query::Filter& out) const;
};

using PermissionLeaf =
    std::variant<query::LogicalQuery<PermissionIdField>, query::LogicalQuery<PermissionUserField>,
                 query::InQuery<PermissionIdField>, RoleQuery, EventOrganizationRoleQuery,
                 PermissionVisibleTo>;

using PermissionQuery = query::Query<PermissionLeaf>;

/// Wire query over permissions (fields "id", "user_id", "role")
[[nodiscard]] Result<PermissionQuery> parse_permission_query(const nlohmann::json& j);

/// Predicate matching the permission rows that let user_id exercise `required`:
/// And(user = user_id, Or(one leaf per satisfying role)).
/// Combine with And against data predicates to filter and authorize in one query.
[[nodiscard]] PermissionQuery authorize(std::string_view user_id, const Capability& required);

}  // namespace warden::core
