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

// Warden Permission Model - Implementation

#include "permission.hpp"

#include <fmt/format.h>

#include "../query/wire.hpp"

namespace warden::core {

namespace {

// Overload set for std::visit
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

constexpr std::string_view kServerAdmin = "SERVER_ADMIN";
constexpr std::string_view kOrganizationAdmin = "ORGANIZATION_ADMIN";
constexpr std::string_view kOrganizationViewer = "ORGANIZATION_VIEWER";
constexpr std::string_view kEventAdmin = "EVENT_ADMIN";
constexpr std::string_view kEventEditor = "EVENT_EDITOR";
constexpr std::string_view kEventViewer = "EVENT_VIEWER";

// Role names are SQL literals from the closed set above; only ids are bound
void render_role_name(query::Filter& out, std::string_view name) {
    out.append("p.role = '");
    out.append(name);
    out.append("'");
}

void render_scoped_role(query::Filter& out, std::string_view name, std::string_view column,
                        std::string_view id) {
    out.append("(");
    render_role_name(out, name);
    out.append(" AND ");
    out.append(column);
    out.append(" = ");
    out.bind(std::string(id));
    out.append(")");
}

PermissionQuery role(Role r) {
    return RoleQuery{std::move(r), false};
}

}  // namespace

// ============================================================================
// Roles
// ============================================================================

std::string_view role_name(const Role& role) noexcept {
    return std::visit(overloaded{
                          [](const ServerAdmin&) { return kServerAdmin; },
                          [](const OrganizationAdmin&) { return kOrganizationAdmin; },
                          [](const OrganizationViewer&) { return kOrganizationViewer; },
                          [](const EventAdmin&) { return kEventAdmin; },
                          [](const EventEditor&) { return kEventEditor; },
                          [](const EventViewer&) { return kEventViewer; },
                      },
                      role);
}

std::string_view role_organization(const Role& role) noexcept {
    if (const auto* r = std::get_if<OrganizationAdmin>(&role)) {
        return r->organization_id;
    }
    if (const auto* r = std::get_if<OrganizationViewer>(&role)) {
        return r->organization_id;
    }
    return {};
}

std::string_view role_event(const Role& role) noexcept {
    if (const auto* r = std::get_if<EventAdmin>(&role)) {
        return r->event_id;
    }
    if (const auto* r = std::get_if<EventEditor>(&role)) {
        return r->event_id;
    }
    if (const auto* r = std::get_if<EventViewer>(&role)) {
        return r->event_id;
    }
    return {};
}

std::optional<Role> make_role(std::string_view name, std::string_view organization_id,
                              std::string_view event_id) {
    if (name == kServerAdmin) {
        return ServerAdmin{};
    }

    if (name == kOrganizationAdmin || name == kOrganizationViewer) {
        if (organization_id.empty()) {
            return std::nullopt;
        }
        if (name == kOrganizationAdmin) {
            return OrganizationAdmin{std::string(organization_id)};
        }
        return OrganizationViewer{std::string(organization_id)};
    }

    if (event_id.empty()) {
        return std::nullopt;
    }
    if (name == kEventAdmin) {
        return EventAdmin{std::string(event_id)};
    } else if (name == kEventEditor) {
        return EventEditor{std::string(event_id)};
    } else if (name == kEventViewer) {
        return EventViewer{std::string(event_id)};
    }
    return std::nullopt;
}

nlohmann::json role_to_json(const Role& role) {
    nlohmann::json j = {{"name", std::string(role_name(role))}};
    if (auto organization_id = role_organization(role); !organization_id.empty()) {
        j["organization_id"] = std::string(organization_id);
    }
    if (auto event_id = role_event(role); !event_id.empty()) {
        j["event_id"] = std::string(event_id);
    }
    return j;
}

Result<Role> role_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error::validation("", ValidationReason::InvalidValue, "role must be an object");
    }

    if (!j.contains("name")) {
        return Error::validation("name", ValidationReason::EmptyField);
    }
    auto name = query::expect_string(j["name"]);
    if (!name) {
        return Error::validation("name", name.error().reason);
    }

    if (*name == kServerAdmin) {
        return Role{ServerAdmin{}};
    }

    bool organization_role = *name == kOrganizationAdmin || *name == kOrganizationViewer;
    bool event_role = *name == kEventAdmin || *name == kEventEditor || *name == kEventViewer;
    if (!organization_role && !event_role) {
        return Error::validation("name", ValidationReason::InvalidEnum);
    }

    const std::string scope_key = organization_role ? "organization_id" : "event_id";
    std::string scope;
    if (j.contains(scope_key)) {
        auto value = query::expect_string(j[scope_key]);
        if (!value) {
            return Error::validation(scope_key, value.error().reason);
        }
        scope = std::move(*value);
    }

    auto role = organization_role ? make_role(*name, scope, "") : make_role(*name, "", scope);
    if (!role) {
        return Error::validation(scope_key, ValidationReason::EmptyField);
    }
    return std::move(*role);
}

Status validate_permission(const Permission& permission) {
    if (permission.user_id.empty()) {
        return Error::validation("user_id", ValidationReason::EmptyField);
    }

    if (std::holds_alternative<OrganizationAdmin>(permission.role) ||
        std::holds_alternative<OrganizationViewer>(permission.role)) {
        if (role_organization(permission.role).empty()) {
            return Error::validation("role.organization_id", ValidationReason::EmptyField);
        }
    } else if (!std::holds_alternative<ServerAdmin>(permission.role)) {
        if (role_event(permission.role).empty()) {
            return Error::validation("role.event_id", ValidationReason::EmptyField);
        }
    }

    return Status::success();
}

// ============================================================================
// Capabilities
// ============================================================================

std::string_view action_to_string(Action action) noexcept {
    switch (action) {
        case Action::Read:
            return "read";
        case Action::Edit:
            return "edit";
        case Action::Admin:
            return "admin";
    }
    return "read";
}

std::optional<Action> parse_action(std::string_view value) noexcept {
    if (value == "read") {
        return Action::Read;
    } else if (value == "edit") {
        return Action::Edit;
    } else if (value == "admin") {
        return Action::Admin;
    }
    return std::nullopt;
}

std::string Capability::resource_id() const {
    return std::visit(overloaded{
                          [](const ServerResource&) { return std::string(); },
                          [](const OrganizationResource& r) { return r.organization_id; },
                          [](const EventResource& r) { return r.event_id; },
                      },
                      resource);
}

std::string Capability::describe() const {
    return std::visit(
        overloaded{
            [this](const ServerResource&) {
                return fmt::format("{} on server", action_to_string(action));
            },
            [this](const OrganizationResource& r) {
                return fmt::format("{} on organization {}", action_to_string(action),
                                   r.organization_id);
            },
            [this](const EventResource& r) {
                return fmt::format("{} on event {}", action_to_string(action), r.event_id);
            },
        },
        resource);
}

Capability required_capability(const Role& role) {
    if (std::holds_alternative<ServerAdmin>(role)) {
        return Capability::server(Action::Admin);
    }

    auto organization_id = role_organization(role);
    if (!organization_id.empty()) {
        return Capability::organization(Action::Admin, std::string(organization_id));
    }

    return Capability::event(Action::Admin, std::string(role_event(role)));
}

Capability visibility_capability(const Role& role) {
    if (std::holds_alternative<ServerAdmin>(role)) {
        return Capability::server(Action::Admin);
    }

    auto organization_id = role_organization(role);
    if (!organization_id.empty()) {
        return Capability::organization(Action::Read, std::string(organization_id));
    }

    return Capability::event(Action::Read, std::string(role_event(role)));
}

// ============================================================================
// Permission queries
// ============================================================================

void RoleQuery::render(query::Filter& out) const {
    if (negate) {
        out.append("NOT ");
    }

    std::visit(overloaded{
                   [&out](const ServerAdmin&) {
                       out.append("(");
                       render_role_name(out, kServerAdmin);
                       out.append(")");
                   },
                   [&out](const OrganizationAdmin& r) {
                       render_scoped_role(out, kOrganizationAdmin, "p.organization",
                                          r.organization_id);
                   },
                   [&out](const OrganizationViewer& r) {
                       render_scoped_role(out, kOrganizationViewer, "p.organization",
                                          r.organization_id);
                   },
                   [&out](const EventAdmin& r) {
                       render_scoped_role(out, kEventAdmin, "p.event", r.event_id);
                   },
                   [&out](const EventEditor& r) {
                       render_scoped_role(out, kEventEditor, "p.event", r.event_id);
                   },
                   [&out](const EventViewer& r) {
                       render_scoped_role(out, kEventViewer, "p.event", r.event_id);
                   },
               },
               role);
}

void EventOrganizationRoleQuery::render(query::Filter& out) const {
    out.append("(p.role IN (");
    for (size_t i = 0; i < role_names.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append("'");
        out.append(role_names[i]);
        out.append("'");
    }
    out.append(") AND p.organization = (SELECT e.organization FROM events e WHERE e.id = ");
    out.bind(event_id);
    out.append("))");
}

void PermissionVisibleTo::render(query::Filter& out) const {
    out.append("EXISTS (SELECT 1 FROM permissions vp WHERE vp.user = ");
    out.bind(user_id);
    out.append(
        " AND (vp.role = 'SERVER_ADMIN'"
        " OR (vp.role IN ('ORGANIZATION_ADMIN', 'ORGANIZATION_VIEWER')"
        " AND vp.organization = p.organization)"
        " OR (vp.role IN ('EVENT_ADMIN', 'EVENT_EDITOR', 'EVENT_VIEWER') AND vp.event = p.event)"
        " OR (vp.role IN ('ORGANIZATION_ADMIN', 'ORGANIZATION_VIEWER')"
        " AND vp.organization = (SELECT e.organization FROM events e WHERE e.id = p.event))))");
}

Result<PermissionQuery> parse_permission_query(const nlohmann::json& j) {
    query::LeafParser<PermissionLeaf> parse_leaf =
        [](std::string_view field, query::LogicalOperator op,
           const nlohmann::json& value) -> Result<PermissionLeaf> {
        if (field == "role") {
            auto role = role_from_json(value);
            if (!role) {
                return role.error().with_context("value");
            }
            return PermissionLeaf{
                RoleQuery{std::move(*role), op == query::LogicalOperator::NotEquals}};
        }

        auto id = query::expect_string(value);
        if (field == "id") {
            if (!id) {
                return std::move(id).error();
            }
            return PermissionLeaf{query::LogicalQuery<PermissionIdField>{op, std::move(*id)}};
        }
        if (field == "user_id") {
            if (!id) {
                return std::move(id).error();
            }
            return PermissionLeaf{query::LogicalQuery<PermissionUserField>{op, std::move(*id)}};
        }
        return query::unknown_field(field, {"id", "user_id", "role"});
    };

    return query::parse_query<PermissionLeaf>(j, parse_leaf);
}

PermissionQuery authorize(std::string_view user_id, const Capability& required) {
    std::vector<PermissionQuery> grants;
    grants.push_back(role(ServerAdmin{}));

    std::visit(
        overloaded{
            [](const ServerResource&) {},
            [&](const OrganizationResource& r) {
                grants.push_back(role(OrganizationAdmin{r.organization_id}));
                if (required.action == Action::Read) {
                    grants.push_back(role(OrganizationViewer{r.organization_id}));
                }
            },
            [&](const EventResource& r) {
                grants.push_back(role(EventAdmin{r.event_id}));
                if (required.action != Action::Admin) {
                    grants.push_back(role(EventEditor{r.event_id}));
                }
                if (required.action == Action::Read) {
                    grants.push_back(role(EventViewer{r.event_id}));
                    grants.push_back(EventOrganizationRoleQuery{
                        {std::string(kOrganizationAdmin), std::string(kOrganizationViewer)},
                        r.event_id});
                } else {
                    grants.push_back(
                        EventOrganizationRoleQuery{{std::string(kOrganizationAdmin)}, r.event_id});
                }
            },
        },
        required.resource);

    return PermissionQuery::all_of({
        query::LogicalQuery<PermissionUserField>::equals(std::string(user_id)),
        PermissionQuery::any_of(std::move(grants)),
    });
}

}  // namespace warden::core
