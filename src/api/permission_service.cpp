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

// Warden API - Permission service implementation

#include "permission_service.hpp"

#include "../core/containers.hpp"
#include "../core/logging.hpp"

namespace warden::api {

Result<std::vector<core::Permission>> PermissionService::fetch(
    const std::vector<std::string>& ids) {
    core::PermissionQuery by_ids = query::InQuery<core::PermissionIdField>{ids};
    auto rows = permissions_->query(&by_ids);
    if (!rows) {
        return std::move(rows).error();
    }

    core::fast_map<std::string, core::Permission> by_id;
    for (auto& row : *rows) {
        by_id.emplace(row.id, std::move(row));
    }

    std::vector<core::Permission> ordered;
    ordered.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = by_id.find(id);
        if (it == by_id.end()) {
            return Error::not_found(id);
        }
        ordered.push_back(it->second);
    }
    return ordered;
}

Status PermissionService::require_on_row(const gateway::CallContext& ctx,
                                         const core::Permission& existing) {
    auto status = require(*permissions_, ctx, core::required_capability(existing.role));
    if (!status && status.error().is(core::ErrorKind::NotFound)) {
        // A row on a hidden resource is itself hidden
        return Error::not_found(existing.id);
    }
    return status;
}

Result<std::vector<core::Permission>> PermissionService::upsert(
    const gateway::CallContext& ctx, std::vector<core::Permission> permissions) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    // STEP 1: Shape of every row before any lookup
    std::vector<std::string> update_ids;
    for (size_t i = 0; i < permissions.size(); ++i) {
        auto status = core::validate_permission(permissions[i]);
        if (!status) {
            return status.error().with_context("permissions[" + std::to_string(i) + "]");
        }
        if (!permissions[i].id.empty()) {
            update_ids.push_back(permissions[i].id);
        }
    }

    // STEP 2: Granting a role requires the capability it confers
    for (const auto& permission : permissions) {
        auto status = require(*permissions_, ctx, core::required_capability(permission.role));
        if (!status) {
            return std::move(status).error();
        }
    }

    // STEP 3: Rewriting a row also requires it over the role being replaced
    if (!update_ids.empty()) {
        auto existing = fetch(update_ids);
        if (!existing) {
            return std::move(existing).error();
        }
        for (const auto& permission : *existing) {
            auto status = require_on_row(ctx, permission);
            if (!status) {
                return std::move(status).error();
            }
        }
    }

    auto stored = permissions_->upsert(std::move(permissions));
    if (!stored) {
        return stored;
    }

    for (const auto& permission : *stored) {
        LOG_AUDIT(logging::get_logger(), "permission_granted",
                  "subject={}, permission={}, user={}, role={}, correlation_id={}", *subject,
                  permission.id, permission.user_id, core::role_name(permission.role),
                  ctx.correlation_id);
    }
    return stored;
}

Result<std::vector<core::Permission>> PermissionService::query(const gateway::CallContext& ctx,
                                                               const core::PermissionQuery* filter) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    // Report errors against the caller's own query before it is wrapped
    if (filter) {
        auto status = query::validate(*filter);
        if (!status) {
            return std::move(status).error();
        }
    }

    std::vector<core::PermissionQuery> parts;
    parts.emplace_back(core::PermissionVisibleTo{*subject});
    if (filter) {
        parts.push_back(*filter);
    }
    auto visible = core::PermissionQuery::all_of(std::move(parts));
    return permissions_->query(&visible);
}

Status PermissionService::remove(const gateway::CallContext& ctx,
                                 const std::vector<std::string>& ids) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    auto existing = fetch(ids);
    if (!existing) {
        return std::move(existing).error();
    }

    for (const auto& permission : *existing) {
        auto status = require_on_row(ctx, permission);
        if (!status) {
            return status;
        }
    }

    auto status = permissions_->remove(ids);
    if (!status) {
        return status;
    }

    for (const auto& permission : *existing) {
        LOG_AUDIT(logging::get_logger(), "permission_revoked",
                  "subject={}, permission={}, user={}, role={}, correlation_id={}", *subject,
                  permission.id, permission.user_id, core::role_name(permission.role),
                  ctx.correlation_id);
    }
    return Status::success();
}

}  // namespace warden::api
