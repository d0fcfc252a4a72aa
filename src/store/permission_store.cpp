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

// Warden Store - Permissions

#include "permission_store.hpp"

#include "../core/crypto.hpp"
#include "../core/logging.hpp"
#include "existence.hpp"

namespace warden::store {

namespace {

query::BindValue optional_id(std::string_view id) {
    if (id.empty()) {
        return nullptr;
    }
    return std::string(id);
}

}  // namespace

Result<std::vector<core::Permission>> PermissionStore::upsert(
    std::vector<core::Permission> permissions) {
    std::vector<std::string> user_ids;
    std::vector<std::string> organization_ids;
    std::vector<std::string> event_ids;
    std::vector<std::string> update_ids;

    for (size_t i = 0; i < permissions.size(); ++i) {
        const auto& permission = permissions[i];
        auto status = core::validate_permission(permission);
        if (!status) {
            return status.error().with_context("[" + std::to_string(i) + "]");
        }

        user_ids.push_back(permission.user_id);
        if (auto id = core::role_organization(permission.role); !id.empty()) {
            organization_ids.emplace_back(id);
        }
        if (auto id = core::role_event(permission.role); !id.empty()) {
            event_ids.emplace_back(id);
        }
        if (!permission.id.empty()) {
            update_ids.push_back(permission.id);
        }
    }

    Transaction tx(*db_);
    auto status = tx.begin();
    if (!status) {
        return std::move(status).error();
    }

    for (auto [table, ids] : {std::pair{Table::Users, &user_ids},
                              std::pair{Table::Organizations, &organization_ids},
                              std::pair{Table::Events, &event_ids},
                              std::pair{Table::Permissions, &update_ids}}) {
        status = ids_in_table(*db_, table, *ids);
        if (!status) {
            return std::move(status).error();
        }
    }

    auto insert = db_->prepare(
        "INSERT INTO permissions (id, user, role, organization, event) VALUES (?, ?, ?, ?, ?)");
    if (!insert) {
        return std::move(insert).error();
    }
    auto update = db_->prepare(
        "UPDATE permissions SET user = ?, role = ?, organization = ?, event = ? WHERE id = ?");
    if (!update) {
        return std::move(update).error();
    }

    for (auto& permission : permissions) {
        bool inserting = permission.id.empty();
        if (inserting) {
            auto id = core::new_id();
            if (!id) {
                return std::move(id).error();
            }
            permission.id = std::move(*id);
        }

        std::string role(core::role_name(permission.role));
        auto organization = optional_id(core::role_organization(permission.role));
        auto event = optional_id(core::role_event(permission.role));

        auto& stmt = inserting ? *insert : *update;
        auto bound = inserting
                         ? stmt.bind_all({permission.id, permission.user_id, role, organization,
                                          event})
                         : stmt.bind_all({permission.user_id, role, organization, event,
                                          permission.id});
        if (!bound) {
            return std::move(bound).error();
        }

        status = stmt.run();
        if (!status) {
            return std::move(status).error();
        }
        stmt.reset();
    }

    status = tx.commit();
    if (!status) {
        return std::move(status).error();
    }
    return permissions;
}

Result<std::vector<core::Permission>> PermissionStore::query(const core::PermissionQuery* query) {
    auto filter = query::render_where(query);
    if (!filter) {
        return std::move(filter).error();
    }

    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "SELECT p.id, p.user, p.role, p.organization, p.event FROM permissions p" +
        filter->expression + " ORDER BY p.user, p.id");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound = stmt->bind_all(filter->binds);
    if (!bound) {
        return std::move(bound).error();
    }

    std::vector<core::Permission> permissions;
    while (true) {
        auto row = stmt->step();
        if (!row) {
            return std::move(row).error();
        }
        if (!*row) {
            break;
        }

        auto id = stmt->text(0);
        auto role = core::make_role(stmt->text(2), stmt->text(3), stmt->text(4));
        if (!role) {
            LOG_ERROR(logging::get_logger(), "Corrupt permission row: id={}, role={}", id,
                      stmt->text(2));
            return Error::store("corrupt permission row " + id);
        }
        permissions.push_back(core::Permission{std::move(id), stmt->text(1), std::move(*role)});
    }
    return permissions;
}

Result<bool> PermissionStore::exists(const core::PermissionQuery& query) {
    auto filter = query::render(query);
    if (!filter) {
        return std::move(filter).error();
    }

    auto guard = db_->lock();

    auto stmt = db_->prepare("SELECT EXISTS (SELECT 1 FROM permissions p WHERE " +
                             filter->expression + ")");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound = stmt->bind_all(filter->binds);
    if (!bound) {
        return std::move(bound).error();
    }

    auto row = stmt->step();
    if (!row) {
        return std::move(row).error();
    }
    return *row && stmt->int64(0) != 0;
}

Status PermissionStore::remove(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return Status::success();
    }

    Transaction tx(*db_);
    auto status = tx.begin();
    if (!status) {
        return status;
    }

    status = ids_in_table(*db_, Table::Permissions, ids);
    if (!status) {
        return status;
    }

    query::Filter filter;
    query::InQuery<core::PermissionIdField>{ids}.render(filter);

    auto stmt = db_->prepare(
        "DELETE FROM permissions WHERE id IN (SELECT p.id FROM permissions p WHERE " +
        filter.expression + ")");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound = stmt->bind_all(filter.binds);
    if (!bound) {
        return std::move(bound).error();
    }

    status = stmt->run();
    if (!status) {
        return status;
    }
    return tx.commit();
}

}  // namespace warden::store
