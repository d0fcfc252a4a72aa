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

#include "organization_store.hpp"

#include "../core/crypto.hpp"
#include "../core/string_utils.hpp"
#include "../query/wire.hpp"
#include "existence.hpp"

namespace warden::store {

void OrganizationReadableBy::render(query::Filter& out) const {
    out.append("EXISTS (SELECT 1 FROM permissions rp WHERE rp.user = ");
    out.bind(user_id);
    out.append(
        " AND (rp.role = 'SERVER_ADMIN' OR (rp.role IN ('ORGANIZATION_ADMIN', "
        "'ORGANIZATION_VIEWER') AND rp.organization = o.id)))");
}

Result<OrganizationQuery> parse_organization_query(const nlohmann::json& j) {
    query::LeafParser<OrganizationLeaf> parse_leaf =
        [](std::string_view field, query::LogicalOperator op,
           const nlohmann::json& value) -> Result<OrganizationLeaf> {
        if (field == "id") {
            auto id = query::expect_string(value);
            if (!id) {
                return std::move(id).error();
            }
            return OrganizationLeaf{query::LogicalQuery<OrganizationIdField>{op, std::move(*id)}};
        }
        if (field == "name") {
            auto name = query::expect_string(value, true);
            if (!name) {
                return std::move(name).error();
            }
            return OrganizationLeaf{
                query::LogicalQuery<OrganizationNameField>{op, std::move(*name)}};
        }
        return query::unknown_field(field, {"id", "name"});
    };

    return query::parse_query<OrganizationLeaf>(j, parse_leaf);
}

Result<std::vector<Organization>> OrganizationStore::upsert(
    std::vector<Organization> organizations) {
    std::vector<std::string> update_ids;
    for (size_t i = 0; i < organizations.size(); ++i) {
        if (organizations[i].name.empty()) {
            return Error::validation("[" + std::to_string(i) + "].name",
                                     core::ValidationReason::EmptyField);
        }
        if (!organizations[i].id.empty()) {
            update_ids.push_back(organizations[i].id);
        }
    }

    Transaction tx(*db_);
    auto status = tx.begin();
    if (!status) {
        return std::move(status).error();
    }

    status = ids_in_table(*db_, Table::Organizations, update_ids);
    if (!status) {
        return std::move(status).error();
    }

    auto insert = db_->prepare("INSERT INTO organizations (id, name) VALUES (?, ?)");
    if (!insert) {
        return std::move(insert).error();
    }
    auto update = db_->prepare("UPDATE organizations SET name = ? WHERE id = ?");
    if (!update) {
        return std::move(update).error();
    }

    for (auto& organization : organizations) {
        bool inserting = organization.id.empty();
        if (inserting) {
            auto id = core::new_id();
            if (!id) {
                return std::move(id).error();
            }
            organization.id = std::move(*id);
        }

        // Each statement is prepared once; rebinding requires a reset
        auto& stmt = inserting ? *insert : *update;
        auto bound = inserting ? stmt.bind_all({organization.id, organization.name})
                               : stmt.bind_all({organization.name, organization.id});
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
    return organizations;
}

Result<std::vector<Organization>> OrganizationStore::query(const OrganizationQuery* query) {
    auto filter = query::render_where(query);
    if (!filter) {
        return std::move(filter).error();
    }

    auto guard = db_->lock();

    auto stmt = db_->prepare("SELECT o.id, o.name FROM organizations o" + filter->expression +
                             " ORDER BY o.name, o.id");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound = stmt->bind_all(filter->binds);
    if (!bound) {
        return std::move(bound).error();
    }

    std::vector<Organization> organizations;
    while (true) {
        auto row = stmt->step();
        if (!row) {
            return std::move(row).error();
        }
        if (!*row) {
            break;
        }
        organizations.push_back(Organization{stmt->text(0), stmt->text(1)});
    }
    return organizations;
}

Status OrganizationStore::remove(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return Status::success();
    }

    Transaction tx(*db_);
    auto status = tx.begin();
    if (!status) {
        return status;
    }

    status = ids_in_table(*db_, Table::Organizations, ids);
    if (!status) {
        return status;
    }

    query::Filter filter;
    query::InQuery<OrganizationIdField>{ids}.render(filter);

    auto stmt = db_->prepare(
        "DELETE FROM organizations WHERE id IN (SELECT o.id FROM organizations o WHERE " +
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
