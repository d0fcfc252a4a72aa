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

// Warden Store - Events

#include "event_store.hpp"

#include "../core/crypto.hpp"
#include "../query/wire.hpp"
#include "existence.hpp"

namespace warden::store {

void EventReadableBy::render(query::Filter& out) const {
    out.append("EXISTS (SELECT 1 FROM permissions rp WHERE rp.user = ");
    out.bind(user_id);
    out.append(
        " AND (rp.role = 'SERVER_ADMIN'"
        " OR (rp.role IN ('EVENT_ADMIN', 'EVENT_EDITOR', 'EVENT_VIEWER') AND rp.event = e.id)"
        " OR (rp.role IN ('ORGANIZATION_ADMIN', 'ORGANIZATION_VIEWER')"
        " AND rp.organization = e.organization)))");
}

Result<EventQuery> parse_event_query(const nlohmann::json& j) {
    query::LeafParser<EventLeaf> parse_leaf = [](std::string_view field,
                                                 query::LogicalOperator op,
                                                 const nlohmann::json& value) -> Result<EventLeaf> {
        if (field == "name") {
            auto name = query::expect_string(value, true);
            if (!name) {
                return std::move(name).error();
            }
            return EventLeaf{query::LogicalQuery<EventNameField>{op, std::move(*name)}};
        }

        auto id = query::expect_string(value);
        if (field == "id") {
            if (!id) {
                return std::move(id).error();
            }
            return EventLeaf{query::LogicalQuery<EventIdField>{op, std::move(*id)}};
        }
        if (field == "organization_id") {
            if (!id) {
                return std::move(id).error();
            }
            return EventLeaf{query::LogicalQuery<EventOrganizationField>{op, std::move(*id)}};
        }
        return query::unknown_field(field, {"id", "organization_id", "name"});
    };

    return query::parse_query<EventLeaf>(j, parse_leaf);
}

Result<std::vector<Event>> EventStore::upsert(std::vector<Event> events) {
    std::vector<std::string> organization_ids;
    std::vector<std::string> update_ids;
    for (size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];
        if (event.name.empty()) {
            return Error::validation("[" + std::to_string(i) + "].name",
                                     core::ValidationReason::EmptyField);
        }
        if (event.id.empty()) {
            if (event.organization_id.empty()) {
                return Error::validation("[" + std::to_string(i) + "].organization_id",
                                         core::ValidationReason::EmptyField);
            }
            organization_ids.push_back(event.organization_id);
        } else {
            update_ids.push_back(event.id);
        }
    }

    Transaction tx(*db_);
    auto status = tx.begin();
    if (!status) {
        return std::move(status).error();
    }

    status = ids_in_table(*db_, Table::Organizations, organization_ids);
    if (!status) {
        return std::move(status).error();
    }
    status = ids_in_table(*db_, Table::Events, update_ids);
    if (!status) {
        return std::move(status).error();
    }

    auto insert = db_->prepare("INSERT INTO events (id, organization, name) VALUES (?, ?, ?)");
    if (!insert) {
        return std::move(insert).error();
    }
    auto update = db_->prepare("UPDATE events SET name = ? WHERE id = ? RETURNING organization");
    if (!update) {
        return std::move(update).error();
    }

    for (auto& event : events) {
        if (event.id.empty()) {
            auto id = core::new_id();
            if (!id) {
                return std::move(id).error();
            }
            event.id = std::move(*id);
            auto bound = insert->bind_all({event.id, event.organization_id, event.name});
            if (!bound) {
                return std::move(bound).error();
            }
            status = insert->run();
            if (!status) {
                return std::move(status).error();
            }
            insert->reset();
            continue;
        }

        auto bound = update->bind_all({event.name, event.id});
        if (!bound) {
            return std::move(bound).error();
        }
        auto row = update->step();
        if (!row) {
            return std::move(row).error();
        }
        if (*row) {
            event.organization_id = update->text(0);
        }
        status = update->run();
        if (!status) {
            return std::move(status).error();
        }
        update->reset();
    }

    status = tx.commit();
    if (!status) {
        return std::move(status).error();
    }
    return events;
}

Result<std::vector<Event>> EventStore::query(const EventQuery* query) {
    auto filter = query::render_where(query);
    if (!filter) {
        return std::move(filter).error();
    }

    auto guard = db_->lock();

    auto stmt = db_->prepare("SELECT e.id, e.organization, e.name FROM events e" +
                             filter->expression + " ORDER BY e.name, e.id");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound = stmt->bind_all(filter->binds);
    if (!bound) {
        return std::move(bound).error();
    }

    std::vector<Event> events;
    while (true) {
        auto row = stmt->step();
        if (!row) {
            return std::move(row).error();
        }
        if (!*row) {
            break;
        }
        events.push_back(Event{stmt->text(0), stmt->text(1), stmt->text(2)});
    }
    return events;
}

Status EventStore::remove(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return Status::success();
    }

    Transaction tx(*db_);
    auto status = tx.begin();
    if (!status) {
        return status;
    }

    status = ids_in_table(*db_, Table::Events, ids);
    if (!status) {
        return status;
    }

    query::Filter filter;
    query::InQuery<EventIdField>{ids}.render(filter);

    auto stmt = db_->prepare("DELETE FROM events WHERE id IN (SELECT e.id FROM events e WHERE " +
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
