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

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "database.hpp"

namespace warden::store {

struct Event {
    std::string id;  // Empty on upsert: insert with a fresh id
    std::string organization_id;
    std::string name;

    bool operator==(const Event&) const = default;
};

struct EventIdField {
    static constexpr std::string_view column = "e.id";
    using Item = std::string;
};

struct EventOrganizationField {
    static constexpr std::string_view column = "e.organization";
    using Item = std::string;
};

struct EventNameField {
    static constexpr std::string_view column = "e.name";
    using Item = std::string;
};

/// Events the user may read: ServerAdmin, any event role on the event, or an
/// organization role on the owning organization
struct EventReadableBy {
    std::string user_id;

    void render(query::Filter& out) const;
};

using EventLeaf =
    std::variant<query::LogicalQuery<EventIdField>, query::LogicalQuery<EventOrganizationField>,
                 query::LogicalQuery<EventNameField>, query::InQuery<EventIdField>,
                 EventReadableBy>;
using EventQuery = query::Query<EventLeaf>;

/// Wire query over events (fields "id", "organization_id", "name")
[[nodiscard]] Result<EventQuery> parse_event_query(const nlohmann::json& j);

class EventStore {
public:
    explicit EventStore(std::shared_ptr<Database> db) : db_(std::move(db)) {}

    /// Insert events with an empty id (their organization must exist), rename
    /// the rest (which must exist; the owning organization never changes).
    /// Returns the stored events in input order.
    [[nodiscard]] Result<std::vector<Event>> upsert(std::vector<Event> events);

    [[nodiscard]] Result<std::vector<Event>> query(const EventQuery* query);

    /// Delete by id (every id must exist)
    [[nodiscard]] Status remove(const std::vector<std::string>& ids);

private:
    std::shared_ptr<Database> db_;
};

}  // namespace warden::store
