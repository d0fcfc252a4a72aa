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

// Warden Store - Referential existence checks

#include "existence.hpp"

#include <fmt/format.h>

#include "../core/string_utils.hpp"

namespace warden::store {

std::string_view table_name(Table table) noexcept {
    switch (table) {
        case Table::Users:
            return "users";
        case Table::Organizations:
            return "organizations";
        case Table::Events:
            return "events";
        case Table::Permissions:
            return "permissions";
    }
    return "users";
}

Status ids_in_table(Database& db, Table table, const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return Status::success();
    }

    // WITH valid_ids(ord, id) AS (VALUES (0, ?), (1, ?), ...)
    // SELECT v.id FROM valid_ids v LEFT JOIN <table> t ON t.id = v.id
    // WHERE t.id IS NULL ORDER BY v.ord LIMIT 1
    std::vector<std::string> rows;
    rows.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        rows.push_back(fmt::format("({}, ?)", i));
    }

    auto sql = fmt::format(
        "WITH valid_ids(ord, id) AS (VALUES {}) "
        "SELECT v.id FROM valid_ids v LEFT JOIN {} t ON t.id = v.id "
        "WHERE t.id IS NULL ORDER BY v.ord LIMIT 1",
        core::join(rows, ", "), table_name(table));

    auto guard = db.lock();

    auto stmt = db.prepare(sql);
    if (!stmt) {
        return std::move(stmt).error();
    }

    std::vector<query::BindValue> binds(ids.begin(), ids.end());
    auto bound = stmt->bind_all(binds);
    if (!bound) {
        return std::move(bound).error();
    }

    auto row = stmt->step();
    if (!row) {
        return std::move(row).error();
    }
    if (*row) {
        return Error::not_found(stmt->text(0));
    }
    return Status::success();
}

}  // namespace warden::store
