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

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../core/permission.hpp"
#include "database.hpp"

namespace warden::store {

class PermissionStore {
public:
    explicit PermissionStore(std::shared_ptr<Database> db) : db_(std::move(db)) {}

    /// Insert permissions with an empty id, update the rest. Referenced users,
    /// organizations, events (and updated permission ids) must exist; the
    /// first missing id fails the whole batch with NotFound. One transaction.
    /// Returns the stored permissions in input order.
    [[nodiscard]] Result<std::vector<core::Permission>> upsert(
        std::vector<core::Permission> permissions);

    /// Permissions matching the query (all when null)
    [[nodiscard]] Result<std::vector<core::Permission>> query(const core::PermissionQuery* query);

    /// Whether any permission matches (used with core::authorize)
    [[nodiscard]] Result<bool> exists(const core::PermissionQuery& query);

    /// Delete by id (every id must exist)
    [[nodiscard]] Status remove(const std::vector<std::string>& ids);

private:
    std::shared_ptr<Database> db_;
};

}  // namespace warden::store
