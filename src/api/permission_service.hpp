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

// Warden API - Permission service
// Grants and revokes roles. Granting a role requires the capability the role
// itself confers; updating a row requires it over the old role as well.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../core/permission.hpp"
#include "../gateway/pipeline.hpp"
#include "../store/permission_store.hpp"
#include "authorization.hpp"

namespace warden::api {

class PermissionService {
public:
    explicit PermissionService(std::shared_ptr<store::PermissionStore> permissions)
        : permissions_(std::move(permissions)) {}

    /// Insert (empty id) or update permissions, all or nothing.
    /// Returns the stored rows in input order.
    [[nodiscard]] Result<std::vector<core::Permission>> upsert(
        const gateway::CallContext& ctx, std::vector<core::Permission> permissions);

    /// Permissions matching the query, restricted to rows whose resource the
    /// caller can read. A null query lists every visible row.
    [[nodiscard]] Result<std::vector<core::Permission>> query(const gateway::CallContext& ctx,
                                                              const core::PermissionQuery* filter);

    /// Revoke by id. Ids the caller cannot see are reported as NotFound.
    [[nodiscard]] Status remove(const gateway::CallContext& ctx,
                                const std::vector<std::string>& ids);

private:
    /// Stored rows for ids, in input order. NotFound for the first missing id.
    [[nodiscard]] Result<std::vector<core::Permission>> fetch(const std::vector<std::string>& ids);

    /// Capability over a stored row; NotFound carries the row id
    [[nodiscard]] Status require_on_row(const gateway::CallContext& ctx,
                                        const core::Permission& existing);

    std::shared_ptr<store::PermissionStore> permissions_;
};

}  // namespace warden::api
