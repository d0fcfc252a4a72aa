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

// Warden API - User service
// Users manage their own account; creating, changing or deleting anyone
// else requires ServerAdmin. Password hashes never leave the service.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../core/password.hpp"
#include "../gateway/pipeline.hpp"
#include "../store/permission_store.hpp"
#include "../store/user_store.hpp"
#include "authorization.hpp"

namespace warden::api {

/// One user to insert (empty id) or update, with a plaintext password change
struct UserRequest {
    std::string id;
    std::string email;
    std::string display_name;
    store::PasswordUpdate::Kind password = store::PasswordUpdate::Kind::Unchanged;
    std::string new_password;  // Kind::Set only
};

class UserService {
public:
    UserService(std::shared_ptr<store::UserStore> users,
                std::shared_ptr<store::PermissionStore> permissions,
                std::shared_ptr<const core::PasswordHasher> hasher)
        : users_(std::move(users)),
          permissions_(std::move(permissions)),
          hasher_(std::move(hasher)) {}

    /// Insert or update users, all or nothing. Returns them in input order
    /// without password hashes.
    [[nodiscard]] Result<std::vector<store::User>> upsert(const gateway::CallContext& ctx,
                                                          std::vector<UserRequest> users);

    /// Users matching the query. Unless the caller is ServerAdmin, other
    /// users come back with id and display name only.
    [[nodiscard]] Result<std::vector<store::User>> query(const gateway::CallContext& ctx,
                                                         const store::UserQuery* filter);

    /// Delete users by id. Deleting anyone but the caller requires ServerAdmin.
    [[nodiscard]] Status remove(const gateway::CallContext& ctx,
                                const std::vector<std::string>& ids);

private:
    std::shared_ptr<store::UserStore> users_;
    std::shared_ptr<store::PermissionStore> permissions_;
    std::shared_ptr<const core::PasswordHasher> hasher_;
};

}  // namespace warden::api
