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

// Warden API - Signing key administration (ServerAdmin only)

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../core/key_manager.hpp"
#include "../gateway/pipeline.hpp"
#include "../store/permission_store.hpp"
#include "authorization.hpp"

namespace warden::api {

class KeyAdminService {
public:
    KeyAdminService(std::shared_ptr<core::KeyManager> keys,
                    std::shared_ptr<store::PermissionStore> permissions)
        : keys_(std::move(keys)), permissions_(std::move(permissions)) {}

    /// New Active key; with clear_old the previous keys are deleted rather
    /// than retired, invalidating every outstanding token
    [[nodiscard]] Result<std::string> rotate(const gateway::CallContext& ctx, bool clear_old);

    [[nodiscard]] Result<std::vector<core::KeyInfo>> list(const gateway::CallContext& ctx);

    /// Number of expired keys deleted
    [[nodiscard]] Result<size_t> purge_expired(const gateway::CallContext& ctx);

private:
    [[nodiscard]] Status require_server_admin(const gateway::CallContext& ctx);

    std::shared_ptr<core::KeyManager> keys_;
    std::shared_ptr<store::PermissionStore> permissions_;
};

}  // namespace warden::api
