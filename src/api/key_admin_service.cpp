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

// Warden API - Signing key administration implementation

#include "key_admin_service.hpp"

#include "../core/logging.hpp"

namespace warden::api {

Status KeyAdminService::require_server_admin(const gateway::CallContext& ctx) {
    return require(*permissions_, ctx, core::Capability::server(core::Action::Admin));
}

Result<std::string> KeyAdminService::rotate(const gateway::CallContext& ctx, bool clear_old) {
    auto status = require_server_admin(ctx);
    if (!status) {
        return std::move(status).error();
    }

    auto key_id = keys_->rotate_key(clear_old);
    if (key_id) {
        LOG_AUDIT(logging::get_logger(), "key_rotation_requested",
                  "subject={}, key_id={}, clear_old={}, correlation_id={}", ctx.subject(),
                  *key_id, clear_old, ctx.correlation_id);
    }
    return key_id;
}

Result<std::vector<core::KeyInfo>> KeyAdminService::list(const gateway::CallContext& ctx) {
    auto status = require_server_admin(ctx);
    if (!status) {
        return std::move(status).error();
    }
    return keys_->list_keys();
}

Result<size_t> KeyAdminService::purge_expired(const gateway::CallContext& ctx) {
    auto status = require_server_admin(ctx);
    if (!status) {
        return std::move(status).error();
    }
    return keys_->purge_expired();
}

}  // namespace warden::api
