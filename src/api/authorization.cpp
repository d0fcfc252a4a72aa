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

// Warden API - Authorization checks shared by the services

#include "authorization.hpp"

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace warden::api {

Result<std::string> require_subject(const gateway::CallContext& ctx) {
    if (!ctx.claims || ctx.claims->sub.empty()) {
        return Error::unauthenticated("no claims in call context");
    }
    return ctx.claims->sub;
}

Status require(store::PermissionStore& permissions, const gateway::CallContext& ctx,
               const core::Capability& capability) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    auto allowed = permissions.exists(core::authorize(*subject, capability));
    if (!allowed) {
        return std::move(allowed).error();
    }
    if (*allowed) {
        return Status::success();
    }

    // Denied: decide whether the resource may be disclosed
    bool visible = false;
    if (std::holds_alternative<core::ServerResource>(capability.resource)) {
        visible = true;
    } else if (capability.action != core::Action::Read) {
        auto readable = permissions.exists(core::authorize(*subject, capability.as_read()));
        if (!readable) {
            return std::move(readable).error();
        }
        visible = *readable;
    }

    LOG_AUDIT(logging::get_logger(), "authorization_denied",
              "subject={}, operation={}, required={}, disclosed={}, correlation_id={}", *subject,
              core::sanitize_for_logging(ctx.operation, 128), capability.describe(), visible,
              ctx.correlation_id);

    if (visible) {
        return Error::forbidden(capability.describe());
    }
    return Error::not_found(capability.resource_id());
}

}  // namespace warden::api
