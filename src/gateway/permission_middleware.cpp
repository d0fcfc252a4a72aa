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

// Warden Permission Middleware - Implementation

#include "permission_middleware.hpp"

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace warden::gateway {

PermissionMiddleware::PermissionMiddleware(Config config,
                                           std::shared_ptr<store::PermissionStore> permissions)
    : config_(std::move(config)), permissions_(std::move(permissions)) {}

const OperationRule* PermissionMiddleware::find_rule(std::string_view operation) const noexcept {
    for (const auto& rule : config_.rules) {
        if (operation_matches(rule.pattern, operation)) {
            return &rule;
        }
    }
    return nullptr;
}

MiddlewareResult PermissionMiddleware::process_request(CallContext& ctx) {
    if (!config_.enabled) {
        return MiddlewareResult::Continue;
    }

    // STEP 1: Check if operation is restricted
    const auto* rule = find_rule(ctx.operation);
    if (!rule) {
        return MiddlewareResult::Continue;
    }

    // STEP 2: Identity from AuthMiddleware
    if (!ctx.claims) {
        ctx.set_error(core::Error::unauthenticated("no identity for restricted operation"));
        return MiddlewareResult::Stop;
    }

    if (!permissions_) {
        ctx.set_error(core::Error::store("permission middleware not configured"));
        return MiddlewareResult::Error;
    }

    // STEP 3: Existence query over the caller's permissions
    auto capability = core::Capability::server(rule->action);
    auto allowed = permissions_->exists(core::authorize(ctx.claims->sub, capability));
    if (!allowed) {
        LOG_ERROR(logging::get_logger(),
                  "Permission lookup failed: operation={}, error={}, correlation_id={}",
                  core::sanitize_for_logging(ctx.operation, 128), allowed.error().describe(),
                  ctx.correlation_id);
        ctx.set_error(std::move(allowed).error());
        return MiddlewareResult::Error;
    }

    if (!*allowed) {
        LOG_AUDIT(logging::get_logger(), "authorization_denied",
                  "subject={}, operation={}, required={}, correlation_id={}", ctx.claims->sub,
                  core::sanitize_for_logging(ctx.operation, 128), capability.describe(),
                  ctx.correlation_id);
        ctx.set_error(core::Error::forbidden(capability.describe()));
        return MiddlewareResult::Stop;
    }

    return MiddlewareResult::Continue;
}

}  // namespace warden::gateway
