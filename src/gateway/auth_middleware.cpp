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

// Warden Authentication Middleware - Implementation

#include "auth_middleware.hpp"

#include <algorithm>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace warden::gateway {

bool BypassList::matches(std::string_view operation) const {
    return std::any_of(patterns_.begin(), patterns_.end(), [operation](const std::string& pattern) {
        return operation_matches(pattern, operation);
    });
}

AuthMiddleware::AuthMiddleware(Config config, std::shared_ptr<core::TokenService> tokens,
                               std::unique_ptr<CredentialExtractor> extractor)
    : config_(std::move(config)),
      bypass_(config_.bypass),
      tokens_(std::move(tokens)),
      extractor_(std::move(extractor)) {}

MiddlewareResult AuthMiddleware::process_request(CallContext& ctx) {
    if (!config_.enabled) {
        return MiddlewareResult::Continue;
    }

    // Bypassed operations skip validation regardless of what they carry
    if (bypass_.matches(ctx.operation)) {
        return MiddlewareResult::Continue;
    }

    if (!tokens_ || !extractor_) {
        ctx.set_error(core::Error::store("authentication middleware not configured"));
        return MiddlewareResult::Error;
    }

    // STEP 1: Locate credential via the configured transport
    auto token = extractor_->extract(ctx);
    if (!token) {
        return reject(ctx, "missing credential");
    }

    // STEP 2: Validate (all token failures are Unauthenticated)
    auto claims = tokens_->validate(*token, core::Audience::Access);
    if (!claims) {
        if (claims.error().is(core::ErrorKind::Unauthenticated)) {
            return reject(ctx, claims.error().message);
        }

        LOG_ERROR(logging::get_logger(),
                  "Token validation failed internally: operation={}, error={}, "
                  "correlation_id={}",
                  core::sanitize_for_logging(ctx.operation, 128), claims.error().describe(),
                  ctx.correlation_id);
        ctx.set_error(std::move(claims).error());
        return MiddlewareResult::Error;
    }

    // STEP 3: Attach identity for downstream middleware and handlers
    ctx.set_metadata("subject", claims->sub);
    ctx.claims = std::move(claims).value();

    return MiddlewareResult::Continue;
}

MiddlewareResult AuthMiddleware::reject(CallContext& ctx, std::string_view reason) const {
    LOG_WARNING(logging::get_logger(),
                "Authentication failed: reason={}, operation={}, transport={}, peer={}, "
                "correlation_id={}",
                reason, core::sanitize_for_logging(ctx.operation, 128), extractor_->name(),
                ctx.peer, ctx.correlation_id);

    ctx.set_error(core::Error::unauthenticated(std::string(reason)));
    return MiddlewareResult::Stop;
}

}  // namespace warden::gateway
