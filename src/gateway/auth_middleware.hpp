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

// Warden Authentication Middleware - Header

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../core/token_service.hpp"
#include "credentials.hpp"
#include "pipeline.hpp"

namespace warden::gateway {

/// Operations that skip authentication (exact names, or prefixes ending in '*')
class BypassList {
public:
    BypassList() = default;
    explicit BypassList(std::vector<std::string> patterns) : patterns_(std::move(patterns)) {}

    /// Exact or `prefix*` match, as operation_matches()
    [[nodiscard]] bool matches(std::string_view operation) const;

    [[nodiscard]] size_t size() const noexcept { return patterns_.size(); }

private:
    std::vector<std::string> patterns_;
};

/// Token authentication middleware (request phase)
/// Attaches validated claims to the context; every failure stops the
/// pipeline with Unauthenticated before the handler runs.
class AuthMiddleware : public Middleware {
public:
    struct Config {
        bool enabled = true;
        std::vector<std::string> bypass;
    };

    AuthMiddleware(Config config, std::shared_ptr<core::TokenService> tokens,
                   std::unique_ptr<CredentialExtractor> extractor);
    ~AuthMiddleware() override = default;

    /// Process request phase (validate token)
    [[nodiscard]] MiddlewareResult process_request(CallContext& ctx) override;

    /// Get middleware name
    [[nodiscard]] std::string_view name() const override { return "AuthMiddleware"; }

private:
    [[nodiscard]] MiddlewareResult reject(CallContext& ctx, std::string_view reason) const;

    Config config_;
    BypassList bypass_;
    std::shared_ptr<core::TokenService> tokens_;
    std::unique_ptr<CredentialExtractor> extractor_;
};

}  // namespace warden::gateway
