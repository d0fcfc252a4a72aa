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

// Warden Permission Middleware - Header
// Per-operation server-level capability checks

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../core/permission.hpp"
#include "../store/permission_store.hpp"
#include "pipeline.hpp"

namespace warden::gateway {

/// Operation pattern -> server-level action
struct OperationRule {
    std::string pattern;  // Exact operation, or prefix when ending in '*'
    core::Action action = core::Action::Admin;
};

/// Permission middleware (request phase)
/// Must run AFTER AuthMiddleware to have access to validated claims
class PermissionMiddleware : public Middleware {
public:
    struct Config {
        bool enabled = true;
        std::vector<OperationRule> rules;  // First matching rule applies
    };

    PermissionMiddleware(Config config, std::shared_ptr<store::PermissionStore> permissions);
    ~PermissionMiddleware() override = default;

    /// Process request phase (authorize against the permission store)
    [[nodiscard]] MiddlewareResult process_request(CallContext& ctx) override;

    /// Get middleware name
    [[nodiscard]] std::string_view name() const override { return "PermissionMiddleware"; }

    /// Rule applying to an operation (nullptr when unrestricted)
    [[nodiscard]] const OperationRule* find_rule(std::string_view operation) const noexcept;

private:
    Config config_;
    std::shared_ptr<store::PermissionStore> permissions_;
};

}  // namespace warden::gateway
