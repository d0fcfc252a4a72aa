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

// Warden Runtime Orchestrator - Header
// Composition root: opens the store, prepares signing keys and wires the
// token service, middleware pipeline and API services together

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "../api/authentication_service.hpp"
#include "../api/key_admin_service.hpp"
#include "../api/organization_service.hpp"
#include "../api/permission_service.hpp"
#include "../api/user_service.hpp"
#include "../control/config.hpp"
#include "../core/clock.hpp"
#include "../core/key_manager.hpp"
#include "../core/password.hpp"
#include "../core/token_service.hpp"
#include "../gateway/pipeline.hpp"
#include "../store/database.hpp"
#include "../store/event_store.hpp"
#include "../store/key_store.hpp"
#include "../store/organization_store.hpp"
#include "../store/permission_store.hpp"
#include "../store/user_store.hpp"

namespace warden::runtime {

/// Fully wired process state
struct Runtime {
    control::Config config;
    core::Clock clock;

    std::shared_ptr<store::Database> database;
    std::shared_ptr<store::UserStore> users;
    std::shared_ptr<store::OrganizationStore> organizations;
    std::shared_ptr<store::EventStore> events;
    std::shared_ptr<store::PermissionStore> permissions;

    std::shared_ptr<core::KeyStore> key_store;
    std::shared_ptr<core::KeyManager> keys;
    std::shared_ptr<core::TokenService> tokens;
    std::shared_ptr<const core::PasswordHasher> hasher;

    std::unique_ptr<gateway::Pipeline> pipeline;

    std::unique_ptr<api::AuthenticationService> authentication;
    std::unique_ptr<api::UserService> user_service;
    std::unique_ptr<api::PermissionService> permission_service;
    std::unique_ptr<api::OrganizationService> organization_service;
    std::unique_ptr<api::EventService> event_service;
    std::unique_ptr<api::KeyAdminService> key_admin;

    /// Run a call through the pipeline into handler
    [[nodiscard]] core::Status dispatch(gateway::CallContext& ctx, const gateway::Handler& handler) {
        return pipeline->dispatch(ctx, handler);
    }
};

/// Open the database, apply the schema and wire every component.
/// Does not touch signing keys; see prepare_signing_keys().
[[nodiscard]] core::Result<std::unique_ptr<Runtime>> build_runtime(
    const control::Config& config, core::Clock clock = core::system_clock());

/// Startup key housekeeping: purge expired keys (when configured) and, when
/// no Active key exists, rotate only if rotate_on_startup_if_missing is set.
/// A missing key is otherwise a warning; token issuance fails until rotation.
[[nodiscard]] core::Status prepare_signing_keys(Runtime& runtime);

/// Create a user holding ServerAdmin. Returns the new user id.
[[nodiscard]] core::Result<std::string> bootstrap_admin(Runtime& runtime, std::string_view email,
                                                        std::string_view password);

/// Set a user's password by email
[[nodiscard]] core::Status set_user_password(Runtime& runtime, std::string_view email,
                                             std::string_view password);

}  // namespace warden::runtime
