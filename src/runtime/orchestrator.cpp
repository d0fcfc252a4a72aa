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

// Warden Runtime Orchestrator - Implementation

#include "orchestrator.hpp"

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../gateway/factory.hpp"

namespace warden::runtime {

using core::Error;
using core::Result;
using core::Status;

namespace {

Result<std::string> hash_password(const Runtime& runtime, std::string_view password) {
    if (password.empty()) {
        return Error::validation("password", core::ValidationReason::EmptyField);
    }
    auto hashed = runtime.hasher->hash(password);
    if (!hashed) {
        return Error::store("password hashing failed");
    }
    return std::move(*hashed);
}

}  // namespace

Result<std::unique_ptr<Runtime>> build_runtime(const control::Config& config, core::Clock clock) {
    auto* logger = logging::get_logger();

    // STEP 1: Storage
    auto database = store::Database::open(config.database.path,
                                           static_cast<int>(config.database.busy_timeout_ms));
    if (!database) {
        return std::move(database).error();
    }
    if (auto status = (*database)->ensure_schema(); !status) {
        return std::move(status).error();
    }

    auto runtime = std::make_unique<Runtime>();
    runtime->config = config;
    runtime->clock = clock;
    runtime->database = std::move(*database);

    runtime->users = std::make_shared<store::UserStore>(runtime->database);
    runtime->organizations = std::make_shared<store::OrganizationStore>(runtime->database);
    runtime->events = std::make_shared<store::EventStore>(runtime->database);
    runtime->permissions = std::make_shared<store::PermissionStore>(runtime->database);

    // STEP 2: Keys and tokens
    runtime->key_store = std::make_shared<store::SqliteKeyStore>(runtime->database);
    runtime->keys = gateway::build_key_manager(config, runtime->key_store, clock);
    runtime->tokens = gateway::build_token_service(config, runtime->keys, clock);
    runtime->hasher = std::make_shared<core::Pbkdf2PasswordHasher>();

    // STEP 3: Middleware
    runtime->pipeline = gateway::build_pipeline(config, runtime->tokens, runtime->permissions);

    // STEP 4: Services
    api::AuthenticationService::Config auth_config;
    auth_config.cookie_name = config.auth.cookie_name;
    auth_config.cookie_secure = config.auth.cookie_secure;
    runtime->authentication = std::make_unique<api::AuthenticationService>(
        auth_config, runtime->users, runtime->tokens, runtime->hasher,
        gateway::build_credential_extractor(config));
    runtime->user_service =
        std::make_unique<api::UserService>(runtime->users, runtime->permissions, runtime->hasher);
    runtime->permission_service = std::make_unique<api::PermissionService>(runtime->permissions);
    runtime->organization_service =
        std::make_unique<api::OrganizationService>(runtime->organizations, runtime->permissions);
    runtime->event_service =
        std::make_unique<api::EventService>(runtime->events, runtime->permissions);
    runtime->key_admin = std::make_unique<api::KeyAdminService>(runtime->keys, runtime->permissions);

    LOG_INFO(logger, "Runtime ready: database={}, issuer={}", config.database.path,
             config.tokens.issuer);
    return runtime;
}

Status prepare_signing_keys(Runtime& runtime) {
    auto* logger = logging::get_logger();

    if (runtime.config.keys.purge_expired_on_startup) {
        auto purged = runtime.keys->purge_expired();
        if (!purged) {
            return std::move(purged).error();
        }
        if (*purged > 0) {
            LOG_INFO(logger, "Purged {} expired signing keys", *purged);
        }
    }

    auto active = runtime.key_store->get_active();
    if (active) {
        return Status::success();
    }
    if (!active.error().is(core::ErrorKind::NotFound)) {
        return std::move(active).error();
    }

    if (!runtime.config.keys.rotate_on_startup_if_missing) {
        LOG_WARNING(logger,
                    "No active signing key; tokens cannot be issued until 'warden rotate' runs");
        return Status::success();
    }

    auto key_id = runtime.keys->rotate_key(false);
    if (!key_id) {
        return std::move(key_id).error();
    }
    LOG_INFO(logger, "Generated initial signing key: key_id={}", *key_id);
    return Status::success();
}

Result<std::string> bootstrap_admin(Runtime& runtime, std::string_view email,
                                    std::string_view password) {
    auto hashed = hash_password(runtime, password);
    if (!hashed) {
        return std::move(hashed).error();
    }

    auto user = runtime.users->create(std::string(email), std::move(*hashed));
    if (!user) {
        return std::move(user).error();
    }

    auto granted = runtime.permissions->upsert({core::Permission{"", user->id, core::ServerAdmin{}}});
    if (!granted) {
        return std::move(granted).error();
    }

    LOG_AUDIT(logging::get_logger(), "admin_bootstrapped", "user={}, email={}", user->id,
              core::sanitize_for_logging(email, 128));
    return user->id;
}

Status set_user_password(Runtime& runtime, std::string_view email, std::string_view password) {
    store::UserQuery by_email =
        query::LogicalQuery<store::UserEmailField>::equals(std::string(email));
    auto users = runtime.users->query(&by_email);
    if (!users) {
        return std::move(users).error();
    }
    if (users->empty()) {
        return Error::not_found(std::string(email));
    }

    auto hashed = hash_password(runtime, password);
    if (!hashed) {
        return std::move(hashed).error();
    }

    auto status = runtime.users->set_password(users->front().id, std::move(*hashed));
    if (status) {
        LOG_AUDIT(logging::get_logger(), "password_set", "user={}", users->front().id);
    }
    return status;
}

}  // namespace warden::runtime
