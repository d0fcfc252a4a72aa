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

// Gateway Component Factory - Implementation

#include "factory.hpp"

#include "../core/logging.hpp"
#include "auth_middleware.hpp"
#include "permission_middleware.hpp"

namespace warden::gateway {

std::shared_ptr<core::KeyManager> build_key_manager(const control::Config& config,
                                                    std::shared_ptr<core::KeyStore> store,
                                                    core::Clock clock) {
    core::KeyManagerConfig key_config;
    key_config.key_lifetime_seconds = config.keys.key_lifetime_seconds;
    key_config.max_token_ttl_seconds = config.tokens.max_ttl_seconds();
    key_config.cache_enabled = config.keys.cache_enabled;
    key_config.cache_capacity = config.keys.cache_capacity;
    key_config.cache_ttl_seconds = config.keys.cache_ttl_seconds;

    return std::make_shared<core::KeyManager>(key_config, std::move(store), std::move(clock));
}

std::shared_ptr<core::TokenService> build_token_service(const control::Config& config,
                                                        std::shared_ptr<core::KeyManager> keys,
                                                        core::Clock clock) {
    core::TokenServiceConfig token_config;
    token_config.issuer = config.tokens.issuer;
    token_config.access_ttl_seconds = config.tokens.access_ttl_seconds;
    token_config.refresh_ttl_seconds = config.tokens.refresh_ttl_seconds;

    return std::make_shared<core::TokenService>(token_config, std::move(keys), std::move(clock));
}

std::unique_ptr<CredentialExtractor> build_credential_extractor(const control::Config& config) {
    CredentialConfig credentials;
    credentials.cookie_name = config.auth.cookie_name;
    credentials.header = config.auth.header;
    credentials.scheme = config.auth.scheme;

    auto transport = parse_credential_transport(config.auth.transport);
    if (transport) {
        credentials.transport = *transport;
    } else {
        LOG_WARNING(logging::get_logger(), "Unknown credential transport '{}', using 'any'",
                    config.auth.transport);
    }

    return make_credential_extractor(credentials);
}

std::unique_ptr<Pipeline> build_pipeline(const control::Config& config,
                                         std::shared_ptr<core::TokenService> tokens,
                                         std::shared_ptr<store::PermissionStore> permissions) {
    auto* logger = logging::get_logger();
    auto pipeline = std::make_unique<Pipeline>();

    // Logging first so it times the whole call and sees every outcome
    pipeline->use(std::make_unique<LoggingMiddleware>());

    AuthMiddleware::Config auth_config;
    auth_config.enabled = config.auth.enabled;
    auth_config.bypass = config.auth.bypass;
    pipeline->use(std::make_unique<AuthMiddleware>(std::move(auth_config), std::move(tokens),
                                                   build_credential_extractor(config)));

    PermissionMiddleware::Config permission_config;
    permission_config.enabled = config.auth.enabled;
    for (const auto& rule_config : config.auth.operation_rules) {
        auto action = core::parse_action(rule_config.action);
        if (!action) {
            // Validation rejects these; fall back to the strictest action
            LOG_WARNING(logger, "Operation rule '{}' has unknown action '{}', requiring admin",
                        rule_config.pattern, rule_config.action);
        }
        permission_config.rules.push_back(
            OperationRule{rule_config.pattern, action.value_or(core::Action::Admin)});
    }
    pipeline->use(
        std::make_unique<PermissionMiddleware>(std::move(permission_config), std::move(permissions)));

    LOG_INFO(logger, "Pipeline built: middleware={}, auth_enabled={}, operation_rules={}",
             pipeline->size(), config.auth.enabled, config.auth.operation_rules.size());
    return pipeline;
}

}  // namespace warden::gateway
