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

// Gateway Component Factory - Header
// Factory functions for building gateway components (keys, tokens, pipeline)

#pragma once

#include <memory>

#include "../control/config.hpp"
#include "../core/clock.hpp"
#include "../core/key_manager.hpp"
#include "../core/token_service.hpp"
#include "../store/permission_store.hpp"
#include "credentials.hpp"
#include "pipeline.hpp"

namespace warden::gateway {

/// Build key manager over a key store from configuration
[[nodiscard]] std::shared_ptr<core::KeyManager> build_key_manager(
    const control::Config& config, std::shared_ptr<core::KeyStore> store,
    core::Clock clock = core::system_clock());

/// Build token service (shares the key manager)
[[nodiscard]] std::shared_ptr<core::TokenService> build_token_service(
    const control::Config& config, std::shared_ptr<core::KeyManager> keys,
    core::Clock clock = core::system_clock());

/// Build credential extractor for the configured transport
[[nodiscard]] std::unique_ptr<CredentialExtractor> build_credential_extractor(
    const control::Config& config);

/// Build middleware pipeline from configuration:
/// Logging -> Auth -> Permission
[[nodiscard]] std::unique_ptr<Pipeline> build_pipeline(
    const control::Config& config, std::shared_ptr<core::TokenService> tokens,
    std::shared_ptr<store::PermissionStore> permissions);

}  // namespace warden::gateway
