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

// Warden Token Service - Header
// Issues and validates signed identity claims using the key manager

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "clock.hpp"
#include "error.hpp"
#include "jwt.hpp"
#include "key_manager.hpp"

namespace warden::core {

/// Token service configuration
struct TokenServiceConfig {
    std::string issuer = "https://auth.example.com";
    int64_t access_ttl_seconds = 60LL * 60 * 24 * 30 * 6;
    int64_t refresh_ttl_seconds = 60LL * 60 * 24 * 30 * 12;
};

/// Issued token with the claims it carries
struct IssuedToken {
    std::string token;
    Claims claims;
};

/// Token service (stateless apart from the key manager it reads)
class TokenService {
public:
    TokenService(TokenServiceConfig config, std::shared_ptr<KeyManager> keys,
                 Clock clock = system_clock());
    ~TokenService() = default;

    // Non-copyable, non-movable
    TokenService(const TokenService&) = delete;
    TokenService& operator=(const TokenService&) = delete;

    /// Sign claims for subject with the current signing key
    [[nodiscard]] Result<IssuedToken> issue(std::string_view subject, Audience audience);

    /// Verify signature, issuer, audience and issued_at <= now < expires_at.
    /// Every failed check is Unauthenticated; only store failures differ.
    [[nodiscard]] Result<Claims> validate(std::string_view token, Audience expected_audience);

    /// Exchange a refresh token for a new access token
    [[nodiscard]] Result<IssuedToken> refresh(std::string_view refresh_token);

    [[nodiscard]] int64_t ttl_for(Audience audience) const noexcept;
    [[nodiscard]] const TokenServiceConfig& config() const noexcept { return config_; }

private:
    /// Log the internal reason and return the uniform failure
    [[nodiscard]] Error reject(std::string_view reason, std::string_view key_id) const;

    TokenServiceConfig config_;
    std::shared_ptr<KeyManager> keys_;
    Clock clock_;
};

}  // namespace warden::core
