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

// Warden API - Authentication service
// Login, session cookie handling and token refresh

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "../core/jwt.hpp"
#include "../core/password.hpp"
#include "../core/token_service.hpp"
#include "../gateway/credentials.hpp"
#include "../gateway/pipeline.hpp"
#include "../store/user_store.hpp"
#include "authorization.hpp"

namespace warden::api {

/// Successful login
struct LoginResponse {
    core::Claims claims;
    std::string token;
    std::string refresh_token;
};

/// HTTP date for cookie expiry, e.g. "Thu, 01 Jan 1970 00:00:00 GMT"
[[nodiscard]] std::string format_http_date(int64_t unix_seconds);

class AuthenticationService {
public:
    struct Config {
        std::string cookie_name = "authorization";
        bool cookie_secure = true;
    };

    AuthenticationService(Config config, std::shared_ptr<store::UserStore> users,
                          std::shared_ptr<core::TokenService> tokens,
                          std::shared_ptr<const core::PasswordHasher> hasher,
                          std::unique_ptr<gateway::CredentialExtractor> credentials);

    // Non-copyable, non-movable
    AuthenticationService(const AuthenticationService&) = delete;
    AuthenticationService& operator=(const AuthenticationService&) = delete;

    /// Check email and password, issue access and refresh tokens and set the
    /// session cookie on the response. Any mismatch is Unauthenticated.
    [[nodiscard]] Result<LoginResponse> login(gateway::CallContext& ctx, std::string_view email,
                                              std::string_view password);

    /// Claims of the authenticated caller
    [[nodiscard]] Result<core::Claims> claims(const gateway::CallContext& ctx) const;

    /// Whether the call carries a valid access token. Runs without the
    /// authentication middleware; only store failures are errors.
    [[nodiscard]] Result<bool> is_logged_in(const gateway::CallContext& ctx);

    /// Clear the session cookie
    void logout(gateway::CallContext& ctx);

    /// Exchange a refresh token for a new access token and session cookie
    [[nodiscard]] Result<core::IssuedToken> refresh(gateway::CallContext& ctx,
                                                    std::string_view refresh_token);

    /// Set-Cookie value carrying token until expires_at
    [[nodiscard]] std::string session_cookie(std::string_view token, int64_t expires_at) const;

private:
    Config config_;
    std::shared_ptr<store::UserStore> users_;
    std::shared_ptr<core::TokenService> tokens_;
    std::shared_ptr<const core::PasswordHasher> hasher_;
    std::unique_ptr<gateway::CredentialExtractor> credentials_;
    std::string decoy_hash_;  // Verified against when no user matches
};

}  // namespace warden::api
