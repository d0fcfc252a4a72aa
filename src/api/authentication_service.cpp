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

// Warden API - Authentication service implementation

#include "authentication_service.hpp"

#include <ctime>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace warden::api {

std::string format_http_date(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buffer[64];
    size_t len = std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string(buffer, len);
}

AuthenticationService::AuthenticationService(
    Config config, std::shared_ptr<store::UserStore> users,
    std::shared_ptr<core::TokenService> tokens, std::shared_ptr<const core::PasswordHasher> hasher,
    std::unique_ptr<gateway::CredentialExtractor> credentials)
    : config_(std::move(config)),
      users_(std::move(users)),
      tokens_(std::move(tokens)),
      hasher_(std::move(hasher)),
      credentials_(std::move(credentials)),
      decoy_hash_(hasher_->hash("decoy").value_or("")) {}

std::string AuthenticationService::session_cookie(std::string_view token,
                                                  int64_t expires_at) const {
    return fmt::format("{}={}; Expires={};{} HttpOnly; SameSite=Strict; Path=/", config_.cookie_name,
                       token, format_http_date(expires_at), config_.cookie_secure ? " Secure;" : "");
}

Result<LoginResponse> AuthenticationService::login(gateway::CallContext& ctx,
                                                   std::string_view email,
                                                   std::string_view password) {
    auto* logger = logging::get_logger();

    if (email.empty() || password.empty()) {
        return Error::unauthenticated("empty email or password");
    }

    // Users without a password cannot log in
    auto filter = store::UserQuery::all_of(
        {store::UserQuery(query::LogicalQuery<store::UserEmailField>::equals(std::string(email))),
         store::UserQuery(store::PasswordIsSetQuery{true})});
    auto users = users_->query(&filter);
    if (!users) {
        return std::move(users).error();
    }

    // Unknown emails still pay for one verification so timing does not reveal them
    bool found = !users->empty() && users->front().password_hash.has_value();
    const std::string& stored = found ? *users->front().password_hash : decoy_hash_;
    bool matched = hasher_->verify(password, stored);
    if (!found || !matched) {
        LOG_AUDIT(logger, "login_failed", "email={}, correlation_id={}",
                  core::sanitize_for_logging(email, 128), ctx.correlation_id);
        return Error::unauthenticated("invalid email or password");
    }

    const auto& user = users->front();

    auto access = tokens_->issue(user.id, core::Audience::Access);
    if (!access) {
        return std::move(access).error();
    }
    auto refresh = tokens_->issue(user.id, core::Audience::Refresh);
    if (!refresh) {
        return std::move(refresh).error();
    }

    ctx.add_response_header("set-cookie", session_cookie(access->token, access->claims.exp));
    LOG_AUDIT(logger, "login", "subject={}, correlation_id={}", user.id, ctx.correlation_id);

    return LoginResponse{access->claims, std::move(access->token), std::move(refresh->token)};
}

Result<core::Claims> AuthenticationService::claims(const gateway::CallContext& ctx) const {
    if (!ctx.claims) {
        return Error::unauthenticated("no claims in call context");
    }
    return *ctx.claims;
}

Result<bool> AuthenticationService::is_logged_in(const gateway::CallContext& ctx) {
    auto token = credentials_ ? credentials_->extract(ctx) : std::nullopt;
    if (!token) {
        return false;
    }

    auto claims = tokens_->validate(*token, core::Audience::Access);
    if (!claims) {
        if (claims.error().is(core::ErrorKind::Unauthenticated)) {
            return false;
        }
        return std::move(claims).error();
    }
    return true;
}

void AuthenticationService::logout(gateway::CallContext& ctx) {
    ctx.add_response_header("set-cookie", session_cookie("", 0));
    if (ctx.claims) {
        LOG_AUDIT(logging::get_logger(), "logout", "subject={}, correlation_id={}",
                  ctx.claims->sub, ctx.correlation_id);
    }
}

Result<core::IssuedToken> AuthenticationService::refresh(gateway::CallContext& ctx,
                                                         std::string_view refresh_token) {
    auto access = tokens_->refresh(refresh_token);
    if (!access) {
        return std::move(access).error();
    }

    ctx.add_response_header("set-cookie", session_cookie(access->token, access->claims.exp));
    return access;
}

}  // namespace warden::api
