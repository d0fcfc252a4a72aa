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

// Warden Token Service - Implementation

#include "token_service.hpp"

#include "logging.hpp"
#include "string_utils.hpp"

namespace warden::core {

TokenService::TokenService(TokenServiceConfig config, std::shared_ptr<KeyManager> keys,
                           Clock clock)
    : config_(std::move(config)), keys_(std::move(keys)), clock_(std::move(clock)) {}

int64_t TokenService::ttl_for(Audience audience) const noexcept {
    return audience == Audience::Refresh ? config_.refresh_ttl_seconds
                                         : config_.access_ttl_seconds;
}

Result<IssuedToken> TokenService::issue(std::string_view subject, Audience audience) {
    if (subject.empty()) {
        return Error::validation("subject", ValidationReason::EmptyField);
    }

    auto signing = keys_->get_signing_key();
    if (!signing) {
        return std::move(signing).error();
    }

    int64_t now = clock_();

    Claims claims;
    claims.iss = config_.issuer;
    claims.sub = std::string(subject);
    claims.aud = audience;
    claims.iat = now;
    claims.exp = now + ttl_for(audience);

    JwtHeader header;
    header.key_id = signing->key_id;

    auto token = encode_token(header, claims, *signing->key);
    if (!token) {
        LOG_ERROR(logging::get_logger(), "Token signing failed: kid={}, error={}",
                  signing->key_id, last_openssl_error());
        return Error::store("token signing failed");
    }

    return IssuedToken{std::move(*token), std::move(claims)};
}

Result<Claims> TokenService::validate(std::string_view token, Audience expected_audience) {
    // STEP 1: Structure and unverified header
    auto decoded = decode_token(token);
    if (!decoded) {
        return reject("malformed token", "");
    }

    const auto& key_id = decoded->header.key_id;

    if (decoded->header.algorithm != kJwtAlgorithm) {
        return reject("unexpected algorithm " + sanitize_for_logging(decoded->header.algorithm, 32),
                      key_id);
    }

    if (key_id.empty()) {
        return reject("missing kid", key_id);
    }

    // STEP 2: Verification key (unknown and expired keys look like bad signatures)
    auto key = keys_->get_verifying_key(key_id);
    if (!key) {
        if (key.error().is(ErrorKind::NotFound)) {
            return reject("unknown or expired key", key_id);
        }
        LOG_ERROR(logging::get_logger(), "Key lookup failed during validation: kid={}, error={}",
                  sanitize_for_logging(key_id, 64), key.error().describe());
        return std::move(key).error();
    }

    // STEP 3: Signature
    if (!(*key)->verify(decoded->signing_input, decoded->signature)) {
        return reject("invalid signature", key_id);
    }

    // STEP 4: Claims
    auto claims = Claims::parse(decoded->payload_json);
    if (!claims) {
        return reject("invalid claims", key_id);
    }

    if (claims->iss != config_.issuer) {
        return reject("issuer mismatch", key_id);
    }

    if (claims->aud != expected_audience) {
        return reject("audience mismatch", key_id);
    }

    if (claims->sub.empty()) {
        return reject("empty subject", key_id);
    }

    if (claims->exp <= claims->iat) {
        return reject("expires_at not after issued_at", key_id);
    }

    int64_t now = clock_();
    if (now < claims->iat) {
        return reject("issued in the future", key_id);
    }
    if (now >= claims->exp) {
        return reject("expired", key_id);
    }

    return std::move(*claims);
}

Result<IssuedToken> TokenService::refresh(std::string_view refresh_token) {
    auto claims = validate(refresh_token, Audience::Refresh);
    if (!claims) {
        return std::move(claims).error();
    }

    return issue(claims->sub, Audience::Access);
}

Error TokenService::reject(std::string_view reason, std::string_view key_id) const {
    LOG_WARNING(logging::get_logger(), "Token rejected: reason={}, kid={}", reason,
                sanitize_for_logging(key_id, 64));
    return Error::unauthenticated(std::string(reason));
}

}  // namespace warden::core
