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

// Warden JWT - Implementation

#include "jwt.hpp"

#include <vector>

namespace warden::core {

// Tokens above this size are rejected before any decoding work
static constexpr size_t kMaxTokenSize = 8192;

std::string_view audience_to_string(Audience audience) noexcept {
    switch (audience) {
        case Audience::Access:
            return "Access";
        case Audience::Refresh:
            return "Refresh";
    }
    return "unknown";
}

std::optional<Audience> parse_audience(std::string_view value) noexcept {
    if (value == "Access") {
        return Audience::Access;
    } else if (value == "Refresh") {
        return Audience::Refresh;
    }
    return std::nullopt;
}

// ============================================================================
// JwtHeader Implementation
// ============================================================================

std::optional<JwtHeader> JwtHeader::parse(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::nullopt;
        }

        JwtHeader header;

        // Algorithm (required)
        if (!j.contains("alg") || !j["alg"].is_string()) {
            return std::nullopt;
        }
        header.algorithm = j["alg"].get<std::string>();

        header.type = j.value("typ", "JWT");

        // Key id is optional in JWS but required by the validator
        header.key_id = j.value("kid", "");

        return header;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::string JwtHeader::serialize() const {
    nlohmann::json j = {{"alg", algorithm}, {"typ", type}};
    if (!key_id.empty()) {
        j["kid"] = key_id;
    }
    return j.dump();
}

// ============================================================================
// Claims Implementation
// ============================================================================

std::optional<Claims> Claims::parse(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::nullopt;
        }

        for (const char* field : {"iss", "sub", "aud"}) {
            if (!j.contains(field) || !j[field].is_string()) {
                return std::nullopt;
            }
        }
        for (const char* field : {"iat", "exp"}) {
            if (!j.contains(field) || !j[field].is_number_integer()) {
                return std::nullopt;
            }
        }

        auto audience = parse_audience(j["aud"].get<std::string>());
        if (!audience) {
            return std::nullopt;
        }

        Claims claims;
        claims.iss = j["iss"].get<std::string>();
        claims.sub = j["sub"].get<std::string>();
        claims.aud = *audience;
        claims.iat = j["iat"].get<int64_t>();
        claims.exp = j["exp"].get<int64_t>();

        return claims;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::string Claims::serialize() const {
    nlohmann::json j = {{"iss", iss},
                        {"sub", sub},
                        {"aud", std::string(audience_to_string(aud))},
                        {"iat", iat},
                        {"exp", exp}};
    return j.dump();
}

// ============================================================================
// Encoding / decoding
// ============================================================================

std::optional<DecodedToken> decode_token(std::string_view token) {
    if (token.empty() || token.size() > kMaxTokenSize) {
        return std::nullopt;
    }

    // STEP 1: Split token into header.payload.signature
    std::vector<std::string_view> parts;
    size_t start = 0;
    for (size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '.') {
            parts.push_back(token.substr(start, i - start));
            start = i + 1;
        }
    }
    parts.push_back(token.substr(start));

    if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
        return std::nullopt;
    }

    // STEP 2: Base64url decode every segment
    auto header_json = base64url_decode(parts[0]);
    auto payload_json = base64url_decode(parts[1]);
    auto signature = base64url_decode(parts[2]);
    if (!header_json || !payload_json || !signature) {
        return std::nullopt;
    }

    // STEP 3: Parse header
    auto header = JwtHeader::parse(*header_json);
    if (!header) {
        return std::nullopt;
    }

    DecodedToken decoded;
    decoded.header = std::move(*header);
    decoded.payload_json = std::move(*payload_json);
    decoded.signature = std::move(*signature);
    decoded.signing_input = std::string(token.substr(0, parts[0].size() + 1 + parts[1].size()));
    return decoded;
}

std::optional<std::string> encode_token(const JwtHeader& header, const Claims& claims,
                                        const SigningKey& key) {
    std::string signing_input =
        base64url_encode(header.serialize()) + "." + base64url_encode(claims.serialize());

    auto signature = key.sign(signing_input);
    if (!signature) {
        return std::nullopt;
    }

    return signing_input + "." + base64url_encode(*signature);
}

}  // namespace warden::core
