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

// Warden JWT - Header
// Compact JWS encoding for EdDSA-signed identity claims (RFC 7519, RFC 8037)

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "crypto.hpp"

namespace warden::core {

/// Only algorithm accepted or produced
inline constexpr std::string_view kJwtAlgorithm = "EdDSA";

/// Token audience
enum class Audience {
    Access,   // Presented on every call
    Refresh   // Exchanged for a new access token only
};

[[nodiscard]] std::string_view audience_to_string(Audience audience) noexcept;
[[nodiscard]] std::optional<Audience> parse_audience(std::string_view value) noexcept;

/// JWT header (first segment)
struct JwtHeader {
    std::string algorithm = std::string(kJwtAlgorithm);
    std::string type = "JWT";
    std::string key_id;

    [[nodiscard]] static std::optional<JwtHeader> parse(std::string_view json);
    [[nodiscard]] std::string serialize() const;
};

/// Identity claims (second segment). Timestamps are Unix seconds.
struct Claims {
    std::string iss;
    std::string sub;
    Audience aud = Audience::Access;
    int64_t iat = 0;
    int64_t exp = 0;

    /// Strict parse: all five fields required with the right types
    [[nodiscard]] static std::optional<Claims> parse(std::string_view json);
    [[nodiscard]] std::string serialize() const;

    bool operator==(const Claims&) const = default;
};

/// Token split into its segments, signature not yet verified
struct DecodedToken {
    JwtHeader header;
    std::string payload_json;
    std::string signature;
    std::string signing_input;  // "<header>.<payload>" as transmitted
};

/// Split and decode a compact token. Checks structure and header only.
[[nodiscard]] std::optional<DecodedToken> decode_token(std::string_view token);

/// Serialize and sign header + claims into a compact token
[[nodiscard]] std::optional<std::string> encode_token(const JwtHeader& header,
                                                      const Claims& claims,
                                                      const SigningKey& key);

}  // namespace warden::core
