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

// Warden Credential Transports - Header
// Locate the bearer token in call metadata (cookie or Authorization header)

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pipeline.hpp"

namespace warden::gateway {

enum class CredentialTransport {
    Cookie,  // Cookie named "authorization"
    Header,  // "Authorization: Bearer <token>"
    Any      // Header first, then cookie
};

[[nodiscard]] std::optional<CredentialTransport> parse_credential_transport(
    std::string_view value) noexcept;

/// Token extraction strategy
class CredentialExtractor {
public:
    virtual ~CredentialExtractor() = default;

    /// Token, or nullopt when this transport carries none
    [[nodiscard]] virtual std::optional<std::string> extract(const CallContext& ctx) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

class CookieCredentialExtractor : public CredentialExtractor {
public:
    explicit CookieCredentialExtractor(std::string cookie_name)
        : cookie_name_(std::move(cookie_name)) {}

    [[nodiscard]] std::optional<std::string> extract(const CallContext& ctx) const override;
    [[nodiscard]] std::string_view name() const override { return "cookie"; }

private:
    std::string cookie_name_;
};

class HeaderCredentialExtractor : public CredentialExtractor {
public:
    HeaderCredentialExtractor(std::string header, std::string scheme)
        : header_(std::move(header)), scheme_(std::move(scheme)) {}

    [[nodiscard]] std::optional<std::string> extract(const CallContext& ctx) const override;
    [[nodiscard]] std::string_view name() const override { return "header"; }

private:
    std::string header_;
    std::string scheme_;
};

/// First extractor that yields a token wins
class AnyCredentialExtractor : public CredentialExtractor {
public:
    explicit AnyCredentialExtractor(std::vector<std::unique_ptr<CredentialExtractor>> extractors)
        : extractors_(std::move(extractors)) {}

    [[nodiscard]] std::optional<std::string> extract(const CallContext& ctx) const override;
    [[nodiscard]] std::string_view name() const override { return "any"; }

private:
    std::vector<std::unique_ptr<CredentialExtractor>> extractors_;
};

/// Transport settings
struct CredentialConfig {
    CredentialTransport transport = CredentialTransport::Any;
    std::string cookie_name = "authorization";
    std::string header = "Authorization";
    std::string scheme = "Bearer";
};

[[nodiscard]] std::unique_ptr<CredentialExtractor> make_credential_extractor(
    const CredentialConfig& config);

}  // namespace warden::gateway
