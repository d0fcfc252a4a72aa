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

// Warden Credential Transports - Implementation

#include "credentials.hpp"

#include "../core/string_utils.hpp"

namespace warden::gateway {

std::optional<CredentialTransport> parse_credential_transport(std::string_view value) noexcept {
    if (value == "cookie") {
        return CredentialTransport::Cookie;
    } else if (value == "header") {
        return CredentialTransport::Header;
    } else if (value == "any") {
        return CredentialTransport::Any;
    }
    return std::nullopt;
}

std::optional<std::string> CookieCredentialExtractor::extract(const CallContext& ctx) const {
    auto cookie_header = ctx.get_header("cookie");
    if (cookie_header.empty()) {
        return std::nullopt;
    }

    auto value = core::find_cookie(cookie_header, cookie_name_);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return std::string(*value);
}

std::optional<std::string> HeaderCredentialExtractor::extract(const CallContext& ctx) const {
    auto auth_header = ctx.get_header(header_);
    if (auth_header.empty()) {
        return std::nullopt;
    }

    // "<scheme> <token>", scheme compared case-insensitively (RFC 7235)
    std::string scheme_prefix = core::to_lower(scheme_) + " ";
    if (auth_header.size() <= scheme_prefix.size() ||
        core::to_lower(auth_header.substr(0, scheme_prefix.size())) != scheme_prefix) {
        return std::nullopt;
    }

    auto token = core::trim(auth_header.substr(scheme_prefix.size()));
    if (token.empty()) {
        return std::nullopt;
    }
    return std::string(token);
}

std::optional<std::string> AnyCredentialExtractor::extract(const CallContext& ctx) const {
    for (const auto& extractor : extractors_) {
        if (auto token = extractor->extract(ctx)) {
            return token;
        }
    }
    return std::nullopt;
}

std::unique_ptr<CredentialExtractor> make_credential_extractor(const CredentialConfig& config) {
    switch (config.transport) {
        case CredentialTransport::Cookie:
            return std::make_unique<CookieCredentialExtractor>(config.cookie_name);
        case CredentialTransport::Header:
            return std::make_unique<HeaderCredentialExtractor>(config.header, config.scheme);
        case CredentialTransport::Any:
            break;
    }

    std::vector<std::unique_ptr<CredentialExtractor>> extractors;
    extractors.push_back(std::make_unique<HeaderCredentialExtractor>(config.header, config.scheme));
    extractors.push_back(std::make_unique<CookieCredentialExtractor>(config.cookie_name));
    return std::make_unique<AnyCredentialExtractor>(std::move(extractors));
}

}  // namespace warden::gateway
