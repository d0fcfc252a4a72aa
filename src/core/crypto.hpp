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

// Warden Crypto - Header
// Ed25519 key material, base64url and random identifiers (OpenSSL EVP)

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <openssl/evp.h>

#include "error.hpp"

namespace warden::core {

/// EVP_PKEY deleter for std::unique_ptr
struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};

/// EVP_MD_CTX deleter for std::unique_ptr
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

/// Raw Ed25519 key sizes (RFC 8032)
inline constexpr size_t kEd25519KeySize = 32;
inline constexpr size_t kEd25519SignatureSize = 64;

/// Ed25519 public key (verification only)
class VerifyingKey {
public:
    VerifyingKey() = default;
    ~VerifyingKey() = default;

    // Non-copyable (owns OpenSSL resources), movable
    VerifyingKey(const VerifyingKey&) = delete;
    VerifyingKey& operator=(const VerifyingKey&) = delete;
    VerifyingKey(VerifyingKey&&) noexcept = default;
    VerifyingKey& operator=(VerifyingKey&&) noexcept = default;

    /// Load from the raw 32-byte public key
    [[nodiscard]] static std::optional<VerifyingKey> from_public_bytes(std::string_view raw);

    /// Verify an EdDSA signature over message
    [[nodiscard]] bool verify(std::string_view message, std::string_view signature) const;

    /// Raw 32-byte public key
    [[nodiscard]] std::optional<std::string> public_bytes() const;

    [[nodiscard]] bool valid() const noexcept { return key_ != nullptr; }

private:
    friend class SigningKey;
    explicit VerifyingKey(EvpPkeyPtr key) : key_(std::move(key)) {}

    EvpPkeyPtr key_;
};

/// Ed25519 private key (signing)
class SigningKey {
public:
    SigningKey() = default;
    ~SigningKey() = default;

    // Non-copyable (owns OpenSSL resources), movable
    SigningKey(const SigningKey&) = delete;
    SigningKey& operator=(const SigningKey&) = delete;
    SigningKey(SigningKey&&) noexcept = default;
    SigningKey& operator=(SigningKey&&) noexcept = default;

    /// Generate a fresh key from the OpenSSL CSPRNG
    [[nodiscard]] static std::optional<SigningKey> generate();

    /// Load from the raw 32-byte private key (as persisted)
    [[nodiscard]] static std::optional<SigningKey> from_private_bytes(std::string_view raw);

    /// Sign message, returns the 64-byte signature
    [[nodiscard]] std::optional<std::string> sign(std::string_view message) const;

    /// Raw 32-byte private key
    [[nodiscard]] std::optional<std::string> private_bytes() const;

    /// Derive the matching public key
    [[nodiscard]] std::optional<VerifyingKey> verifying_key() const;

    [[nodiscard]] bool valid() const noexcept { return key_ != nullptr; }

private:
    explicit SigningKey(EvpPkeyPtr key) : key_(std::move(key)) {}

    EvpPkeyPtr key_;
};

/// Base64url encode without padding (RFC 4648 section 5)
[[nodiscard]] std::string base64url_encode(std::string_view input);

/// Base64url decode (accepts missing padding)
[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

/// Cryptographically random bytes (nullopt if the CSPRNG fails)
[[nodiscard]] std::optional<std::string> random_bytes(size_t count);

/// Random UUID v4 identifier for keys and entities (Store error if the CSPRNG fails)
[[nodiscard]] Result<std::string> new_id();

/// Constant-time comparison
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

/// Last OpenSSL error as text (for logs)
[[nodiscard]] std::string last_openssl_error();

}  // namespace warden::core
