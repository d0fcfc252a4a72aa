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

// Warden Password Hashing - Header

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace warden::core {

/// One-way password hash with verification
class PasswordHasher {
public:
    virtual ~PasswordHasher() = default;

    /// Hash a plaintext password into a self-describing string
    [[nodiscard]] virtual std::optional<std::string> hash(std::string_view plaintext) const = 0;

    /// Check plaintext against a stored hash. A malformed hash is a mismatch.
    [[nodiscard]] virtual bool verify(std::string_view plaintext,
                                      std::string_view stored_hash) const = 0;
};

/// PBKDF2-HMAC-SHA256, stored as "pbkdf2-sha256$<iterations>$<salt>$<hash>"
/// with base64url salt and hash
class Pbkdf2PasswordHasher : public PasswordHasher {
public:
    static constexpr uint32_t kDefaultIterations = 310000;
    static constexpr size_t kSaltSize = 16;
    static constexpr size_t kHashSize = 32;

    explicit Pbkdf2PasswordHasher(uint32_t iterations = kDefaultIterations)
        : iterations_(iterations) {}

    [[nodiscard]] std::optional<std::string> hash(std::string_view plaintext) const override;
    [[nodiscard]] bool verify(std::string_view plaintext,
                              std::string_view stored_hash) const override;

private:
    uint32_t iterations_;
};

}  // namespace warden::core
