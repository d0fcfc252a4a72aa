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

// Warden Password Hashing - Implementation

#include "password.hpp"

#include <charconv>
#include <vector>

#include <fmt/format.h>
#include <openssl/evp.h>

#include "crypto.hpp"

namespace warden::core {

namespace {

constexpr std::string_view kScheme = "pbkdf2-sha256";
constexpr uint32_t kMaxIterations = 10'000'000;

std::optional<std::string> derive(std::string_view plaintext, std::string_view salt,
                                  uint32_t iterations, size_t length) {
    std::string out(length, '\0');
    if (PKCS5_PBKDF2_HMAC(plaintext.data(), static_cast<int>(plaintext.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()), static_cast<int>(iterations),
                          EVP_sha256(), static_cast<int>(length),
                          reinterpret_cast<unsigned char*>(out.data())) != 1) {
        return std::nullopt;
    }
    return out;
}

std::vector<std::string_view> split(std::string_view input, char delimiter) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    for (size_t i = 0; i <= input.size(); ++i) {
        if (i == input.size() || input[i] == delimiter) {
            parts.push_back(input.substr(start, i - start));
            start = i + 1;
        }
    }
    return parts;
}

}  // namespace

std::optional<std::string> Pbkdf2PasswordHasher::hash(std::string_view plaintext) const {
    auto salt = random_bytes(kSaltSize);
    if (!salt) {
        return std::nullopt;
    }

    auto derived = derive(plaintext, *salt, iterations_, kHashSize);
    if (!derived) {
        return std::nullopt;
    }

    return fmt::format("{}${}${}${}", kScheme, iterations_, base64url_encode(*salt),
                       base64url_encode(*derived));
}

bool Pbkdf2PasswordHasher::verify(std::string_view plaintext,
                                  std::string_view stored_hash) const {
    auto parts = split(stored_hash, '$');
    if (parts.size() != 4 || parts[0] != kScheme) {
        return false;
    }

    uint32_t iterations = 0;
    auto [ptr, ec] = std::from_chars(parts[1].data(), parts[1].data() + parts[1].size(),
                                     iterations);
    if (ec != std::errc() || ptr != parts[1].data() + parts[1].size() || iterations == 0 ||
        iterations > kMaxIterations) {
        return false;
    }

    auto salt = base64url_decode(parts[2]);
    auto expected = base64url_decode(parts[3]);
    if (!salt || !expected || salt->empty() || expected->empty()) {
        return false;
    }

    auto derived = derive(plaintext, *salt, iterations, expected->size());
    if (!derived) {
        return false;
    }

    return constant_time_equals(*derived, *expected);
}

}  // namespace warden::core
