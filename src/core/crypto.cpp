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

// Warden Crypto - Implementation

#include "crypto.hpp"

#include <algorithm>
#include <array>
#include <vector>

#include <fmt/format.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace warden::core {

// ============================================================================
// Base64url
// ============================================================================

std::string base64url_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, bmem);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    BIO_write(b64, input.data(), static_cast<int>(input.size()));
    (void)BIO_flush(b64);

    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64, &bptr);

    std::string result(bptr->data, bptr->length);
    BIO_free_all(b64);

    // base64 -> base64url: '+' -> '-', '/' -> '_', strip '='
    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    return result;
}

std::optional<std::string> base64url_decode(std::string_view input) {
    if (input.empty()) {
        return std::string();
    }

    // BIO silently skips characters outside the alphabet, so reject them first
    for (char c : input) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_';
        if (!ok) {
            return std::nullopt;
        }
    }
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string base64(input);
    std::replace(base64.begin(), base64.end(), '-', '+');
    std::replace(base64.begin(), base64.end(), '_', '/');

    size_t padding = (4 - (base64.size() % 4)) % 4;
    base64.append(padding, '=');

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new_mem_buf(base64.data(), static_cast<int>(base64.size()));
    bmem = BIO_push(b64, bmem);
    BIO_set_flags(bmem, BIO_FLAGS_BASE64_NO_NL);

    std::vector<char> buffer(base64.size());
    int decoded_size = BIO_read(bmem, buffer.data(), static_cast<int>(buffer.size()));
    BIO_free_all(bmem);

    if (decoded_size <= 0) {
        return std::nullopt;
    }

    return std::string(buffer.data(), static_cast<size_t>(decoded_size));
}

// ============================================================================
// Randomness
// ============================================================================

std::optional<std::string> random_bytes(size_t count) {
    std::string out(count, '\0');
    if (count == 0) {
        return out;
    }
    if (RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
        return std::nullopt;
    }
    return out;
}

Result<std::string> new_id() {
    std::array<uint8_t, 16> bytes{};

    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return Error::store(fmt::format("RAND_bytes failed: {}", last_openssl_error()));
    }

    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += fmt::format("{:02x}", bytes[i]);
    }
    return out;
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string last_openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    std::array<char, 256> buf{};
    ERR_error_string_n(code, buf.data(), buf.size());
    ERR_clear_error();
    return std::string(buf.data());
}

// ============================================================================
// VerifyingKey
// ============================================================================

std::optional<VerifyingKey> VerifyingKey::from_public_bytes(std::string_view raw) {
    if (raw.size() != kEd25519KeySize) {
        return std::nullopt;
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(
        EVP_PKEY_ED25519, nullptr, reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
    if (!pkey) {
        return std::nullopt;
    }

    return VerifyingKey(EvpPkeyPtr(pkey));
}

bool VerifyingKey::verify(std::string_view message, std::string_view signature) const {
    if (!key_ || signature.size() != kEd25519SignatureSize) {
        return false;
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }

    // Ed25519 is a one-shot scheme: no digest, no Update/Final
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
        return false;
    }

    return EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char*>(signature.data()),
                            signature.size(),
                            reinterpret_cast<const unsigned char*>(message.data()),
                            message.size()) == 1;
}

std::optional<std::string> VerifyingKey::public_bytes() const {
    if (!key_) {
        return std::nullopt;
    }

    std::string out(kEd25519KeySize, '\0');
    size_t len = out.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), reinterpret_cast<unsigned char*>(out.data()),
                                    &len) != 1 ||
        len != kEd25519KeySize) {
        return std::nullopt;
    }
    return out;
}

// ============================================================================
// SigningKey
// ============================================================================

std::optional<SigningKey> SigningKey::generate() {
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (!pctx) {
        return std::nullopt;
    }

    EVP_PKEY* pkey = nullptr;
    bool ok = EVP_PKEY_keygen_init(pctx) == 1 && EVP_PKEY_keygen(pctx, &pkey) == 1;
    EVP_PKEY_CTX_free(pctx);

    if (!ok || !pkey) {
        EVP_PKEY_free(pkey);
        return std::nullopt;
    }

    return SigningKey(EvpPkeyPtr(pkey));
}

std::optional<SigningKey> SigningKey::from_private_bytes(std::string_view raw) {
    if (raw.size() != kEd25519KeySize) {
        return std::nullopt;
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr, reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
    if (!pkey) {
        return std::nullopt;
    }

    return SigningKey(EvpPkeyPtr(pkey));
}

std::optional<std::string> SigningKey::sign(std::string_view message) const {
    if (!key_) {
        return std::nullopt;
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
        return std::nullopt;
    }

    std::string signature(kEd25519SignatureSize, '\0');
    size_t sig_len = signature.size();
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()), &sig_len,
                       reinterpret_cast<const unsigned char*>(message.data()),
                       message.size()) != 1) {
        return std::nullopt;
    }

    signature.resize(sig_len);
    return signature;
}

std::optional<std::string> SigningKey::private_bytes() const {
    if (!key_) {
        return std::nullopt;
    }

    std::string out(kEd25519KeySize, '\0');
    size_t len = out.size();
    if (EVP_PKEY_get_raw_private_key(key_.get(), reinterpret_cast<unsigned char*>(out.data()),
                                     &len) != 1 ||
        len != kEd25519KeySize) {
        return std::nullopt;
    }
    return out;
}

std::optional<VerifyingKey> SigningKey::verifying_key() const {
    if (!key_) {
        return std::nullopt;
    }

    std::string raw(kEd25519KeySize, '\0');
    size_t len = raw.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), reinterpret_cast<unsigned char*>(raw.data()),
                                    &len) != 1) {
        return std::nullopt;
    }
    return VerifyingKey::from_public_bytes(raw);
}

}  // namespace warden::core
