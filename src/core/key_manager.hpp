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

// Warden Key Lifecycle - Header
// Persistent Ed25519 signing keys with zero-downtime rotation

#pragma once

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clock.hpp"
#include "containers.hpp"
#include "crypto.hpp"
#include "error.hpp"

namespace warden::core {

/// Persisted key state. "Expired" is derived from expires_at, never stored.
enum class KeyState {
    Active,  // Signs new tokens, verifies
    Retired  // Verifies until expiry
};

[[nodiscard]] std::string_view key_state_to_string(KeyState state) noexcept;
[[nodiscard]] std::optional<KeyState> parse_key_state(std::string_view value) noexcept;

/// Key row as persisted
struct StoredKey {
    std::string id;
    std::string private_key;  // Raw 32-byte Ed25519 seed
    KeyState state = KeyState::Active;
    int64_t created_at = 0;
    int64_t expires_at = 0;
};

/// Key metadata for administration (no key material)
struct KeyInfo {
    std::string id;
    KeyState state = KeyState::Active;
    int64_t created_at = 0;
    int64_t expires_at = 0;
    bool expired = false;
};

/// Persistent key store. Implementations must make rotate() atomic.
class KeyStore {
public:
    virtual ~KeyStore() = default;

    /// The single Active key (NotFound if there is none)
    [[nodiscard]] virtual Result<StoredKey> get_active() = 0;

    /// Any key by id, regardless of state or expiry (NotFound if unknown)
    [[nodiscard]] virtual Result<StoredKey> get(std::string_view id) = 0;

    /// All keys, newest first
    [[nodiscard]] virtual Result<std::vector<StoredKey>> list() = 0;

    /// In one transaction: demote Active keys to Retired (or delete every
    /// existing key when clear_old), then insert new_key as Active
    [[nodiscard]] virtual Status rotate(const StoredKey& new_key, bool clear_old) = 0;

    /// Delete keys with expires_at <= now, returns the count removed
    [[nodiscard]] virtual Result<size_t> delete_expired(int64_t now) = 0;
};

/// Key manager configuration
struct KeyManagerConfig {
    int64_t key_lifetime_seconds = 60LL * 60 * 24 * 30 * 24;

    // Longest TTL of any token the service issues. The Active key is refused for
    // signing once less than this remains, so a key always outlives its tokens.
    int64_t max_token_ttl_seconds = 60LL * 60 * 24 * 30 * 12;

    bool cache_enabled = false;
    size_t cache_capacity = 64;
    int64_t cache_ttl_seconds = 300;
};

/// Signing key handle returned to the token service
struct SigningKeyHandle {
    std::string key_id;
    std::shared_ptr<const SigningKey> key;
    int64_t expires_at = 0;
};

/// Time-bounded LRU cache of verifying keys (shared across workers, mutex guarded)
class VerifyingKeyCache {
public:
    explicit VerifyingKeyCache(size_t capacity, int64_t ttl_seconds);
    ~VerifyingKeyCache() = default;

    // Non-copyable, non-movable (owns a mutex)
    VerifyingKeyCache(const VerifyingKeyCache&) = delete;
    VerifyingKeyCache& operator=(const VerifyingKeyCache&) = delete;

    /// Cached key, or nullptr on miss or when the entry is past its deadline
    [[nodiscard]] std::shared_ptr<const VerifyingKey> get(std::string_view key_id, int64_t now);

    /// Cache a key until min(now + ttl, key_expires_at)
    void put(std::string_view key_id, std::shared_ptr<const VerifyingKey> key, int64_t now,
             int64_t key_expires_at);

    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    struct Entry {
        std::shared_ptr<const VerifyingKey> key;
        int64_t deadline;
    };

    size_t capacity_;
    int64_t ttl_seconds_;

    mutable std::mutex mutex_;
    std::list<std::pair<std::string, Entry>> lru_list_;
    fast_map<std::string, decltype(lru_list_)::iterator> index_;
};

/// Key lifecycle manager
class KeyManager {
public:
    KeyManager(KeyManagerConfig config, std::shared_ptr<KeyStore> store,
               Clock clock = system_clock());
    ~KeyManager() = default;

    // Non-copyable, non-movable (shared by reference between services)
    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;

    /// Current Active key. Store error if none exists or if it is too close to
    /// expiry to sign a token of max_token_ttl; never generates a key implicitly.
    [[nodiscard]] Result<SigningKeyHandle> get_signing_key();

    /// Any non-expired key by id (NotFound if unknown or expired)
    [[nodiscard]] Result<std::shared_ptr<const VerifyingKey>> get_verifying_key(
        std::string_view key_id);

    /// Generate and persist a new Active key, retiring (or with clear_old,
    /// deleting) previous keys in the same transaction. Returns the new key id.
    [[nodiscard]] Result<std::string> rotate_key(bool clear_old);

    /// Key metadata, newest first
    [[nodiscard]] Result<std::vector<KeyInfo>> list_keys();

    /// Delete expired keys
    [[nodiscard]] Result<size_t> purge_expired();

    [[nodiscard]] const KeyManagerConfig& config() const noexcept { return config_; }
    [[nodiscard]] size_t cache_size() const { return cache_ ? cache_->size() : 0; }

private:
    KeyManagerConfig config_;
    std::shared_ptr<KeyStore> store_;
    Clock clock_;
    std::unique_ptr<VerifyingKeyCache> cache_;
};

}  // namespace warden::core
