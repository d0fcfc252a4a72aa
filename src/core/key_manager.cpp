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

// Warden Key Lifecycle - Implementation

#include "key_manager.hpp"

#include <algorithm>

#include "logging.hpp"

namespace warden::core {

std::string_view key_state_to_string(KeyState state) noexcept {
    switch (state) {
        case KeyState::Active:
            return "ACTIVE";
        case KeyState::Retired:
            return "RETIRED";
    }
    return "UNKNOWN";
}

std::optional<KeyState> parse_key_state(std::string_view value) noexcept {
    if (value == "ACTIVE") {
        return KeyState::Active;
    } else if (value == "RETIRED") {
        return KeyState::Retired;
    }
    return std::nullopt;
}

// ============================================================================
// VerifyingKeyCache Implementation
// ============================================================================

VerifyingKeyCache::VerifyingKeyCache(size_t capacity, int64_t ttl_seconds)
    : capacity_(std::max<size_t>(capacity, 1)), ttl_seconds_(ttl_seconds) {}

std::shared_ptr<const VerifyingKey> VerifyingKeyCache::get(std::string_view key_id,
                                                           int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(std::string(key_id));
    if (it == index_.end()) {
        return nullptr;
    }

    // Past deadline (cache TTL or key expiry, whichever came first)
    if (now >= it->second->second.deadline) {
        lru_list_.erase(it->second);
        index_.erase(it);
        return nullptr;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return it->second->second.key;
}

void VerifyingKeyCache::put(std::string_view key_id, std::shared_ptr<const VerifyingKey> key,
                            int64_t now, int64_t key_expires_at) {
    int64_t deadline = std::min(now + ttl_seconds_, key_expires_at);
    if (deadline <= now) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string id(key_id);

    auto it = index_.find(id);
    if (it != index_.end()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        it->second->second = Entry{std::move(key), deadline};
        return;
    }

    if (index_.size() >= capacity_) {
        auto& oldest = lru_list_.back();
        index_.erase(oldest.first);
        lru_list_.pop_back();
    }

    lru_list_.emplace_front(id, Entry{std::move(key), deadline});
    index_[id] = lru_list_.begin();
}

void VerifyingKeyCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    lru_list_.clear();
}

size_t VerifyingKeyCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

// ============================================================================
// KeyManager Implementation
// ============================================================================

KeyManager::KeyManager(KeyManagerConfig config, std::shared_ptr<KeyStore> store, Clock clock)
    : config_(std::move(config)), store_(std::move(store)), clock_(std::move(clock)) {
    if (config_.cache_enabled) {
        cache_ = std::make_unique<VerifyingKeyCache>(config_.cache_capacity,
                                                     config_.cache_ttl_seconds);
    }
}

Result<SigningKeyHandle> KeyManager::get_signing_key() {
    auto active = store_->get_active();
    if (!active) {
        if (active.error().is(ErrorKind::NotFound)) {
            LOG_ERROR(logging::get_logger(),
                      "No active signing key; rotate_key must be run before issuing tokens");
            return Error::store("no active signing key");
        }
        return std::move(active).error();
    }

    int64_t now = clock_();
    if (active->expires_at <= now) {
        LOG_ERROR(logging::get_logger(), "Active signing key expired: kid={}, expires_at={}",
                  active->id, active->expires_at);
        return Error::store("active signing key expired");
    }

    // A token signed now may live max_token_ttl; the key must still verify it then
    if (now + config_.max_token_ttl_seconds > active->expires_at) {
        LOG_ERROR(logging::get_logger(),
                  "Active signing key too close to expiry to sign: kid={}, expires_at={}, "
                  "max_token_ttl={}",
                  active->id, active->expires_at, config_.max_token_ttl_seconds);
        return Error::store("active signing key too close to expiry");
    }

    auto key = SigningKey::from_private_bytes(active->private_key);
    if (!key) {
        LOG_ERROR(logging::get_logger(), "Corrupt signing key material: kid={}", active->id);
        return Error::store("corrupt signing key material");
    }

    SigningKeyHandle handle;
    handle.key_id = active->id;
    handle.key = std::make_shared<const SigningKey>(std::move(*key));
    handle.expires_at = active->expires_at;
    return handle;
}

Result<std::shared_ptr<const VerifyingKey>> KeyManager::get_verifying_key(
    std::string_view key_id) {
    int64_t now = clock_();

    if (cache_) {
        if (auto cached = cache_->get(key_id, now)) {
            return cached;
        }
    }

    auto stored = store_->get(key_id);
    if (!stored) {
        return std::move(stored).error();
    }

    if (stored->expires_at <= now) {
        return Error::not_found(std::string(key_id));
    }

    auto signing = SigningKey::from_private_bytes(stored->private_key);
    if (!signing) {
        LOG_ERROR(logging::get_logger(), "Corrupt signing key material: kid={}", stored->id);
        return Error::store("corrupt signing key material");
    }

    auto verifying = signing->verifying_key();
    if (!verifying) {
        return Error::store("cannot derive verifying key");
    }

    auto key = std::make_shared<const VerifyingKey>(std::move(*verifying));
    if (cache_) {
        cache_->put(key_id, key, now, stored->expires_at);
    }
    return key;
}

Result<std::string> KeyManager::rotate_key(bool clear_old) {
    auto key = SigningKey::generate();
    if (!key) {
        LOG_ERROR(logging::get_logger(), "Key generation failed: {}", last_openssl_error());
        return Error::store("key generation failed");
    }

    auto raw = key->private_bytes();
    if (!raw) {
        return Error::store("cannot export generated key");
    }

    auto key_id = new_id();
    if (!key_id) {
        LOG_ERROR(logging::get_logger(), "Key id generation failed: {}",
                  key_id.error().describe());
        return std::move(key_id).error();
    }

    int64_t now = clock_();

    StoredKey stored;
    stored.id = std::move(*key_id);
    stored.private_key = std::move(*raw);
    stored.state = KeyState::Active;
    stored.created_at = now;
    stored.expires_at = now + config_.key_lifetime_seconds;

    auto status = store_->rotate(stored, clear_old);
    if (!status) {
        LOG_ERROR(logging::get_logger(), "Key rotation failed, previous keys unchanged: {}",
                  status.error().describe());
        return std::move(status).error();
    }

    if (cache_ && clear_old) {
        cache_->clear();
    }

    LOG_AUDIT(logging::get_logger(), "key_rotated", "kid={}, expires_at={}, clear_old={}",
              stored.id, stored.expires_at, clear_old);

    return stored.id;
}

Result<std::vector<KeyInfo>> KeyManager::list_keys() {
    auto keys = store_->list();
    if (!keys) {
        return std::move(keys).error();
    }

    int64_t now = clock_();
    std::vector<KeyInfo> infos;
    infos.reserve(keys->size());
    for (const auto& key : *keys) {
        infos.push_back(KeyInfo{key.id, key.state, key.created_at, key.expires_at,
                                key.expires_at <= now});
    }
    return infos;
}

Result<size_t> KeyManager::purge_expired() {
    auto removed = store_->delete_expired(clock_());
    if (!removed) {
        return std::move(removed).error();
    }

    if (*removed > 0) {
        LOG_AUDIT(logging::get_logger(), "keys_purged", "count={}", *removed);
    }
    return removed;
}

}  // namespace warden::core
