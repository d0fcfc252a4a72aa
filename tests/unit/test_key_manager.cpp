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

// Warden Key Lifecycle Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "core/key_manager.hpp"
#include "test_helpers.hpp"

using namespace warden;
using namespace warden::core;
using warden::testing::FakeClock;
using warden::testing::Fixture;
using warden::testing::kDay;

namespace {

/// Key store whose writes always fail
class FailingKeyStore final : public KeyStore {
public:
    Result<StoredKey> get_active() override { return Error::not_found("active signing key"); }
    Result<StoredKey> get(std::string_view id) override { return Error::not_found(std::string(id)); }
    Result<std::vector<StoredKey>> list() override { return std::vector<StoredKey>{}; }
    Status rotate(const StoredKey&, bool) override { return Error::store("disk full"); }
    Result<size_t> delete_expired(int64_t) override { return Error::store("disk full"); }
};

}  // namespace

TEST_CASE("KeyManager - key state names", "[keys]") {
    REQUIRE(key_state_to_string(KeyState::Active) == "ACTIVE");
    REQUIRE(key_state_to_string(KeyState::Retired) == "RETIRED");
    REQUIRE(parse_key_state("RETIRED") == KeyState::Retired);
    REQUIRE_FALSE(parse_key_state("EXPIRED").has_value());
}

TEST_CASE("KeyManager - no key until the first rotation", "[keys]") {
    Fixture f;

    auto signing = f.keys->get_signing_key();
    REQUIRE_FALSE(signing);
    REQUIRE(signing.error().kind == ErrorKind::Store);

    // Never generated implicitly
    auto keys = f.keys->list_keys();
    REQUIRE(keys);
    REQUIRE(keys->empty());
}

TEST_CASE("KeyManager - rotation retires the previous key", "[keys]") {
    Fixture f;

    auto first = f.keys->rotate_key(false);
    REQUIRE(first);
    f.clock.advance(60);
    auto second = f.keys->rotate_key(false);
    REQUIRE(second);
    REQUIRE(*first != *second);

    auto signing = f.keys->get_signing_key();
    REQUIRE(signing);
    REQUIRE(signing->key_id == *second);
    REQUIRE(signing->expires_at == f.clock.now() + f.keys->config().key_lifetime_seconds);

    auto keys = f.keys->list_keys();
    REQUIRE(keys);
    REQUIRE(keys->size() == 2);
    REQUIRE((*keys)[0].id == *second);
    REQUIRE((*keys)[0].state == KeyState::Active);
    REQUIRE((*keys)[1].id == *first);
    REQUIRE((*keys)[1].state == KeyState::Retired);
    REQUIRE_FALSE((*keys)[1].expired);

    // Retired keys still verify
    REQUIRE(f.keys->get_verifying_key(*first));
    REQUIRE(f.keys->get_verifying_key(*second));
}

TEST_CASE("KeyManager - clear_old deletes every previous key", "[keys]") {
    Fixture f;

    auto first = f.keys->rotate_key(false);
    REQUIRE(first);
    auto second = f.keys->rotate_key(true);
    REQUIRE(second);

    auto keys = f.keys->list_keys();
    REQUIRE(keys);
    REQUIRE(keys->size() == 1);
    REQUIRE(keys->front().id == *second);

    auto old = f.keys->get_verifying_key(*first);
    REQUIRE_FALSE(old);
    REQUIRE(old.error().kind == ErrorKind::NotFound);
}

TEST_CASE("KeyManager - signing window", "[keys]") {
    Fixture f;
    REQUIRE(f.keys->rotate_key(false));

    const auto& config = f.keys->config();
    int64_t last_signing_moment = config.key_lifetime_seconds - config.max_token_ttl_seconds;

    SECTION("signs while a full-length token fits before expiry") {
        f.clock.advance(last_signing_moment);
        REQUIRE(f.keys->get_signing_key());
    }

    SECTION("refuses once it does not") {
        f.clock.advance(last_signing_moment + 1);
        auto signing = f.keys->get_signing_key();
        REQUIRE_FALSE(signing);
        REQUIRE(signing.error().kind == ErrorKind::Store);

        // Still verifies what it already signed
        auto keys = f.keys->list_keys();
        REQUIRE(keys);
        REQUIRE(f.keys->get_verifying_key(keys->front().id));
    }

    SECTION("expired keys neither sign nor verify") {
        f.clock.advance(config.key_lifetime_seconds);
        REQUIRE_FALSE(f.keys->get_signing_key());

        auto keys = f.keys->list_keys();
        REQUIRE(keys);
        REQUIRE(keys->front().expired);

        auto verifying = f.keys->get_verifying_key(keys->front().id);
        REQUIRE_FALSE(verifying);
        REQUIRE(verifying.error().kind == ErrorKind::NotFound);
    }
}

TEST_CASE("KeyManager - purge_expired", "[keys]") {
    Fixture f;

    REQUIRE(f.keys->rotate_key(false));
    f.clock.advance(30 * kDay);
    auto survivor = f.keys->rotate_key(false);
    REQUIRE(survivor);

    auto none = f.keys->purge_expired();
    REQUIRE(none);
    REQUIRE(*none == 0);

    // First key expires, the second has 30 days left
    f.clock.advance(f.keys->config().key_lifetime_seconds - 30 * kDay);
    auto removed = f.keys->purge_expired();
    REQUIRE(removed);
    REQUIRE(*removed == 1);

    auto keys = f.keys->list_keys();
    REQUIRE(keys);
    REQUIRE(keys->size() == 1);
    REQUIRE(keys->front().id == *survivor);
}

TEST_CASE("KeyManager - store failures propagate", "[keys]") {
    FakeClock clock;
    KeyManager keys(KeyManagerConfig{}, std::make_shared<FailingKeyStore>(), clock.clock());

    auto rotated = keys.rotate_key(false);
    REQUIRE_FALSE(rotated);
    REQUIRE(rotated.error().kind == ErrorKind::Store);

    REQUIRE_FALSE(keys.purge_expired());
    REQUIRE_FALSE(keys.get_signing_key());
}

TEST_CASE("KeyManager - verifying key cache", "[keys][cache]") {
    FakeClock clock;
    auto db = warden::testing::open_memory_database();
    KeyManagerConfig config;
    config.cache_enabled = true;
    config.cache_ttl_seconds = 300;
    KeyManager keys(config, std::make_shared<store::SqliteKeyStore>(db), clock.clock());

    auto id = keys.rotate_key(false);
    REQUIRE(id);
    REQUIRE(keys.cache_size() == 0);

    auto first = keys.get_verifying_key(*id);
    REQUIRE(first);
    REQUIRE(keys.cache_size() == 1);

    auto second = keys.get_verifying_key(*id);
    REQUIRE(second);
    REQUIRE(first->get() == second->get());

    SECTION("clear_old rotation empties the cache") {
        REQUIRE(keys.rotate_key(true));
        REQUIRE(keys.cache_size() == 0);
        REQUIRE_FALSE(keys.get_verifying_key(*id));
    }

    SECTION("disabled by default") {
        Fixture f;
        REQUIRE(f.keys->rotate_key(false));
        auto listed = f.keys->list_keys();
        REQUIRE(listed);
        REQUIRE(f.keys->get_verifying_key(listed->front().id));
        REQUIRE(f.keys->cache_size() == 0);
    }
}

TEST_CASE("VerifyingKeyCache - deadlines and eviction", "[keys][cache]") {
    auto signing = SigningKey::generate();
    REQUIRE(signing.has_value());
    auto verifying = signing->verifying_key();
    REQUIRE(verifying.has_value());
    auto key = std::make_shared<const VerifyingKey>(std::move(*verifying));

    SECTION("entry lives until the cache ttl") {
        VerifyingKeyCache cache(4, 100);
        cache.put("a", key, 1000, 1'000'000);
        REQUIRE(cache.get("a", 1099) != nullptr);
        REQUIRE(cache.get("a", 1100) == nullptr);
        REQUIRE(cache.size() == 0);
    }

    SECTION("or until the key expires, whichever is first") {
        VerifyingKeyCache cache(4, 100);
        cache.put("a", key, 1000, 1050);
        REQUIRE(cache.get("a", 1049) != nullptr);
        REQUIRE(cache.get("a", 1050) == nullptr);
    }

    SECTION("already expired keys are not cached") {
        VerifyingKeyCache cache(4, 100);
        cache.put("a", key, 1000, 1000);
        REQUIRE(cache.size() == 0);
    }

    SECTION("least recently used entry is evicted") {
        VerifyingKeyCache cache(2, 100);
        cache.put("a", key, 1000, 1'000'000);
        cache.put("b", key, 1000, 1'000'000);
        REQUIRE(cache.get("a", 1001) != nullptr);

        cache.put("c", key, 1001, 1'000'000);
        REQUIRE(cache.size() == 2);
        REQUIRE(cache.get("a", 1002) != nullptr);
        REQUIRE(cache.get("b", 1002) == nullptr);
        REQUIRE(cache.get("c", 1002) != nullptr);
    }

    SECTION("capacity is at least one") {
        VerifyingKeyCache cache(0, 100);
        REQUIRE(cache.capacity() == 1);
        cache.put("a", key, 1000, 1'000'000);
        cache.put("b", key, 1000, 1'000'000);
        REQUIRE(cache.size() == 1);
        REQUIRE(cache.get("b", 1001) != nullptr);
    }

    SECTION("clear") {
        VerifyingKeyCache cache(4, 100);
        cache.put("a", key, 1000, 1'000'000);
        cache.clear();
        REQUIRE(cache.get("a", 1001) == nullptr);
    }
}
