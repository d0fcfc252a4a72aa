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

// Warden Store - Signing key persistence

#include "key_store.hpp"

#include "../core/crypto.hpp"
#include "../core/logging.hpp"

namespace warden::store {

namespace {

constexpr std::string_view kSelectKeys =
    "SELECT id, private_key, state, created_at, expires_at FROM signing_keys";

}  // namespace

Result<std::vector<core::StoredKey>> SqliteKeyStore::select(std::string_view where,
                                                            const query::Filter& filter) {
    auto guard = db_->lock();

    std::string sql(kSelectKeys);
    sql += where;
    sql += " ORDER BY created_at DESC, rowid DESC";

    auto stmt = db_->prepare(sql);
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound = stmt->bind_all(filter.binds);
    if (!bound) {
        return std::move(bound).error();
    }

    std::vector<core::StoredKey> keys;
    while (true) {
        auto row = stmt->step();
        if (!row) {
            return std::move(row).error();
        }
        if (!*row) {
            break;
        }

        core::StoredKey key;
        key.id = stmt->text(0);

        auto material = core::base64url_decode(stmt->text(1));
        auto state = core::parse_key_state(stmt->text(2));
        if (!material || !state) {
            LOG_ERROR(logging::get_logger(), "Corrupt signing key row: kid={}", key.id);
            return Error::store("corrupt signing key row " + key.id);
        }

        key.private_key = std::move(*material);
        key.state = *state;
        key.created_at = stmt->int64(3);
        key.expires_at = stmt->int64(4);
        keys.push_back(std::move(key));
    }
    return keys;
}

Result<core::StoredKey> SqliteKeyStore::get_active() {
    query::Filter filter;
    auto keys = select(" WHERE state = 'ACTIVE'", filter);
    if (!keys) {
        return std::move(keys).error();
    }
    if (keys->empty()) {
        return Error::not_found("active signing key");
    }
    return std::move(keys->front());
}

Result<core::StoredKey> SqliteKeyStore::get(std::string_view id) {
    query::Filter filter;
    filter.append(" WHERE id = ");
    filter.bind(std::string(id));

    auto keys = select(filter.expression, filter);
    if (!keys) {
        return std::move(keys).error();
    }
    if (keys->empty()) {
        return Error::not_found(std::string(id));
    }
    return std::move(keys->front());
}

Result<std::vector<core::StoredKey>> SqliteKeyStore::list() {
    return select("", query::Filter{});
}

Status SqliteKeyStore::rotate(const core::StoredKey& new_key, bool clear_old) {
    Transaction tx(*db_);
    auto status = tx.begin();
    if (!status) {
        return status;
    }

    // Demote or remove first: the partial unique index admits one ACTIVE row
    status = db_->execute(clear_old ? "DELETE FROM signing_keys;"
                                    : "UPDATE signing_keys SET state = 'RETIRED' "
                                      "WHERE state = 'ACTIVE';");
    if (!status) {
        return status;
    }

    auto stmt = db_->prepare(
        "INSERT INTO signing_keys (id, private_key, state, created_at, expires_at) "
        "VALUES (?, ?, ?, ?, ?)");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound = stmt->bind_all({
        new_key.id,
        core::base64url_encode(new_key.private_key),
        std::string(core::key_state_to_string(core::KeyState::Active)),
        new_key.created_at,
        new_key.expires_at,
    });
    if (!bound) {
        return std::move(bound).error();
    }

    status = stmt->run();
    if (!status) {
        return status;
    }

    return tx.commit();
}

Result<size_t> SqliteKeyStore::delete_expired(int64_t now) {
    auto guard = db_->lock();

    auto stmt = db_->prepare("DELETE FROM signing_keys WHERE expires_at <= ?");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto status = stmt->bind(1, now);
    if (!status) {
        return std::move(status).error();
    }

    status = stmt->run();
    if (!status) {
        return std::move(status).error();
    }
    return static_cast<size_t>(stmt->changes());
}

}  // namespace warden::store
