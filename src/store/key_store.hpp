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

#pragma once

#include <memory>

#include "../core/key_manager.hpp"
#include "database.hpp"

namespace warden::store {

/// signing_keys table. Key material is stored base64url encoded.
class SqliteKeyStore final : public core::KeyStore {
public:
    explicit SqliteKeyStore(std::shared_ptr<Database> db) : db_(std::move(db)) {}

    [[nodiscard]] Result<core::StoredKey> get_active() override;
    [[nodiscard]] Result<core::StoredKey> get(std::string_view id) override;
    [[nodiscard]] Result<std::vector<core::StoredKey>> list() override;
    [[nodiscard]] Status rotate(const core::StoredKey& new_key, bool clear_old) override;
    [[nodiscard]] Result<size_t> delete_expired(int64_t now) override;

private:
    [[nodiscard]] Result<std::vector<core::StoredKey>> select(std::string_view where,
                                                              const query::Filter& filter);

    std::shared_ptr<Database> db_;
};

}  // namespace warden::store
