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

// Warden Store - Users

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "database.hpp"

namespace warden::store {

struct User {
    std::string id;
    std::string email;
    std::string display_name;
    std::optional<std::string> password_hash;  // Unset: cannot log in
};

/// Password change carried by an upsert
struct PasswordUpdate {
    enum class Kind {
        Unchanged,  // Updates only
        Unset,
        Set
    };

    Kind kind = Kind::Unchanged;
    std::string hash;  // Kind::Set only

    [[nodiscard]] static PasswordUpdate unchanged() { return {}; }
    [[nodiscard]] static PasswordUpdate unset() { return {Kind::Unset, {}}; }
    [[nodiscard]] static PasswordUpdate set(std::string hash) { return {Kind::Set, std::move(hash)}; }
};

/// Insert (empty id) or update of one user
struct UserUpsert {
    std::string id;
    std::string email;
    std::string display_name;
    PasswordUpdate password;
};

struct UserIdField {
    static constexpr std::string_view column = "u.id";
    using Item = std::string;
};

struct UserEmailField {
    static constexpr std::string_view column = "u.email";
    using Item = std::string;
};

struct UserDisplayNameField {
    static constexpr std::string_view column = "u.display_name";
    using Item = std::string;
};

/// `u.password IS [NOT] NULL`
struct PasswordIsSetQuery {
    bool is_set = true;

    void render(query::Filter& out) const {
        out.append(is_set ? "u.password IS NOT NULL" : "u.password IS NULL");
    }
};

using UserLeaf = std::variant<query::LogicalQuery<UserIdField>, query::LogicalQuery<UserEmailField>,
                              query::LogicalQuery<UserDisplayNameField>,
                              query::InQuery<UserIdField>, PasswordIsSetQuery>;
using UserQuery = query::Query<UserLeaf>;

/// Wire query over users (fields "id", "email", "display_name")
[[nodiscard]] Result<UserQuery> parse_user_query(const nlohmann::json& j);

class UserStore {
public:
    explicit UserStore(std::shared_ptr<Database> db) : db_(std::move(db)) {}

    /// Insert a user with a fresh id. Empty email is a validation error; an
    /// empty display name defaults to the email.
    [[nodiscard]] Result<User> create(std::string email,
                                      std::optional<std::string> password_hash = std::nullopt,
                                      std::string display_name = {});

    /// Insert users with an empty id, update the rest (which must exist), all
    /// or nothing. Emails stay unique. Returns the stored users in input order.
    [[nodiscard]] Result<std::vector<User>> upsert(std::vector<UserUpsert> users);

    /// Users matching the query (all users when null)
    [[nodiscard]] Result<std::vector<User>> query(const UserQuery* query);

    /// Replace the stored hash (NotFound if the user does not exist)
    [[nodiscard]] Status set_password(const std::string& user_id, std::string password_hash);

    /// Delete by id (every id must exist). Permissions cascade.
    [[nodiscard]] Status remove(const std::vector<std::string>& ids);

private:
    std::shared_ptr<Database> db_;
};

}  // namespace warden::store
