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

#include "user_store.hpp"

#include "../core/containers.hpp"
#include "../core/crypto.hpp"
#include "../query/wire.hpp"
#include "existence.hpp"

namespace warden::store {

namespace {

query::BindValue password_bind(const std::optional<std::string>& hash) {
    if (hash) {
        return *hash;
    }
    return nullptr;
}

}  // namespace

Result<UserQuery> parse_user_query(const nlohmann::json& j) {
    query::LeafParser<UserLeaf> parse_leaf = [](std::string_view field, query::LogicalOperator op,
                                                const nlohmann::json& value) -> Result<UserLeaf> {
        if (field != "id" && field != "email" && field != "display_name") {
            return query::unknown_field(field, {"id", "email", "display_name"});
        }

        auto text = query::expect_string(value, field == "display_name");
        if (!text) {
            return std::move(text).error();
        }
        if (field == "id") {
            return UserLeaf{query::LogicalQuery<UserIdField>{op, std::move(*text)}};
        }
        if (field == "email") {
            return UserLeaf{query::LogicalQuery<UserEmailField>{op, std::move(*text)}};
        }
        return UserLeaf{query::LogicalQuery<UserDisplayNameField>{op, std::move(*text)}};
    };

    return query::parse_query<UserLeaf>(j, parse_leaf);
}

Result<User> UserStore::create(std::string email, std::optional<std::string> password_hash,
                               std::string display_name) {
    if (email.empty()) {
        return Error::validation("email", core::ValidationReason::EmptyField);
    }
    if (display_name.empty()) {
        display_name = email;
    }

    auto id = core::new_id();
    if (!id) {
        return std::move(id).error();
    }
    User user{std::move(*id), std::move(email), std::move(display_name), std::move(password_hash)};

    auto guard = db_->lock();

    auto stmt =
        db_->prepare("INSERT INTO users (id, email, display_name, password) VALUES (?, ?, ?, ?)");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound =
        stmt->bind_all({user.id, user.email, user.display_name, password_bind(user.password_hash)});
    if (!bound) {
        return std::move(bound).error();
    }

    auto status = stmt->run();
    if (!status) {
        return std::move(status).error();
    }
    return user;
}

Result<std::vector<User>> UserStore::upsert(std::vector<UserUpsert> users) {
    std::vector<std::string> update_ids;
    core::fast_set<std::string> emails;
    for (size_t i = 0; i < users.size(); ++i) {
        const auto& user = users[i];
        const std::string path = "[" + std::to_string(i) + "]";
        if (user.email.empty()) {
            return Error::validation(path + ".email", core::ValidationReason::EmptyField);
        }
        if (user.display_name.empty()) {
            return Error::validation(path + ".display_name", core::ValidationReason::EmptyField);
        }
        if (user.id.empty() && user.password.kind == PasswordUpdate::Kind::Unchanged) {
            return Error::validation(path + ".password", core::ValidationReason::EmptyField,
                                     "new users need a password or an explicit unset");
        }
        if (!emails.insert(user.email).second) {
            return Error::validation(path + ".email", core::ValidationReason::InvalidValue,
                                     "email appears twice in the request");
        }
        if (!user.id.empty()) {
            update_ids.push_back(user.id);
        }
    }

    Transaction tx(*db_);
    auto status = tx.begin();
    if (!status) {
        return std::move(status).error();
    }

    status = ids_in_table(*db_, Table::Users, update_ids);
    if (!status) {
        return std::move(status).error();
    }

    // Email owned by another user
    auto taken = db_->prepare("SELECT 1 FROM users WHERE email = ? AND id != ?");
    if (!taken) {
        return std::move(taken).error();
    }
    auto insert =
        db_->prepare("INSERT INTO users (id, email, display_name, password) VALUES (?, ?, ?, ?)");
    if (!insert) {
        return std::move(insert).error();
    }
    auto update = db_->prepare("UPDATE users SET email = ?, display_name = ? WHERE id = ?");
    if (!update) {
        return std::move(update).error();
    }
    auto update_password = db_->prepare("UPDATE users SET password = ? WHERE id = ?");
    if (!update_password) {
        return std::move(update_password).error();
    }
    auto select = db_->prepare("SELECT password FROM users WHERE id = ?");
    if (!select) {
        return std::move(select).error();
    }

    std::vector<User> stored;
    stored.reserve(users.size());
    for (size_t i = 0; i < users.size(); ++i) {
        auto& user = users[i];
        bool inserting = user.id.empty();
        if (inserting) {
            auto id = core::new_id();
            if (!id) {
                return std::move(id).error();
            }
            user.id = std::move(*id);
        }

        auto bound = taken->bind_all({user.email, user.id});
        if (!bound) {
            return std::move(bound).error();
        }
        auto row = taken->step();
        if (!row) {
            return std::move(row).error();
        }
        taken->reset();
        if (*row) {
            return Error::validation("[" + std::to_string(i) + "].email",
                                     core::ValidationReason::InvalidValue, "email already in use");
        }

        std::optional<std::string> hash;
        if (user.password.kind == PasswordUpdate::Kind::Set) {
            hash = user.password.hash;
        }

        if (inserting) {
            bound = insert->bind_all({user.id, user.email, user.display_name, password_bind(hash)});
            if (!bound) {
                return std::move(bound).error();
            }
            status = insert->run();
            insert->reset();
        } else {
            bound = update->bind_all({user.email, user.display_name, user.id});
            if (!bound) {
                return std::move(bound).error();
            }
            status = update->run();
            update->reset();
            if (status && user.password.kind != PasswordUpdate::Kind::Unchanged) {
                bound = update_password->bind_all({password_bind(hash), user.id});
                if (!bound) {
                    return std::move(bound).error();
                }
                status = update_password->run();
                update_password->reset();
            }
            if (status && user.password.kind == PasswordUpdate::Kind::Unchanged) {
                // Report the hash that stays in place
                bound = select->bind_all({user.id});
                if (!bound) {
                    return std::move(bound).error();
                }
                auto current = select->step();
                if (!current) {
                    return std::move(current).error();
                }
                if (*current) {
                    hash = select->optional_text(0);
                }
                select->reset();
            }
        }
        if (!status) {
            return std::move(status).error();
        }

        stored.push_back(
            User{std::move(user.id), std::move(user.email), std::move(user.display_name), hash});
    }

    status = tx.commit();
    if (!status) {
        return std::move(status).error();
    }
    return stored;
}

Result<std::vector<User>> UserStore::query(const UserQuery* query) {
    auto filter = query::render_where(query);
    if (!filter) {
        return std::move(filter).error();
    }

    auto guard = db_->lock();

    auto stmt = db_->prepare("SELECT u.id, u.email, u.display_name, u.password FROM users u" +
                             filter->expression + " ORDER BY u.email");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound = stmt->bind_all(filter->binds);
    if (!bound) {
        return std::move(bound).error();
    }

    std::vector<User> users;
    while (true) {
        auto row = stmt->step();
        if (!row) {
            return std::move(row).error();
        }
        if (!*row) {
            break;
        }
        users.push_back(
            User{stmt->text(0), stmt->text(1), stmt->text(2), stmt->optional_text(3)});
    }
    return users;
}

Status UserStore::set_password(const std::string& user_id, std::string password_hash) {
    auto guard = db_->lock();

    auto exists = ids_in_table(*db_, Table::Users, {user_id});
    if (!exists) {
        return exists;
    }

    auto stmt = db_->prepare("UPDATE users SET password = ? WHERE id = ?");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound = stmt->bind_all({std::move(password_hash), user_id});
    if (!bound) {
        return std::move(bound).error();
    }
    return stmt->run();
}

Status UserStore::remove(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return Status::success();
    }

    Transaction tx(*db_);
    auto status = tx.begin();
    if (!status) {
        return status;
    }

    status = ids_in_table(*db_, Table::Users, ids);
    if (!status) {
        return status;
    }

    query::Filter filter;
    query::InQuery<UserIdField>{ids}.render(filter);

    auto stmt = db_->prepare("DELETE FROM users WHERE id IN (SELECT u.id FROM users u WHERE " +
                             filter.expression + ")");
    if (!stmt) {
        return std::move(stmt).error();
    }

    auto bound = stmt->bind_all(filter.binds);
    if (!bound) {
        return std::move(bound).error();
    }

    status = stmt->run();
    if (!status) {
        return status;
    }
    return tx.commit();
}

}  // namespace warden::store
