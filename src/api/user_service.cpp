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

// Warden API - User service implementation

#include "user_service.hpp"

#include <algorithm>

#include "../core/logging.hpp"

namespace warden::api {

namespace {

using PasswordKind = store::PasswordUpdate::Kind;

Status validate_request(const UserRequest& user) {
    if (user.email.empty()) {
        return Error::validation("email", core::ValidationReason::EmptyField);
    }
    if (user.display_name.empty()) {
        return Error::validation("display_name", core::ValidationReason::EmptyField);
    }
    if (user.password == PasswordKind::Set && user.new_password.empty()) {
        return Error::validation("password", core::ValidationReason::EmptyField);
    }
    if (user.id.empty() && user.password == PasswordKind::Unchanged) {
        return Error::validation("password", core::ValidationReason::EmptyField,
                                 "new users need a password or an explicit unset");
    }
    return Status::success();
}

}  // namespace

Result<std::vector<store::User>> UserService::upsert(const gateway::CallContext& ctx,
                                                     std::vector<UserRequest> users) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    for (size_t i = 0; i < users.size(); ++i) {
        auto status = validate_request(users[i]);
        if (!status) {
            return status.error().with_context("users[" + std::to_string(i) + "]");
        }
    }

    // New users and other accounts are server administration
    bool only_self = std::all_of(users.begin(), users.end(),
                                 [&](const UserRequest& user) { return user.id == *subject; });
    if (!only_self) {
        auto status = require(*permissions_, ctx, core::Capability::server(core::Action::Admin));
        if (!status) {
            return std::move(status).error();
        }
    }

    std::vector<store::UserUpsert> rows;
    rows.reserve(users.size());
    for (auto& user : users) {
        store::PasswordUpdate password;
        switch (user.password) {
            case PasswordKind::Unchanged:
                password = store::PasswordUpdate::unchanged();
                break;
            case PasswordKind::Unset:
                password = store::PasswordUpdate::unset();
                break;
            case PasswordKind::Set: {
                auto hashed = hasher_->hash(user.new_password);
                if (!hashed) {
                    return Error::store("password hashing failed");
                }
                password = store::PasswordUpdate::set(std::move(*hashed));
                break;
            }
        }
        rows.push_back(store::UserUpsert{std::move(user.id), std::move(user.email),
                                         std::move(user.display_name), std::move(password)});
    }

    auto stored = users_->upsert(std::move(rows));
    if (!stored) {
        return stored.error().with_context("users");
    }

    for (auto& user : *stored) {
        LOG_AUDIT(logging::get_logger(), "user_upserted",
                  "subject={}, user={}, password_set={}, correlation_id={}", *subject, user.id,
                  user.password_hash.has_value(), ctx.correlation_id);
        user.password_hash.reset();
    }
    return stored;
}

Result<std::vector<store::User>> UserService::query(const gateway::CallContext& ctx,
                                                    const store::UserQuery* filter) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    if (filter) {
        auto status = query::validate(*filter);
        if (!status) {
            return std::move(status).error();
        }
    }

    auto found = users_->query(filter);
    if (!found) {
        return found;
    }

    auto admin = permissions_->exists(
        core::authorize(*subject, core::Capability::server(core::Action::Admin)));
    if (!admin) {
        return std::move(admin).error();
    }

    for (auto& user : *found) {
        user.password_hash.reset();
        if (!*admin && user.id != *subject) {
            user.email.clear();
        }
    }
    return found;
}

Status UserService::remove(const gateway::CallContext& ctx, const std::vector<std::string>& ids) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    bool only_self =
        std::all_of(ids.begin(), ids.end(), [&](const std::string& id) { return id == *subject; });
    if (!only_self) {
        auto status = require(*permissions_, ctx, core::Capability::server(core::Action::Admin));
        if (!status) {
            return status;
        }
    }

    auto status = users_->remove(ids);
    if (!status) {
        return status;
    }

    for (const auto& id : ids) {
        LOG_AUDIT(logging::get_logger(), "user_removed", "subject={}, user={}, correlation_id={}",
                  *subject, id, ctx.correlation_id);
    }
    return Status::success();
}

}  // namespace warden::api
