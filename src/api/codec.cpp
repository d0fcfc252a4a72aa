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

// Warden API - JSON request/response codec

#include "codec.hpp"

#include <functional>

#include "../query/wire.hpp"

namespace warden::api {

using core::Error;
using core::Result;
using core::ValidationReason;

namespace {

/// Optional string member ("" when absent)
Result<std::string> optional_string(const nlohmann::json& object, const std::string& key) {
    if (!object.contains(key) || object[key].is_null()) {
        return std::string();
    }
    auto value = query::expect_string(object[key], true);
    if (!value) {
        return Error::validation(key, value.error().reason, value.error().message);
    }
    return value;
}

/// Decode request[key] as an array, item by item, with "key[i]" error paths
template <typename T>
Result<std::vector<T>> list_from_json(const nlohmann::json& request, std::string_view key,
                                      const std::function<Result<T>(const nlohmann::json&)>& item) {
    const std::string name(key);
    if (!request.is_object() || !request.contains(name)) {
        return Error::validation(name, ValidationReason::EmptyField);
    }

    const auto& array = request[name];
    if (!array.is_array()) {
        return Error::validation(name, ValidationReason::InvalidValue, "expected an array");
    }
    if (array.empty()) {
        return Error::validation(name, ValidationReason::EmptyField);
    }
    if (array.size() > kMaxRequestItems) {
        return Error::validation(name, ValidationReason::TooManyItems);
    }

    std::vector<T> items;
    items.reserve(array.size());
    for (size_t i = 0; i < array.size(); ++i) {
        auto decoded = item(array[i]);
        if (!decoded) {
            return decoded.error().with_context(name + "[" + std::to_string(i) + "]");
        }
        items.push_back(std::move(decoded).value());
    }
    return items;
}

Result<core::Permission> permission_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error::validation("", ValidationReason::InvalidValue, "expected an object");
    }

    auto id = optional_string(j, "id");
    if (!id) {
        return std::move(id).error();
    }

    auto user_id = optional_string(j, "user_id");
    if (!user_id) {
        return std::move(user_id).error();
    }
    if (user_id->empty()) {
        return Error::validation("user_id", ValidationReason::EmptyField);
    }

    if (!j.contains("role")) {
        return Error::validation("role", ValidationReason::EmptyField);
    }
    auto role = core::role_from_json(j["role"]);
    if (!role) {
        return role.error().with_context("role");
    }

    return core::Permission{std::move(*id), std::move(*user_id), std::move(*role)};
}

Result<store::Organization> organization_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error::validation("", ValidationReason::InvalidValue, "expected an object");
    }

    auto id = optional_string(j, "id");
    if (!id) {
        return std::move(id).error();
    }
    auto name = optional_string(j, "name");
    if (!name) {
        return std::move(name).error();
    }
    if (name->empty()) {
        return Error::validation("name", ValidationReason::EmptyField);
    }
    return store::Organization{std::move(*id), std::move(*name)};
}

Result<store::Event> event_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error::validation("", ValidationReason::InvalidValue, "expected an object");
    }

    auto id = optional_string(j, "id");
    if (!id) {
        return std::move(id).error();
    }
    auto organization_id = optional_string(j, "organization_id");
    if (!organization_id) {
        return std::move(organization_id).error();
    }
    auto name = optional_string(j, "name");
    if (!name) {
        return std::move(name).error();
    }

    if (id->empty() && organization_id->empty()) {
        return Error::validation("organization_id", ValidationReason::EmptyField);
    }
    if (name->empty()) {
        return Error::validation("name", ValidationReason::EmptyField);
    }
    return store::Event{std::move(*id), std::move(*organization_id), std::move(*name)};
}

Result<UserRequest> user_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error::validation("", ValidationReason::InvalidValue, "expected an object");
    }

    UserRequest user;
    for (auto [key, target] : {std::pair{"id", &user.id}, std::pair{"email", &user.email},
                               std::pair{"display_name", &user.display_name}}) {
        auto value = optional_string(j, key);
        if (!value) {
            return std::move(value).error();
        }
        *target = std::move(*value);
    }

    if (!j.contains("password") || !j["password"].is_object()) {
        return Error::validation("password", ValidationReason::EmptyField);
    }
    const auto& password = j["password"];
    auto action = optional_string(password, "action");
    if (!action) {
        return action.error().with_context("password");
    }

    if (*action == "SET") {
        auto value = optional_string(password, "value");
        if (!value) {
            return value.error().with_context("password");
        }
        user.password = store::PasswordUpdate::Kind::Set;
        user.new_password = std::move(*value);
    } else if (*action == "UNSET") {
        user.password = store::PasswordUpdate::Kind::Unset;
    } else if (*action == "UNCHANGED") {
        user.password = store::PasswordUpdate::Kind::Unchanged;
    } else if (action->empty()) {
        return Error::validation("password.action", ValidationReason::EmptyField);
    } else {
        return Error::validation("password.action", ValidationReason::InvalidValue,
                                 "expected SET, UNSET or UNCHANGED");
    }
    return user;
}

Result<std::string> id_from_json(const nlohmann::json& j) {
    auto id = query::expect_string(j);
    if (!id) {
        // The element itself is the value; drop the "value" segment
        return Error::validation("", id.error().reason);
    }
    return id;
}

}  // namespace

nlohmann::json to_json(const core::Permission& permission) {
    return {{"id", permission.id},
            {"user_id", permission.user_id},
            {"role", core::role_to_json(permission.role)}};
}

nlohmann::json to_json(const store::Organization& organization) {
    return {{"id", organization.id}, {"name", organization.name}};
}

nlohmann::json to_json(const store::Event& event) {
    return {{"id", event.id}, {"organization_id", event.organization_id}, {"name", event.name}};
}

nlohmann::json to_json(const store::User& user) {
    return {{"id", user.id}, {"email", user.email}, {"display_name", user.display_name}};
}

nlohmann::json to_json(const core::KeyInfo& key) {
    return {{"id", key.id},
            {"state", std::string(core::key_state_to_string(key.state))},
            {"created_at", key.created_at},
            {"expires_at", key.expires_at},
            {"expired", key.expired}};
}

nlohmann::json to_json(const core::Claims& claims) {
    return {{"iss", claims.iss},
            {"sub", claims.sub},
            {"aud", std::string(core::audience_to_string(claims.aud))},
            {"iat", claims.iat},
            {"exp", claims.exp}};
}

Result<std::vector<core::Permission>> permissions_from_json(const nlohmann::json& request,
                                                            std::string_view key) {
    return list_from_json<core::Permission>(request, key, permission_from_json);
}

Result<std::vector<store::Organization>> organizations_from_json(const nlohmann::json& request,
                                                                 std::string_view key) {
    return list_from_json<store::Organization>(request, key, organization_from_json);
}

Result<std::vector<store::Event>> events_from_json(const nlohmann::json& request,
                                                   std::string_view key) {
    return list_from_json<store::Event>(request, key, event_from_json);
}

Result<std::vector<UserRequest>> users_from_json(const nlohmann::json& request,
                                                std::string_view key) {
    return list_from_json<UserRequest>(request, key, user_from_json);
}

Result<std::vector<std::string>> ids_from_json(const nlohmann::json& request,
                                               std::string_view key) {
    return list_from_json<std::string>(request, key, id_from_json);
}

}  // namespace warden::api
