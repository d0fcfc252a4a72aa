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
// Request decoding reports validation errors with field paths such as
// "permissions[2].role.event_id".

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/error.hpp"
#include "../core/jwt.hpp"
#include "../core/key_manager.hpp"
#include "../core/permission.hpp"
#include "../store/event_store.hpp"
#include "../store/organization_store.hpp"
#include "../store/user_store.hpp"
#include "user_service.hpp"

namespace warden::api {

/// Upper bound on items in one request list
inline constexpr size_t kMaxRequestItems = 1000;

[[nodiscard]] nlohmann::json to_json(const core::Permission& permission);
[[nodiscard]] nlohmann::json to_json(const store::Organization& organization);
[[nodiscard]] nlohmann::json to_json(const store::Event& event);
/// Never includes the password hash
[[nodiscard]] nlohmann::json to_json(const store::User& user);
[[nodiscard]] nlohmann::json to_json(const core::KeyInfo& key);
[[nodiscard]] nlohmann::json to_json(const core::Claims& claims);

template <typename T>
[[nodiscard]] nlohmann::json to_json_array(const std::vector<T>& items) {
    auto array = nlohmann::json::array();
    for (const auto& item : items) {
        array.push_back(to_json(item));
    }
    return array;
}

/// request[key] as a list of permissions
[[nodiscard]] core::Result<std::vector<core::Permission>> permissions_from_json(
    const nlohmann::json& request, std::string_view key = "permissions");

[[nodiscard]] core::Result<std::vector<store::Organization>> organizations_from_json(
    const nlohmann::json& request, std::string_view key = "organizations");

[[nodiscard]] core::Result<std::vector<store::Event>> events_from_json(
    const nlohmann::json& request, std::string_view key = "events");

/// request[key] as a list of users. "password" is {"action": "SET", "value": ...},
/// {"action": "UNSET"} or {"action": "UNCHANGED"}.
[[nodiscard]] core::Result<std::vector<UserRequest>> users_from_json(
    const nlohmann::json& request, std::string_view key = "users");

/// request[key] as a list of non-empty ids
[[nodiscard]] core::Result<std::vector<std::string>> ids_from_json(const nlohmann::json& request,
                                                                   std::string_view key = "ids");

}  // namespace warden::api
