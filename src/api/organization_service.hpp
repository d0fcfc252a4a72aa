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

// Warden API - Organization and event services

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../gateway/pipeline.hpp"
#include "../store/event_store.hpp"
#include "../store/organization_store.hpp"
#include "../store/permission_store.hpp"
#include "authorization.hpp"

namespace warden::api {

/// Organizations: ServerAdmin creates and deletes, OrganizationAdmin renames
class OrganizationService {
public:
    OrganizationService(std::shared_ptr<store::OrganizationStore> organizations,
                        std::shared_ptr<store::PermissionStore> permissions)
        : organizations_(std::move(organizations)), permissions_(std::move(permissions)) {}

    [[nodiscard]] Result<std::vector<store::Organization>> upsert(
        const gateway::CallContext& ctx, std::vector<store::Organization> organizations);

    /// Organizations matching the filter that the caller can read
    [[nodiscard]] Result<std::vector<store::Organization>> query(
        const gateway::CallContext& ctx, const store::OrganizationQuery* filter);

    /// Delete organizations (their events and permissions cascade)
    [[nodiscard]] Status remove(const gateway::CallContext& ctx,
                                const std::vector<std::string>& ids);

private:
    std::shared_ptr<store::OrganizationStore> organizations_;
    std::shared_ptr<store::PermissionStore> permissions_;
};

/// Events: OrganizationAdmin of the owner creates, EventEditor renames, EventAdmin deletes
class EventService {
public:
    EventService(std::shared_ptr<store::EventStore> events,
                 std::shared_ptr<store::PermissionStore> permissions)
        : events_(std::move(events)), permissions_(std::move(permissions)) {}

    [[nodiscard]] Result<std::vector<store::Event>> upsert(const gateway::CallContext& ctx,
                                                           std::vector<store::Event> events);

    /// Events matching the filter that the caller can read
    [[nodiscard]] Result<std::vector<store::Event>> query(const gateway::CallContext& ctx,
                                                          const store::EventQuery* filter);

    [[nodiscard]] Status remove(const gateway::CallContext& ctx,
                                const std::vector<std::string>& ids);

private:
    std::shared_ptr<store::EventStore> events_;
    std::shared_ptr<store::PermissionStore> permissions_;
};

}  // namespace warden::api
