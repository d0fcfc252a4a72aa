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

// Warden API - Organization and event services implementation

#include "organization_service.hpp"

#include "../core/logging.hpp"

namespace warden::api {

namespace {

/// Prefix store field paths ("[1].name") with the request list name
template <typename T>
Result<T> in_request(Result<T> result, std::string_view list) {
    if (!result && result.error().is(core::ErrorKind::Validation)) {
        return result.error().with_context(list);
    }
    return result;
}

/// Validate the caller's filter, then restrict it to readable rows
template <typename Q, typename Readable>
Result<Q> restrict_to(const Q* filter, Readable readable) {
    if (filter) {
        auto status = query::validate(*filter);
        if (!status) {
            return std::move(status).error();
        }
    }

    std::vector<Q> parts;
    parts.emplace_back(std::move(readable));
    if (filter) {
        parts.push_back(*filter);
    }
    return Q::all_of(std::move(parts));
}

}  // namespace

// ============================================================================
// OrganizationService
// ============================================================================

Result<std::vector<store::Organization>> OrganizationService::upsert(
    const gateway::CallContext& ctx, std::vector<store::Organization> organizations) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    for (const auto& organization : organizations) {
        auto capability = organization.id.empty()
                              ? core::Capability::server(core::Action::Admin)
                              : core::Capability::organization(core::Action::Admin, organization.id);
        auto status = require(*permissions_, ctx, capability);
        if (!status) {
            return std::move(status).error();
        }
    }

    auto stored = in_request(organizations_->upsert(std::move(organizations)), "organizations");
    if (stored) {
        for (const auto& organization : *stored) {
            LOG_AUDIT(logging::get_logger(), "organization_upserted",
                      "subject={}, organization={}, correlation_id={}", *subject, organization.id,
                      ctx.correlation_id);
        }
    }
    return stored;
}

Result<std::vector<store::Organization>> OrganizationService::query(
    const gateway::CallContext& ctx, const store::OrganizationQuery* filter) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    auto readable = restrict_to(filter, store::OrganizationReadableBy{*subject});
    if (!readable) {
        return std::move(readable).error();
    }
    return organizations_->query(&*readable);
}

Status OrganizationService::remove(const gateway::CallContext& ctx,
                                   const std::vector<std::string>& ids) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    // Hidden organizations are NotFound before the ServerAdmin check
    for (const auto& id : ids) {
        auto status =
            require(*permissions_, ctx, core::Capability::organization(core::Action::Read, id));
        if (!status) {
            return status;
        }
    }

    auto status = require(*permissions_, ctx, core::Capability::server(core::Action::Admin));
    if (!status) {
        return status;
    }

    status = organizations_->remove(ids);
    if (status) {
        for (const auto& id : ids) {
            LOG_AUDIT(logging::get_logger(), "organization_removed",
                      "subject={}, organization={}, correlation_id={}", *subject, id,
                      ctx.correlation_id);
        }
    }
    return status;
}

// ============================================================================
// EventService
// ============================================================================

Result<std::vector<store::Event>> EventService::upsert(const gateway::CallContext& ctx,
                                                       std::vector<store::Event> events) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    for (size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];
        if (event.id.empty() && event.organization_id.empty()) {
            return Error::validation("events[" + std::to_string(i) + "].organization_id",
                                     core::ValidationReason::EmptyField);
        }

        auto capability = event.id.empty()
                              ? core::Capability::organization(core::Action::Admin,
                                                               event.organization_id)
                              : core::Capability::event(core::Action::Edit, event.id);
        auto status = require(*permissions_, ctx, capability);
        if (!status) {
            return std::move(status).error();
        }
    }

    auto stored = in_request(events_->upsert(std::move(events)), "events");
    if (stored) {
        for (const auto& event : *stored) {
            LOG_AUDIT(logging::get_logger(), "event_upserted",
                      "subject={}, event={}, organization={}, correlation_id={}", *subject,
                      event.id, event.organization_id, ctx.correlation_id);
        }
    }
    return stored;
}

Result<std::vector<store::Event>> EventService::query(const gateway::CallContext& ctx,
                                                      const store::EventQuery* filter) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    auto readable = restrict_to(filter, store::EventReadableBy{*subject});
    if (!readable) {
        return std::move(readable).error();
    }
    return events_->query(&*readable);
}

Status EventService::remove(const gateway::CallContext& ctx, const std::vector<std::string>& ids) {
    auto subject = require_subject(ctx);
    if (!subject) {
        return std::move(subject).error();
    }

    for (const auto& id : ids) {
        auto status = require(*permissions_, ctx, core::Capability::event(core::Action::Admin, id));
        if (!status) {
            return status;
        }
    }

    auto status = events_->remove(ids);
    if (status) {
        for (const auto& id : ids) {
            LOG_AUDIT(logging::get_logger(), "event_removed",
                      "subject={}, event={}, correlation_id={}", *subject, id,
                      ctx.correlation_id);
        }
    }
    return status;
}

}  // namespace warden::api
