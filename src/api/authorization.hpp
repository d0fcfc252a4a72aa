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

// Warden API - Authorization checks shared by the services

#pragma once

#include <string>

#include "../core/permission.hpp"
#include "../gateway/pipeline.hpp"
#include "../store/permission_store.hpp"

namespace warden::api {

using core::Error;
using core::Result;
using core::Status;

/// Authenticated subject of the call (Unauthenticated when the context has no claims)
[[nodiscard]] Result<std::string> require_subject(const gateway::CallContext& ctx);

/// Require a capability for the caller.
///
/// Denial is Forbidden when the caller can at least read the resource, and
/// NotFound (carrying the resource id) when it cannot, so hidden resources
/// are indistinguishable from missing ones.
[[nodiscard]] Status require(store::PermissionStore& permissions, const gateway::CallContext& ctx,
                             const core::Capability& capability);

}  // namespace warden::api
