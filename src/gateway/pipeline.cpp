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

// Warden Pipeline - Implementation

#include "pipeline.hpp"

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace warden::gateway {

std::string_view CallContext::get_header(std::string_view name) const {
    auto it = headers.find(core::to_lower(name));
    return (it != headers.end()) ? std::string_view(it->second) : std::string_view{};
}

void CallContext::set_header(std::string_view name, std::string value) {
    headers[core::to_lower(name)] = std::move(value);
}

bool operation_matches(std::string_view pattern, std::string_view operation) noexcept {
    if (!pattern.empty() && pattern.back() == '*') {
        pattern.remove_suffix(1);
        return operation.starts_with(pattern);
    }
    return operation == pattern;
}

// LoggingMiddleware implementation (timing starts in request phase)

MiddlewareResult LoggingMiddleware::process_request(CallContext& ctx) {
    ctx.start_time = std::chrono::steady_clock::now();
    if (ctx.correlation_id.empty() || !logging::is_valid_correlation_id(ctx.correlation_id)) {
        ctx.correlation_id = logging::generate_correlation_id();
    }
    return MiddlewareResult::Continue;
}

void LoggingMiddleware::process_response(CallContext& ctx, const core::Status& outcome) {
    auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
                           std::chrono::steady_clock::now() - ctx.start_time)
                           .count();

    auto* logger = logging::get_logger();
    if (outcome) {
        LOG_INFO(logger,
                 "Call completed: operation={}, subject={}, status=ok, duration_us={}, peer={}, "
                 "correlation_id={}",
                 core::sanitize_for_logging(ctx.operation, 128), ctx.subject(), duration_us,
                 ctx.peer, ctx.correlation_id);
    } else {
        LOG_INFO(logger,
                 "Call completed: operation={}, subject={}, status={}, duration_us={}, peer={}, "
                 "correlation_id={}",
                 core::sanitize_for_logging(ctx.operation, 128), ctx.subject(),
                 core::error_kind_to_string(outcome.error().kind), duration_us, ctx.peer,
                 ctx.correlation_id);
    }
}

// Pipeline implementation

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    middleware_.push_back(std::move(middleware));
}

void Pipeline::use(MiddlewareFunc func, std::string_view name) {
    middleware_.push_back(std::make_unique<FunctionMiddleware>(std::move(func), std::string(name)));
}

MiddlewareResult Pipeline::execute_request(CallContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_request(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error) {
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

void Pipeline::execute_response(CallContext& ctx, const core::Status& outcome) {
    for (auto it = middleware_.rbegin(); it != middleware_.rend(); ++it) {
        (*it)->process_response(ctx, outcome);
    }
}

core::Status Pipeline::dispatch(CallContext& ctx, const Handler& handler) {
    core::Status outcome;

    switch (execute_request(ctx)) {
        case MiddlewareResult::Continue:
            outcome = handler(ctx);
            break;
        case MiddlewareResult::Stop:
            outcome = ctx.error ? *ctx.error : core::Error::unauthenticated("pipeline stopped");
            break;
        case MiddlewareResult::Error:
            outcome = ctx.error ? *ctx.error : core::Error::store("middleware failure");
            break;
    }

    execute_response(ctx, outcome);
    return outcome;
}

}  // namespace warden::gateway
