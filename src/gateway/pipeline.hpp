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

// Warden Pipeline - Header
// Middleware chain run before every API call

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../core/containers.hpp"
#include "../core/error.hpp"
#include "../core/jwt.hpp"

namespace warden::gateway {

/// Call context (passed through middleware chain to the handler)
struct CallContext {
    // Fully qualified operation, e.g. "/warden.PermissionService/Upsert"
    std::string operation;

    // Request metadata (header names lowercased)
    core::fast_map<std::string, std::string> headers;

    // Response metadata (e.g. set-cookie), in insertion order
    std::vector<std::pair<std::string, std::string>> response_headers;

    std::string correlation_id;
    std::string peer;

    // Set by AuthMiddleware once the credential validated
    std::optional<core::Claims> claims;

    // Metadata (for middleware communication)
    core::fast_map<std::string, std::string> metadata;

    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

    // Error that stopped the pipeline
    std::optional<core::Error> error;

    /// Helper: Set error
    void set_error(core::Error e) { error = std::move(e); }

    /// Helper: Get request header (case-insensitive name)
    [[nodiscard]] std::string_view get_header(std::string_view name) const;

    /// Helper: Set request header (name is lowercased)
    void set_header(std::string_view name, std::string value);

    /// Helper: Add response header
    void add_response_header(std::string name, std::string value) {
        response_headers.emplace_back(std::move(name), std::move(value));
    }

    /// Helper: Get metadata
    [[nodiscard]] std::string_view get_metadata(std::string_view key) const {
        auto it = metadata.find(std::string(key));
        return (it != metadata.end()) ? std::string_view(it->second) : std::string_view{};
    }

    /// Helper: Set metadata
    void set_metadata(std::string key, std::string value) {
        metadata[std::move(key)] = std::move(value);
    }

    /// Authenticated subject (empty when unauthenticated)
    [[nodiscard]] std::string_view subject() const noexcept {
        return claims ? std::string_view(claims->sub) : std::string_view{};
    }
};

/// Operation pattern match: exact, or prefix when the pattern ends in '*'
[[nodiscard]] bool operation_matches(std::string_view pattern, std::string_view operation) noexcept;

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Stop pipeline execution (ctx.error says why)
    Error      // Internal failure
};

/// Middleware function signature
using MiddlewareFunc = std::function<MiddlewareResult(CallContext&)>;

/// Final call handler
using Handler = std::function<core::Status(CallContext&)>;

/// Middleware base class (Two-Phase: Request + Response)
class Middleware {
public:
    virtual ~Middleware() = default;

    /// Process request phase (before the handler)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_request(CallContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Process response phase (after the handler or a stopped request phase)
    virtual void process_response(CallContext& ctx, const core::Status& outcome) {
        (void)ctx;
        (void)outcome;
    }

    /// Get middleware name (for debugging)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Logging middleware (logs in response phase with timing)
class LoggingMiddleware : public Middleware {
public:
    MiddlewareResult process_request(CallContext& ctx) override;
    void process_response(CallContext& ctx, const core::Status& outcome) override;
    std::string_view name() const override { return "LoggingMiddleware"; }
};

/// Middleware pipeline
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept = default;
    Pipeline& operator=(Pipeline&&) noexcept = default;

    /// Add middleware to pipeline
    void use(std::unique_ptr<Middleware> middleware);

    /// Add middleware function to pipeline
    void use(MiddlewareFunc func, std::string_view name = "CustomMiddleware");

    /// Execute request phase
    [[nodiscard]] MiddlewareResult execute_request(CallContext& ctx);

    /// Execute response phase (reverse order)
    void execute_response(CallContext& ctx, const core::Status& outcome);

    /// Run the request phase, then the handler only if every middleware
    /// continued, then the response phase. Returns the call outcome.
    [[nodiscard]] core::Status dispatch(CallContext& ctx, const Handler& handler);

    /// Get middleware count
    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }

    /// Clear all middleware
    void clear() { middleware_.clear(); }

private:
    std::vector<std::unique_ptr<Middleware>> middleware_;
};

/// Pipeline builder (fluent API)
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    PipelineBuilder& use(std::unique_ptr<Middleware> middleware) {
        pipeline_.use(std::move(middleware));
        return *this;
    }

    PipelineBuilder& use(MiddlewareFunc func, std::string_view name = "CustomMiddleware") {
        pipeline_.use(std::move(func), name);
        return *this;
    }

    Pipeline build() && { return std::move(pipeline_); }

private:
    Pipeline pipeline_;
};

/// Function middleware wrapper
class FunctionMiddleware : public Middleware {
public:
    explicit FunctionMiddleware(MiddlewareFunc func, std::string name)
        : func_(std::move(func)), name_(std::move(name)) {}

    MiddlewareResult process_request(CallContext& ctx) override { return func_(ctx); }

    std::string_view name() const override { return name_; }

private:
    MiddlewareFunc func_;
    std::string name_;
};

}  // namespace warden::gateway
