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

#include <catch2/catch_test_macros.hpp>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "gateway/auth_middleware.hpp"
#include "gateway/credentials.hpp"
#include "gateway/factory.hpp"
#include "gateway/permission_middleware.hpp"
#include "gateway/pipeline.hpp"
#include "test_helpers.hpp"

using namespace warden;
using namespace warden::gateway;
using core::ErrorKind;
using warden::testing::Fixture;

// ============================================================================
// Test Middleware Implementations
// ============================================================================

/// Test middleware that tracks execution
class TrackingMiddleware : public Middleware {
public:
    int request_count = 0;
    int response_count = 0;
    MiddlewareResult request_result = MiddlewareResult::Continue;
    std::optional<core::Status> last_outcome;

    MiddlewareResult process_request(CallContext& ctx) override {
        (void)ctx;
        request_count++;
        return request_result;
    }

    void process_response(CallContext& ctx, const core::Status& outcome) override {
        (void)ctx;
        response_count++;
        last_outcome = outcome;
    }

    std::string_view name() const override { return "TrackingMiddleware"; }
};

namespace {

core::Status ok_handler(CallContext& ctx) {
    ctx.set_metadata("handled", "yes");
    return core::Status::success();
}

/// Auth middleware over the fixture's token service
std::unique_ptr<AuthMiddleware> make_auth(Fixture& f, CredentialTransport transport,
                                          std::vector<std::string> bypass = {}) {
    CredentialConfig credentials;
    credentials.transport = transport;
    return std::make_unique<AuthMiddleware>(AuthMiddleware::Config{true, std::move(bypass)},
                                            f.tokens, make_credential_extractor(credentials));
}

}  // namespace

// ============================================================================
// Pipeline Tests
// ============================================================================

TEST_CASE("Pipeline - runs request phase in order, response in reverse", "[gateway][pipeline]") {
    std::vector<std::string> trace;
    Pipeline pipeline;
    pipeline.use(
        [&trace](CallContext&) {
            trace.push_back("first");
            return MiddlewareResult::Continue;
        },
        "first");
    pipeline.use(
        [&trace](CallContext&) {
            trace.push_back("second");
            return MiddlewareResult::Continue;
        },
        "second");
    REQUIRE(pipeline.size() == 2);

    CallContext ctx;
    auto outcome = pipeline.dispatch(ctx, [&trace](CallContext&) {
        trace.push_back("handler");
        return core::Status::success();
    });

    REQUIRE(outcome);
    REQUIRE(trace == std::vector<std::string>{"first", "second", "handler"});
}

TEST_CASE("Pipeline - stop skips the handler but runs responses", "[gateway][pipeline]") {
    auto tracking = std::make_unique<TrackingMiddleware>();
    auto* tracker = tracking.get();

    Pipeline pipeline;
    pipeline.use(std::move(tracking));
    pipeline.use(
        [](CallContext& ctx) {
            ctx.set_error(core::Error::forbidden("nope"));
            return MiddlewareResult::Stop;
        },
        "stopper");

    CallContext ctx;
    bool handled = false;
    auto outcome = pipeline.dispatch(ctx, [&handled](CallContext&) {
        handled = true;
        return core::Status::success();
    });

    REQUIRE_FALSE(handled);
    REQUIRE_FALSE(outcome);
    REQUIRE(outcome.error().kind == ErrorKind::Forbidden);
    REQUIRE(tracker->request_count == 1);
    REQUIRE(tracker->response_count == 1);
    REQUIRE(tracker->last_outcome.has_value());
    REQUIRE_FALSE(*tracker->last_outcome);
}

TEST_CASE("Pipeline - handler outcome reaches response phase", "[gateway][pipeline]") {
    auto tracking = std::make_unique<TrackingMiddleware>();
    auto* tracker = tracking.get();
    PipelineBuilder builder;
    builder.use(std::move(tracking));
    auto pipeline = std::move(builder).build();

    CallContext ctx;
    auto outcome = pipeline.dispatch(
        ctx, [](CallContext&) -> core::Status { return core::Error::not_found("x"); });

    REQUIRE_FALSE(outcome);
    REQUIRE(outcome.error().kind == ErrorKind::NotFound);
    REQUIRE(tracker->last_outcome.has_value());
    REQUIRE(tracker->last_outcome->error().kind == ErrorKind::NotFound);
}

TEST_CASE("Pipeline - middleware error without detail", "[gateway][pipeline]") {
    Pipeline pipeline;
    pipeline.use([](CallContext&) { return MiddlewareResult::Error; }, "broken");

    CallContext ctx;
    auto outcome = pipeline.dispatch(ctx, ok_handler);
    REQUIRE_FALSE(outcome);
    REQUIRE(outcome.error().kind == ErrorKind::Store);
}

TEST_CASE("CallContext - headers and metadata", "[gateway][context]") {
    CallContext ctx;
    ctx.set_header("Authorization", "Bearer abc");
    REQUIRE(ctx.get_header("authorization") == "Bearer abc");
    REQUIRE(ctx.get_header("AUTHORIZATION") == "Bearer abc");
    REQUIRE(ctx.get_header("cookie").empty());

    ctx.set_metadata("k", "v");
    REQUIRE(ctx.get_metadata("k") == "v");
    REQUIRE(ctx.get_metadata("missing").empty());
    REQUIRE(ctx.subject().empty());
}

TEST_CASE("operation_matches", "[gateway]") {
    REQUIRE(operation_matches("/warden.KeyService/Rotate", "/warden.KeyService/Rotate"));
    REQUIRE_FALSE(operation_matches("/warden.KeyService/Rotate", "/warden.KeyService/List"));
    REQUIRE(operation_matches("/warden.KeyService/*", "/warden.KeyService/List"));
    REQUIRE_FALSE(operation_matches("/warden.KeyService/*", "/warden.EventService/Query"));
}

TEST_CASE("LoggingMiddleware - assigns a correlation id", "[gateway][logging]") {
    LoggingMiddleware logging_middleware;
    CallContext ctx;
    ctx.operation = "/warden.Test/Call";
    ctx.correlation_id = "not-a-correlation-id";

    REQUIRE(logging_middleware.process_request(ctx) == MiddlewareResult::Continue);
    REQUIRE(logging::is_valid_correlation_id(ctx.correlation_id));

    // Response phase only logs
    logging_middleware.process_response(ctx, core::Status::success());
}

// ============================================================================
// Credential Transport Tests
// ============================================================================

TEST_CASE("Credential extractors", "[gateway][credentials]") {
    REQUIRE(parse_credential_transport("cookie") == CredentialTransport::Cookie);
    REQUIRE(parse_credential_transport("any") == CredentialTransport::Any);
    REQUIRE_FALSE(parse_credential_transport("query").has_value());

    SECTION("header with case-insensitive scheme") {
        HeaderCredentialExtractor extractor("Authorization", "Bearer");
        CallContext ctx;
        ctx.set_header("authorization", "bearer   tok123 ");
        REQUIRE(extractor.extract(ctx) == std::optional<std::string>("tok123"));

        ctx.set_header("authorization", "Basic dXNlcg==");
        REQUIRE_FALSE(extractor.extract(ctx).has_value());

        ctx.set_header("authorization", "Bearer ");
        REQUIRE_FALSE(extractor.extract(ctx).has_value());
    }

    SECTION("cookie") {
        CookieCredentialExtractor extractor("authorization");
        CallContext ctx;
        ctx.set_header("cookie", "theme=dark; authorization=tok456");
        REQUIRE(extractor.extract(ctx) == std::optional<std::string>("tok456"));

        ctx.set_header("cookie", "theme=dark");
        REQUIRE_FALSE(extractor.extract(ctx).has_value());
    }

    SECTION("any prefers the header") {
        auto extractor = make_credential_extractor(CredentialConfig{});
        REQUIRE(extractor->name() == "any");

        CallContext ctx;
        ctx.set_header("cookie", "authorization=from-cookie");
        REQUIRE(extractor->extract(ctx) == std::optional<std::string>("from-cookie"));

        ctx.set_header("authorization", "Bearer from-header");
        REQUIRE(extractor->extract(ctx) == std::optional<std::string>("from-header"));
    }
}

// ============================================================================
// AuthMiddleware Tests
// ============================================================================

TEST_CASE("AuthMiddleware - validates the access token", "[gateway][auth]") {
    Fixture f;
    REQUIRE(f.keys->rotate_key(false));
    auto issued = f.tokens->issue("user-1", core::Audience::Access);
    REQUIRE(issued);

    auto auth = make_auth(f, CredentialTransport::Any, {"/warden.AuthenticationService/Login"});

    SECTION("header credential attaches claims") {
        CallContext ctx;
        ctx.operation = "/warden.EventService/Query";
        ctx.set_header("authorization", "Bearer " + issued->token);

        REQUIRE(auth->process_request(ctx) == MiddlewareResult::Continue);
        REQUIRE(ctx.claims.has_value());
        REQUIRE(ctx.subject() == "user-1");
        REQUIRE(ctx.get_metadata("subject") == "user-1");
    }

    SECTION("cookie credential") {
        CallContext ctx;
        ctx.operation = "/warden.EventService/Query";
        ctx.set_header("cookie", "authorization=" + issued->token);
        REQUIRE(auth->process_request(ctx) == MiddlewareResult::Continue);
        REQUIRE(ctx.subject() == "user-1");
    }

    SECTION("missing credential") {
        CallContext ctx;
        ctx.operation = "/warden.EventService/Query";
        REQUIRE(auth->process_request(ctx) == MiddlewareResult::Stop);
        REQUIRE(ctx.error.has_value());
        REQUIRE(ctx.error->kind == ErrorKind::Unauthenticated);
        REQUIRE_FALSE(ctx.claims.has_value());
    }

    SECTION("invalid token") {
        CallContext ctx;
        ctx.operation = "/warden.EventService/Query";
        ctx.set_header("authorization", "Bearer not.a.token");
        REQUIRE(auth->process_request(ctx) == MiddlewareResult::Stop);
        REQUIRE(ctx.error->kind == ErrorKind::Unauthenticated);
    }

    SECTION("refresh token is not an access credential") {
        auto refresh = f.tokens->issue("user-1", core::Audience::Refresh);
        REQUIRE(refresh);
        CallContext ctx;
        ctx.operation = "/warden.EventService/Query";
        ctx.set_header("authorization", "Bearer " + refresh->token);
        REQUIRE(auth->process_request(ctx) == MiddlewareResult::Stop);
    }

    SECTION("bypassed operation ignores the credential") {
        CallContext ctx;
        ctx.operation = "/warden.AuthenticationService/Login";
        ctx.set_header("authorization", "Bearer garbage");
        REQUIRE(auth->process_request(ctx) == MiddlewareResult::Continue);
        REQUIRE_FALSE(ctx.claims.has_value());
    }
}

TEST_CASE("AuthMiddleware - transport restricts where the token is read", "[gateway][auth]") {
    Fixture f;
    REQUIRE(f.keys->rotate_key(false));
    auto issued = f.tokens->issue("user-1", core::Audience::Access);
    REQUIRE(issued);

    auto cookie_only = make_auth(f, CredentialTransport::Cookie);
    CallContext ctx;
    ctx.operation = "/warden.EventService/Query";
    ctx.set_header("authorization", "Bearer " + issued->token);
    REQUIRE(cookie_only->process_request(ctx) == MiddlewareResult::Stop);
}

TEST_CASE("AuthMiddleware - disabled", "[gateway][auth]") {
    Fixture f;
    AuthMiddleware auth(AuthMiddleware::Config{false, {}}, f.tokens,
                        make_credential_extractor(CredentialConfig{}));
    CallContext ctx;
    REQUIRE(auth.process_request(ctx) == MiddlewareResult::Continue);
}

TEST_CASE("BypassList", "[gateway][auth]") {
    BypassList bypass({"/warden.AuthenticationService/Login", "/grpc.health.v1.Health/*"});
    REQUIRE(bypass.size() == 2);
    REQUIRE(bypass.matches("/warden.AuthenticationService/Login"));
    REQUIRE(bypass.matches("/grpc.health.v1.Health/Check"));
    REQUIRE_FALSE(bypass.matches("/warden.AuthenticationService/Refresh"));
}

TEST_CASE("BypassList agrees with operation_matches", "[gateway][auth]") {
    const std::vector<std::string> patterns = {"/warden.AuthenticationService/Login",
                                               "/warden.KeyService/*", "*"};
    const std::vector<std::string> operations = {"/warden.AuthenticationService/Login",
                                                 "/warden.AuthenticationService/LoginX",
                                                 "/warden.KeyService/",
                                                 "/warden.KeyService/Rotate",
                                                 "/warden.KeyServiceX/Rotate",
                                                 ""};
    for (const auto& pattern : patterns) {
        BypassList bypass({pattern});
        for (const auto& operation : operations) {
            CAPTURE(pattern, operation);
            REQUIRE(bypass.matches(operation) == operation_matches(pattern, operation));
        }
    }
    REQUIRE_FALSE(BypassList{}.matches("/warden.KeyService/Rotate"));
}

// ============================================================================
// PermissionMiddleware Tests
// ============================================================================

TEST_CASE("PermissionMiddleware - server-level operation rules", "[gateway][permission]") {
    Fixture f;
    auto admin = f.add_user("admin@example.com");
    auto user = f.add_user("user@example.com");
    f.grant(admin, core::ServerAdmin{});

    PermissionMiddleware::Config config;
    config.rules = {{"/warden.KeyService/*", core::Action::Admin}};
    PermissionMiddleware middleware(config, f.permissions);

    REQUIRE(middleware.find_rule("/warden.KeyService/Rotate") != nullptr);
    REQUIRE(middleware.find_rule("/warden.EventService/Query") == nullptr);

    SECTION("unrestricted operation passes") {
        auto ctx = f.context_for(user, "/warden.EventService/Query");
        REQUIRE(middleware.process_request(ctx) == MiddlewareResult::Continue);
    }

    SECTION("server admin passes") {
        auto ctx = f.context_for(admin, "/warden.KeyService/Rotate");
        REQUIRE(middleware.process_request(ctx) == MiddlewareResult::Continue);
    }

    SECTION("other users are forbidden") {
        auto ctx = f.context_for(user, "/warden.KeyService/Rotate");
        REQUIRE(middleware.process_request(ctx) == MiddlewareResult::Stop);
        REQUIRE(ctx.error->kind == ErrorKind::Forbidden);
    }

    SECTION("no identity") {
        CallContext ctx;
        ctx.operation = "/warden.KeyService/Rotate";
        REQUIRE(middleware.process_request(ctx) == MiddlewareResult::Stop);
        REQUIRE(ctx.error->kind == ErrorKind::Unauthenticated);
    }
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST_CASE("build_pipeline - end to end", "[gateway][factory]") {
    Fixture f;
    control::Config config;

    auto keys = build_key_manager(config, f.key_store, f.clock.clock());
    REQUIRE(keys->config().max_token_ttl_seconds == config.tokens.max_ttl_seconds());
    auto tokens = build_token_service(config, keys, f.clock.clock());
    REQUIRE(keys->rotate_key(false));

    auto pipeline = build_pipeline(config, tokens, f.permissions);
    REQUIRE(pipeline->size() == 3);

    auto admin = f.add_user("admin@example.com");
    auto user = f.add_user("user@example.com");
    f.grant(admin, core::ServerAdmin{});

    auto call = [&](const std::string& operation, const std::string& subject) {
        CallContext ctx;
        ctx.operation = operation;
        if (!subject.empty()) {
            auto issued = tokens->issue(subject, core::Audience::Access);
            REQUIRE(issued);
            ctx.set_header("authorization", "Bearer " + issued->token);
        }
        return pipeline->dispatch(ctx, ok_handler);
    };

    REQUIRE(call("/warden.AuthenticationService/Login", ""));
    REQUIRE(call("/warden.EventService/Query", user));
    REQUIRE(call("/warden.KeyService/Rotate", admin));

    auto anonymous = call("/warden.EventService/Query", "");
    REQUIRE_FALSE(anonymous);
    REQUIRE(anonymous.error().kind == ErrorKind::Unauthenticated);

    auto forbidden = call("/warden.KeyService/Rotate", user);
    REQUIRE_FALSE(forbidden);
    REQUIRE(forbidden.error().kind == ErrorKind::Forbidden);
}

TEST_CASE("build_credential_extractor - unknown transport falls back to any",
          "[gateway][factory]") {
    control::Config config;
    config.auth.transport = "header";
    REQUIRE(build_credential_extractor(config)->name() == "header");

    config.auth.transport = "carrier-pigeon";
    REQUIRE(build_credential_extractor(config)->name() == "any");
}
