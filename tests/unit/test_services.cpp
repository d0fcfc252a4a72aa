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

// Warden API Service Unit Tests - authentication, permissions, resources and keys

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "api/codec.hpp"
#include "runtime/orchestrator.hpp"
#include "test_helpers.hpp"

using namespace warden;
using core::ErrorKind;
using nlohmann::json;
using warden::testing::FakeClock;
using warden::testing::Fixture;

namespace {

/// Two organizations, one event each, and a user per role
struct Directory {
    Fixture f;
    std::string o1 = f.add_organization("acme");
    std::string o2 = f.add_organization("globex");
    std::string e1 = f.add_event(o1, "launch");
    std::string e2 = f.add_event(o2, "summit");

    std::string admin = f.add_user("admin@example.com");
    std::string org_admin = f.add_user("org-admin@example.com");
    std::string viewer = f.add_user("viewer@example.com");
    std::string event_admin = f.add_user("event-admin@example.com");
    std::string outsider = f.add_user("outsider@example.com");
    std::string target = f.add_user("target@example.com");

    std::string admin_grant = f.grant(admin, core::ServerAdmin{});
    std::string org_admin_grant = f.grant(org_admin, core::OrganizationAdmin{o1});
    std::string viewer_grant = f.grant(viewer, core::OrganizationViewer{o1});
    std::string event_admin_grant = f.grant(event_admin, core::EventAdmin{e1});

    api::PermissionService permissions{f.permissions};
    api::OrganizationService organizations{f.organizations, f.permissions};
    api::EventService events{f.events, f.permissions};

    gateway::CallContext as(const std::string& user) const { return f.context_for(user); }
};

api::AuthenticationService make_authentication(Fixture& f, bool secure = true) {
    api::AuthenticationService::Config config;
    config.cookie_secure = secure;
    return api::AuthenticationService(config, f.users, f.tokens, f.hasher,
                                      gateway::make_credential_extractor({}));
}

/// Counts verifications so both login failure paths can be compared
class CountingHasher : public core::PasswordHasher {
public:
    explicit CountingHasher(std::shared_ptr<int> verifications)
        : verifications_(std::move(verifications)) {}

    std::optional<std::string> hash(std::string_view plaintext) const override {
        return inner_.hash(plaintext);
    }

    bool verify(std::string_view plaintext, std::string_view stored_hash) const override {
        ++*verifications_;
        return inner_.verify(plaintext, stored_hash);
    }

private:
    core::Pbkdf2PasswordHasher inner_{1000};
    std::shared_ptr<int> verifications_;
};

api::UserRequest user_request(std::string id, std::string email, std::string display_name,
                              store::PasswordUpdate::Kind password,
                              std::string new_password = {}) {
    return api::UserRequest{std::move(id), std::move(email), std::move(display_name), password,
                            std::move(new_password)};
}

std::string cookie_header(const gateway::CallContext& ctx) {
    for (const auto& [name, value] : ctx.response_headers) {
        if (name == "set-cookie") {
            return value;
        }
    }
    return "";
}

}  // namespace

// ============================================================================
// AuthenticationService
// ============================================================================

TEST_CASE("format_http_date", "[api][auth]") {
    REQUIRE(api::format_http_date(0) == "Thu, 01 Jan 1970 00:00:00 GMT");
    REQUIRE(api::format_http_date(1'700'000'000) == "Tue, 14 Nov 2023 22:13:20 GMT");
}

TEST_CASE("AuthenticationService - login", "[api][auth]") {
    Fixture f;
    REQUIRE(f.keys->rotate_key(false));
    auto alice = f.add_user("alice@example.com", "correct horse");
    f.add_user("nopassword@example.com");
    auto service = make_authentication(f);

    SECTION("correct credentials") {
        gateway::CallContext ctx;
        auto response = service.login(ctx, "alice@example.com", "correct horse");
        REQUIRE(response);
        REQUIRE(response->claims.sub == alice);
        REQUIRE(f.tokens->validate(response->token, core::Audience::Access));
        REQUIRE(f.tokens->validate(response->refresh_token, core::Audience::Refresh));

        auto cookie = cookie_header(ctx);
        REQUIRE(cookie.starts_with("authorization=" + response->token + "; Expires="));
        REQUIRE(cookie.find("Secure;") != std::string::npos);
        REQUIRE(cookie.find("HttpOnly; SameSite=Strict; Path=/") != std::string::npos);
    }

    SECTION("every mismatch is Unauthenticated") {
        gateway::CallContext ctx;
        for (auto [email, password] : {std::pair{"alice@example.com", "wrong"},
                                       std::pair{"bob@example.com", "correct horse"},
                                       std::pair{"nopassword@example.com", "anything"},
                                       std::pair{"alice@example.com", ""},
                                       std::pair{"", "correct horse"}}) {
            auto response = service.login(ctx, email, password);
            REQUIRE_FALSE(response);
            REQUIRE(response.error().kind == ErrorKind::Unauthenticated);
        }
        REQUIRE(ctx.response_headers.empty());
    }

    SECTION("insecure cookie for local development") {
        auto insecure = make_authentication(f, false);
        gateway::CallContext ctx;
        REQUIRE(insecure.login(ctx, "alice@example.com", "correct horse"));
        REQUIRE(cookie_header(ctx).find("Secure") == std::string::npos);
    }

    SECTION("no signing key") {
        Fixture empty;
        empty.add_user("alice@example.com", "correct horse");
        auto unkeyed = make_authentication(empty);
        gateway::CallContext ctx;
        auto response = unkeyed.login(ctx, "alice@example.com", "correct horse");
        REQUIRE_FALSE(response);
        REQUIRE(response.error().kind == ErrorKind::Store);
    }
}

TEST_CASE("AuthenticationService - unknown emails are verified like wrong passwords",
          "[api][auth]") {
    Fixture f;
    REQUIRE(f.keys->rotate_key(false));
    auto verifications = std::make_shared<int>(0);
    f.hasher = std::make_shared<CountingHasher>(verifications);
    f.add_user("alice@example.com", "correct horse");
    auto service = make_authentication(f);
    gateway::CallContext ctx;

    REQUIRE_FALSE(service.login(ctx, "alice@example.com", "wrong"));
    REQUIRE(*verifications == 1);

    REQUIRE_FALSE(service.login(ctx, "nobody@example.com", "wrong"));
    REQUIRE(*verifications == 2);

    REQUIRE(service.login(ctx, "alice@example.com", "correct horse"));
    REQUIRE(*verifications == 3);
}

TEST_CASE("AuthenticationService - session", "[api][auth]") {
    Fixture f;
    REQUIRE(f.keys->rotate_key(false));
    f.add_user("alice@example.com", "correct horse");
    auto service = make_authentication(f);

    gateway::CallContext login_ctx;
    auto response = service.login(login_ctx, "alice@example.com", "correct horse");
    REQUIRE(response);

    SECTION("is_logged_in") {
        gateway::CallContext with_cookie;
        with_cookie.set_header("cookie", "authorization=" + response->token);
        auto logged_in = service.is_logged_in(with_cookie);
        REQUIRE(logged_in);
        REQUIRE(*logged_in);

        gateway::CallContext anonymous;
        auto anonymous_result = service.is_logged_in(anonymous);
        REQUIRE(anonymous_result);
        REQUIRE_FALSE(*anonymous_result);

        gateway::CallContext garbage;
        garbage.set_header("authorization", "Bearer garbage");
        auto garbage_result = service.is_logged_in(garbage);
        REQUIRE(garbage_result);
        REQUIRE_FALSE(*garbage_result);

        f.clock.advance(f.tokens->ttl_for(core::Audience::Access));
        auto expired = service.is_logged_in(with_cookie);
        REQUIRE(expired);
        REQUIRE_FALSE(*expired);
    }

    SECTION("claims") {
        auto ctx = f.context_for(response->claims.sub);
        auto claims = service.claims(ctx);
        REQUIRE(claims);
        REQUIRE(claims->sub == response->claims.sub);

        gateway::CallContext anonymous;
        REQUIRE(service.claims(anonymous).error().kind == ErrorKind::Unauthenticated);
    }

    SECTION("logout clears the cookie") {
        gateway::CallContext ctx;
        service.logout(ctx);
        REQUIRE(cookie_header(ctx) ==
                "authorization=; Expires=Thu, 01 Jan 1970 00:00:00 GMT; Secure; HttpOnly; "
                "SameSite=Strict; Path=/");
    }

    SECTION("refresh issues a new access token") {
        f.clock.advance(60);
        gateway::CallContext ctx;
        auto refreshed = service.refresh(ctx, response->refresh_token);
        REQUIRE(refreshed);
        REQUIRE(refreshed->claims.sub == response->claims.sub);
        REQUIRE(refreshed->claims.iat == f.clock.now());
        REQUIRE(cookie_header(ctx).starts_with("authorization=" + refreshed->token));

        gateway::CallContext wrong;
        auto rejected = service.refresh(wrong, response->token);
        REQUIRE_FALSE(rejected);
        REQUIRE(rejected.error().kind == ErrorKind::Unauthenticated);
        REQUIRE(wrong.response_headers.empty());
    }
}

// ============================================================================
// Authorization helper
// ============================================================================

TEST_CASE("require - disclosure of denied resources", "[api][authorization]") {
    Directory d;

    auto viewer = d.as(d.viewer);
    auto forbidden = api::require(*d.f.permissions, viewer,
                                  core::Capability::organization(core::Action::Admin, d.o1));
    REQUIRE_FALSE(forbidden);
    REQUIRE(forbidden.error().kind == ErrorKind::Forbidden);

    auto hidden = api::require(*d.f.permissions, viewer,
                               core::Capability::organization(core::Action::Admin, d.o2));
    REQUIRE_FALSE(hidden);
    REQUIRE(hidden.error().kind == ErrorKind::NotFound);
    REQUIRE(hidden.error().field == d.o2);

    auto server = api::require(*d.f.permissions, viewer, core::Capability::server(core::Action::Admin));
    REQUIRE(server.error().kind == ErrorKind::Forbidden);

    gateway::CallContext anonymous;
    auto unauthenticated =
        api::require(*d.f.permissions, anonymous, core::Capability::server(core::Action::Read));
    REQUIRE(unauthenticated.error().kind == ErrorKind::Unauthenticated);
}

// ============================================================================
// PermissionService
// ============================================================================

TEST_CASE("PermissionService - upsert", "[api][permissions]") {
    Directory d;

    SECTION("organization admin grants event roles in its organization") {
        auto ctx = d.as(d.org_admin);
        auto stored = d.permissions.upsert(ctx, {core::Permission{"", d.target, core::EventViewer{d.e1}}});
        REQUIRE(stored);
        REQUIRE(stored->size() == 1);
        REQUIRE_FALSE(stored->front().id.empty());
    }

    SECTION("hidden resources are NotFound") {
        auto ctx = d.as(d.org_admin);
        auto result = d.permissions.upsert(
            ctx, {core::Permission{"", d.target, core::OrganizationAdmin{d.o2}}});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::NotFound);
        REQUIRE(result.error().field == d.o2);
    }

    SECTION("visible but not administrable is Forbidden") {
        auto ctx = d.as(d.viewer);
        auto result =
            d.permissions.upsert(ctx, {core::Permission{"", d.target, core::EventViewer{d.e1}}});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::Forbidden);

        auto outsider = d.as(d.outsider);
        auto server = d.permissions.upsert(outsider, {core::Permission{"", d.target, core::ServerAdmin{}}});
        REQUIRE(server.error().kind == ErrorKind::Forbidden);
    }

    SECTION("validation happens before any authorization") {
        auto ctx = d.as(d.outsider);
        auto result = d.permissions.upsert(ctx, {
                                                    core::Permission{"", d.target, core::ServerAdmin{}},
                                                    core::Permission{"", "", core::ServerAdmin{}},
                                                });
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::Validation);
        REQUIRE(result.error().field == "permissions[1].user_id");
    }

    SECTION("updating needs authority over the replaced role too") {
        // Event admin may grant EventViewer on e1 but cannot touch an OrganizationAdmin row
        auto ctx = d.as(d.event_admin);
        auto result = d.permissions.upsert(
            ctx, {core::Permission{d.org_admin_grant, d.target, core::EventViewer{d.e1}}});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::NotFound);
        REQUIRE(result.error().field == d.org_admin_grant);

        auto admin = d.as(d.admin);
        auto updated = d.permissions.upsert(
            admin, {core::Permission{d.org_admin_grant, d.org_admin, core::OrganizationViewer{d.o1}}});
        REQUIRE(updated);
        REQUIRE(updated->front().id == d.org_admin_grant);
    }

    SECTION("unknown permission id") {
        auto ctx = d.as(d.admin);
        auto result =
            d.permissions.upsert(ctx, {core::Permission{"ghost", d.target, core::ServerAdmin{}}});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::NotFound);
        REQUIRE(result.error().field == "ghost");
    }

    SECTION("unauthenticated") {
        gateway::CallContext anonymous;
        auto result =
            d.permissions.upsert(anonymous, {core::Permission{"", d.target, core::ServerAdmin{}}});
        REQUIRE(result.error().kind == ErrorKind::Unauthenticated);
    }
}

TEST_CASE("PermissionService - query is limited to visible rows", "[api][permissions]") {
    Directory d;
    d.f.grant(d.target, core::EventViewer{d.e2});

    SECTION("server admin sees everything") {
        auto rows = d.permissions.query(d.as(d.admin), nullptr);
        REQUIRE(rows);
        REQUIRE(rows->size() == 5);
    }

    SECTION("organization viewer sees its organization and events") {
        auto rows = d.permissions.query(d.as(d.viewer), nullptr);
        REQUIRE(rows);
        REQUIRE(rows->size() == 3);
        for (const auto& row : *rows) {
            REQUIRE_FALSE(std::holds_alternative<core::ServerAdmin>(row.role));
            REQUIRE(core::role_event(row.role) != d.e2);
        }
    }

    SECTION("filter applies within the visible set") {
        core::PermissionQuery filter =
            query::LogicalQuery<core::PermissionUserField>::equals(d.event_admin);
        auto rows = d.permissions.query(d.as(d.viewer), &filter);
        REQUIRE(rows);
        REQUIRE(rows->size() == 1);
        REQUIRE(rows->front().id == d.event_admin_grant);
    }

    SECTION("users without roles see nothing") {
        auto rows = d.permissions.query(d.as(d.outsider), nullptr);
        REQUIRE(rows);
        REQUIRE(rows->empty());
    }

    SECTION("invalid filter is reported against the caller's query") {
        auto filter = core::PermissionQuery::all_of({});
        auto rows = d.permissions.query(d.as(d.admin), &filter);
        REQUIRE_FALSE(rows);
        REQUIRE(rows.error().field == "query.queries");
    }
}

TEST_CASE("PermissionService - remove", "[api][permissions]") {
    Directory d;

    SECTION("organization admin revokes within its organization") {
        REQUIRE(d.permissions.remove(d.as(d.org_admin), {d.viewer_grant, d.event_admin_grant}));
        auto rows = d.permissions.query(d.as(d.admin), nullptr);
        REQUIRE(rows);
        REQUIRE(rows->size() == 2);
    }

    SECTION("rows on hidden resources are NotFound") {
        auto result = d.permissions.remove(d.as(d.outsider), {d.org_admin_grant});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::NotFound);
        REQUIRE(result.error().field == d.org_admin_grant);
    }

    SECTION("visible rows without authority are Forbidden") {
        auto result = d.permissions.remove(d.as(d.viewer), {d.event_admin_grant});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::Forbidden);
    }

    SECTION("missing ids fail the whole batch") {
        auto result = d.permissions.remove(d.as(d.admin), {d.viewer_grant, "ghost"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().field == "ghost");

        auto rows = d.permissions.query(d.as(d.admin), nullptr);
        REQUIRE(rows);
        REQUIRE(rows->size() == 4);
    }
}

// ============================================================================
// UserService
// ============================================================================

TEST_CASE("UserService - upsert", "[api][users]") {
    Directory d;
    api::UserService users(d.f.users, d.f.permissions, d.f.hasher);
    using Kind = store::PasswordUpdate::Kind;

    auto stored_user = [&](const std::string& id) {
        store::UserQuery by_id = query::LogicalQuery<store::UserIdField>::equals(id);
        auto rows = d.f.users->query(&by_id);
        REQUIRE(rows);
        REQUIRE(rows->size() == 1);
        return rows->front();
    };

    SECTION("users update themselves") {
        auto updated = users.upsert(
            d.as(d.viewer),
            {user_request(d.viewer, "viewer@example.com", "Vera Viewer", Kind::Set, "hunter2")});
        REQUIRE(updated);
        REQUIRE(updated->front().display_name == "Vera Viewer");
        REQUIRE_FALSE(updated->front().password_hash);

        auto row = stored_user(d.viewer);
        REQUIRE(row.password_hash);
        REQUIRE(d.f.hasher->verify("hunter2", *row.password_hash));

        REQUIRE(users.upsert(d.as(d.viewer), {user_request(d.viewer, "vera@example.com",
                                                           "Vera Viewer", Kind::Unchanged)}));
        row = stored_user(d.viewer);
        REQUIRE(row.email == "vera@example.com");
        REQUIRE(row.password_hash);
        REQUIRE(d.f.hasher->verify("hunter2", *row.password_hash));
    }

    SECTION("other users and new users need ServerAdmin") {
        auto create = users.upsert(
            d.as(d.org_admin), {user_request("", "new@example.com", "New", Kind::Set, "pw")});
        REQUIRE(create.error().kind == ErrorKind::Forbidden);

        auto other = users.upsert(
            d.as(d.viewer), {user_request(d.target, "target@example.com", "Mine", Kind::Unset)});
        REQUIRE(other.error().kind == ErrorKind::Forbidden);
        REQUIRE(stored_user(d.target).display_name == "target@example.com");
    }

    SECTION("server admins create and unset passwords") {
        auto created = users.upsert(
            d.as(d.admin), {user_request("", "new@example.com", "New", Kind::Set, "pw"),
                            user_request(d.target, "target@example.com", "Target", Kind::Unset)});
        REQUIRE(created);
        REQUIRE(created->size() == 2);
        REQUIRE_FALSE((*created)[0].id.empty());
        REQUIRE((*created)[1].id == d.target);
        REQUIRE(d.f.hasher->verify("pw", *stored_user((*created)[0].id).password_hash));
        REQUIRE_FALSE(stored_user(d.target).password_hash);
    }

    SECTION("validation paths name the request list") {
        auto no_password = users.upsert(
            d.as(d.admin), {user_request(d.viewer, "viewer@example.com", "V", Kind::Unchanged),
                            user_request("", "new@example.com", "New", Kind::Unchanged)});
        REQUIRE(no_password.error().field == "users[1].password");

        auto empty_set = users.upsert(
            d.as(d.viewer), {user_request(d.viewer, "viewer@example.com", "V", Kind::Set)});
        REQUIRE(empty_set.error().field == "users[0].password");

        auto no_name = users.upsert(
            d.as(d.viewer), {user_request(d.viewer, "viewer@example.com", "", Kind::Unchanged)});
        REQUIRE(no_name.error().field == "users[0].display_name");

        auto taken = users.upsert(
            d.as(d.viewer), {user_request(d.viewer, "admin@example.com", "V", Kind::Unchanged)});
        REQUIRE(taken.error().field == "users[0].email");
        REQUIRE(taken.error().reason == core::ValidationReason::InvalidValue);
    }

    SECTION("unknown ids are NotFound") {
        auto missing = users.upsert(
            d.as(d.admin), {user_request("ghost", "ghost@example.com", "Ghost", Kind::Unset)});
        REQUIRE(missing.error().kind == ErrorKind::NotFound);
        REQUIRE(missing.error().field == "ghost");
    }
}

TEST_CASE("UserService - query strips other users", "[api][users]") {
    Directory d;
    api::UserService users(d.f.users, d.f.permissions, d.f.hasher);

    auto seen = users.query(d.as(d.viewer), nullptr);
    REQUIRE(seen);
    REQUIRE(seen->size() == 6);
    for (const auto& user : *seen) {
        REQUIRE_FALSE(user.password_hash);
        REQUIRE_FALSE(user.display_name.empty());
        if (user.id == d.viewer) {
            REQUIRE(user.email == "viewer@example.com");
        } else {
            REQUIRE(user.email.empty());
        }
    }

    auto all = users.query(d.as(d.admin), nullptr);
    REQUIRE(all);
    for (const auto& user : *all) {
        REQUIRE_FALSE(user.email.empty());
        REQUIRE_FALSE(user.password_hash);
    }

    store::UserQuery by_name =
        query::LogicalQuery<store::UserDisplayNameField>::equals("target@example.com");
    auto filtered = users.query(d.as(d.admin), &by_name);
    REQUIRE(filtered);
    REQUIRE(filtered->size() == 1);
    REQUIRE(filtered->front().id == d.target);
    REQUIRE(api::to_json(filtered->front()) == json{{"id", d.target},
                                                    {"email", "target@example.com"},
                                                    {"display_name", "target@example.com"}});
}

TEST_CASE("UserService - remove", "[api][users]") {
    Directory d;
    api::UserService users(d.f.users, d.f.permissions, d.f.hasher);

    auto forbidden = users.remove(d.as(d.viewer), {d.target});
    REQUIRE(forbidden.error().kind == ErrorKind::Forbidden);

    REQUIRE(users.remove(d.as(d.viewer), {d.viewer}));
    auto rows = d.permissions.query(d.as(d.admin), nullptr);
    REQUIRE(rows);
    REQUIRE(rows->size() == 3);

    auto missing = users.remove(d.as(d.admin), {d.target, "ghost"});
    REQUIRE(missing.error().kind == ErrorKind::NotFound);
    REQUIRE(missing.error().field == "ghost");

    REQUIRE(users.remove(d.as(d.admin), {d.target}));
    auto left = users.query(d.as(d.admin), nullptr);
    REQUIRE(left);
    REQUIRE(left->size() == 4);
}

// ============================================================================
// OrganizationService / EventService
// ============================================================================

TEST_CASE("OrganizationService", "[api][organizations]") {
    Directory d;

    SECTION("only server admins create") {
        auto created = d.organizations.upsert(d.as(d.admin), {store::Organization{"", "initech"}});
        REQUIRE(created);
        REQUIRE_FALSE(created->front().id.empty());

        auto denied = d.organizations.upsert(d.as(d.org_admin), {store::Organization{"", "hooli"}});
        REQUIRE(denied.error().kind == ErrorKind::Forbidden);
    }

    SECTION("organization admins rename their own") {
        REQUIRE(d.organizations.upsert(d.as(d.org_admin), {store::Organization{d.o1, "acme inc"}}));

        auto hidden = d.organizations.upsert(d.as(d.org_admin), {store::Organization{d.o2, "mine"}});
        REQUIRE(hidden.error().kind == ErrorKind::NotFound);

        auto forbidden = d.organizations.upsert(d.as(d.viewer), {store::Organization{d.o1, "mine"}});
        REQUIRE(forbidden.error().kind == ErrorKind::Forbidden);
    }

    SECTION("store validation paths name the request list") {
        auto result = d.organizations.upsert(d.as(d.admin), {store::Organization{"", ""}});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().field == "organizations[0].name");
    }

    SECTION("query returns readable organizations") {
        auto all = d.organizations.query(d.as(d.admin), nullptr);
        REQUIRE(all);
        REQUIRE(all->size() == 2);

        auto mine = d.organizations.query(d.as(d.viewer), nullptr);
        REQUIRE(mine);
        REQUIRE(mine->size() == 1);
        REQUIRE(mine->front().id == d.o1);

        store::OrganizationQuery by_name =
            query::LogicalQuery<store::OrganizationNameField>::equals("globex");
        auto filtered = d.organizations.query(d.as(d.viewer), &by_name);
        REQUIRE(filtered);
        REQUIRE(filtered->empty());
    }

    SECTION("remove") {
        auto hidden = d.organizations.remove(d.as(d.outsider), {d.o1});
        REQUIRE(hidden.error().kind == ErrorKind::NotFound);

        auto forbidden = d.organizations.remove(d.as(d.org_admin), {d.o1});
        REQUIRE(forbidden.error().kind == ErrorKind::Forbidden);

        REQUIRE(d.organizations.remove(d.as(d.admin), {d.o1}));
        auto events = d.events.query(d.as(d.admin), nullptr);
        REQUIRE(events);
        REQUIRE(events->size() == 1);
        REQUIRE(events->front().id == d.e2);
    }
}

TEST_CASE("EventService", "[api][events]") {
    Directory d;

    SECTION("organization admins create events in their organization") {
        auto created = d.events.upsert(d.as(d.org_admin), {store::Event{"", d.o1, "afterparty"}});
        REQUIRE(created);
        REQUIRE(created->front().organization_id == d.o1);

        auto hidden = d.events.upsert(d.as(d.org_admin), {store::Event{"", d.o2, "afterparty"}});
        REQUIRE(hidden.error().kind == ErrorKind::NotFound);
        REQUIRE(hidden.error().field == d.o2);
    }

    SECTION("new events need an organization") {
        auto result = d.events.upsert(d.as(d.admin), {store::Event{"", "", "floating"}});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().field == "events[0].organization_id");
    }

    SECTION("event admins rename, viewers cannot") {
        auto renamed = d.events.upsert(d.as(d.event_admin), {store::Event{d.e1, "", "relaunch"}});
        REQUIRE(renamed);
        REQUIRE(renamed->front().organization_id == d.o1);

        auto forbidden = d.events.upsert(d.as(d.viewer), {store::Event{d.e1, "", "mine"}});
        REQUIRE(forbidden.error().kind == ErrorKind::Forbidden);
    }

    SECTION("event editors rename but cannot remove") {
        auto editor = d.f.add_user("editor@example.com");
        d.f.grant(editor, core::EventEditor{d.e1});

        auto renamed = d.events.upsert(d.as(editor), {store::Event{d.e1, "", "relaunch"}});
        REQUIRE(renamed);
        REQUIRE(renamed->front().name == "relaunch");

        auto removed = d.events.remove(d.as(editor), {d.e1});
        REQUIRE(removed.error().kind == ErrorKind::Forbidden);

        auto hidden = d.events.upsert(d.as(editor), {store::Event{d.e2, "", "mine"}});
        REQUIRE(hidden.error().kind == ErrorKind::NotFound);
    }

    SECTION("query returns readable events") {
        auto own = d.events.query(d.as(d.event_admin), nullptr);
        REQUIRE(own);
        REQUIRE(own->size() == 1);
        REQUIRE(own->front().id == d.e1);

        auto through_organization = d.events.query(d.as(d.viewer), nullptr);
        REQUIRE(through_organization);
        REQUIRE(through_organization->size() == 1);

        auto none = d.events.query(d.as(d.outsider), nullptr);
        REQUIRE(none);
        REQUIRE(none->empty());
    }

    SECTION("remove") {
        auto forbidden = d.events.remove(d.as(d.viewer), {d.e1});
        REQUIRE(forbidden.error().kind == ErrorKind::Forbidden);

        REQUIRE(d.events.remove(d.as(d.event_admin), {d.e1}));
        auto rows = d.permissions.query(d.as(d.admin), nullptr);
        REQUIRE(rows);
        REQUIRE(rows->size() == 3);
    }
}

// ============================================================================
// KeyAdminService
// ============================================================================

TEST_CASE("KeyAdminService", "[api][keys]") {
    Directory d;
    api::KeyAdminService keys(d.f.keys, d.f.permissions);

    auto first = keys.rotate(d.as(d.admin), false);
    REQUIRE(first);
    auto second = keys.rotate(d.as(d.admin), false);
    REQUIRE(second);

    auto listed = keys.list(d.as(d.admin));
    REQUIRE(listed);
    REQUIRE(listed->size() == 2);

    auto purged = keys.purge_expired(d.as(d.admin));
    REQUIRE(purged);
    REQUIRE(*purged == 0);

    REQUIRE(keys.rotate(d.as(d.org_admin), true).error().kind == ErrorKind::Forbidden);
    REQUIRE(keys.list(d.as(d.outsider)).error().kind == ErrorKind::Forbidden);

    auto json_keys = api::to_json_array(*listed);
    REQUIRE(json_keys.size() == 2);
    REQUIRE(json_keys[0]["state"] == "ACTIVE");
    REQUIRE(json_keys[1]["state"] == "RETIRED");
    REQUIRE(json_keys[0].contains("expires_at"));
}

// ============================================================================
// Codec
// ============================================================================

TEST_CASE("Codec - request lists", "[api][codec]") {
    SECTION("permissions") {
        auto request = json::parse(R"({"permissions": [
            {"user_id": "u1", "role": {"name": "SERVER_ADMIN"}},
            {"id": "p2", "user_id": "u2", "role": {"name": "EVENT_VIEWER", "event_id": "e1"}}
        ]})");
        auto permissions = api::permissions_from_json(request);
        REQUIRE(permissions);
        REQUIRE(permissions->size() == 2);
        REQUIRE((*permissions)[0].id.empty());
        REQUIRE((*permissions)[1].role == core::Role{core::EventViewer{"e1"}});

        REQUIRE(api::to_json((*permissions)[1]) ==
                json{{"id", "p2"},
                     {"user_id", "u2"},
                     {"role", {{"name", "EVENT_VIEWER"}, {"event_id", "e1"}}}});
    }

    SECTION("error paths") {
        auto missing_scope = api::permissions_from_json(json::parse(
            R"({"permissions": [{"user_id": "u1", "role": {"name": "SERVER_ADMIN"}},
                                {"user_id": "u1", "role": {"name": "EVENT_ADMIN"}}]})"));
        REQUIRE_FALSE(missing_scope);
        REQUIRE(missing_scope.error().field == "permissions[1].role.event_id");

        auto wrong_type = api::organizations_from_json(
            json::parse(R"({"organizations": [{"id": 5, "name": "acme"}]})"));
        REQUIRE_FALSE(wrong_type);
        REQUIRE(wrong_type.error().field == "organizations[0].id");

        auto no_owner = api::events_from_json(json::parse(R"({"events": [{"name": "launch"}]})"));
        REQUIRE_FALSE(no_owner);
        REQUIRE(no_owner.error().field == "events[0].organization_id");

        auto not_object = api::events_from_json(json::parse(R"({"events": ["launch"]})"));
        REQUIRE_FALSE(not_object);
        REQUIRE(not_object.error().field == "events[0]");
    }

    SECTION("users") {
        auto request = json::parse(R"({"users": [
            {"email": "a@example.com", "display_name": "A", "password": {"action": "SET", "value": "pw"}},
            {"id": "u2", "email": "b@example.com", "display_name": "B", "password": {"action": "UNSET"}},
            {"id": "u3", "email": "c@example.com", "display_name": "C", "password": {"action": "UNCHANGED"}}
        ]})");
        auto users = api::users_from_json(request);
        REQUIRE(users);
        REQUIRE(users->size() == 3);
        REQUIRE((*users)[0].password == store::PasswordUpdate::Kind::Set);
        REQUIRE((*users)[0].new_password == "pw");
        REQUIRE((*users)[1].password == store::PasswordUpdate::Kind::Unset);
        REQUIRE((*users)[2].id == "u3");
        REQUIRE((*users)[2].password == store::PasswordUpdate::Kind::Unchanged);

        auto no_password = api::users_from_json(
            json::parse(R"({"users": [{"email": "a@example.com", "display_name": "A"}]})"));
        REQUIRE(no_password.error().field == "users[0].password");

        auto bad_action = api::users_from_json(json::parse(
            R"({"users": [{"email": "a@example.com", "password": {"action": "RESET"}}]})"));
        REQUIRE(bad_action.error().field == "users[0].password.action");
        REQUIRE(bad_action.error().reason == core::ValidationReason::InvalidValue);

        auto bad_value = api::users_from_json(json::parse(
            R"({"users": [{"email": "a@example.com", "password": {"action": "SET", "value": 1}}]})"));
        REQUIRE(bad_value.error().field == "users[0].password.value");
    }

    SECTION("list shape") {
        auto missing = api::ids_from_json(json::object());
        REQUIRE(missing.error().field == "ids");
        REQUIRE(missing.error().reason == core::ValidationReason::EmptyField);

        auto empty = api::ids_from_json(json{{"ids", json::array()}});
        REQUIRE(empty.error().reason == core::ValidationReason::EmptyField);

        auto not_array = api::ids_from_json(json{{"ids", "a"}});
        REQUIRE(not_array.error().reason == core::ValidationReason::InvalidValue);

        auto too_many = api::ids_from_json(
            json{{"ids", json(std::vector<std::string>(api::kMaxRequestItems + 1, "x"))}});
        REQUIRE(too_many.error().reason == core::ValidationReason::TooManyItems);

        auto bad_item = api::ids_from_json(json{{"ids", {"a", ""}}});
        REQUIRE(bad_item.error().field == "ids[1]");

        auto ids = api::ids_from_json(json{{"ids", {"a", "b"}}});
        REQUIRE(ids);
        REQUIRE(*ids == std::vector<std::string>{"a", "b"});
    }

    SECTION("claims") {
        core::Claims claims{"https://issuer", "u1", core::Audience::Access, 10, 20};
        auto j = api::to_json(claims);
        REQUIRE(j["aud"] == "Access");
        REQUIRE(j["exp"] == 20);
    }
}

// ============================================================================
// Runtime
// ============================================================================

TEST_CASE("Runtime - build, keys and bootstrap", "[runtime]") {
    FakeClock clock;
    control::Config config;
    config.database.path = ":memory:";
    config.logging.output = "-";

    auto runtime = runtime::build_runtime(config, clock.clock());
    REQUIRE(runtime);
    auto& rt = **runtime;

    SECTION("missing key is only a warning unless rotation is enabled") {
        REQUIRE(runtime::prepare_signing_keys(rt));
        REQUIRE(rt.key_store->get_active().error().kind == ErrorKind::NotFound);

        rt.config.keys.rotate_on_startup_if_missing = true;
        REQUIRE(runtime::prepare_signing_keys(rt));
        auto active = rt.key_store->get_active();
        REQUIRE(active);

        // Idempotent once a key exists
        REQUIRE(runtime::prepare_signing_keys(rt));
        auto keys = rt.keys->list_keys();
        REQUIRE(keys);
        REQUIRE(keys->size() == 1);
    }

    SECTION("expired keys are purged at startup") {
        REQUIRE(rt.keys->rotate_key(false));
        clock.advance(config.keys.key_lifetime_seconds);
        rt.config.keys.rotate_on_startup_if_missing = true;
        REQUIRE(runtime::prepare_signing_keys(rt));

        auto keys = rt.keys->list_keys();
        REQUIRE(keys);
        REQUIRE(keys->size() == 1);
        REQUIRE_FALSE(keys->front().expired);
    }

    SECTION("bootstrap admin logs in and passes the key service rule") {
        REQUIRE(rt.keys->rotate_key(false));
        auto admin = runtime::bootstrap_admin(rt, "root@example.com", "bootstrap-pw");
        REQUIRE(admin);

        gateway::CallContext login_ctx;
        auto login = rt.authentication->login(login_ctx, "root@example.com", "bootstrap-pw");
        REQUIRE(login);
        REQUIRE(login->claims.sub == *admin);

        gateway::CallContext ctx;
        ctx.operation = "/warden.KeyService/Rotate";
        ctx.set_header("authorization", "Bearer " + login->token);
        std::string rotated;
        auto outcome = rt.dispatch(ctx, [&](gateway::CallContext& call) -> core::Status {
            auto key_id = rt.key_admin->rotate(call, false);
            if (!key_id) {
                return std::move(key_id).error();
            }
            rotated = *key_id;
            return core::Status::success();
        });
        REQUIRE(outcome);
        REQUIRE_FALSE(rotated.empty());

        auto duplicate = runtime::bootstrap_admin(rt, "root@example.com", "other");
        REQUIRE_FALSE(duplicate);
    }

    SECTION("set_user_password") {
        auto created = rt.users->create("late@example.com");
        REQUIRE(created);

        REQUIRE(runtime::set_user_password(rt, "late@example.com", "new-password"));
        auto missing = runtime::set_user_password(rt, "ghost@example.com", "pw");
        REQUIRE(missing.error().kind == ErrorKind::NotFound);

        auto empty = runtime::set_user_password(rt, "late@example.com", "");
        REQUIRE(empty.error().kind == ErrorKind::Validation);
        REQUIRE(empty.error().field == "password");
    }
}
