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

// Warden Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::control {

/// Persistence settings
struct DatabaseConfig {
    std::string path = "warden.db";  // SQLite file, ":memory:" for ephemeral stores
    uint32_t busy_timeout_ms = 5000;
};

/// Signing key lifecycle settings
struct KeysConfig {
    int64_t key_lifetime_seconds = 60LL * 60 * 24 * 30 * 24;  // 24 months
    bool rotate_on_startup_if_missing = false;
    bool purge_expired_on_startup = true;

    // Verifying-key cache (disabled by default; entries never outlive key expiry)
    bool cache_enabled = false;
    uint32_t cache_capacity = 64;
    int64_t cache_ttl_seconds = 300;
};

/// Token issuance settings
struct TokenConfig {
    std::string issuer = "https://auth.example.com";
    int64_t access_ttl_seconds = 60LL * 60 * 24 * 30 * 6;    // 6 months
    int64_t refresh_ttl_seconds = 60LL * 60 * 24 * 30 * 12;  // 12 months

    [[nodiscard]] int64_t max_ttl_seconds() const noexcept {
        return access_ttl_seconds > refresh_ttl_seconds ? access_ttl_seconds
                                                        : refresh_ttl_seconds;
    }
};

/// Per-operation server-level requirement
struct OperationRuleConfig {
    std::string pattern;           // Exact operation, or prefix when ending in '*'
    std::string action = "admin";  // read, edit, admin
};

/// Authentication middleware settings
struct AuthConfig {
    bool enabled = true;
    std::string transport = "any";  // cookie, header, any
    std::string cookie_name = "authorization";
    std::string header = "Authorization";
    std::string scheme = "Bearer";
    bool cookie_secure = true;

    // Operations that skip token validation entirely
    std::vector<std::string> bypass = {"/warden.AuthenticationService/Login",
                                       "/warden.AuthenticationService/IsLoggedIn",
                                       "/warden.AuthenticationService/Logout",
                                       "/warden.AuthenticationService/Refresh",
                                       "/grpc.health.v1.Health/*",
                                       "/grpc.reflection.*"};

    std::vector<OperationRuleConfig> operation_rules = {
        {"/warden.KeyService/*", "admin"}};
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";              // debug, info, warning, error
    std::string format = "json";             // json, text
    std::string output = "/var/log/warden";  // Log directory (warden.log appended)
    std::string file_name = "warden.log";

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Warden configuration
struct Config {
    DatabaseConfig database;
    KeysConfig keys;
    TokenConfig tokens;
    AuthConfig auth;
    LogConfig logging;

    std::string version = "1.0";
};

// Custom from_json/to_json so partial configs fall back to defaults

inline void from_json(const nlohmann::json& j, DatabaseConfig& d) {
    d.path = j.value("path", std::string("warden.db"));
    d.busy_timeout_ms = j.value("busy_timeout_ms", 5000u);
}

inline void to_json(nlohmann::json& j, const DatabaseConfig& d) {
    j = nlohmann::json{{"path", d.path}, {"busy_timeout_ms", d.busy_timeout_ms}};
}

inline void from_json(const nlohmann::json& j, KeysConfig& k) {
    KeysConfig defaults;
    k.key_lifetime_seconds = j.value("key_lifetime_seconds", defaults.key_lifetime_seconds);
    k.rotate_on_startup_if_missing = j.value("rotate_on_startup_if_missing", false);
    k.purge_expired_on_startup = j.value("purge_expired_on_startup", true);
    k.cache_enabled = j.value("cache_enabled", false);
    k.cache_capacity = j.value("cache_capacity", 64u);
    k.cache_ttl_seconds = j.value("cache_ttl_seconds", int64_t(300));
}

inline void to_json(nlohmann::json& j, const KeysConfig& k) {
    j = nlohmann::json{{"key_lifetime_seconds", k.key_lifetime_seconds},
                       {"rotate_on_startup_if_missing", k.rotate_on_startup_if_missing},
                       {"purge_expired_on_startup", k.purge_expired_on_startup},
                       {"cache_enabled", k.cache_enabled},
                       {"cache_capacity", k.cache_capacity},
                       {"cache_ttl_seconds", k.cache_ttl_seconds}};
}

inline void from_json(const nlohmann::json& j, TokenConfig& t) {
    TokenConfig defaults;
    t.issuer = j.value("issuer", defaults.issuer);
    t.access_ttl_seconds = j.value("access_ttl_seconds", defaults.access_ttl_seconds);
    t.refresh_ttl_seconds = j.value("refresh_ttl_seconds", defaults.refresh_ttl_seconds);
}

inline void to_json(nlohmann::json& j, const TokenConfig& t) {
    j = nlohmann::json{{"issuer", t.issuer},
                       {"access_ttl_seconds", t.access_ttl_seconds},
                       {"refresh_ttl_seconds", t.refresh_ttl_seconds}};
}

inline void from_json(const nlohmann::json& j, OperationRuleConfig& r) {
    r.pattern = j.value("pattern", std::string());
    r.action = j.value("action", std::string("admin"));
}

inline void to_json(nlohmann::json& j, const OperationRuleConfig& r) {
    j = nlohmann::json{{"pattern", r.pattern}, {"action", r.action}};
}

inline void from_json(const nlohmann::json& j, AuthConfig& a) {
    AuthConfig defaults;
    a.enabled = j.value("enabled", true);
    a.transport = j.value("transport", defaults.transport);
    a.cookie_name = j.value("cookie_name", defaults.cookie_name);
    a.header = j.value("header", defaults.header);
    a.scheme = j.value("scheme", defaults.scheme);
    a.cookie_secure = j.value("cookie_secure", true);
    if (j.contains("bypass")) {
        j.at("bypass").get_to(a.bypass);
    }
    if (j.contains("operation_rules")) {
        j.at("operation_rules").get_to(a.operation_rules);
    }
}

inline void to_json(nlohmann::json& j, const AuthConfig& a) {
    j = nlohmann::json{{"enabled", a.enabled},
                       {"transport", a.transport},
                       {"cookie_name", a.cookie_name},
                       {"header", a.header},
                       {"scheme", a.scheme},
                       {"cookie_secure", a.cookie_secure},
                       {"bypass", a.bypass},
                       {"operation_rules", a.operation_rules}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/warden"));
    l.file_name = j.value("file_name", std::string("warden.log"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"file_name", l.file_name},
                       {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("database")) {
        j.at("database").get_to(c.database);
    }
    if (j.contains("keys")) {
        j.at("keys").get_to(c.keys);
    }
    if (j.contains("tokens")) {
        j.at("tokens").get_to(c.tokens);
    }
    if (j.contains("auth")) {
        j.at("auth").get_to(c.auth);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    c.version = j.value("version", std::string("1.0"));
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"database", c.database}, {"keys", c.keys},
                       {"tokens", c.tokens},     {"auth", c.auth},
                       {"logging", c.logging},   {"version", c.version}};
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace warden::control
