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

// Warden Configuration - Implementation

#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "../core/string_utils.hpp"

namespace warden::control {

namespace {

const std::vector<std::string_view> kTransports = {"cookie", "header", "any"};
const std::vector<std::string_view> kActions = {"read", "edit", "admin"};
const std::vector<std::string_view> kLogLevels = {"debug", "info", "warning", "warn", "error"};

bool contains(const std::vector<std::string_view>& values, std::string_view value) {
    for (auto v : values) {
        if (v == value) {
            return true;
        }
    }
    return false;
}

std::string did_you_mean(std::string_view value, const std::vector<std::string_view>& values) {
    auto suggestion = core::closest_match(value, values);
    if (!suggestion) {
        return "";
    }
    return " (did you mean '" + *suggestion + "'?)";
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open config file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Logging is not up yet when the config is read
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);

    for (const auto& warning : validation.warnings) {
        fprintf(stderr, "Config warning: %s\n", warning.c_str());
    }

    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Config error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Database
    if (config.database.path.empty()) {
        result.add_error("database.path cannot be empty");
    }
    if (config.database.path == ":memory:") {
        result.add_warning("database.path is ':memory:' (signing keys will not survive restart)");
    }

    // Tokens
    if (config.tokens.issuer.empty()) {
        result.add_error("tokens.issuer cannot be empty");
    }
    if (config.tokens.access_ttl_seconds <= 0) {
        result.add_error("tokens.access_ttl_seconds must be > 0");
    }
    if (config.tokens.refresh_ttl_seconds <= 0) {
        result.add_error("tokens.refresh_ttl_seconds must be > 0");
    }

    // Keys: a key must outlive every token it signs, so the key lifetime has to
    // leave a non-empty signing window after subtracting the longest token TTL
    if (config.keys.key_lifetime_seconds <= config.tokens.max_ttl_seconds()) {
        result.add_error("keys.key_lifetime_seconds (" +
                         std::to_string(config.keys.key_lifetime_seconds) +
                         ") must exceed the longest token TTL (" +
                         std::to_string(config.tokens.max_ttl_seconds()) + ")");
    } else if (config.keys.key_lifetime_seconds < 2 * config.tokens.max_ttl_seconds()) {
        result.add_warning(
            "keys.key_lifetime_seconds leaves a signing window shorter than the longest token "
            "TTL; keys will need frequent rotation");
    }

    if (config.keys.cache_enabled) {
        if (config.keys.cache_capacity == 0) {
            result.add_error("keys.cache_capacity must be > 0 when the cache is enabled");
        }
        if (config.keys.cache_ttl_seconds <= 0) {
            result.add_error("keys.cache_ttl_seconds must be > 0 when the cache is enabled");
        }
    }

    // Auth
    if (!contains(kTransports, config.auth.transport)) {
        result.add_error("Unknown auth.transport '" + config.auth.transport + "'" +
                         did_you_mean(config.auth.transport, kTransports));
    }
    if (config.auth.cookie_name.empty()) {
        result.add_error("auth.cookie_name cannot be empty");
    }
    if (config.auth.header.empty()) {
        result.add_error("auth.header cannot be empty");
    }
    if (!config.auth.enabled) {
        result.add_warning("auth.enabled is false (every operation runs without identity)");
    }

    for (const auto& pattern : config.auth.bypass) {
        if (pattern.empty() || pattern == "*") {
            result.add_error("auth.bypass entries cannot be empty or match every operation");
        }
    }

    for (const auto& rule : config.auth.operation_rules) {
        if (rule.pattern.empty()) {
            result.add_error("auth.operation_rules pattern cannot be empty");
        }
        if (!contains(kActions, rule.action)) {
            result.add_error("Unknown action '" + rule.action + "' for operation rule '" +
                             rule.pattern + "'" + did_you_mean(rule.action, kActions));
        }
    }

    // Logging
    std::string level = core::to_lower(config.logging.level);
    if (!contains(kLogLevels, level)) {
        result.add_warning("Unknown logging.level '" + config.logging.level +
                           "', falling back to info");
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("logging.format must be 'json' or 'text'");
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << to_json(config);
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    nlohmann::json j = config;
    return j.dump(2);
}

}  // namespace warden::control
