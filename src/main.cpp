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

// Warden - Administration CLI Entry Point
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "api/codec.hpp"
#include "control/config.hpp"
#include "core/logging.hpp"
#include "runtime/orchestrator.hpp"

namespace {

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s --config <config.json> <command> [args]\n"
            "\n"
            "Commands:\n"
            "  check-config                     Validate the configuration file\n"
            "  migrate                          Create or update the database schema\n"
            "  rotate [--clear|--noclear]       Generate a new active signing key\n"
            "                                   (--clear deletes old keys, revoking all tokens)\n"
            "  list-keys                        Print signing key metadata\n"
            "  purge-keys                       Delete expired signing keys\n"
            "  user add <email> [password]      Create a user (no password: cannot log in)\n"
            "  user set-password <email> [password]\n"
            "  init <email> [password]          Create the first ServerAdmin and signing key\n"
            "\n"
            "set-password and init read a password left off the command line from stdin.\n",
            program);
}

void print_validation(const warden::control::ValidationResult& validation) {
    for (const auto& warning : validation.warnings) {
        printf("  warning: %s\n", warning.c_str());
    }
    for (const auto& error : validation.errors) {
        fprintf(stderr, "  error: %s\n", error.c_str());
    }
}

int fail(const warden::core::Error& error) {
    fprintf(stderr, "ERROR: %s\n", error.describe().c_str());
    warden::logging::shutdown_logging();
    return EXIT_FAILURE;
}

/// args[index], or one line from stdin
std::string password_argument(const std::vector<std::string>& args, size_t index) {
    if (index < args.size()) {
        return args[index];
    }
    std::string password;
    std::getline(std::cin, password);
    return password;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 4 || std::string(argv[1]) != "--config") {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];
    std::string command = argv[3];
    std::vector<std::string> args(argv + 4, argv + argc);

    // Load and validate configuration
    auto config = warden::control::ConfigLoader::load_from_file(config_path);
    if (!config) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_path.c_str());
        return EXIT_FAILURE;
    }

    auto validation = warden::control::ConfigLoader::validate(*config);
    if (command == "check-config") {
        print_validation(validation);
        if (validation.has_errors()) {
            return EXIT_FAILURE;
        }
        printf("Configuration OK\n");
        return EXIT_SUCCESS;
    }
    if (validation.has_errors()) {
        fprintf(stderr, "Configuration validation errors:\n");
        print_validation(validation);
        return EXIT_FAILURE;
    }

    warden::logging::init_logger(config->logging);

    auto runtime = warden::runtime::build_runtime(*config);
    if (!runtime) {
        return fail(runtime.error());
    }
    auto& rt = **runtime;

    if (command == "migrate") {
        // build_runtime applied the schema
        printf("Database schema up to date: %s\n", config->database.path.c_str());
    } else if (command == "rotate") {
        bool clear_old = false;
        for (const auto& arg : args) {
            if (arg == "--clear") {
                clear_old = true;
            } else if (arg == "--noclear") {
                clear_old = false;
            } else {
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
        auto key_id = rt.keys->rotate_key(clear_old);
        if (!key_id) {
            return fail(key_id.error());
        }
        printf("Active signing key: %s%s\n", key_id->c_str(),
               clear_old ? " (previous keys deleted)" : "");
    } else if (command == "list-keys") {
        auto keys = rt.keys->list_keys();
        if (!keys) {
            return fail(keys.error());
        }
        printf("%s\n", warden::api::to_json_array(*keys).dump(2).c_str());
    } else if (command == "purge-keys") {
        auto purged = rt.keys->purge_expired();
        if (!purged) {
            return fail(purged.error());
        }
        printf("Purged %zu expired keys\n", *purged);
    } else if (command == "user" && !args.empty() && args[0] == "add" && args.size() >= 2) {
        std::optional<std::string> password_hash;
        if (args.size() >= 3) {
            password_hash = rt.hasher->hash(args[2]);
            if (!password_hash) {
                return fail(warden::core::Error::store("password hashing failed"));
            }
        }
        auto user = rt.users->create(args[1], std::move(password_hash));
        if (!user) {
            return fail(user.error());
        }
        printf("Created user %s (%s)\n", user->id.c_str(), user->email.c_str());
    } else if (command == "user" && !args.empty() && args[0] == "set-password" &&
               args.size() >= 2) {
        auto status = warden::runtime::set_user_password(rt, args[1], password_argument(args, 2));
        if (!status) {
            return fail(status.error());
        }
        printf("Password updated for %s\n", args[1].c_str());
    } else if (command == "init" && !args.empty()) {
        auto user_id = warden::runtime::bootstrap_admin(rt, args[0], password_argument(args, 1));
        if (!user_id) {
            return fail(user_id.error());
        }
        printf("Created ServerAdmin %s (%s)\n", user_id->c_str(), args[0].c_str());

        // Ensure tokens can be issued right away
        rt.config.keys.rotate_on_startup_if_missing = true;
        auto status = warden::runtime::prepare_signing_keys(rt);
        if (!status) {
            return fail(status.error());
        }
    } else {
        print_usage(argv[0]);
        warden::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    warden::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
