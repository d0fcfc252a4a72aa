// Warden Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <unordered_set>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

using namespace warden::logging;

TEST_CASE("Correlation ids", "[logging][correlation_id]") {
    SECTION("generated ids validate and never repeat") {
        std::unordered_set<std::string> seen;
        for (int i = 0; i < 100; ++i) {
            auto id = generate_correlation_id();
            REQUIRE(is_valid_correlation_id(id));
            REQUIRE(seen.insert(id).second);
        }
    }

    SECTION("one thread shares a base and bumps the counter") {
        auto first = generate_correlation_id();
        auto second = generate_correlation_id();

        auto split = first.find('#');
        REQUIRE(split == 36);
        REQUIRE(second.substr(0, split) == first.substr(0, split));
        REQUIRE(std::stoull(second.substr(split + 1)) > std::stoull(first.substr(split + 1)));

        // uuid v4, RFC 4122 variant
        REQUIRE(first[14] == '4');
        REQUIRE(std::string("89ab").find(first[19]) != std::string::npos);
    }

    SECTION("caller supplied ids") {
        REQUIRE(is_valid_correlation_id("123e4567-e89b-42d3-a456-426614174000#0"));
        REQUIRE(is_valid_correlation_id("123E4567-E89B-42D3-A456-426614174000#17"));

        for (const char* bad : {"",
                                "not-a-correlation-id",
                                "123e4567-e89b-42d3-a456-426614174000",
                                "123e4567-e89b-42d3-a456-426614174000#",
                                "123e4567-e89b-42d3-a456-426614174000#1a",
                                "123e4567-e89b-12d3-a456-426614174000#1",
                                "123e4567-e89b-42d3-c456-426614174000#1",
                                "123e4567e89b-42d3-a456-4266141740000#1",
                                "123e4567-e89b-42d3-a456-42661417400g#1",
                                "123e4567-e89b-42d3-a456-426614174000#1#2"}) {
            INFO(bad);
            REQUIRE_FALSE(is_valid_correlation_id(bad));
        }
    }
}

TEST_CASE("Process logger", "[logging][logger]") {
    SECTION("get_logger always returns a usable logger") {
        auto* logger = get_logger();
        REQUIRE(logger != nullptr);
        REQUIRE(get_logger() == logger);

        LOG_INFO(logger, "logger smoke test: {}", 42);
        LOG_AUDIT(logger, "key_rotated", "kid={}, clear_old={}", "k1", false);
    }

    SECTION("\"-\" output keeps the current process logger") {
        warden::control::LogConfig console;
        console.output = "-";
        console.level = "debug";
        REQUIRE(init_logger(console) == get_logger());
    }
}
