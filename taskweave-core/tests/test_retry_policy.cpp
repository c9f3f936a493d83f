/**
 * @file test_retry_policy.cpp
 * @brief Tests for backoff and transient-error classification
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/retry_policy.hpp"
#include <stdexcept>

using namespace taskweave;

namespace {

RetryConfig make_config(long base_ms, long max_ms, double jitter) {
    RetryConfig config;
    config.max_attempts = 5;
    config.base_delay = std::chrono::milliseconds(base_ms);
    config.max_delay = std::chrono::milliseconds(max_ms);
    config.jitter_ratio = jitter;
    return config;
}

} // anonymous namespace

TEST_CASE("RetryPolicy: Exponential backoff without jitter", "[retry]") {
    RetryPolicy policy(make_config(100, 10000, 0.0));

    REQUIRE(policy.backoff_delay(1) == std::chrono::milliseconds(100));
    REQUIRE(policy.backoff_delay(2) == std::chrono::milliseconds(200));
    REQUIRE(policy.backoff_delay(3) == std::chrono::milliseconds(400));
    REQUIRE(policy.backoff_delay(4) == std::chrono::milliseconds(800));
}

TEST_CASE("RetryPolicy: Backoff is capped at max_delay", "[retry]") {
    RetryPolicy policy(make_config(100, 250, 0.0));

    REQUIRE(policy.backoff_delay(3) == std::chrono::milliseconds(250));
    REQUIRE(policy.backoff_delay(60) == std::chrono::milliseconds(250));
}

TEST_CASE("RetryPolicy: Jitter stays within the ratio", "[retry]") {
    RetryPolicy policy(make_config(100, 10000, 0.5));

    for (int i = 0; i < 50; ++i) {
        auto delay = policy.backoff_delay(2);
        REQUIRE(delay >= std::chrono::milliseconds(200));
        REQUIRE(delay <= std::chrono::milliseconds(300));
    }
}

TEST_CASE("RetryPolicy: Transient classification", "[retry]") {
    RetryPolicy policy(make_config(10, 100, 0.0));

    SECTION("Attempt timeouts are always transient") {
        REQUIRE(policy.is_transient(AttemptTimeoutError("search", std::chrono::milliseconds(5))));
    }

    SECTION("Configured kinds are transient") {
        REQUIRE(policy.is_transient(DependencyError("network", "connection reset")));
        REQUIRE(policy.is_transient(DependencyError("server_busy", "429", 429)));
        REQUIRE(policy.is_transient(DependencyError("server_error", "502", 502)));
    }

    SECTION("Other kinds are permanent") {
        REQUIRE_FALSE(policy.is_transient(DependencyError("client_error", "400", 400)));
        REQUIRE_FALSE(policy.is_transient(DependencyError("invalid_response", "not json")));
    }

    SECTION("Non-dependency errors are permanent") {
        REQUIRE_FALSE(policy.is_transient(std::runtime_error("bug")));
        REQUIRE_FALSE(policy.is_transient(BlockedInputError("nope")));
    }
}

TEST_CASE("RetryPolicy: Custom classifier decides everything but attempt timeouts", "[retry]") {
    RetryPolicy policy(make_config(10, 100, 0.0), [](const std::exception& e) {
        return std::string(e.what()) == "flaky";
    });

    REQUIRE(policy.is_transient(std::runtime_error("flaky")));
    REQUIRE_FALSE(policy.is_transient(DependencyError("network", "connection reset")));

    SECTION("Attempt timeouts stay transient even when the classifier says no") {
        RetryPolicy strict(make_config(10, 100, 0.0), [](const std::exception&) { return false; });
        REQUIRE(strict.is_transient(AttemptTimeoutError("search", std::chrono::milliseconds(5))));
        REQUIRE_FALSE(strict.is_transient(DependencyError("timeout", "reported by the server")));
    }
}
