/**
 * @file test_resilience_pipeline.cpp
 * @brief Tests for the breaker -> retry -> bulkhead -> timeout pipeline
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/resilience_pipeline.hpp"
#include "test_support.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <thread>

using namespace taskweave;
using namespace taskweave::testing;

// ============================================================================
// DependencyRegistry Tests
// ============================================================================

TEST_CASE("DependencyRegistry: Register and look up", "[registry]") {
    quiet_logger();
    EventEmitter events;
    DependencyRegistry registry(events);

    registry.add(make_dependency("search"));
    registry.add(make_dependency("billing"));

    REQUIRE(registry.contains("search"));
    REQUIRE(registry.names().size() == 2);
    REQUIRE(registry.get("billing").config.name == "billing");
    REQUIRE_THROWS_AS(registry.get("unknown"), ConfigurationError);
}

TEST_CASE("DependencyRegistry: Duplicate name is rejected", "[registry]") {
    quiet_logger();
    EventEmitter events;
    DependencyRegistry registry(events);

    registry.add(make_dependency("search"));
    REQUIRE_THROWS_AS(registry.add(make_dependency("search")), ConfigurationError);
}

TEST_CASE("DependencyRegistry: Release hooks run once", "[registry]") {
    quiet_logger();
    EventEmitter events;
    DependencyRegistry registry(events);

    int closed = 0;
    registry.register_release_hook("db", [&closed]() { ++closed; });
    registry.register_release_hook("broken", []() { throw std::runtime_error("close failed"); });

    REQUIRE(registry.release_all() == 1);
    REQUIRE(registry.release_all() == 0);
    REQUIRE(closed == 1);
}

TEST_CASE("DependencyConfig: Placeholder parameters are listed", "[registry]") {
    DependencyConfig unset;
    unset.name = "search";

    auto missing = find_placeholder_parameters(unset);
    REQUIRE(missing.size() == 7);
    REQUIRE(missing.front() == "search.timeout_ms");

    REQUIRE(find_placeholder_parameters(make_dependency("search")).empty());
}

// ============================================================================
// ResiliencePipeline Tests
// ============================================================================

TEST_CASE("ResiliencePipeline: Returns the operation result", "[pipeline]") {
    quiet_logger();
    EventEmitter events;
    DependencyRegistry registry(events);
    registry.add(make_dependency("search"));
    ResiliencePipeline pipeline(registry, events);

    int value = pipeline.execute("search", []() { return 42; });
    REQUIRE(value == 42);

    auto calls = std::make_shared<std::atomic<int>>(0);
    pipeline.execute("search", [calls]() { ++*calls; });
    REQUIRE(calls->load() == 1);
}

TEST_CASE("ResiliencePipeline: Transient failures are retried", "[pipeline]") {
    quiet_logger();
    EventEmitter events;
    EventRecorder recorder(events);
    DependencyRegistry registry(events);
    registry.add(make_dependency("search", 3, 1000, 3));
    ResiliencePipeline pipeline(registry, events);

    auto calls = std::make_shared<std::atomic<int>>(0);
    std::string result = pipeline.execute("search", [calls]() -> std::string {
        if (++*calls < 3) {
            throw DependencyError("network", "connection reset");
        }
        return "ok";
    });

    REQUIRE(result == "ok");
    REQUIRE(calls->load() == 3);
    REQUIRE(recorder.count("retry_attempt") == 2);
    REQUIRE(registry.get("search").breaker.snapshot().failure_count == 0);
}

TEST_CASE("ResiliencePipeline: Permanent failures propagate unchanged", "[pipeline]") {
    quiet_logger();
    EventEmitter events;
    DependencyRegistry registry(events);
    registry.add(make_dependency("search", 3, 1000, 5));
    ResiliencePipeline pipeline(registry, events);

    auto calls = std::make_shared<std::atomic<int>>(0);
    REQUIRE_THROWS_AS(pipeline.execute("search", [calls]() -> int {
        ++*calls;
        throw DependencyError("client_error", "bad request", 400);
    }), DependencyError);

    REQUIRE(calls->load() == 1);
}

TEST_CASE("ResiliencePipeline: Exhausted retries raise DependencyExhausted", "[pipeline]") {
    quiet_logger();
    EventEmitter events;
    EventRecorder recorder(events);
    DependencyRegistry registry(events);
    registry.add(make_dependency("search", 5, 1000, 3));
    ResiliencePipeline pipeline(registry, events);

    auto calls = std::make_shared<std::atomic<int>>(0);
    try {
        pipeline.execute("search", [calls]() -> int {
            ++*calls;
            throw DependencyError("server_busy", "slow down", 429);
        });
        FAIL("Expected DependencyExhaustedError");
    } catch (const DependencyExhaustedError& e) {
        REQUIRE(e.attempts() == 3);
        REQUIRE(e.last_error() == "slow down");
        REQUIRE(e.code() == ErrorCode::DEPENDENCY_EXHAUSTED);
    }

    REQUIRE(calls->load() == 3);
    REQUIRE(recorder.count("retry_exhausted") == 1);
    // One exhausted execution is one breaker failure
    REQUIRE(registry.get("search").breaker.snapshot().failure_count == 1);
}

TEST_CASE("ResiliencePipeline: Open breaker short-circuits calls", "[pipeline]") {
    quiet_logger();
    EventEmitter events;
    DependencyRegistry registry(events);
    registry.add(make_dependency("search", 2, 10000, 1));
    ResiliencePipeline pipeline(registry, events);

    auto calls = std::make_shared<std::atomic<int>>(0);
    auto failing = [calls]() -> int {
        ++*calls;
        throw DependencyError("network", "down");
    };

    REQUIRE_THROWS_AS(pipeline.execute("search", failing), DependencyExhaustedError);
    REQUIRE_THROWS_AS(pipeline.execute("search", failing), DependencyExhaustedError);
    REQUIRE(registry.get("search").breaker.is_open());

    REQUIRE_THROWS_AS(pipeline.execute("search", failing), DependencyUnavailableError);
    REQUIRE(calls->load() == 2);
}

TEST_CASE("ResiliencePipeline: Half-open trial is a single attempt", "[pipeline]") {
    quiet_logger();
    EventEmitter events;
    DependencyRegistry registry(events);
    registry.add(make_dependency("search", 1, 30, 4));
    ResiliencePipeline pipeline(registry, events);

    auto calls = std::make_shared<std::atomic<int>>(0);
    auto failing = [calls]() -> int {
        ++*calls;
        throw DependencyError("network", "down");
    };

    REQUIRE_THROWS_AS(pipeline.execute("search", failing), DependencyExhaustedError);
    REQUIRE(calls->load() == 4);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    SECTION("Failing trial reopens after one call") {
        REQUIRE_THROWS_AS(pipeline.execute("search", failing), DependencyExhaustedError);
        REQUIRE(calls->load() == 5);
        REQUIRE(registry.get("search").breaker.is_open());
    }

    SECTION("Successful trial closes the breaker") {
        REQUIRE(pipeline.execute("search", []() { return 7; }) == 7);
        REQUIRE(registry.get("search").breaker.state() == BreakerState::CLOSED);
    }
}

TEST_CASE("ResiliencePipeline: Slow attempts time out", "[pipeline]") {
    quiet_logger();
    EventEmitter events;
    EventRecorder recorder(events);
    DependencyRegistry registry(events);
    registry.add(make_dependency("search", 5, 1000, 2, 30));
    ResiliencePipeline pipeline(registry, events);

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(pipeline.execute("search", []() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return 1;
    }), DependencyExhaustedError);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(recorder.count("attempt_timeout") == 2);
    REQUIRE(elapsed < std::chrono::milliseconds(250));
}

TEST_CASE("ResiliencePipeline: Bulkhead timeout does not count against the breaker", "[pipeline]") {
    quiet_logger();
    EventEmitter events;
    DependencyRegistry registry(events);
    registry.add(make_dependency("search", 1, 10000, 1, 2000, 1, 20));
    ResiliencePipeline pipeline(registry, events);

    std::promise<void> entered;
    auto entered_future = entered.get_future();
    auto release = std::make_shared<std::promise<void>>();
    std::shared_future<void> released = release->get_future().share();
    auto entered_signal = std::make_shared<std::promise<void>>(std::move(entered));

    std::thread occupant([&pipeline, entered_signal, released]() {
        pipeline.execute("search", [entered_signal, released]() {
            entered_signal->set_value();
            released.wait();
            return 0;
        });
    });
    entered_future.wait();

    REQUIRE_THROWS_AS(pipeline.execute("search", []() { return 1; }), BulkheadTimeoutError);
    REQUIRE(registry.get("search").breaker.state() == BreakerState::CLOSED);

    release->set_value();
    occupant.join();
}

TEST_CASE("ResiliencePipeline: Unknown dependency is a configuration error", "[pipeline]") {
    quiet_logger();
    EventEmitter events;
    DependencyRegistry registry(events);
    ResiliencePipeline pipeline(registry, events);

    REQUIRE_THROWS_AS(pipeline.execute("nowhere", []() { return 1; }), ConfigurationError);
}
