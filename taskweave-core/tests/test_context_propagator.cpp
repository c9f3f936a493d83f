/**
 * @file test_context_propagator.cpp
 * @brief Tests for ambient context capture and restore across threads
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/context_propagator.hpp"
#include <regex>
#include <set>
#include <thread>

using namespace taskweave;

TEST_CASE("ContextPropagator: Bind and capture on one thread", "[context]") {
    ContextPropagator::clear();
    ContextPropagator::bind("correlation_id", "corr-1");
    ContextPropagator::bind("trace_id", "trace-1");
    ContextPropagator::bind("request_id", "req-9");

    PropagationToken token = ContextPropagator::capture();
    REQUIRE(token.correlation_id == "corr-1");
    REQUIRE(token.trace_id == "trace-1");
    REQUIRE(token.fields.at("request_id") == "req-9");

    ContextPropagator::clear();
    REQUIRE(ContextPropagator::current().empty());
}

TEST_CASE("ContextPropagator: New threads start without context", "[context]") {
    ContextPropagator::clear();
    ContextPropagator::bind("correlation_id", "corr-main");

    std::string seen = "unset";
    std::thread worker([&seen]() { seen = ContextPropagator::current().correlation_id; });
    worker.join();

    REQUIRE(seen.empty());
    ContextPropagator::clear();
}

TEST_CASE("ContextPropagator: Restore is scoped", "[context]") {
    ContextPropagator::clear();
    ContextPropagator::bind("correlation_id", "outer");

    PropagationToken inner;
    inner.correlation_id = "inner";
    {
        ScopedContext scope = ContextPropagator::restore(inner);
        REQUIRE(ContextPropagator::current().correlation_id == "inner");
    }
    REQUIRE(ContextPropagator::current().correlation_id == "outer");
    ContextPropagator::clear();
}

TEST_CASE("ContextPropagator: Explicit capture and restore on another thread", "[context]") {
    ContextPropagator::clear();
    ContextPropagator::bind("correlation_id", "corr-42");
    PropagationToken token = ContextPropagator::capture();

    std::string seen;
    std::thread worker([token, &seen]() {
        ScopedContext scope = ContextPropagator::restore(token);
        seen = ContextPropagator::current().correlation_id;
    });
    worker.join();

    REQUIRE(seen == "corr-42");
    ContextPropagator::clear();
}

TEST_CASE("ContextPropagator: propagating_async carries the caller's context", "[context]") {
    ContextPropagator::clear();
    ContextPropagator::bind("correlation_id", "corr-async");
    ContextPropagator::bind("tenant", "acme");

    auto future = propagating_async([]() {
        const PropagationToken& current = ContextPropagator::current();
        return current.correlation_id + "/" + current.fields.at("tenant");
    });

    REQUIRE(future.get() == "corr-async/acme");
    ContextPropagator::clear();
}

TEST_CASE("PropagationToken: Serialized form survives an isolation boundary", "[context]") {
    PropagationToken token;
    token.correlation_id = "corr-7";
    token.fields["conversation_id"] = "conv-3";

    std::string wire = token.to_json().dump();
    PropagationToken restored = PropagationToken::from_json(nlohmann::json::parse(wire));

    REQUIRE(restored.correlation_id == "corr-7");
    REQUIRE(restored.trace_id.empty());
    REQUIRE(restored.fields.at("conversation_id") == "conv-3");

    REQUIRE(PropagationToken::from_json(nlohmann::json::array()).empty());
}

TEST_CASE("PropagationToken: Ids of the wrong type are dropped", "[context]") {
    auto wire = nlohmann::json::parse(R"({
        "correlation_id": null,
        "trace_id": 42,
        "fields": {"conversation_id": "conv-9", "attempt": 3}
    })");

    PropagationToken token;
    REQUIRE_NOTHROW(token = PropagationToken::from_json(wire));
    REQUIRE(token.correlation_id.empty());
    REQUIRE(token.trace_id.empty());
    REQUIRE(token.fields.size() == 1);
    REQUIRE(token.fields.at("conversation_id") == "conv-9");
}

TEST_CASE("ContextPropagator: Generated ids are unique version 4 UUIDs", "[context]") {
    const std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        std::string id = ContextPropagator::generate_id();
        REQUIRE(std::regex_match(id, uuid));
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);
}
