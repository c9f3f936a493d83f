/**
 * @file test_router.cpp
 * @brief Tests for handler registration and rule-then-classifier routing
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/handler_registry.hpp"
#include "../src/router.hpp"
#include "test_support.hpp"
#include <atomic>

using namespace taskweave;
using namespace taskweave::testing;

// ============================================================================
// Test Fixtures and Helpers
// ============================================================================

namespace {

HandlerResult echo(const WorkUnit& unit, const DelegationContext&) {
    return HandlerResult(unit.input);
}

class ScriptedClassifier : public IClassifier {
public:
    explicit ScriptedClassifier(std::string answer, bool fail = false)
        : answer_(std::move(answer)), fail_(fail), calls_(0) {}

    std::string classify(const WorkUnit&, const std::vector<HandlerDescriptor>&) override {
        ++calls_;
        if (fail_) {
            throw DependencyError("network", "classifier down");
        }
        return answer_;
    }

    int calls() const { return calls_.load(); }

private:
    std::string answer_;
    bool fail_;
    std::atomic<int> calls_;
};

struct RouterFixture {
    EventEmitter events;
    DependencyRegistry dependencies;
    ResiliencePipeline pipeline;
    HandlerRegistry handlers;
    Router router;

    RouterFixture()
        : dependencies(events),
          pipeline(dependencies, events),
          router(handlers, pipeline, events, make_config()) {
        quiet_logger();
        dependencies.add(make_dependency("classifier", 3, 1000, 2));

        HandlerDescriptor general("general");
        handlers.register_handler(general, echo);

        HandlerDescriptor billing("billing");
        billing.keywords = {"Invoice", "refund"};
        handlers.register_handler(billing, echo);

        HandlerDescriptor scheduler("scheduler");
        scheduler.kinds = {WorkKind::SCHEDULED_JOB};
        handlers.register_handler(scheduler, echo);

        HandlerDescriptor research("research");
        research.description = "Looks things up";
        handlers.register_handler(research, echo);
    }

    static RouterConfig make_config() {
        RouterConfig config;
        config.default_handler = "general";
        return config;
    }
};

WorkUnit request(const std::string& text, WorkKind kind = WorkKind::USER_REQUEST) {
    return WorkUnit::create(kind, {{"text", text}}, "conv-r");
}

} // anonymous namespace

// ============================================================================
// HandlerRegistry Tests
// ============================================================================

TEST_CASE("HandlerRegistry: Registration rules", "[registry]") {
    HandlerRegistry registry;
    registry.register_handler(HandlerDescriptor("alpha"), echo);

    SECTION("Duplicate name is rejected") {
        REQUIRE_THROWS_AS(registry.register_handler(HandlerDescriptor("alpha"), echo), ConfigurationError);
    }

    SECTION("Empty name is rejected") {
        REQUIRE_THROWS_AS(registry.register_handler(HandlerDescriptor(""), echo), ConfigurationError);
    }

    SECTION("Empty callable is rejected") {
        REQUIRE_THROWS_AS(registry.register_handler(HandlerDescriptor("beta"), Handler()), ConfigurationError);
    }

    REQUIRE(registry.size() == 1);
}

TEST_CASE("HandlerRegistry: Unknown handler lists the available ones", "[registry]") {
    HandlerRegistry registry;
    registry.register_handler(HandlerDescriptor("alpha"), echo);
    registry.register_handler(HandlerDescriptor("beta"), echo);

    try {
        registry.get_handler("gamma");
        FAIL("Expected ConfigurationError");
    } catch (const ConfigurationError& e) {
        std::string message = e.what();
        REQUIRE(message.find("Unknown handler: gamma") != std::string::npos);
        REQUIRE(message.find("alpha") != std::string::npos);
        REQUIRE(message.find("beta") != std::string::npos);
    }
    REQUIRE_THROWS_AS(registry.get_descriptor("gamma"), ConfigurationError);
}

TEST_CASE("HandlerRegistry: Listing keeps registration order", "[registry]") {
    HandlerRegistry registry;
    registry.register_handler(HandlerDescriptor("zulu"), echo);
    registry.register_handler(HandlerDescriptor("alpha"), echo);
    registry.register_handler(HandlerDescriptor("mike"), echo);

    REQUIRE(registry.list_handler_names() == std::vector<std::string>{"zulu", "alpha", "mike"});
    REQUIRE(registry.list_handlers().front().name == "zulu");
    REQUIRE(registry.is_registered("mike"));
    REQUIRE_FALSE(registry.is_registered("oscar"));
}

// ============================================================================
// Deterministic rules
// ============================================================================

TEST_CASE("Router: Target hint wins when registered", "[router]") {
    RouterFixture fixture;

    RoutingDecision decision = fixture.router.resolve(request("refund my invoice"), "research");
    REQUIRE(decision.handler == "research");
    REQUIRE(decision.rule == "hint");

    SECTION("Unknown hint falls back to the rules") {
        RoutingDecision fallback = fixture.router.resolve(request("refund my invoice"), "nobody");
        REQUIRE(fallback.handler == "billing");
        REQUIRE(fallback.rule == "keyword");
    }
}

TEST_CASE("Router: Keyword match is case-insensitive", "[router]") {
    RouterFixture fixture;
    RoutingDecision decision = fixture.router.resolve(request("Where is my INVOICE?"));
    REQUIRE(decision.handler == "billing");
    REQUIRE(decision.rule == "keyword");
}

TEST_CASE("Router: Kind match", "[router]") {
    RouterFixture fixture;
    RoutingDecision decision = fixture.router.resolve(request("nightly rollup", WorkKind::SCHEDULED_JOB));
    REQUIRE(decision.handler == "scheduler");
    REQUIRE(decision.rule == "kind");
}

TEST_CASE("Router: Custom rules run before built-in rules", "[router]") {
    RouterFixture fixture;
    fixture.router.add_rule(RoutingRule{"vip", [](const WorkUnit& unit) -> std::optional<std::string> {
        if (unit.input.value("text", "").find("urgent") != std::string::npos) {
            return std::string("research");
        }
        return std::nullopt;
    }});

    REQUIRE(fixture.router.resolve(request("urgent refund")).rule == "vip");
    REQUIRE(fixture.router.resolve(request("plain refund")).rule == "keyword");

    SECTION("Rule without matcher is rejected") {
        REQUIRE_THROWS_AS(fixture.router.add_rule(RoutingRule{"empty", nullptr}), ConfigurationError);
    }
}

TEST_CASE("Router: Emits a routing event", "[router]") {
    RouterFixture fixture;
    EventRecorder recorder(fixture.events);

    WorkUnit unit = request("refund please");
    fixture.router.resolve(unit);

    auto events = recorder.all();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].name == "routing");
    REQUIRE(events[0].outcome == "keyword");
    REQUIRE(events[0].work_unit_id == unit.id);
    REQUIRE(events[0].conversation_id == "conv-r");
    REQUIRE(events[0].attributes["handler"] == "billing");
}

// ============================================================================
// Classifier fallback
// ============================================================================

TEST_CASE("Router: Classifier is consulted only when no rule matches", "[router]") {
    RouterFixture fixture;
    auto classifier = std::make_shared<ScriptedClassifier>("research");
    fixture.router.set_classifier(classifier);

    RoutingDecision ruled = fixture.router.resolve(request("refund"));
    REQUIRE(ruled.rule == "keyword");
    REQUIRE(classifier->calls() == 0);

    RoutingDecision classified = fixture.router.resolve(request("what is the tallest mountain"));
    REQUIRE(classified.handler == "research");
    REQUIRE(classified.rule == "classifier");
    REQUIRE(classifier->calls() == 1);
}

TEST_CASE("Router: Classifier failure falls back to the default", "[router]") {
    RouterFixture fixture;
    EventRecorder recorder(fixture.events);
    auto classifier = std::make_shared<ScriptedClassifier>("", true);
    fixture.router.set_classifier(classifier);

    RoutingDecision decision = fixture.router.resolve(request("tell me a story"));
    REQUIRE(decision.handler == "general");
    REQUIRE(decision.rule == "default");

    // Called through the pipeline, so retried
    REQUIRE(classifier->calls() == 2);
    REQUIRE(recorder.count("retry_exhausted") == 1);
}

TEST_CASE("Router: Unknown classifier answer falls back to the default", "[router]") {
    RouterFixture fixture;
    fixture.router.set_classifier(std::make_shared<ScriptedClassifier>("astrology"));

    RoutingDecision decision = fixture.router.resolve(request("tell me a story"));
    REQUIRE(decision.handler == "general");
    REQUIRE(decision.rule == "default");
}

TEST_CASE("Router: No match and no default is a configuration error", "[router]") {
    EventEmitter events;
    DependencyRegistry dependencies(events);
    ResiliencePipeline pipeline(dependencies, events);
    HandlerRegistry handlers;
    handlers.register_handler(HandlerDescriptor("billing"), echo);

    RouterConfig config;
    config.default_handler = "missing";
    Router router(handlers, pipeline, events, config);

    quiet_logger();
    REQUIRE_THROWS_AS(router.resolve(request("hello")), ConfigurationError);
}
