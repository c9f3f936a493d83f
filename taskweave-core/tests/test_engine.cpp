/**
 * @file test_engine.cpp
 * @brief End-to-end tests of a fully wired TaskEngine
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/engine.hpp"
#include "../src/errors.hpp"
#include "test_support.hpp"
#include <atomic>

using namespace taskweave;
using namespace taskweave::testing;

// ============================================================================
// Test Fixtures and Helpers
// ============================================================================

namespace {

EngineConfig make_config() {
    EngineConfig config;
    config.engine.name = "test-engine";
    config.engine.default_budget = 5.0;
    config.engine.default_handler = "general";
    config.engine.max_delegation_depth = 3;
    config.dependencies = {
        make_dependency("state_store", 3, 1000, 1),
        make_dependency("cost_store", 3, 1000, 1)
    };

    HandlerRouting billing;
    billing.description = "Invoices and refunds";
    billing.keywords = {"invoice", "refund"};
    config.handlers["billing"] = billing;

    config.lifecycle.drain_timeout = std::chrono::milliseconds(500);
    config.worker_threads = 2;
    config.logging.enable_console = false;
    config.logging.min_level = LogLevel::ERROR;
    return config;
}

HandlerResult general(const WorkUnit& unit, const DelegationContext&) {
    return HandlerResult(nlohmann::json{{"reply", "hello"}, {"turns_seen", unit.state.value("turns", 0)}});
}

HandlerResult billing(const WorkUnit&, const DelegationContext&) {
    HandlerResult result(nlohmann::json{{"reply", "refund issued"}});
    result.usage = Usage(1.0);
    return result;
}

} // anonymous namespace

// ============================================================================
// Startup
// ============================================================================

TEST_CASE("TaskEngine: Work is refused before start", "[engine]") {
    TaskEngine engine(make_config());
    engine.register_handler("general", general);

    REQUIRE_FALSE(engine.is_healthy());
    REQUIRE_THROWS_AS(engine.submit(WorkKind::USER_REQUEST, {{"text", "hi"}}), std::runtime_error);
}

TEST_CASE("TaskEngine: Startup is fail-closed", "[engine]") {
    SECTION("Default handler must be registered") {
        TaskEngine engine(make_config());
        REQUIRE_THROWS_AS(engine.start(), StartupValidationError);
        REQUIRE_FALSE(engine.is_healthy());
    }

    SECTION("Store dependencies must be configured") {
        EngineConfig config = make_config();
        config.dependencies.clear();
        TaskEngine engine(config);
        engine.register_handler("general", general);

        try {
            engine.start();
            FAIL("Expected StartupValidationError");
        } catch (const StartupValidationError& e) {
            REQUIRE(e.problems().size() == 2);
        }
        REQUIRE(engine.lifecycle().get_state() == LifecycleState::FAILED);
    }

    SECTION("Placeholder parameters block startup") {
        EngineConfig config = make_config();
        config.dependencies[0].retry.max_attempts = 0;
        TaskEngine engine(config);
        engine.register_handler("general", general);

        REQUIRE_THROWS_AS(engine.start(), StartupValidationError);
    }
}

TEST_CASE("TaskEngine: Invalid configuration is rejected at construction", "[engine]") {
    EngineConfig config = make_config();
    config.engine.default_budget = 0.0;
    REQUIRE_THROWS_AS(TaskEngine(config), ConfigurationError);
}

// ============================================================================
// Handling
// ============================================================================

TEST_CASE("TaskEngine: Routes, charges and remembers conversations", "[engine]") {
    TaskEngine engine(make_config());
    engine.register_handler("general", general);
    engine.register_handler("billing", billing);
    engine.start();
    REQUIRE(engine.is_healthy());

    WorkUnit refund = engine.submit(WorkKind::USER_REQUEST, {{"text", "Refund my invoice"}}, "conv-e");
    REQUIRE(refund.status == WorkUnitStatus::COMPLETED);
    REQUIRE(refund.handler == "billing");
    REQUIRE(refund.cost == 1.0);

    WorkUnit chat = engine.submit(WorkKind::USER_REQUEST, {{"text", "hello there"}}, "conv-e");
    REQUIRE(chat.status == WorkUnitStatus::COMPLETED);
    REQUIRE(chat.handler == "general");
    REQUIRE((*chat.output)["turns_seen"] == 1);

    REQUIRE(engine.shutdown().performed);
}

TEST_CASE("TaskEngine: Custom rules and budget limits", "[engine]") {
    TaskEngine engine(make_config());
    engine.register_handler("general", general);
    engine.register_handler(HandlerDescriptor("pricey"), [](const WorkUnit&, const DelegationContext&) {
        HandlerResult result(nlohmann::json{{"reply", "premium"}});
        result.usage = Usage(6.0);
        return result;
    });
    engine.add_routing_rule(RoutingRule{"premium", [](const WorkUnit& unit) -> std::optional<std::string> {
        if (flatten_text(unit.input).find("premium") != std::string::npos) {
            return std::string("pricey");
        }
        return std::nullopt;
    }});
    engine.start();

    WorkUnit result = engine.submit(WorkKind::USER_REQUEST, {{"text", "premium answer please"}});
    REQUIRE(result.handler == "pricey");
    REQUIRE(result.status == WorkUnitStatus::FAILED);
    REQUIRE(result.error->code == ErrorCode::BUDGET_EXCEEDED);
}

TEST_CASE("TaskEngine: Work submitted from the pool keeps its correlation id", "[engine]") {
    TaskEngine engine(make_config());
    std::string seen_correlation;
    engine.register_handler("general", [&seen_correlation](const WorkUnit&, const DelegationContext& ctx) {
        seen_correlation = ContextPropagator::current().correlation_id;
        return HandlerResult(nlohmann::json{{"correlation_id", ctx.correlation_id}});
    });
    engine.start();

    ContextPropagator::clear();
    ContextPropagator::bind("correlation_id", "corr-engine");
    auto future = engine.worker_pool().submit([&engine]() {
        return engine.submit(WorkKind::BACKGROUND_TASK, {{"text", "sync"}});
    });
    ContextPropagator::clear();

    WorkUnit result = future.get();
    REQUIRE(result.status == WorkUnitStatus::COMPLETED);
    REQUIRE((*result.output)["correlation_id"] == "corr-engine");
    REQUIRE(seen_correlation == "corr-engine");
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE("TaskEngine: Shutdown drains queued tasks and refuses new work", "[engine]") {
    TaskEngine engine(make_config());
    engine.register_handler("general", general);

    std::atomic<int> reindexed{0};
    engine.task_queue().register_task("reindex", [&reindexed](const nlohmann::json&) { ++reindexed; });
    engine.start();

    engine.task_queue().enqueue("reindex", {{"shard", 1}});
    engine.task_queue().enqueue("reindex", {{"shard", 2}});

    ShutdownReport report = engine.shutdown();
    REQUIRE(report.performed);
    REQUIRE(report.drained);
    REQUIRE(reindexed.load() == 2);
    REQUIRE_FALSE(engine.is_healthy());
    REQUIRE_FALSE(engine.worker_pool().is_running());

    WorkUnit late = engine.submit(WorkKind::USER_REQUEST, {{"text", "anyone there?"}});
    REQUIRE(late.status == WorkUnitStatus::FAILED);
    REQUIRE(late.error->code == ErrorCode::SHUTDOWN_INTERRUPTED);

    REQUIRE_FALSE(engine.shutdown().performed);
}
