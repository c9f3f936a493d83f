/**
 * @file orchestration_example.cpp
 * @brief Example wiring a TaskEngine with a few handlers
 *
 * Shows:
 * - Loading the engine configuration (or building one in code)
 * - Keyword routing and concurrent delegation
 * - A flaky external dependency behind the Resilience Pipeline
 * - A background task carrying the caller's correlation id
 * - Graceful shutdown on SIGTERM/SIGINT or after the demo requests
 *
 * Usage: taskweave_example [engine.json]
 */

#include "../src/config_parser.hpp"
#include "../src/engine.hpp"
#include "../src/errors.hpp"
#include "../src/logger.hpp"
#include <atomic>
#include <iostream>

using namespace taskweave;

namespace {

EngineConfig build_default_config() {
    EngineConfig config;
    config.engine.name = "example";
    config.engine.default_budget = 1.0;
    config.engine.default_deadline = std::chrono::milliseconds(5000);
    config.engine.default_handler = "general";

    for (const char* name : {"state_store", "cost_store", "weather_api"}) {
        DependencyConfig dependency;
        dependency.name = name;
        dependency.timeout = std::chrono::milliseconds(200);
        dependency.breaker = BreakerConfig(3, std::chrono::milliseconds(2000));
        dependency.retry.max_attempts = 3;
        dependency.retry.base_delay = std::chrono::milliseconds(20);
        dependency.retry.max_delay = std::chrono::milliseconds(200);
        dependency.bulkhead = BulkheadConfig(4, std::chrono::milliseconds(100));
        config.dependencies.push_back(dependency);
    }

    HandlerRouting planner;
    planner.description = "Splits trip planning into parallel lookups";
    planner.keywords = {"trip", "travel"};
    config.handlers["planner"] = planner;

    config.blocked_patterns = {"drop\\s+table"};
    config.logging.enable_console = true;
    config.logging.enable_json = true;
    return config;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    EngineConfig config;
    try {
        config = argc > 1 ? parse_engine_config_from_file(argv[1]) : build_default_config();
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << "\n";
        return 1;
    }

    TaskEngine engine(config);
    EngineLifecycleManager::install_signal_handlers();

    engine.register_handler("general", [](const WorkUnit& unit, const DelegationContext&) {
        HandlerResult result(nlohmann::json{{"reply", "You said: " + flatten_text(unit.input)}});
        result.usage = Usage(0.01);
        return result;
    });

    // Every other call is rejected as busy; retries absorb it
    auto weather_calls = std::make_shared<std::atomic<int>>(0);
    ResiliencePipeline& pipeline = engine.pipeline();
    engine.register_handler(HandlerDescriptor("weather"),
        [&pipeline, weather_calls](const WorkUnit& unit, const DelegationContext&) {
            std::string city = unit.input.value("city", "nowhere");
            std::string forecast = pipeline.execute("weather_api", [weather_calls, city]() {
                if ((*weather_calls)++ % 2 == 0) {
                    throw DependencyError("server_busy", "weather service overloaded");
                }
                return std::string("sunny in ") + city;
            });
            HandlerResult result(nlohmann::json{{"forecast", forecast}});
            result.usage = Usage(0.05);
            return result;
        });

    engine.register_handler(HandlerDescriptor("hotels"), [](const WorkUnit& unit, const DelegationContext&) {
        HandlerResult result(nlohmann::json{{"hotel", "Grand " + unit.input.value("city", "Hotel")}});
        result.usage = Usage(0.1);
        return result;
    });

    engine.register_handler("planner", [](const WorkUnit&, const DelegationContext&) {
        HandlerResult result(nlohmann::json{{"plan", "checking weather and hotels"}});
        result.usage = Usage(0.02);
        result.delegations.push_back(DelegationRequest("weather", {{"city", "Lisbon"}}));
        result.delegations.push_back(DelegationRequest("hotels", {{"city", "Lisbon"}}));
        return result;
    });

    engine.task_queue().register_task("audit", [](const nlohmann::json& args) {
        Logger::get_instance().log_info("audit", "Recorded work unit",
                                        {{"audited_id", args.value("work_unit_id", "")}});
    });

    try {
        engine.start();
    } catch (const StartupValidationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    const std::vector<std::pair<std::string, std::string>> requests = {
        {"Plan a trip to Lisbon", "conv-1"},
        {"What's new?", "conv-1"},
        {"please DROP TABLE users", "conv-2"}
    };

    for (const auto& [text, conversation] : requests) {
        if (EngineLifecycleManager::termination_requested()) {
            break;
        }
        ContextPropagator::bind("correlation_id", ContextPropagator::generate_id());
        WorkUnit done = engine.submit(WorkKind::USER_REQUEST, {{"text", text}}, conversation);
        engine.task_queue().enqueue("audit", {{"work_unit_id", done.id}});
        ContextPropagator::clear();

        std::cout << done.to_json().dump(2) << "\n";
    }

    ShutdownReport report = engine.shutdown();
    std::cout << "Shutdown: drained=" << (report.drained ? "true" : "false")
              << " flushed_events=" << report.flushed_events
              << " duration_ms=" << report.duration_ms << "\n";
    return 0;
}
