#include <catch2/catch_test_macros.hpp>
#include "../src/config_parser.hpp"
#include "../src/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace taskweave;

namespace {

const char* kFullConfig = R"({
    "engine": {
        "name": "support-bot",
        "max_delegation_depth": 3,
        "default_budget": 2.5,
        "default_deadline_ms": 15000,
        "default_handler": "general",
        "state_directory": "state",
        "cancel_siblings_on_budget_exceeded": true,
        "approval_timeout_ms": 60000,
        "ledger_capacity": 250
    },
    "dependencies": {
        "classifier": {
            "timeout_ms": 800,
            "breaker": {"failure_threshold": 5, "open_duration_ms": 30000},
            "retry": {"max_attempts": 3, "base_delay_ms": 100, "max_delay_ms": 2000,
                      "jitter_ratio": 0.1, "transient_kinds": ["timeout", "server_busy"]},
            "bulkhead": {"capacity": 8, "wait_timeout_ms": 250}
        }
    },
    "safety": {"blocked_patterns": ["drop\\s+table"]},
    "output_contracts": {"billing": {"type": "object", "required": ["answer"]}},
    "handlers": {
        "billing": {"description": "Invoices and refunds", "keywords": ["invoice", "refund"]},
        "nightly": {"kinds": ["scheduled_job"]}
    },
    "lifecycle": {"propagation_delay_ms": 5000, "drain_timeout_ms": 20000},
    "worker_pool": {"threads": 6},
    "logging": {"level": "DEBUG", "json": false, "console": false},
    "classifier": {"url": "http://classifier.local/v1/route", "model": "intent-small", "timeout_ms": 700}
})";

} // anonymous namespace

TEST_CASE("Environment variable expansion", "[config_parser]") {
    SECTION("Braced syntax") {
        setenv("TASKWEAVE_TEST_VAR", "test_value", 1);
        REQUIRE(expand_environment_variables("${TASKWEAVE_TEST_VAR}/path") == "test_value/path");
        unsetenv("TASKWEAVE_TEST_VAR");
    }

    SECTION("Bare syntax") {
        setenv("TASKWEAVE_TEST_VAR", "test_value", 1);
        REQUIRE(expand_environment_variables("Bearer $TASKWEAVE_TEST_VAR") == "Bearer test_value");
        unsetenv("TASKWEAVE_TEST_VAR");
    }

    SECTION("Unset variable expands to empty") {
        unsetenv("TASKWEAVE_UNSET_VAR");
        REQUIRE(expand_environment_variables("a${TASKWEAVE_UNSET_VAR}b") == "ab");
    }

    SECTION("Unterminated braces are kept") {
        REQUIRE(expand_environment_variables("${OPEN") == "${OPEN");
    }
}

TEST_CASE("JSON config parsing", "[config_parser]") {
    SECTION("Full configuration") {
        auto config = parse_engine_config_from_string(kFullConfig);

        REQUIRE(config.engine.name == "support-bot");
        REQUIRE(config.engine.max_delegation_depth == 3);
        REQUIRE(config.engine.ledger_capacity == 250);
        REQUIRE(config.engine.default_budget == 2.5);
        REQUIRE(config.engine.default_deadline == std::chrono::milliseconds(15000));
        REQUIRE(config.engine.default_handler == "general");
        REQUIRE(config.engine.cancel_siblings_on_budget_exceeded);
        REQUIRE(config.engine.approval_timeout == std::chrono::milliseconds(60000));

        const DependencyConfig* classifier = config.find_dependency("classifier");
        REQUIRE(classifier != nullptr);
        REQUIRE(classifier->timeout == std::chrono::milliseconds(800));
        REQUIRE(classifier->breaker.failure_threshold == 5);
        REQUIRE(classifier->retry.max_attempts == 3);
        REQUIRE(classifier->retry.transient_kinds.size() == 2);
        REQUIRE(classifier->bulkhead.capacity == 8);
        REQUIRE(find_placeholder_parameters(*classifier).empty());

        REQUIRE(config.blocked_patterns.size() == 1);
        REQUIRE(config.output_contracts.at("billing").required == std::vector<std::string>{"answer"});
        REQUIRE(config.handlers.at("billing").keywords.size() == 2);
        REQUIRE(config.handlers.at("nightly").kinds == std::vector<WorkKind>{WorkKind::SCHEDULED_JOB});

        REQUIRE(config.lifecycle.drain_timeout == std::chrono::milliseconds(20000));
        REQUIRE(config.worker_threads == 6);
        REQUIRE(config.logging.min_level == LogLevel::DEBUG);
        REQUIRE_FALSE(config.logging.enable_console);
        REQUIRE(config.classifier.model == "intent-small");
        REQUIRE(config.find_dependency("missing") == nullptr);

        auto required = required_dependencies(config);
        REQUIRE(required == std::vector<std::string>{"state_store", "cost_store", "classifier"});
    }

    SECTION("Missing resilience numbers stay at the placeholder") {
        auto config = parse_engine_config_from_string(R"({
            "engine": {"default_budget": 1.0},
            "dependencies": {"search": {"breaker": {"open_duration_ms": 1000}}}
        })");

        auto missing = find_placeholder_parameters(config.dependencies.at(0));
        REQUIRE(missing.size() == 6);
        REQUIRE(missing[0] == "search.timeout_ms");
    }

    SECTION("Headers are expanded from the environment") {
        setenv("TASKWEAVE_TEST_TOKEN", "secret-token", 1);
        auto config = parse_engine_config_from_string(R"({
            "engine": {"default_budget": 1.0},
            "classifier": {"url": "http://c", "headers": {"Authorization": "Bearer ${TASKWEAVE_TEST_TOKEN}"}}
        })");
        unsetenv("TASKWEAVE_TEST_TOKEN");

        REQUIRE(config.classifier.headers.at("Authorization") == "Bearer secret-token");
    }

    SECTION("Invalid JSON should fail") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string("{ invalid json }"), ConfigParseError);
    }

    SECTION("Wrong value type should fail") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"engine": {"name": 42, "default_budget": 1}})"),
                          ConfigParseError);
    }

    SECTION("Unknown handler kind should fail") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({
            "engine": {"default_budget": 1.0},
            "handlers": {"x": {"kinds": ["telepathy"]}}
        })"), ConfigurationError);
    }
}

TEST_CASE("EngineConfig validation", "[config_parser]") {
    SECTION("Budget must be configured") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string("{}"), ConfigurationError);
    }

    SECTION("Depth must be at least one") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(
            R"({"engine": {"default_budget": 1.0, "max_delegation_depth": 0}})"), ConfigurationError);
    }

    SECTION("Jitter outside [0, 1] should fail") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({
            "engine": {"default_budget": 1.0},
            "dependencies": {"x": {"retry": {"jitter_ratio": 1.5}}}
        })"), ConfigurationError);
    }

    SECTION("Max delay below base delay should fail") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({
            "engine": {"default_budget": 1.0},
            "dependencies": {"x": {"retry": {"base_delay_ms": 500, "max_delay_ms": 100}}}
        })"), ConfigurationError);
    }

    SECTION("Unknown contract type should fail") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({
            "engine": {"default_budget": 1.0},
            "output_contracts": {"x": {"type": "xml"}}
        })"), ConfigurationError);
    }

    SECTION("Non-positive worker threads should fail") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(
            R"({"engine": {"default_budget": 1.0}, "worker_pool": {"threads": 0}})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(
            R"({"engine": {"default_budget": 1.0}, "worker_pool": {"threads": -2}})"), ConfigParseError);

        EngineConfig config;
        config.engine.default_budget = 1.0;
        config.worker_threads = 0;
        REQUIRE_THROWS_AS(validate_engine_config(config), ConfigurationError);
    }

    SECTION("Negative breaker threshold should fail") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({
            "engine": {"default_budget": 1.0},
            "dependencies": {"search": {"breaker": {"failure_threshold": -1, "open_duration_ms": 1000}}}
        })"), ConfigParseError);
    }

    SECTION("Negative or zero bulkhead capacity should fail") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({
            "engine": {"default_budget": 1.0},
            "dependencies": {"search": {"bulkhead": {"capacity": -1, "wait_timeout_ms": 100}}}
        })"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({
            "engine": {"default_budget": 1.0},
            "dependencies": {"search": {"bulkhead": {"capacity": 0, "wait_timeout_ms": 100}}}
        })"), ConfigParseError);
    }

    SECTION("Duplicate dependency should fail") {
        EngineConfig config;
        config.engine.default_budget = 1.0;
        DependencyConfig dependency;
        dependency.name = "store";
        config.dependencies = {dependency, dependency};
        REQUIRE_THROWS_AS(validate_engine_config(config), ConfigurationError);
    }
}

TEST_CASE("Config file loading", "[config_parser]") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "taskweave_config_test";
    fs::create_directories(dir);
    fs::path file = dir / "engine.json";
    {
        std::ofstream out(file);
        out << kFullConfig;
    }

    auto config = parse_engine_config_from_file(file.string());
    REQUIRE(config.engine.state_directory == (dir / "state").string());

    REQUIRE_THROWS_AS(parse_engine_config_from_file((dir / "missing.json").string()), ConfigParseError);
    REQUIRE(resolve_relative_path("/abs/path", file.string()) == "/abs/path");

    fs::remove_all(dir);
}
