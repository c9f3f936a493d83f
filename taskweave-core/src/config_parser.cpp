#include "config_parser.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace taskweave {

namespace {

std::string string_value(const json& j, const std::string& key, const std::string& fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return expand_environment_variables(j.at(key).get<std::string>());
}

std::chrono::milliseconds millis_value(const json& j, const std::string& key,
                                       std::chrono::milliseconds fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return std::chrono::milliseconds(j.at(key).get<long long>());
}

// Absent keys stay at 0 (placeholder); an explicit value must be positive
size_t count_value(const json& j, const std::string& key, const std::string& owner) {
    if (!j.contains(key)) {
        return 0;
    }
    long long value = j.at(key).get<long long>();
    if (value <= 0) {
        throw ConfigParseError(owner + "." + key + " must be positive, got " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

std::vector<std::string> string_list(const json& j, const std::string& key) {
    std::vector<std::string> values;
    if (j.contains(key)) {
        for (const auto& item : j.at(key)) {
            values.push_back(expand_environment_variables(item.get<std::string>()));
        }
    }
    return values;
}

void parse_engine_section(const json& j, EngineSettings& engine) {
    engine.name = string_value(j, "name", engine.name);
    engine.max_delegation_depth = j.value("max_delegation_depth", engine.max_delegation_depth);
    engine.default_budget = j.value("default_budget", engine.default_budget);
    engine.default_deadline = millis_value(j, "default_deadline_ms", engine.default_deadline);
    engine.default_handler = string_value(j, "default_handler", engine.default_handler);
    engine.classifier_dependency = string_value(j, "classifier_dependency", engine.classifier_dependency);
    engine.state_store_dependency = string_value(j, "state_store_dependency", engine.state_store_dependency);
    engine.cost_store_dependency = string_value(j, "cost_store_dependency", engine.cost_store_dependency);
    engine.state_directory = string_value(j, "state_directory", engine.state_directory);
    engine.cancel_siblings_on_budget_exceeded =
        j.value("cancel_siblings_on_budget_exceeded", engine.cancel_siblings_on_budget_exceeded);
    engine.approval_timeout = millis_value(j, "approval_timeout_ms", engine.approval_timeout);
    if (j.contains("ledger_capacity")) {
        engine.ledger_capacity = count_value(j, "ledger_capacity", "engine");
    }
}

// Missing numbers stay at 0 so startup validation can list them
DependencyConfig parse_dependency(const std::string& name, const json& j) {
    DependencyConfig dependency;
    dependency.name = name;
    dependency.timeout = millis_value(j, "timeout_ms", dependency.timeout);

    if (j.contains("breaker")) {
        const json& breaker = j["breaker"];
        dependency.breaker.failure_threshold = count_value(breaker, "failure_threshold", name + ".breaker");
        dependency.breaker.open_duration = millis_value(breaker, "open_duration_ms", dependency.breaker.open_duration);
    }

    if (j.contains("retry")) {
        const json& retry = j["retry"];
        dependency.retry.max_attempts = retry.value("max_attempts", 0);
        dependency.retry.base_delay = millis_value(retry, "base_delay_ms", dependency.retry.base_delay);
        dependency.retry.max_delay = millis_value(retry, "max_delay_ms", dependency.retry.max_delay);
        dependency.retry.jitter_ratio = retry.value("jitter_ratio", dependency.retry.jitter_ratio);
        if (retry.contains("transient_kinds")) {
            std::vector<std::string> kinds = string_list(retry, "transient_kinds");
            dependency.retry.transient_kinds = std::set<std::string>(kinds.begin(), kinds.end());
        }
    }

    if (j.contains("bulkhead")) {
        const json& bulkhead = j["bulkhead"];
        dependency.bulkhead.capacity = count_value(bulkhead, "capacity", name + ".bulkhead");
        dependency.bulkhead.wait_timeout = millis_value(bulkhead, "wait_timeout_ms", dependency.bulkhead.wait_timeout);
    }

    return dependency;
}

HandlerRouting parse_handler_routing(const std::string& handler, const json& j) {
    HandlerRouting routing;
    routing.description = string_value(j, "description", "");
    routing.keywords = string_list(j, "keywords");
    for (const auto& kind : string_list(j, "kinds")) {
        try {
            routing.kinds.push_back(kind_from_string(kind));
        } catch (const std::invalid_argument&) {
            throw ConfigurationError("Handler '" + handler + "' lists unknown kind: " + kind);
        }
    }
    return routing;
}

void parse_logging_section(const json& j, LoggerConfig& logging) {
    if (j.contains("level")) {
        logging.min_level = string_to_level(j["level"].get<std::string>());
    }
    logging.enable_json = j.value("json", logging.enable_json);
    logging.enable_console = j.value("console", logging.enable_console);
    if (j.contains("file")) {
        logging.log_file_path = string_value(j, "file", logging.log_file_path);
        logging.enable_file = !logging.log_file_path.empty();
    }
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos++;

        bool braces = pos < result.size() && result[pos] == '{';
        if (braces) {
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated ${, keep literally
                pos = name_start;
                continue;
            }
            pos++;
        }
        if (var_name.empty()) {
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";
        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    return (fs::path(config_file_path).parent_path() / p).string();
}

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Engine configuration must be a JSON object");
        }

        if (j.contains("engine")) {
            parse_engine_section(j["engine"], config.engine);
        }

        if (j.contains("dependencies")) {
            for (auto it = j["dependencies"].begin(); it != j["dependencies"].end(); ++it) {
                config.dependencies.push_back(parse_dependency(it.key(), it.value()));
            }
        }

        if (j.contains("safety")) {
            config.blocked_patterns = string_list(j["safety"], "blocked_patterns");
        }

        if (j.contains("output_contracts")) {
            for (auto it = j["output_contracts"].begin(); it != j["output_contracts"].end(); ++it) {
                OutputContract contract;
                contract.type = it.value().value("type", contract.type);
                contract.required = string_list(it.value(), "required");
                config.output_contracts[it.key()] = contract;
            }
        }

        if (j.contains("handlers")) {
            for (auto it = j["handlers"].begin(); it != j["handlers"].end(); ++it) {
                config.handlers[it.key()] = parse_handler_routing(it.key(), it.value());
            }
        }

        if (j.contains("lifecycle")) {
            const json& lifecycle = j["lifecycle"];
            config.lifecycle.propagation_delay =
                millis_value(lifecycle, "propagation_delay_ms", config.lifecycle.propagation_delay);
            config.lifecycle.drain_timeout =
                millis_value(lifecycle, "drain_timeout_ms", config.lifecycle.drain_timeout);
        }

        if (j.contains("worker_pool")) {
            if (j["worker_pool"].contains("threads")) {
                config.worker_threads = count_value(j["worker_pool"], "threads", "worker_pool");
            }
        }

        if (j.contains("logging")) {
            parse_logging_section(j["logging"], config.logging);
        }

        if (j.contains("classifier")) {
            const json& classifier = j["classifier"];
            config.classifier.url = string_value(classifier, "url", "");
            config.classifier.model = string_value(classifier, "model", "");
            config.classifier.timeout_ms = classifier.value("timeout_ms", config.classifier.timeout_ms);
            if (classifier.contains("headers")) {
                for (auto it = classifier["headers"].begin(); it != classifier["headers"].end(); ++it) {
                    config.classifier.headers[it.key()] =
                        expand_environment_variables(it.value().get<std::string>());
                }
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    }

    validate_engine_config(config);

    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config = parse_engine_config_from_string(buffer.str());

    if (!config.engine.state_directory.empty()) {
        config.engine.state_directory = resolve_relative_path(config.engine.state_directory, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace taskweave
