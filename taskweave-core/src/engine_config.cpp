#include "engine_config.hpp"
#include "errors.hpp"
#include <set>

namespace taskweave {

const DependencyConfig* EngineConfig::find_dependency(const std::string& name) const {
    for (const auto& dependency : dependencies) {
        if (dependency.name == name) {
            return &dependency;
        }
    }
    return nullptr;
}

void validate_engine_config(const EngineConfig& config) {
    if (config.engine.max_delegation_depth < 1) {
        throw ConfigurationError("engine.max_delegation_depth must be at least 1");
    }
    if (!(config.engine.default_budget > 0.0)) {
        throw ConfigurationError("engine.default_budget must be positive");
    }
    if (config.engine.default_deadline.count() < 0) {
        throw ConfigurationError("engine.default_deadline_ms cannot be negative");
    }

    std::set<std::string> names;
    for (const auto& dependency : config.dependencies) {
        if (dependency.name.empty()) {
            throw ConfigurationError("Dependency name cannot be empty");
        }
        if (!names.insert(dependency.name).second) {
            throw ConfigurationError("Duplicate dependency: " + dependency.name);
        }
        const RetryConfig& retry = dependency.retry;
        if (retry.jitter_ratio < 0.0 || retry.jitter_ratio > 1.0) {
            throw ConfigurationError("Dependency '" + dependency.name + "': jitter_ratio must be within [0, 1]");
        }
        if (retry.max_delay.count() > 0 && retry.max_delay < retry.base_delay) {
            throw ConfigurationError("Dependency '" + dependency.name + "': max_delay_ms below base_delay_ms");
        }
    }

    static const std::set<std::string> contract_types = {
        "object", "array", "string", "number", "boolean", "any"
    };
    for (const auto& [handler, contract] : config.output_contracts) {
        if (contract_types.count(contract.type) == 0) {
            throw ConfigurationError("Output contract for '" + handler + "' has unknown type: " + contract.type);
        }
    }

    if (config.worker_threads < 1) {
        throw ConfigurationError("worker_pool.threads must be at least 1");
    }
}

std::vector<std::string> required_dependencies(const EngineConfig& config) {
    std::vector<std::string> required = {
        config.engine.state_store_dependency,
        config.engine.cost_store_dependency
    };
    if (!config.classifier.url.empty()) {
        required.push_back(config.engine.classifier_dependency);
    }
    return required;
}

} // namespace taskweave
