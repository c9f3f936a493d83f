#ifndef TASKWEAVE_ENGINE_CONFIG_HPP
#define TASKWEAVE_ENGINE_CONFIG_HPP

#include "engine_lifecycle.hpp"
#include "http_classifier.hpp"
#include "logger.hpp"
#include "middleware_stages.hpp"
#include "resilience_pipeline.hpp"
#include "work_unit.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace taskweave {

/**
 * @brief Request-level defaults and routing settings
 */
struct EngineSettings {
    std::string name;
    int max_delegation_depth;
    double default_budget;                           // Budget of each request tree
    std::chrono::milliseconds default_deadline;      // 0 = no deadline
    std::string default_handler;                     // Routing fallback, may be empty
    std::string classifier_dependency;
    std::string state_store_dependency;
    std::string cost_store_dependency;
    std::string state_directory;                     // Non-empty: file-backed state store
    bool cancel_siblings_on_budget_exceeded;
    std::chrono::milliseconds approval_timeout;
    size_t ledger_capacity;                          // Terminal records kept for replay

    EngineSettings()
        : name("taskweave"),
          max_delegation_depth(5),
          default_budget(0.0),
          default_deadline(0),
          classifier_dependency("classifier"),
          state_store_dependency("state_store"),
          cost_store_dependency("cost_store"),
          cancel_siblings_on_budget_exceeded(false),
          approval_timeout(0),
          ledger_capacity(10000) {}
};

/**
 * @brief Routing metadata for a handler registered in code
 */
struct HandlerRouting {
    std::string description;
    std::vector<WorkKind> kinds;
    std::vector<std::string> keywords;
};

/**
 * @brief Complete engine configuration
 */
struct EngineConfig {
    EngineSettings engine;
    std::vector<DependencyConfig> dependencies;
    std::vector<std::string> blocked_patterns;
    std::map<std::string, OutputContract> output_contracts;
    std::map<std::string, HandlerRouting> handlers;
    LifecycleConfig lifecycle;
    size_t worker_threads;
    LoggerConfig logging;
    HttpClassifierConfig classifier;                 // url empty = no HTTP classifier

    EngineConfig() : worker_threads(4) {}

    const DependencyConfig* find_dependency(const std::string& name) const;
};

/**
 * @brief Validates an engine configuration
 *
 * Validates:
 * - engine.max_delegation_depth >= 1 and engine.default_budget > 0
 * - Dependency names are non-empty and unique
 * - jitter_ratio within [0, 1] and max_delay not below base_delay
 * - Output contract types are known
 * - worker_pool.threads >= 1
 *
 * Resilience parameters left at 0 are not rejected here; they are reported
 * by the startup checks so every missing value is listed at once.
 *
 * @throws ConfigurationError On the first violation found
 */
void validate_engine_config(const EngineConfig& config);

/**
 * @brief Dependencies the engine cannot start without
 *
 * The state and cost stores always; the classifier when an HTTP classifier
 * is configured.
 */
std::vector<std::string> required_dependencies(const EngineConfig& config);

} // namespace taskweave

#endif // TASKWEAVE_ENGINE_CONFIG_HPP
