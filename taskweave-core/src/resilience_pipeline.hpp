/**
 * @file resilience_pipeline.hpp
 * @brief Layered protection around calls to external dependencies
 *
 * Every external call (classifier, state store, cost store, handler-owned
 * services) goes through ResiliencePipeline::execute, which applies, outermost
 * first:
 *
 *   circuit breaker -> retry with backoff -> bulkhead -> per-attempt timeout
 *
 * - The breaker is consulted once per execution and sees one outcome after
 *   retries. An open breaker fails fast with DependencyUnavailableError.
 * - Retries run only for transient failures and stop early if the breaker
 *   opens meanwhile. Exhaustion raises DependencyExhaustedError.
 * - The bulkhead slot is taken per attempt and held until the attempt really
 *   finishes. BulkheadTimeoutError is raised immediately and does not count
 *   as a breaker failure.
 * - Each attempt runs on its own thread. When it overruns its timeout, the caller
 *   gets AttemptTimeoutError (transient) and the attempt is abandoned. Operations
 *   must therefore own everything they touch: capture by value, never by
 *   reference to caller-stack objects.
 */

#ifndef TASKWEAVE_RESILIENCE_PIPELINE_HPP
#define TASKWEAVE_RESILIENCE_PIPELINE_HPP

#include "bulkhead.hpp"
#include "circuit_breaker.hpp"
#include "observability.hpp"
#include "retry_policy.hpp"
#include <any>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace taskweave {

/**
 * @brief Full resilience parameters for one named dependency
 */
struct DependencyConfig {
    std::string name;
    std::chrono::milliseconds timeout;   ///< Per-attempt timeout
    BreakerConfig breaker;
    RetryConfig retry;
    BulkheadConfig bulkhead;

    DependencyConfig() : timeout(0) {}
};

/**
 * @brief List parameters still at their unset placeholder (0)
 *
 * @return "dependency.parameter" entries, empty when fully configured
 */
std::vector<std::string> find_placeholder_parameters(const DependencyConfig& config);

/**
 * @brief The resilience primitives owned by one dependency
 */
struct DependencyGuard {
    DependencyConfig config;
    CircuitBreaker breaker;
    std::shared_ptr<Bulkhead> bulkhead;
    RetryPolicy retry;

    DependencyGuard(const DependencyConfig& dependency_config,
                    RetryPolicy::TransientClassifier classifier,
                    EventEmitter& events);
};

/**
 * @brief Registry of configured dependencies
 *
 * Dependencies are registered at startup. Looking up an unknown name is a
 * configuration error.
 */
class DependencyRegistry {
public:
    explicit DependencyRegistry(EventEmitter& events);

    /**
     * @throws ConfigurationError If a dependency with this name already exists
     */
    void add(const DependencyConfig& config, RetryPolicy::TransientClassifier classifier = nullptr);

    /**
     * @throws ConfigurationError If the dependency is not registered
     */
    DependencyGuard& get(const std::string& name);

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    std::vector<DependencyConfig> configs() const;
    std::vector<DependencyBreakerState> breaker_states() const;

    /**
     * @brief Register a callback that closes a dependency's connections at shutdown
     */
    void register_release_hook(const std::string& name, std::function<void()> hook);

    /**
     * @brief Run all release hooks once; failures are logged, never thrown
     *
     * @return Number of hooks that completed without error
     */
    size_t release_all();

private:
    EventEmitter& events_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<DependencyGuard>> guards_;
    std::vector<std::pair<std::string, std::function<void()>>> release_hooks_;
    bool released_;
};

class ResiliencePipeline {
public:
    ResiliencePipeline(DependencyRegistry& registry, EventEmitter& events);

    /**
     * @brief Run an operation against a dependency with full protection
     *
     * @param dependency Registered dependency name
     * @param operation Callable with no arguments; copied into each attempt
     * @return Whatever the operation returns
     * @throws DependencyUnavailableError, BulkheadTimeoutError, DependencyExhaustedError,
     *         ConfigurationError (unknown dependency), or the operation's own
     *         non-transient exception
     */
    template <typename Fn>
    auto execute(const std::string& dependency, Fn operation) -> decltype(operation()) {
        using Result = decltype(operation());
        if constexpr (std::is_void_v<Result>) {
            run(dependency, [operation]() mutable -> std::any {
                operation();
                return std::any();
            });
        } else {
            std::any value = run(dependency, [operation]() mutable -> std::any {
                return std::any(operation());
            });
            return std::any_cast<Result>(std::move(value));
        }
    }

    /**
     * @brief Type-erased core used by execute()
     */
    std::any run(const std::string& dependency, std::function<std::any()> operation);

    DependencyRegistry& registry() { return registry_; }

private:
    std::any run_with_retry(DependencyGuard& guard, const std::function<std::any()>& operation,
                            int max_attempts);
    std::any run_attempt(DependencyGuard& guard, const std::function<std::any()>& operation,
                         int attempt);

    DependencyRegistry& registry_;
    EventEmitter& events_;
};

} // namespace taskweave

#endif // TASKWEAVE_RESILIENCE_PIPELINE_HPP
