/**
 * @file engine_lifecycle.hpp
 * @brief Startup validation and graceful shutdown of the engine
 *
 * The EngineLifecycleManager handles:
 * - Fail-closed startup: every required dependency must be configured and no
 *   resilience parameter may sit at its placeholder value
 * - Readiness reporting for health probes
 * - The ordered shutdown sequence (see shutdown())
 * - SIGTERM/SIGINT capture for embedding processes
 *
 * Design Pattern: Resource Manager with an explicit state machine
 */

#ifndef TASKWEAVE_ENGINE_LIFECYCLE_HPP
#define TASKWEAVE_ENGINE_LIFECYCLE_HPP

#include "coordinator.hpp"
#include "observability.hpp"
#include "resilience_pipeline.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace taskweave {

/**
 * @brief Engine lifecycle state
 */
enum class LifecycleState {
    CREATED,    ///< Constructed, not yet validated
    STARTING,   ///< Startup checks in progress
    RUNNING,    ///< Healthy and accepting work
    DRAINING,   ///< Shutdown in progress, reported unhealthy
    STOPPED,    ///< Shutdown complete
    FAILED      ///< Startup checks failed
};

inline std::string state_to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::CREATED: return "CREATED";
        case LifecycleState::STARTING: return "STARTING";
        case LifecycleState::RUNNING: return "RUNNING";
        case LifecycleState::DRAINING: return "DRAINING";
        case LifecycleState::STOPPED: return "STOPPED";
        case LifecycleState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Lifecycle configuration
 */
struct LifecycleConfig {
    std::chrono::milliseconds propagation_delay;   ///< Unhealthy-before-stop window for load balancers
    std::chrono::milliseconds drain_timeout;       ///< Max wait for in-flight work

    LifecycleConfig()
        : propagation_delay(0),
          drain_timeout(30000) {}
};

/**
 * @brief Outcome of a shutdown
 */
struct ShutdownReport {
    bool performed;                            ///< false when shutdown had already run
    bool drained;                              ///< All in-flight work finished in time
    std::vector<std::string> interrupted_ids;  ///< Root units recorded as ShutdownInterrupted
    size_t flushed_events;
    size_t released_dependencies;
    double duration_ms;

    ShutdownReport()
        : performed(false), drained(true), flushed_events(0),
          released_dependencies(0), duration_ms(0.0) {}
};

class EngineLifecycleManager {
public:
    EngineLifecycleManager(Coordinator& coordinator, DependencyRegistry& dependencies,
                           EventEmitter& events, LifecycleConfig config = LifecycleConfig());

    EngineLifecycleManager(const EngineLifecycleManager&) = delete;
    EngineLifecycleManager& operator=(const EngineLifecycleManager&) = delete;

    /**
     * @brief Run startup checks and transition to RUNNING
     *
     * Every failed check is logged; then a single StartupValidationError
     * listing all of them is thrown and the state becomes FAILED.
     *
     * @param required_dependencies Dependencies the engine cannot run without
     * @throws StartupValidationError If any check fails
     * @throws std::runtime_error If called in any state other than CREATED
     */
    void start(const std::vector<std::string>& required_dependencies);

    /**
     * @brief Register a hook run during the release step, after dependencies
     */
    void add_shutdown_hook(const std::string& name, std::function<void()> hook);

    /**
     * @brief Graceful shutdown
     *
     * 1. report unhealthy
     * 2. wait propagation_delay
     * 3. stop accepting new work
     * 4. wait up to drain_timeout for in-flight work
     * 5. interrupt what is left (recorded as ShutdownInterrupted)
     * 6. flush observability events
     * 7. release dependencies and run shutdown hooks
     *
     * Idempotent: later calls return a report with performed == false.
     */
    ShutdownReport shutdown();

    bool is_healthy() const { return healthy_.load(); }
    LifecycleState get_state() const;
    const LifecycleConfig& config() const { return config_; }

    /**
     * @brief Route SIGTERM and SIGINT to the termination flag
     */
    static void install_signal_handlers();
    static bool termination_requested();
    static void request_termination();
    static void reset_termination();

    /**
     * @brief Block until termination is requested or the timeout passes
     *
     * @return true if termination was requested
     */
    static bool wait_for_termination(std::chrono::milliseconds timeout);

private:
    void transition_state(LifecycleState new_state);

    Coordinator& coordinator_;
    DependencyRegistry& dependencies_;
    EventEmitter& events_;
    LifecycleConfig config_;

    mutable std::mutex mutex_;
    LifecycleState state_;
    std::atomic<bool> healthy_;
    std::vector<std::pair<std::string, std::function<void()>>> shutdown_hooks_;
};

} // namespace taskweave

#endif // TASKWEAVE_ENGINE_LIFECYCLE_HPP
