/**
 * @file engine_lifecycle.cpp
 * @brief Implementation of EngineLifecycleManager
 */

#include "engine_lifecycle.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <csignal>
#include <stdexcept>
#include <thread>

namespace taskweave {

namespace {

volatile std::sig_atomic_t g_termination_requested = 0;

extern "C" void handle_termination_signal(int) {
    g_termination_requested = 1;
}

} // anonymous namespace

EngineLifecycleManager::EngineLifecycleManager(Coordinator& coordinator, DependencyRegistry& dependencies,
                                               EventEmitter& events, LifecycleConfig config)
    : coordinator_(coordinator),
      dependencies_(dependencies),
      events_(events),
      config_(config),
      state_(LifecycleState::CREATED),
      healthy_(false) {}

void EngineLifecycleManager::start(const std::vector<std::string>& required_dependencies) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LifecycleState::CREATED) {
            throw std::runtime_error("Cannot start engine in state: " + state_to_string(state_));
        }
    }
    transition_state(LifecycleState::STARTING);

    std::vector<std::string> problems;
    for (const auto& name : required_dependencies) {
        if (!dependencies_.contains(name)) {
            problems.push_back("required dependency '" + name + "' is not configured");
        }
    }
    for (const auto& dependency : dependencies_.configs()) {
        for (const auto& parameter : find_placeholder_parameters(dependency)) {
            problems.push_back("parameter '" + parameter + "' is unset");
        }
    }
    if (config_.drain_timeout.count() <= 0) {
        problems.push_back("lifecycle.drain_timeout_ms must be positive");
    }

    if (!problems.empty()) {
        for (const auto& problem : problems) {
            Logger::get_instance().log_error("lifecycle", "Startup check failed", {{"problem", problem}});
        }
        transition_state(LifecycleState::FAILED);
        throw StartupValidationError(problems);
    }

    coordinator_.prepare();
    healthy_.store(true);
    transition_state(LifecycleState::RUNNING);

    ObservabilityEvent event("engine_started", "ok");
    event.attributes["dependencies"] = std::to_string(dependencies_.names().size());
    events_.emit(event);
}

void EngineLifecycleManager::add_shutdown_hook(const std::string& name, std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_hooks_.emplace_back(name, std::move(hook));
}

ShutdownReport EngineLifecycleManager::shutdown() {
    ShutdownReport report;
    LifecycleState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == LifecycleState::DRAINING || state_ == LifecycleState::STOPPED) {
            return report;
        }
        previous = state_;
        state_ = LifecycleState::DRAINING;
    }
    report.performed = true;
    auto start = std::chrono::steady_clock::now();

    // 1. unhealthy
    healthy_.store(false);
    Logger::get_instance().log_state_transition("lifecycle", "engine", state_to_string(previous),
                                                state_to_string(LifecycleState::DRAINING));
    ObservabilityEvent unhealthy("engine_unhealthy", "draining");
    unhealthy.level = LogLevel::WARN;
    events_.emit(unhealthy);

    // 2. let load balancers notice
    if (config_.propagation_delay.count() > 0) {
        std::this_thread::sleep_for(config_.propagation_delay);
    }

    // 3. stop intake
    coordinator_.stop_accepting();

    // 4. drain
    report.drained = coordinator_.wait_for_drain(config_.drain_timeout);

    // 5. interrupt leftovers
    if (!report.drained) {
        for (const auto& unit : coordinator_.interrupt_in_flight("Interrupted by engine shutdown")) {
            report.interrupted_ids.push_back(unit.id);
        }
    }

    ObservabilityEvent drained("engine_drained", report.drained ? "drained" : "interrupted");
    drained.level = report.drained ? LogLevel::INFO : LogLevel::WARN;
    drained.attributes["interrupted"] = std::to_string(report.interrupted_ids.size());
    events_.emit(drained);

    // 6. flush
    report.flushed_events = events_.flush();

    // 7. release
    report.released_dependencies = dependencies_.release_all();
    std::vector<std::pair<std::string, std::function<void()>>> hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hooks = shutdown_hooks_;
    }
    for (const auto& [name, hook] : hooks) {
        try {
            hook();
        } catch (const std::exception& e) {
            Logger::get_instance().log_error("lifecycle", "Shutdown hook failed",
                                             {{"hook", name}, {"error", e.what()}});
        }
    }

    transition_state(LifecycleState::STOPPED);
    report.duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    Logger::get_instance().log_info("lifecycle", "Engine stopped",
        {{"drained", report.drained ? "true" : "false"},
         {"interrupted", std::to_string(report.interrupted_ids.size())},
         {"duration_ms", std::to_string(report.duration_ms)}});
    Logger::get_instance().flush();
    return report;
}

LifecycleState EngineLifecycleManager::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void EngineLifecycleManager::transition_state(LifecycleState new_state) {
    LifecycleState old_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_state = state_;
        state_ = new_state;
    }
    Logger::get_instance().log_state_transition("lifecycle", "engine",
                                                state_to_string(old_state), state_to_string(new_state));
}

void EngineLifecycleManager::install_signal_handlers() {
    std::signal(SIGTERM, handle_termination_signal);
    std::signal(SIGINT, handle_termination_signal);
}

bool EngineLifecycleManager::termination_requested() {
    return g_termination_requested != 0;
}

void EngineLifecycleManager::request_termination() {
    g_termination_requested = 1;
}

void EngineLifecycleManager::reset_termination() {
    g_termination_requested = 0;
}

bool EngineLifecycleManager::wait_for_termination(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!termination_requested()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

} // namespace taskweave
