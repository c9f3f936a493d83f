/**
 * @file resilience_pipeline.cpp
 * @brief Implementation of DependencyRegistry and ResiliencePipeline
 */

#include "resilience_pipeline.hpp"
#include "context_propagator.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <future>
#include <thread>

namespace taskweave {

std::vector<std::string> find_placeholder_parameters(const DependencyConfig& config) {
    std::vector<std::string> missing;
    const std::string prefix = config.name + ".";
    if (config.timeout.count() <= 0) missing.push_back(prefix + "timeout_ms");
    if (config.breaker.failure_threshold == 0) missing.push_back(prefix + "breaker.failure_threshold");
    if (config.breaker.open_duration.count() <= 0) missing.push_back(prefix + "breaker.open_duration_ms");
    if (config.retry.max_attempts <= 0) missing.push_back(prefix + "retry.max_attempts");
    if (config.retry.base_delay.count() <= 0) missing.push_back(prefix + "retry.base_delay_ms");
    if (config.bulkhead.capacity == 0) missing.push_back(prefix + "bulkhead.capacity");
    if (config.bulkhead.wait_timeout.count() <= 0) missing.push_back(prefix + "bulkhead.wait_timeout_ms");
    return missing;
}

DependencyGuard::DependencyGuard(const DependencyConfig& dependency_config,
                                 RetryPolicy::TransientClassifier classifier,
                                 EventEmitter& events)
    : config(dependency_config),
      breaker(dependency_config.name, dependency_config.breaker, events),
      bulkhead(std::make_shared<Bulkhead>(dependency_config.name, dependency_config.bulkhead, events)),
      retry(dependency_config.retry, std::move(classifier)) {}

// ---------------------------------------------------------------------------
// DependencyRegistry
// ---------------------------------------------------------------------------

DependencyRegistry::DependencyRegistry(EventEmitter& events)
    : events_(events), released_(false) {}

void DependencyRegistry::add(const DependencyConfig& config, RetryPolicy::TransientClassifier classifier) {
    if (config.name.empty()) {
        throw ConfigurationError("Dependency name cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (guards_.count(config.name) > 0) {
        throw ConfigurationError("Dependency already registered: " + config.name);
    }
    guards_[config.name] = std::make_unique<DependencyGuard>(config, std::move(classifier), events_);
}

DependencyGuard& DependencyRegistry::get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = guards_.find(name);
    if (it == guards_.end()) {
        throw ConfigurationError("Unknown dependency: " + name);
    }
    return *it->second;
}

bool DependencyRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return guards_.count(name) > 0;
}

std::vector<std::string> DependencyRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(guards_.size());
    for (const auto& [name, guard] : guards_) {
        result.push_back(name);
    }
    return result;
}

std::vector<DependencyConfig> DependencyRegistry::configs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DependencyConfig> result;
    for (const auto& [name, guard] : guards_) {
        result.push_back(guard->config);
    }
    return result;
}

std::vector<DependencyBreakerState> DependencyRegistry::breaker_states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DependencyBreakerState> result;
    for (const auto& [name, guard] : guards_) {
        result.push_back(guard->breaker.snapshot());
    }
    return result;
}

void DependencyRegistry::register_release_hook(const std::string& name, std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    release_hooks_.emplace_back(name, std::move(hook));
}

size_t DependencyRegistry::release_all() {
    std::vector<std::pair<std::string, std::function<void()>>> hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (released_) {
            return 0;
        }
        released_ = true;
        hooks = release_hooks_;
    }

    size_t released = 0;
    for (const auto& [name, hook] : hooks) {
        try {
            hook();
            ++released;
            Logger::get_instance().log_info("dependency_registry", "Released dependency",
                                            {{"dependency", name}});
        } catch (const std::exception& e) {
            Logger::get_instance().log_error("dependency_registry", "Failed to release dependency",
                                             {{"dependency", name}, {"error", e.what()}});
        }
    }
    return released;
}

// ---------------------------------------------------------------------------
// ResiliencePipeline
// ---------------------------------------------------------------------------

ResiliencePipeline::ResiliencePipeline(DependencyRegistry& registry, EventEmitter& events)
    : registry_(registry), events_(events) {}

std::any ResiliencePipeline::run(const std::string& dependency, std::function<std::any()> operation) {
    DependencyGuard& guard = registry_.get(dependency);

    // Throws DependencyUnavailableError without attempting the call
    Admission admission = guard.breaker.acquire();

    // A half-open trial is a single probe, never retried
    int max_attempts = admission == Admission::TRIAL ? 1 : guard.retry.max_attempts();
    if (max_attempts < 1) {
        max_attempts = 1;
    }

    try {
        std::any value = run_with_retry(guard, operation, max_attempts);
        guard.breaker.record_success(admission);
        return value;
    } catch (const BulkheadTimeoutError&) {
        guard.breaker.release(admission);
        throw;
    } catch (const DependencyUnavailableError&) {
        // Breaker opened by concurrent callers while this call was retrying
        guard.breaker.release(admission);
        throw;
    } catch (const std::exception& e) {
        guard.breaker.record_failure(admission, e.what());
        throw;
    }
}

std::any ResiliencePipeline::run_with_retry(DependencyGuard& guard,
                                            const std::function<std::any()>& operation,
                                            int max_attempts) {
    const std::string& dependency = guard.config.name;

    for (int attempt = 1; ; ++attempt) {
        auto attempt_start = std::chrono::steady_clock::now();
        try {
            return run_attempt(guard, operation, attempt);
        } catch (const BulkheadTimeoutError&) {
            throw;
        } catch (const std::exception& e) {
            if (!guard.retry.is_transient(e)) {
                throw;
            }
            if (attempt >= max_attempts) {
                ObservabilityEvent exhausted("retry_exhausted", "failed");
                exhausted.level = LogLevel::WARN;
                exhausted.attributes["dependency"] = dependency;
                exhausted.attributes["attempts"] = std::to_string(attempt);
                exhausted.attributes["error"] = e.what();
                events_.emit(exhausted);
                throw DependencyExhaustedError(dependency, attempt, e.what());
            }

            auto delay = guard.retry.backoff_delay(attempt);

            ObservabilityEvent retry_event("retry_attempt", "scheduled");
            retry_event.level = LogLevel::DEBUG;
            retry_event.duration_ms = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - attempt_start).count();
            retry_event.attributes["dependency"] = dependency;
            retry_event.attributes["attempt"] = std::to_string(attempt);
            retry_event.attributes["delay_ms"] = std::to_string(delay.count());
            retry_event.attributes["error"] = e.what();
            events_.emit(retry_event);

            std::this_thread::sleep_for(delay);

            if (guard.breaker.is_open()) {
                throw DependencyUnavailableError(dependency);
            }
        }
    }
}

std::any ResiliencePipeline::run_attempt(DependencyGuard& guard,
                                         const std::function<std::any()>& operation,
                                         int attempt) {
    auto permit = std::make_shared<Bulkhead::Permit>(guard.bulkhead->acquire());

    auto task = std::make_shared<std::packaged_task<std::any()>>(
        ContextPropagator::wrap(operation));
    std::future<std::any> result = task->get_future();

    // The runner shares the permit so the slot stays taken until the attempt
    // actually returns, even after the caller has given up on it.
    std::thread runner([task, permit]() { (*task)(); });
    runner.detach();

    if (result.wait_for(guard.config.timeout) == std::future_status::timeout) {
        ObservabilityEvent event("attempt_timeout", "abandoned");
        event.level = LogLevel::WARN;
        event.attributes["dependency"] = guard.config.name;
        event.attributes["attempt"] = std::to_string(attempt);
        event.attributes["timeout_ms"] = std::to_string(guard.config.timeout.count());
        events_.emit(event);
        throw AttemptTimeoutError(guard.config.name, guard.config.timeout);
    }
    return result.get();
}

} // namespace taskweave
