/**
 * @file circuit_breaker.hpp
 * @brief Per-dependency circuit breaker
 *
 * State machine:
 *   CLOSED    --failure_threshold consecutive failed calls--> OPEN
 *   OPEN      --open_duration elapsed, next caller---------> HALF_OPEN (single trial)
 *   HALF_OPEN --trial succeeds-----------------------------> CLOSED
 *   HALF_OPEN --trial fails--------------------------------> OPEN (timer restarts)
 *
 * A "call" is one Resilience Pipeline execution after retries, so a retried
 * operation that eventually fails counts as a single failure. While a trial is
 * in flight, other callers are rejected as if the breaker were open.
 */

#ifndef TASKWEAVE_CIRCUIT_BREAKER_HPP
#define TASKWEAVE_CIRCUIT_BREAKER_HPP

#include "observability.hpp"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

namespace taskweave {

enum class BreakerState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

inline std::string breaker_state_to_string(BreakerState state) {
    switch (state) {
        case BreakerState::CLOSED: return "CLOSED";
        case BreakerState::OPEN: return "OPEN";
        case BreakerState::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Breaker parameters (0 is the unset placeholder)
 */
struct BreakerConfig {
    size_t failure_threshold;                  ///< Consecutive failures before opening
    std::chrono::milliseconds open_duration;   ///< Time spent open before a trial

    BreakerConfig()
        : failure_threshold(0), open_duration(0) {}

    BreakerConfig(size_t threshold, std::chrono::milliseconds duration)
        : failure_threshold(threshold), open_duration(duration) {}
};

/**
 * @brief Point-in-time view of a breaker
 */
struct DependencyBreakerState {
    std::string dependency;
    BreakerState state;
    size_t failure_count;
    std::chrono::steady_clock::time_point opened_at;
    size_t rejected_calls;
};

/**
 * @brief How a call was admitted
 */
enum class Admission {
    NORMAL,  ///< Breaker closed
    TRIAL    ///< The single half-open trial call
};

class CircuitBreaker {
public:
    CircuitBreaker(std::string dependency, BreakerConfig config, EventEmitter& events);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Admit a call or reject it
     *
     * @throws DependencyUnavailableError While open, or while a half-open trial is in flight
     */
    Admission acquire();

    void record_success(Admission admission);
    void record_failure(Admission admission, const std::string& error);

    /**
     * @brief Give back an admission whose call produced no outcome (e.g. bulkhead timeout)
     *
     * A released trial leaves the breaker half-open so the next caller becomes the trial.
     */
    void release(Admission admission);

    /**
     * @brief True when calls are currently rejected without a trial being due
     */
    bool is_open() const;

    BreakerState state() const;
    DependencyBreakerState snapshot() const;
    const BreakerConfig& config() const { return config_; }

private:
    struct Transition {
        bool happened = false;
        BreakerState from = BreakerState::CLOSED;
        BreakerState to = BreakerState::CLOSED;
    };

    Transition move_to(BreakerState next);   // caller holds mutex_
    void publish(const Transition& transition, const std::string& error);

    std::string dependency_;
    BreakerConfig config_;
    EventEmitter& events_;

    mutable std::mutex mutex_;
    BreakerState state_;
    size_t consecutive_failures_;
    std::chrono::steady_clock::time_point opened_at_;
    bool trial_in_flight_;
    size_t rejected_calls_;
};

} // namespace taskweave

#endif // TASKWEAVE_CIRCUIT_BREAKER_HPP
