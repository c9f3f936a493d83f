/**
 * @file circuit_breaker.cpp
 * @brief Implementation of CircuitBreaker
 */

#include "circuit_breaker.hpp"
#include "errors.hpp"

namespace taskweave {

CircuitBreaker::CircuitBreaker(std::string dependency, BreakerConfig config, EventEmitter& events)
    : dependency_(std::move(dependency)),
      config_(config),
      events_(events),
      state_(BreakerState::CLOSED),
      consecutive_failures_(0),
      opened_at_(),
      trial_in_flight_(false),
      rejected_calls_(0) {}

Admission CircuitBreaker::acquire() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case BreakerState::CLOSED:
                return Admission::NORMAL;

            case BreakerState::OPEN: {
                auto elapsed = std::chrono::steady_clock::now() - opened_at_;
                if (elapsed < config_.open_duration) {
                    ++rejected_calls_;
                    throw DependencyUnavailableError(dependency_);
                }
                transition = move_to(BreakerState::HALF_OPEN);
                trial_in_flight_ = true;
                break;
            }

            case BreakerState::HALF_OPEN:
                if (trial_in_flight_) {
                    ++rejected_calls_;
                    throw DependencyUnavailableError(dependency_);
                }
                trial_in_flight_ = true;
                break;
        }
    }
    publish(transition, "");
    return Admission::TRIAL;
}

void CircuitBreaker::record_success(Admission admission) {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (admission == Admission::TRIAL) {
            trial_in_flight_ = false;
            consecutive_failures_ = 0;
            transition = move_to(BreakerState::CLOSED);
        } else if (state_ == BreakerState::CLOSED) {
            consecutive_failures_ = 0;
        }
    }
    publish(transition, "");
}

void CircuitBreaker::record_failure(Admission admission, const std::string& error) {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++consecutive_failures_;
        if (admission == Admission::TRIAL) {
            trial_in_flight_ = false;
            transition = move_to(BreakerState::OPEN);
            opened_at_ = std::chrono::steady_clock::now();
        } else if (state_ == BreakerState::CLOSED &&
                   consecutive_failures_ >= config_.failure_threshold) {
            transition = move_to(BreakerState::OPEN);
            opened_at_ = std::chrono::steady_clock::now();
        }
    }

    ObservabilityEvent event("circuit_breaker_failure", "failed");
    event.level = LogLevel::DEBUG;
    event.attributes["dependency"] = dependency_;
    event.attributes["error"] = error;
    events_.emit(event);

    publish(transition, error);
}

void CircuitBreaker::release(Admission admission) {
    if (admission != Admission::TRIAL) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    trial_in_flight_ = false;
}

bool CircuitBreaker::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == BreakerState::OPEN;
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

DependencyBreakerState CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DependencyBreakerState view;
    view.dependency = dependency_;
    view.state = state_;
    view.failure_count = consecutive_failures_;
    view.opened_at = opened_at_;
    view.rejected_calls = rejected_calls_;
    return view;
}

CircuitBreaker::Transition CircuitBreaker::move_to(BreakerState next) {
    Transition transition;
    if (state_ == next) {
        return transition;
    }
    transition.happened = true;
    transition.from = state_;
    transition.to = next;
    state_ = next;
    return transition;
}

void CircuitBreaker::publish(const Transition& transition, const std::string& error) {
    if (!transition.happened) {
        return;
    }

    Logger::get_instance().log_state_transition(
        "circuit_breaker", dependency_,
        breaker_state_to_string(transition.from), breaker_state_to_string(transition.to));

    std::string name;
    switch (transition.to) {
        case BreakerState::OPEN: name = "circuit_breaker_opened"; break;
        case BreakerState::HALF_OPEN: name = "circuit_breaker_half_open"; break;
        case BreakerState::CLOSED: name = "circuit_breaker_closed"; break;
    }

    ObservabilityEvent event(name, breaker_state_to_string(transition.to));
    event.level = transition.to == BreakerState::OPEN ? LogLevel::WARN : LogLevel::INFO;
    event.attributes["dependency"] = dependency_;
    event.attributes["previous_state"] = breaker_state_to_string(transition.from);
    if (!error.empty()) {
        event.attributes["error"] = error;
    }
    events_.emit(event);
}

} // namespace taskweave
