/**
 * @file bulkhead.cpp
 * @brief Implementation of Bulkhead
 */

#include "bulkhead.hpp"
#include "errors.hpp"
#include <algorithm>

namespace taskweave {

Bulkhead::Bulkhead(std::string dependency, BulkheadConfig config, EventEmitter& events)
    : dependency_(std::move(dependency)),
      config_(config),
      events_(events),
      in_flight_(0),
      peak_in_flight_(0) {}

Bulkhead::Permit Bulkhead::acquire() {
    auto start = std::chrono::steady_clock::now();
    bool waited = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (in_flight_ >= config_.capacity) {
            waited = true;
            bool got_slot = slot_freed_.wait_for(lock, config_.wait_timeout, [this]() {
                return in_flight_ < config_.capacity;
            });
            if (!got_slot) {
                lock.unlock();
                ObservabilityEvent event("bulkhead_timeout", "rejected");
                event.level = LogLevel::WARN;
                event.duration_ms = std::chrono::duration<double, std::milli>(
                    std::chrono::steady_clock::now() - start).count();
                event.attributes["dependency"] = dependency_;
                event.attributes["capacity"] = std::to_string(config_.capacity);
                events_.emit(event);
                throw BulkheadTimeoutError(dependency_, config_.wait_timeout);
            }
        }
        ++in_flight_;
        peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
    }

    if (waited) {
        ObservabilityEvent event("bulkhead_contention", "acquired");
        event.level = LogLevel::DEBUG;
        event.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        event.attributes["dependency"] = dependency_;
        events_.emit(event);
    }
    return Permit(shared_from_this());
}

void Bulkhead::release_slot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    slot_freed_.notify_one();
}

size_t Bulkhead::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

size_t Bulkhead::peak_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_in_flight_;
}

} // namespace taskweave
