/**
 * @file retry_policy.cpp
 * @brief Implementation of RetryPolicy
 */

#include "retry_policy.hpp"
#include "errors.hpp"
#include <algorithm>

namespace taskweave {

RetryPolicy::RetryPolicy(RetryConfig config, TransientClassifier classifier)
    : config_(std::move(config)),
      classifier_(std::move(classifier)),
      rng_(std::random_device{}()) {}

std::chrono::milliseconds RetryPolicy::backoff_delay(int retry_number) const {
    if (retry_number < 1) {
        retry_number = 1;
    }

    // Cap the shift so large attempt counts cannot overflow
    int shift = std::min(retry_number - 1, 30);
    long long delay = config_.base_delay.count() * (1LL << shift);
    if (config_.max_delay.count() > 0) {
        delay = std::min<long long>(delay, config_.max_delay.count());
    }

    if (config_.jitter_ratio > 0.0 && delay > 0) {
        std::uniform_real_distribution<double> dist(0.0, config_.jitter_ratio);
        double factor;
        {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            factor = dist(rng_);
        }
        delay += static_cast<long long>(delay * factor);
    }
    return std::chrono::milliseconds(delay);
}

bool RetryPolicy::is_transient(const std::exception& error) const {
    if (dynamic_cast<const AttemptTimeoutError*>(&error) != nullptr) {
        return true;
    }
    if (classifier_) {
        return classifier_(error);
    }
    if (const auto* dependency_error = dynamic_cast<const DependencyError*>(&error)) {
        return config_.transient_kinds.count(dependency_error->kind()) > 0;
    }
    return false;
}

} // namespace taskweave
