/**
 * @file retry_policy.hpp
 * @brief Exponential backoff with jitter and transient-error classification
 *
 * Delay before retry n (1-based): base_delay * 2^(n-1), capped at max_delay,
 * plus a uniform jitter in [0, jitter_ratio * delay].
 *
 * Transient classification, in order:
 * - AttemptTimeoutError is always transient
 * - A custom classifier, when one is supplied, decides everything else
 * - DependencyError is transient when its kind is in transient_kinds
 * - Everything else (including all TaskweaveError) is non-transient
 */

#ifndef TASKWEAVE_RETRY_POLICY_HPP
#define TASKWEAVE_RETRY_POLICY_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <set>
#include <string>

namespace taskweave {

/**
 * @brief Retry parameters (0 is the unset placeholder)
 */
struct RetryConfig {
    int max_attempts;                        ///< Total attempts including the first
    std::chrono::milliseconds base_delay;
    std::chrono::milliseconds max_delay;
    double jitter_ratio;                     ///< 0 disables jitter
    std::set<std::string> transient_kinds;   ///< DependencyError kinds worth retrying

    RetryConfig()
        : max_attempts(0), base_delay(0), max_delay(0), jitter_ratio(0.2),
          transient_kinds({"timeout", "network", "server_busy", "server_error"}) {}
};

class RetryPolicy {
public:
    using TransientClassifier = std::function<bool(const std::exception&)>;

    explicit RetryPolicy(RetryConfig config, TransientClassifier classifier = nullptr);

    /**
     * @brief Delay to sleep before the given retry
     *
     * @param retry_number 1 for the first retry (i.e. before attempt 2)
     */
    std::chrono::milliseconds backoff_delay(int retry_number) const;

    bool is_transient(const std::exception& error) const;

    int max_attempts() const { return config_.max_attempts; }
    const RetryConfig& config() const { return config_; }

private:
    RetryConfig config_;
    TransientClassifier classifier_;
    mutable std::mutex rng_mutex_;
    mutable std::mt19937 rng_;
};

} // namespace taskweave

#endif // TASKWEAVE_RETRY_POLICY_HPP
