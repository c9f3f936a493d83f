/**
 * @file errors.hpp
 * @brief Error taxonomy and exception hierarchy for the orchestration engine
 *
 * Every failure the engine can encode on a WorkUnit has an ErrorCode. Components
 * raise the matching TaskweaveError subclass; the Coordinator catches them at its
 * boundary and records the code on the unit, so no exception ever escapes Handle.
 *
 * Operations wrapped by the Resilience Pipeline report their own failures as
 * DependencyError, carrying a short "kind" string (network, timeout, server_busy, ...)
 * that the retry layer classifies as transient or not.
 */

#ifndef TASKWEAVE_ERRORS_HPP
#define TASKWEAVE_ERRORS_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace taskweave {

/**
 * @brief Failure codes recorded on terminal work units
 */
enum class ErrorCode {
    BLOCKED_INPUT,              ///< Safety rejection, non-retryable
    DEPENDENCY_UNAVAILABLE,     ///< Circuit breaker open
    BULKHEAD_TIMEOUT,           ///< No concurrency slot within the wait timeout
    DEPENDENCY_EXHAUSTED,       ///< Retries exhausted against a transient fault
    DELEGATION_DEPTH_EXCEEDED,
    DELEGATION_CYCLE_DETECTED,
    BUDGET_EXCEEDED,
    DEADLINE_EXCEEDED,
    SHUTDOWN_INTERRUPTED,
    VALIDATION_FAILURE,         ///< Output contract violation (logged, not fatal)
    HANDLER_FAILED,             ///< Handler raised an unclassified exception
    CANCELLED,
    APPROVAL_REJECTED,
    DUPLICATE_IN_FLIGHT,        ///< Same id handled again while still running
    CONFIGURATION,
    INTERNAL
};

/**
 * @brief Convert error code to its taxonomy name
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::BLOCKED_INPUT: return "BlockedInput";
        case ErrorCode::DEPENDENCY_UNAVAILABLE: return "DependencyUnavailable";
        case ErrorCode::BULKHEAD_TIMEOUT: return "BulkheadTimeout";
        case ErrorCode::DEPENDENCY_EXHAUSTED: return "DependencyExhausted";
        case ErrorCode::DELEGATION_DEPTH_EXCEEDED: return "DelegationDepthExceeded";
        case ErrorCode::DELEGATION_CYCLE_DETECTED: return "DelegationCycleDetected";
        case ErrorCode::BUDGET_EXCEEDED: return "BudgetExceeded";
        case ErrorCode::DEADLINE_EXCEEDED: return "DeadlineExceeded";
        case ErrorCode::SHUTDOWN_INTERRUPTED: return "ShutdownInterrupted";
        case ErrorCode::VALIDATION_FAILURE: return "ValidationFailure";
        case ErrorCode::HANDLER_FAILED: return "HandlerFailed";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::APPROVAL_REJECTED: return "ApprovalRejected";
        case ErrorCode::DUPLICATE_IN_FLIGHT: return "DuplicateInFlight";
        case ErrorCode::CONFIGURATION: return "Configuration";
        case ErrorCode::INTERNAL: return "Internal";
        default: return "Unknown";
    }
}

/**
 * @brief Parse a taxonomy name back into an error code
 *
 * @throws std::invalid_argument If the name is not part of the taxonomy
 */
inline ErrorCode error_code_from_string(const std::string& name) {
    static const ErrorCode all_codes[] = {
        ErrorCode::BLOCKED_INPUT, ErrorCode::DEPENDENCY_UNAVAILABLE,
        ErrorCode::BULKHEAD_TIMEOUT, ErrorCode::DEPENDENCY_EXHAUSTED,
        ErrorCode::DELEGATION_DEPTH_EXCEEDED, ErrorCode::DELEGATION_CYCLE_DETECTED,
        ErrorCode::BUDGET_EXCEEDED, ErrorCode::DEADLINE_EXCEEDED,
        ErrorCode::SHUTDOWN_INTERRUPTED, ErrorCode::VALIDATION_FAILURE,
        ErrorCode::HANDLER_FAILED, ErrorCode::CANCELLED, ErrorCode::APPROVAL_REJECTED, ErrorCode::DUPLICATE_IN_FLIGHT,
        ErrorCode::CONFIGURATION, ErrorCode::INTERNAL
    };
    for (ErrorCode code : all_codes) {
        if (error_code_to_string(code) == name) {
            return code;
        }
    }
    throw std::invalid_argument("Unknown error code: " + name);
}

/**
 * @brief True for failures that abort only the delegation that triggered them
 */
inline bool is_delegation_scoped(ErrorCode code) {
    return code == ErrorCode::DELEGATION_DEPTH_EXCEEDED ||
           code == ErrorCode::DELEGATION_CYCLE_DETECTED ||
           code == ErrorCode::BUDGET_EXCEEDED;
}

/**
 * @brief Base exception for engine errors
 */
class TaskweaveError : public std::runtime_error {
public:
    TaskweaveError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class BlockedInputError : public TaskweaveError {
public:
    explicit BlockedInputError(const std::string& message)
        : TaskweaveError(ErrorCode::BLOCKED_INPUT, "Blocked input: " + message) {}
};

/**
 * @brief Raised without attempting the call when a dependency's breaker is open
 */
class DependencyUnavailableError : public TaskweaveError {
public:
    explicit DependencyUnavailableError(const std::string& dependency)
        : TaskweaveError(ErrorCode::DEPENDENCY_UNAVAILABLE,
                         "Dependency unavailable (circuit open): " + dependency),
          dependency_(dependency) {}

    const std::string& dependency() const { return dependency_; }

private:
    std::string dependency_;
};

class BulkheadTimeoutError : public TaskweaveError {
public:
    BulkheadTimeoutError(const std::string& dependency, std::chrono::milliseconds waited)
        : TaskweaveError(ErrorCode::BULKHEAD_TIMEOUT,
                         "No concurrency slot for " + dependency + " after " +
                         std::to_string(waited.count()) + "ms"),
          dependency_(dependency) {}

    const std::string& dependency() const { return dependency_; }

private:
    std::string dependency_;
};

/**
 * @brief Raised when every retry attempt failed with a transient error
 *
 * what() carries the last transient error message.
 */
class DependencyExhaustedError : public TaskweaveError {
public:
    DependencyExhaustedError(const std::string& dependency, int attempts, const std::string& last_error)
        : TaskweaveError(ErrorCode::DEPENDENCY_EXHAUSTED,
                         "Dependency " + dependency + " exhausted after " +
                         std::to_string(attempts) + " attempts: " + last_error),
          dependency_(dependency), attempts_(attempts), last_error_(last_error) {}

    const std::string& dependency() const { return dependency_; }
    int attempts() const { return attempts_; }
    const std::string& last_error() const { return last_error_; }

private:
    std::string dependency_;
    int attempts_;
    std::string last_error_;
};

class DelegationDepthExceededError : public TaskweaveError {
public:
    DelegationDepthExceededError(int depth, int max_depth)
        : TaskweaveError(ErrorCode::DELEGATION_DEPTH_EXCEEDED,
                         "Delegation depth " + std::to_string(depth) +
                         " exceeds maximum " + std::to_string(max_depth)) {}
};

class DelegationCycleDetectedError : public TaskweaveError {
public:
    explicit DelegationCycleDetectedError(const std::string& handler)
        : TaskweaveError(ErrorCode::DELEGATION_CYCLE_DETECTED,
                         "Handler already on the delegation path: " + handler) {}
};

class BudgetExceededError : public TaskweaveError {
public:
    explicit BudgetExceededError(const std::string& message)
        : TaskweaveError(ErrorCode::BUDGET_EXCEEDED, message) {}
};

class DeadlineExceededError : public TaskweaveError {
public:
    explicit DeadlineExceededError(const std::string& message)
        : TaskweaveError(ErrorCode::DEADLINE_EXCEEDED, message) {}
};

class ShutdownInterruptedError : public TaskweaveError {
public:
    explicit ShutdownInterruptedError(const std::string& message)
        : TaskweaveError(ErrorCode::SHUTDOWN_INTERRUPTED, message) {}
};

class CancelledError : public TaskweaveError {
public:
    explicit CancelledError(const std::string& message)
        : TaskweaveError(ErrorCode::CANCELLED, message) {}
};

class ApprovalRejectedError : public TaskweaveError {
public:
    explicit ApprovalRejectedError(const std::string& work_unit_id)
        : TaskweaveError(ErrorCode::APPROVAL_REJECTED, "Approval rejected for " + work_unit_id) {}
};

/**
 * @brief Raised when configuration is invalid or names an unknown component
 */
class ConfigurationError : public TaskweaveError {
public:
    explicit ConfigurationError(const std::string& message)
        : TaskweaveError(ErrorCode::CONFIGURATION, "Configuration error: " + message) {}
};

/**
 * @brief Raised by the Lifecycle Manager when startup checks fail
 */
class StartupValidationError : public TaskweaveError {
public:
    explicit StartupValidationError(const std::vector<std::string>& problems)
        : TaskweaveError(ErrorCode::CONFIGURATION, build_message(problems)),
          problems_(problems) {}

    const std::vector<std::string>& problems() const { return problems_; }

private:
    std::vector<std::string> problems_;

    static std::string build_message(const std::vector<std::string>& problems) {
        std::string message = "Startup blocked, " + std::to_string(problems.size()) +
                              " check(s) failed:";
        for (const auto& problem : problems) {
            message += "\n  - " + problem;
        }
        return message;
    }
};

/**
 * @brief Failure reported by an external-call operation
 *
 * The kind is matched against the configured transient kinds by the retry layer.
 */
class DependencyError : public std::runtime_error {
public:
    DependencyError(const std::string& kind, const std::string& message, int status_code = 0)
        : std::runtime_error(message), kind_(kind), status_code_(status_code) {}

    const std::string& kind() const { return kind_; }
    int status_code() const { return status_code_; }

private:
    std::string kind_;
    int status_code_;
};

/**
 * @brief A single attempt exceeded its per-dependency timeout (always transient)
 */
class AttemptTimeoutError : public DependencyError {
public:
    AttemptTimeoutError(const std::string& dependency, std::chrono::milliseconds timeout)
        : DependencyError("timeout", "Attempt against " + dependency + " timed out after " +
                          std::to_string(timeout.count()) + "ms") {}
};

} // namespace taskweave

#endif // TASKWEAVE_ERRORS_HPP
