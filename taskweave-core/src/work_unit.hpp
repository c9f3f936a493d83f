/**
 * @file work_unit.hpp
 * @brief The unit of work tracked by the engine
 *
 * A WorkUnit is created at intake (or by a delegating handler), moves through
 * the status state machine below and ends in exactly one terminal status:
 *
 *   PENDING -> RUNNING -> AWAITING_APPROVAL -> RUNNING -> COMPLETED
 *      |          |              |
 *      +----------+--------------+--> FAILED | CANCELLED
 *
 * Once terminal, a unit is never modified again.
 */

#ifndef TASKWEAVE_WORK_UNIT_HPP
#define TASKWEAVE_WORK_UNIT_HPP

#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace taskweave {

enum class WorkUnitStatus {
    PENDING,
    RUNNING,
    AWAITING_APPROVAL,
    COMPLETED,
    FAILED,
    CANCELLED
};

inline std::string status_to_string(WorkUnitStatus status) {
    switch (status) {
        case WorkUnitStatus::PENDING: return "pending";
        case WorkUnitStatus::RUNNING: return "running";
        case WorkUnitStatus::AWAITING_APPROVAL: return "awaiting_approval";
        case WorkUnitStatus::COMPLETED: return "completed";
        case WorkUnitStatus::FAILED: return "failed";
        case WorkUnitStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

WorkUnitStatus status_from_string(const std::string& name);

inline bool is_terminal(WorkUnitStatus status) {
    return status == WorkUnitStatus::COMPLETED ||
           status == WorkUnitStatus::FAILED ||
           status == WorkUnitStatus::CANCELLED;
}

bool is_valid_transition(WorkUnitStatus from, WorkUnitStatus to);

/**
 * @brief Request category, used for kind-based routing
 */
enum class WorkKind {
    USER_REQUEST,
    SCHEDULED_JOB,
    DELEGATED_TASK,
    BACKGROUND_TASK
};

inline std::string kind_to_string(WorkKind kind) {
    switch (kind) {
        case WorkKind::USER_REQUEST: return "user_request";
        case WorkKind::SCHEDULED_JOB: return "scheduled_job";
        case WorkKind::DELEGATED_TASK: return "delegated_task";
        case WorkKind::BACKGROUND_TASK: return "background_task";
        default: return "unknown";
    }
}

/**
 * @throws std::invalid_argument For unknown kind names
 */
WorkKind kind_from_string(const std::string& name);

class InvalidTransitionError : public std::logic_error {
public:
    InvalidTransitionError(WorkUnitStatus from, WorkUnitStatus to)
        : std::logic_error("Invalid work unit transition: " + status_to_string(from) +
                           " -> " + status_to_string(to)) {}
};

struct TraceStep {
    std::string handler;
    std::string event;    ///< "routed", "handler_completed", "delegated", ...
    std::string detail;
    std::chrono::system_clock::time_point at;
};

/**
 * @brief Output of a successful handler somewhere in a unit's delegation subtree
 */
struct PartialOutput {
    std::string work_unit_id;
    std::string handler;
    nlohmann::json output;
};

/**
 * @brief A delegation that was aborted without failing the delegating unit
 */
struct DelegationFailure {
    std::string work_unit_id;   ///< The rejected child unit
    std::string target;         ///< Hint or resolved handler of the child
    ErrorCode code;
    std::string message;
};

struct WorkUnitError {
    ErrorCode code;
    std::string message;
};

struct WorkUnit {
    std::string id;
    WorkKind kind;
    WorkUnitStatus status;
    nlohmann::json input;
    std::optional<nlohmann::json> output;     ///< Set once terminal (may carry partial output on failure)
    std::optional<std::string> parent_id;
    std::string conversation_id;
    std::string handler;                       ///< Resolved handler, empty until routed
    nlohmann::json state;                      ///< Conversation state loaded by middleware
    double cost;
    std::vector<TraceStep> trace;
    std::vector<PartialOutput> partial_outputs;
    std::vector<DelegationFailure> delegation_failures;
    std::optional<WorkUnitError> error;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;

    WorkUnit();

    /**
     * @brief Create a pending root unit with a fresh id
     */
    static WorkUnit create(WorkKind kind, nlohmann::json input, const std::string& conversation_id = "");

    /**
     * @brief Create a pending child unit in the same conversation
     */
    WorkUnit spawn_child(WorkKind child_kind, nlohmann::json child_input) const;

    bool is_terminal() const { return taskweave::is_terminal(status); }

    /**
     * @throws InvalidTransitionError When the move is not allowed by the state machine
     */
    void transition_to(WorkUnitStatus next);

    void complete(nlohmann::json result);
    void fail(ErrorCode code, const std::string& message);

    /**
     * @brief Move to CANCELLED, recording why (CANCELLED, APPROVAL_REJECTED, ...)
     */
    void cancel(ErrorCode code, const std::string& message);

    void add_trace(const std::string& step_handler, const std::string& event, const std::string& detail = "");

    double duration_ms() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Concatenate every string value in a payload, space separated
 *
 * Used by safety checks and keyword routing to scan inputs of any shape.
 */
std::string flatten_text(const nlohmann::json& payload);

} // namespace taskweave

#endif // TASKWEAVE_WORK_UNIT_HPP
