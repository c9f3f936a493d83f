/**
 * @file approval_gate.hpp
 * @brief Human-in-the-loop suspension point for work units
 *
 * A unit whose handler asks for approval is parked in AWAITING_APPROVAL until
 * an external approve/reject arrives, the request is cancelled, or the
 * deadline passes. Decisions can arrive before the waiter starts waiting;
 * they are kept until consumed.
 */

#ifndef TASKWEAVE_APPROVAL_GATE_HPP
#define TASKWEAVE_APPROVAL_GATE_HPP

#include "delegation_context.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

enum class ApprovalDecision {
    APPROVED,
    REJECTED,
    CANCELLED,
    TIMED_OUT
};

inline std::string decision_to_string(ApprovalDecision decision) {
    switch (decision) {
        case ApprovalDecision::APPROVED: return "approved";
        case ApprovalDecision::REJECTED: return "rejected";
        case ApprovalDecision::CANCELLED: return "cancelled";
        case ApprovalDecision::TIMED_OUT: return "timed_out";
        default: return "unknown";
    }
}

class ApprovalGate {
public:
    /**
     * @brief Register a unit as waiting for a decision
     */
    void open(const std::string& work_unit_id);

    /**
     * @brief Block until a decision, cancellation, or the deadline
     *
     * The pending entry is removed on return.
     */
    ApprovalDecision wait(const std::string& work_unit_id,
                          std::chrono::system_clock::time_point deadline,
                          const CancellationToken* cancellation);

    /**
     * @return false if the unit is not awaiting approval
     */
    bool approve(const std::string& work_unit_id);

    /**
     * @return false if the unit is not awaiting approval
     */
    bool reject(const std::string& work_unit_id);

    std::vector<std::string> pending() const;

private:
    bool decide(const std::string& work_unit_id, ApprovalDecision decision);

    mutable std::mutex mutex_;
    std::condition_variable decided_;
    std::map<std::string, std::optional<ApprovalDecision>> waiting_;
};

} // namespace taskweave

#endif // TASKWEAVE_APPROVAL_GATE_HPP
