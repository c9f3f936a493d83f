/**
 * @file approval_gate.cpp
 * @brief Implementation of ApprovalGate
 */

#include "approval_gate.hpp"
#include <algorithm>

namespace taskweave {

namespace {
// Cancellation is a flag, not a notification; poll it at this interval
constexpr std::chrono::milliseconds kCancellationPoll(10);
}

void ApprovalGate::open(const std::string& work_unit_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    waiting_.emplace(work_unit_id, std::nullopt);
}

ApprovalDecision ApprovalGate::wait(const std::string& work_unit_id,
                                    std::chrono::system_clock::time_point deadline,
                                    const CancellationToken* cancellation) {
    std::unique_lock<std::mutex> lock(mutex_);
    waiting_.emplace(work_unit_id, std::nullopt);

    while (true) {
        auto it = waiting_.find(work_unit_id);
        if (it->second) {
            ApprovalDecision decision = *it->second;
            waiting_.erase(it);
            return decision;
        }
        if (cancellation && cancellation->is_cancelled()) {
            waiting_.erase(it);
            return ApprovalDecision::CANCELLED;
        }
        auto now = std::chrono::system_clock::now();
        if (now >= deadline) {
            waiting_.erase(it);
            return ApprovalDecision::TIMED_OUT;
        }

        auto until_deadline = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        decided_.wait_for(lock, std::min(until_deadline + std::chrono::milliseconds(1), kCancellationPoll));
    }
}

bool ApprovalGate::approve(const std::string& work_unit_id) {
    return decide(work_unit_id, ApprovalDecision::APPROVED);
}

bool ApprovalGate::reject(const std::string& work_unit_id) {
    return decide(work_unit_id, ApprovalDecision::REJECTED);
}

bool ApprovalGate::decide(const std::string& work_unit_id, ApprovalDecision decision) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiting_.find(work_unit_id);
        if (it == waiting_.end() || it->second) {
            return false;
        }
        it->second = decision;
    }
    decided_.notify_all();
    return true;
}

std::vector<std::string> ApprovalGate::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, decision] : waiting_) {
        if (!decision) {
            ids.push_back(id);
        }
    }
    return ids;
}

} // namespace taskweave
