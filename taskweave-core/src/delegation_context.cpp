/**
 * @file delegation_context.cpp
 * @brief Implementation of DelegationContext, BudgetLedger and CancellationToken
 */

#include "delegation_context.hpp"
#include "context_propagator.hpp"
#include <limits>

namespace taskweave {

BudgetLedger::BudgetLedger(double limit)
    : limit_(limit), spent_(0.0) {}

double BudgetLedger::charge(double amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    spent_ += amount;
    return limit_ - spent_;
}

double BudgetLedger::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_ - spent_;
}

double BudgetLedger::spent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spent_;
}

void CancellationToken::cancel(ErrorCode reason) {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    if (!cancelled_.load()) {
        // Reason first: a reader that sees the flag must see its reason
        reason_.store(reason);
        cancelled_.store(true);
    }
}

bool CancellationToken::is_cancelled() const {
    if (cancelled_.load()) {
        return true;
    }
    return parent_ && parent_->is_cancelled();
}

ErrorCode CancellationToken::reason() const {
    if (parent_ && parent_->is_cancelled()) {
        return parent_->reason();
    }
    return reason_.load();
}

DelegationContext::DelegationContext()
    : depth(0),
      deadline(std::chrono::system_clock::time_point::max()) {}

DelegationContext DelegationContext::root(double budget_limit,
                                          std::chrono::milliseconds deadline_in,
                                          const std::string& correlation) {
    DelegationContext ctx;
    ctx.budget = std::make_shared<BudgetLedger>(budget_limit);
    ctx.cancellation = std::make_shared<CancellationToken>();
    ctx.correlation_id = correlation.empty() ? ContextPropagator::generate_id() : correlation;
    if (deadline_in.count() > 0) {
        ctx.deadline = std::chrono::system_clock::now() + deadline_in;
    }
    return ctx;
}

DelegationContext DelegationContext::descend(const std::string& handler) const {
    DelegationContext child = *this;
    child.depth = depth + 1;
    child.visited_handlers.insert(handler);
    return child;
}

double DelegationContext::budget_remaining() const {
    return budget ? budget->remaining() : std::numeric_limits<double>::infinity();
}

bool DelegationContext::deadline_passed() const {
    return std::chrono::system_clock::now() >= deadline;
}

bool DelegationContext::is_cancelled() const {
    return cancellation && cancellation->is_cancelled();
}

void DelegationContext::check_active() const {
    if (is_cancelled()) {
        ErrorCode reason = cancellation->reason();
        if (reason == ErrorCode::SHUTDOWN_INTERRUPTED) {
            throw ShutdownInterruptedError("Interrupted by engine shutdown");
        }
        if (reason == ErrorCode::BUDGET_EXCEEDED) {
            throw CancelledError("Cancelled after a sibling exceeded the budget");
        }
        throw CancelledError("Request cancelled");
    }
    if (deadline_passed()) {
        throw DeadlineExceededError("Request deadline passed");
    }
}

} // namespace taskweave
