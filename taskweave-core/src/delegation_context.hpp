/**
 * @file delegation_context.hpp
 * @brief Guard rails that travel with a request through nested delegation
 *
 * The context is copied downward on every delegation (descend) while the
 * budget ledger and cancellation token are shared by the whole tree, so a cost
 * charged deep in the tree is visible to every sibling and a cancel at the
 * root reaches every descendant.
 */

#ifndef TASKWEAVE_DELEGATION_CONTEXT_HPP
#define TASKWEAVE_DELEGATION_CONTEXT_HPP

#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace taskweave {

/**
 * @brief Shared, thread-safe budget for one request tree
 */
class BudgetLedger {
public:
    explicit BudgetLedger(double limit);

    /**
     * @brief Charge a cost and return what remains (may go negative)
     */
    double charge(double amount);

    double remaining() const;
    double spent() const;
    double limit() const { return limit_; }

    /**
     * @brief True once nothing remains for further delegations
     */
    bool exhausted() const { return remaining() <= 0.0; }

private:
    const double limit_;
    mutable std::mutex mutex_;
    double spent_;
};

/**
 * @brief Cooperative cancellation flag, optionally chained to a parent
 *
 * A token reports cancelled when it or any ancestor was cancelled. The first
 * reason recorded along the chain wins.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false), reason_(ErrorCode::CANCELLED) {}
    explicit CancellationToken(std::shared_ptr<CancellationToken> parent)
        : parent_(std::move(parent)), cancelled_(false), reason_(ErrorCode::CANCELLED) {}

    void cancel(ErrorCode reason = ErrorCode::CANCELLED);
    bool is_cancelled() const;
    ErrorCode reason() const;

private:
    std::shared_ptr<CancellationToken> parent_;
    std::mutex cancel_mutex_;
    std::atomic<bool> cancelled_;
    std::atomic<ErrorCode> reason_;
};

struct DelegationContext {
    int depth;                                         ///< 0 at intake, +1 per handler invocation
    std::set<std::string> visited_handlers;            ///< Handlers on the current path
    std::shared_ptr<BudgetLedger> budget;              ///< Shared by the whole tree
    std::string correlation_id;
    std::chrono::system_clock::time_point deadline;    ///< time_point::max() when unbounded
    std::shared_ptr<CancellationToken> cancellation;   ///< Shared by the whole tree

    DelegationContext();

    /**
     * @brief Fresh context for a new request
     *
     * @param budget_limit Budget for the whole tree
     * @param deadline_in Time allowed from now, 0 for no deadline
     * @param correlation Correlation id, generated when empty
     */
    static DelegationContext root(double budget_limit,
                                  std::chrono::milliseconds deadline_in,
                                  const std::string& correlation = "");

    /**
     * @brief Context for the invocation of a handler one level deeper
     */
    DelegationContext descend(const std::string& handler) const;

    bool has_visited(const std::string& handler) const {
        return visited_handlers.count(handler) > 0;
    }

    double budget_remaining() const;
    bool deadline_passed() const;
    bool is_cancelled() const;

    /**
     * @brief Throw if the tree was cancelled or its deadline passed
     *
     * @throws CancelledError, ShutdownInterruptedError or DeadlineExceededError
     */
    void check_active() const;
};

} // namespace taskweave

#endif // TASKWEAVE_DELEGATION_CONTEXT_HPP
