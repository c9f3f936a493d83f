/**
 * @file coordinator.hpp
 * @brief Drives work units through routing, middleware, handlers and delegation
 *
 * handle() never throws: every failure ends up encoded on the returned unit,
 * which is always terminal. Guard rails enforced on every delegation:
 * - depth: invoking a handler at depth > max_delegation_depth is rejected
 * - cycles: a handler already on the path is rejected
 * - budget: no new delegation once the shared budget is exhausted; a handler
 *   whose cost drives it below zero fails with BudgetExceeded
 * - deadline and cancellation: checked before every step
 *
 * Depth, cycle, budget and most child failures abort only that delegation:
 * the delegating unit still completes, with the failure listed in
 * delegation_failures and every successful output of its subtree in
 * partial_outputs. DeadlineExceeded, cancellation and shutdown abort the
 * whole tree.
 *
 * Multiple delegations from one handler run concurrently, each on its own
 * thread with the caller's ambient context.
 */

#ifndef TASKWEAVE_COORDINATOR_HPP
#define TASKWEAVE_COORDINATOR_HPP

#include "approval_gate.hpp"
#include "delegation_context.hpp"
#include "handler_registry.hpp"
#include "middleware_chain.hpp"
#include "observability.hpp"
#include "router.hpp"
#include "work_unit.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

struct CoordinatorConfig {
    int max_delegation_depth;
    bool cancel_siblings_on_budget_exceeded;     ///< Stop concurrent siblings once one overspends
    std::chrono::milliseconds approval_timeout;  ///< 0: bounded by the request deadline only
    size_t ledger_capacity;                      ///< Terminal records kept for replay

    CoordinatorConfig()
        : max_delegation_depth(5),
          cancel_siblings_on_budget_exceeded(false),
          approval_timeout(0),
          ledger_capacity(10000) {}
};

/**
 * @brief Record of terminal work units, keyed by id
 *
 * The first terminal record for an id wins; later commits are ignored. This
 * makes replaying a unit idempotent and keeps a shutdown interruption from
 * being overwritten by a handler that finishes afterwards. Once capacity is
 * reached the oldest record is evicted, so replay protection covers the most
 * recent `capacity` units only.
 */
class WorkUnitLedger {
public:
    explicit WorkUnitLedger(size_t capacity = 10000);

    /**
     * @return false if a terminal record for this id already exists
     */
    bool commit(const WorkUnit& unit);

    std::optional<WorkUnit> find(const std::string& id) const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t evicted_count() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::map<std::string, WorkUnit> records_;
    std::deque<std::string> order_;  ///< Insertion order, oldest first
    size_t evicted_;
};

class Coordinator {
public:
    Coordinator(const HandlerRegistry& handlers, const Router& router, const MiddlewareChain& chain,
                EventEmitter& events, CoordinatorConfig config);

    /**
     * @brief Compose the middleware chain around every registered handler
     *
     * Handlers registered later are composed on first use.
     */
    void prepare();

    /**
     * @brief Route and run a unit to completion
     *
     * Replaying a unit whose id already has a terminal record returns that
     * record without running anything. A unit whose id is still running is
     * refused with DuplicateInFlight and leaves the running one untouched.
     */
    WorkUnit handle(WorkUnit unit, DelegationContext context);

    /**
     * @brief Run a unit on a named handler, bypassing routing
     */
    WorkUnit handle_direct(WorkUnit unit, const std::string& handler, DelegationContext context);

    /**
     * @brief Cancel an in-flight request tree by its root unit id
     */
    bool cancel(const std::string& root_id);

    bool approve(const std::string& work_unit_id);
    bool reject(const std::string& work_unit_id);
    std::vector<std::string> awaiting_approval() const;

    void stop_accepting();
    bool is_accepting() const { return accepting_.load(); }

    size_t in_flight_count() const;

    /**
     * @return true if every in-flight request finished within the timeout
     */
    bool wait_for_drain(std::chrono::milliseconds timeout);

    /**
     * @brief Cancel everything still running and record it as ShutdownInterrupted
     *
     * @return The interrupted root units as recorded in the ledger
     */
    std::vector<WorkUnit> interrupt_in_flight(const std::string& reason);

    const WorkUnitLedger& ledger() const { return ledger_; }
    const CoordinatorConfig& config() const { return config_; }

private:
    struct ActiveRequest {
        WorkUnit snapshot;
        std::shared_ptr<CancellationToken> cancellation;
    };

    WorkUnit run_root(WorkUnit unit, DelegationContext context, const std::string& forced_handler);
    void process(WorkUnit& unit, const DelegationContext& context,
                 const std::string& hint, const std::string& forced_handler);
    void execute(WorkUnit& unit, const DelegationContext& context,
                 const std::string& hint, const std::string& forced_handler);
    void await_approval(WorkUnit& unit, const DelegationContext& context);
    void run_delegations(WorkUnit& parent, const DelegationContext& context,
                         const std::vector<DelegationRequest>& requests);
    bool admit_delegation(WorkUnit& parent, const DelegationContext& context, const DelegationRequest& request);
    void merge_child(WorkUnit& parent, const WorkUnit& child, const DelegationRequest& request,
                     const DelegationContext& context);
    void record_delegation_failure(WorkUnit& parent, const std::string& child_id, const std::string& target,
                                   ErrorCode code, const std::string& message);
    void settle(WorkUnit& unit, ErrorCode code, const std::string& message);

    Invocation invocation_for(const std::string& handler);

    enum class Admission { TRACKED, NOT_ACCEPTING, DUPLICATE };

    Admission try_track(const WorkUnit& unit, std::shared_ptr<CancellationToken> cancellation);
    void update_snapshot(const WorkUnit& unit);
    void untrack(const std::string& id);

    void emit(const WorkUnit& unit, const std::string& name, const std::string& outcome,
              LogLevel level, std::map<std::string, std::string> attributes = {}, double duration_ms = 0.0);

    const HandlerRegistry& handlers_;
    const Router& router_;
    const MiddlewareChain& chain_;
    EventEmitter& events_;
    CoordinatorConfig config_;

    std::atomic<bool> accepting_;
    mutable std::mutex active_mutex_;
    std::condition_variable drained_;
    std::map<std::string, ActiveRequest> active_;

    std::mutex compose_mutex_;
    std::map<std::string, Invocation> composed_;

    ApprovalGate approvals_;
    WorkUnitLedger ledger_;
};

} // namespace taskweave

#endif // TASKWEAVE_COORDINATOR_HPP
