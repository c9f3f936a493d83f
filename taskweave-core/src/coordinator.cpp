/**
 * @file coordinator.cpp
 * @brief Implementation of Coordinator and WorkUnitLedger
 */

#include "coordinator.hpp"
#include "context_propagator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <future>

namespace taskweave {

// ---------------------------------------------------------------------------
// WorkUnitLedger
// ---------------------------------------------------------------------------

WorkUnitLedger::WorkUnitLedger(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)), evicted_(0) {}

bool WorkUnitLedger::commit(const WorkUnit& unit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(unit.id);
    if (it != records_.end()) {
        if (it->second.is_terminal()) {
            return false;
        }
        it->second = unit;
        return true;
    }

    while (records_.size() >= capacity_ && !order_.empty()) {
        records_.erase(order_.front());
        order_.pop_front();
        ++evicted_;
    }
    records_.emplace(unit.id, unit);
    order_.push_back(unit.id);
    return true;
}

size_t WorkUnitLedger::evicted_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

std::optional<WorkUnit> WorkUnitLedger::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t WorkUnitLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

// ---------------------------------------------------------------------------
// Coordinator
// ---------------------------------------------------------------------------

Coordinator::Coordinator(const HandlerRegistry& handlers, const Router& router, const MiddlewareChain& chain,
                         EventEmitter& events, CoordinatorConfig config)
    : handlers_(handlers),
      router_(router),
      chain_(chain),
      events_(events),
      config_(config),
      accepting_(true),
      ledger_(config.ledger_capacity) {}

void Coordinator::prepare() {
    for (const auto& name : handlers_.list_handler_names()) {
        invocation_for(name);
    }
}

WorkUnit Coordinator::handle(WorkUnit unit, DelegationContext context) {
    return run_root(std::move(unit), std::move(context), "");
}

WorkUnit Coordinator::handle_direct(WorkUnit unit, const std::string& handler, DelegationContext context) {
    return run_root(std::move(unit), std::move(context), handler);
}

WorkUnit Coordinator::run_root(WorkUnit unit, DelegationContext context, const std::string& forced_handler) {
    if (auto stored = ledger_.find(unit.id); stored && stored->is_terminal()) {
        emit(*stored, "work_unit_replayed", status_to_string(stored->status), LogLevel::INFO);
        return *stored;
    }
    if (unit.is_terminal()) {
        return unit;
    }

    if (!context.cancellation) {
        context.cancellation = std::make_shared<CancellationToken>();
    }
    if (context.correlation_id.empty()) {
        const auto& ambient = ContextPropagator::current();
        context.correlation_id = ambient.correlation_id.empty() ? ContextPropagator::generate_id()
                                                                : ambient.correlation_id;
    }

    PropagationToken token = ContextPropagator::capture();
    token.correlation_id = context.correlation_id;
    token.fields["work_unit_id"] = unit.id;
    if (!unit.conversation_id.empty()) {
        token.fields["conversation_id"] = unit.conversation_id;
    }
    ScopedContext scope = ContextPropagator::restore(token);

    switch (try_track(unit, context.cancellation)) {
        case Admission::TRACKED:
            break;
        case Admission::NOT_ACCEPTING:
            settle(unit, ErrorCode::SHUTDOWN_INTERRUPTED, "Engine is shutting down; new work is not accepted");
            ledger_.commit(unit);
            emit(unit, "work_unit_rejected", "shutting_down", LogLevel::WARN);
            return unit;
        case Admission::DUPLICATE:
            // Not committed: the ledger record belongs to the run already in flight
            unit.fail(ErrorCode::DUPLICATE_IN_FLIGHT, "Work unit " + unit.id + " is already running");
            emit(unit, "work_unit_rejected", "duplicate_in_flight", LogLevel::WARN);
            return unit;
    }

    process(unit, context, "", forced_handler);
    untrack(unit.id);

    if (!ledger_.commit(unit)) {
        // Interrupted by shutdown while running; the interruption record stands
        if (auto stored = ledger_.find(unit.id)) {
            return *stored;
        }
    }
    return unit;
}

void Coordinator::process(WorkUnit& unit, const DelegationContext& context,
                          const std::string& hint, const std::string& forced_handler) {
    auto start = std::chrono::steady_clock::now();
    try {
        execute(unit, context, hint, forced_handler);
    } catch (const TaskweaveError& e) {
        settle(unit, e.code(), e.what());
    } catch (const std::exception& e) {
        settle(unit, ErrorCode::HANDLER_FAILED, e.what());
    }

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    std::map<std::string, std::string> attributes;
    attributes["handler"] = unit.handler;
    attributes["depth"] = std::to_string(context.depth + 1);
    attributes["cost"] = std::to_string(unit.cost);
    attributes["budget_remaining"] = std::to_string(context.budget_remaining());
    LogLevel level = LogLevel::INFO;
    if (unit.error) {
        attributes["error_code"] = error_code_to_string(unit.error->code);
        attributes["error"] = unit.error->message;
        level = unit.status == WorkUnitStatus::FAILED ? LogLevel::ERROR : LogLevel::WARN;
    }
    if (unit.parent_id) {
        attributes["parent_id"] = *unit.parent_id;
    }
    emit(unit, "work_unit_" + status_to_string(unit.status), status_to_string(unit.status),
         level, attributes, duration);
}

void Coordinator::execute(WorkUnit& unit, const DelegationContext& context,
                          const std::string& hint, const std::string& forced_handler) {
    context.check_active();

    int next_depth = context.depth + 1;
    if (next_depth > config_.max_delegation_depth) {
        throw DelegationDepthExceededError(next_depth, config_.max_delegation_depth);
    }

    RoutingDecision decision;
    if (!forced_handler.empty()) {
        if (!handlers_.is_registered(forced_handler)) {
            throw ConfigurationError("Unknown handler: " + forced_handler);
        }
        decision = RoutingDecision{forced_handler, "direct"};
    } else {
        decision = router_.resolve(unit, hint);
    }

    if (context.has_visited(decision.handler)) {
        throw DelegationCycleDetectedError(decision.handler);
    }

    unit.handler = decision.handler;
    unit.add_trace(decision.handler, "routed", decision.rule);
    unit.transition_to(WorkUnitStatus::RUNNING);
    update_snapshot(unit);

    DelegationContext invocation_context = context.descend(decision.handler);
    ExecutionFrame frame(unit, invocation_context, decision.handler);
    invocation_for(decision.handler)(frame);

    if (!frame.result) {
        throw TaskweaveError(ErrorCode::INTERNAL, "Handler " + decision.handler + " produced no result");
    }
    const HandlerResult& result = *frame.result;
    unit.add_trace(decision.handler, "handler_completed", frame.output_valid ? "" : "contract_violation");

    if (frame.budget_exceeded) {
        throw BudgetExceededError("Cost of handler " + decision.handler + " exceeded the budget (remaining " +
                                  std::to_string(invocation_context.budget_remaining()) + ")");
    }
    invocation_context.check_active();

    // Kept on the unit even if a later step fails
    unit.output = result.output;
    unit.partial_outputs.insert(unit.partial_outputs.begin(),
                                PartialOutput{unit.id, decision.handler, result.output});

    if (result.requires_approval) {
        await_approval(unit, invocation_context);
    }

    run_delegations(unit, invocation_context, result.delegations);

    unit.complete(result.output);
}

void Coordinator::await_approval(WorkUnit& unit, const DelegationContext& context) {
    approvals_.open(unit.id);
    unit.transition_to(WorkUnitStatus::AWAITING_APPROVAL);
    update_snapshot(unit);
    emit(unit, "approval_requested", "waiting", LogLevel::INFO, {{"handler", unit.handler}});

    auto deadline = context.deadline;
    if (config_.approval_timeout.count() > 0) {
        deadline = std::min(deadline, std::chrono::system_clock::now() + config_.approval_timeout);
    }

    ApprovalDecision decision = approvals_.wait(unit.id, deadline, context.cancellation.get());
    emit(unit, "approval_decided", decision_to_string(decision), LogLevel::INFO);

    switch (decision) {
        case ApprovalDecision::APPROVED:
            unit.transition_to(WorkUnitStatus::RUNNING);
            update_snapshot(unit);
            unit.add_trace(unit.handler, "approved");
            return;
        case ApprovalDecision::REJECTED:
            throw ApprovalRejectedError(unit.id);
        case ApprovalDecision::CANCELLED:
            context.check_active();
            throw CancelledError("Request cancelled while awaiting approval");
        case ApprovalDecision::TIMED_OUT:
            throw DeadlineExceededError("No approval decision before the deadline");
    }
}

bool Coordinator::admit_delegation(WorkUnit& parent, const DelegationContext& context,
                                   const DelegationRequest& request) {
    context.check_active();
    if (context.budget && context.budget->exhausted()) {
        record_delegation_failure(parent, "", request.target_hint, ErrorCode::BUDGET_EXCEEDED,
                                  "Budget exhausted before delegation (remaining " +
                                  std::to_string(context.budget->remaining()) + ")");
        return false;
    }
    return true;
}

void Coordinator::run_delegations(WorkUnit& parent, const DelegationContext& context,
                                  const std::vector<DelegationRequest>& requests) {
    if (requests.empty()) {
        return;
    }

    if (requests.size() == 1) {
        const DelegationRequest& request = requests.front();
        if (!admit_delegation(parent, context, request)) {
            return;
        }
        WorkUnit child = parent.spawn_child(request.kind, request.input);
        emit(child, "delegation", "issued", LogLevel::DEBUG,
             {{"parent_id", parent.id}, {"target", request.target_hint}});
        process(child, context, request.target_hint, "");
        merge_child(parent, child, request, context);
        return;
    }

    // Siblings share a group token so one overspending sibling can stop the rest
    auto group = std::make_shared<CancellationToken>(context.cancellation);
    DelegationContext group_context = context;
    group_context.cancellation = group;

    std::vector<const DelegationRequest*> launched;
    std::vector<std::future<WorkUnit>> futures;
    for (const auto& request : requests) {
        if (context.is_cancelled() || context.deadline_passed()) {
            break;
        }
        if (group->is_cancelled()) {
            record_delegation_failure(parent, "", request.target_hint, ErrorCode::CANCELLED,
                                      "Not issued: a sibling exceeded the budget");
            continue;
        }
        if (context.budget && context.budget->exhausted()) {
            record_delegation_failure(parent, "", request.target_hint, ErrorCode::BUDGET_EXCEEDED,
                                      "Budget exhausted before delegation (remaining " +
                                      std::to_string(context.budget->remaining()) + ")");
            continue;
        }

        WorkUnit child = parent.spawn_child(request.kind, request.input);
        emit(child, "delegation", "issued", LogLevel::DEBUG,
             {{"parent_id", parent.id}, {"target", request.target_hint}, {"concurrent", "true"}});

        std::string hint = request.target_hint;
        bool cancel_siblings = config_.cancel_siblings_on_budget_exceeded;
        launched.push_back(&request);
        futures.push_back(propagating_async(
            [this, child, group_context, hint, group, cancel_siblings]() mutable {
                process(child, group_context, hint, "");
                if (cancel_siblings && child.error && child.error->code == ErrorCode::BUDGET_EXCEEDED) {
                    group->cancel(ErrorCode::BUDGET_EXCEEDED);
                }
                return child;
            }));
    }

    std::vector<WorkUnit> children;
    children.reserve(futures.size());
    for (auto& future : futures) {
        children.push_back(future.get());
    }

    context.check_active();
    for (size_t i = 0; i < children.size(); ++i) {
        merge_child(parent, children[i], *launched[i], context);
    }
}

void Coordinator::merge_child(WorkUnit& parent, const WorkUnit& child, const DelegationRequest& request,
                              const DelegationContext& context) {
    const std::string target = child.handler.empty() ? request.target_hint : child.handler;
    parent.cost += child.cost;
    parent.add_trace(target, "delegated", status_to_string(child.status));
    parent.partial_outputs.insert(parent.partial_outputs.end(),
                                  child.partial_outputs.begin(), child.partial_outputs.end());
    parent.delegation_failures.insert(parent.delegation_failures.end(),
                                      child.delegation_failures.begin(), child.delegation_failures.end());

    if (child.status == WorkUnitStatus::COMPLETED) {
        return;
    }

    ErrorCode code = child.error ? child.error->code : ErrorCode::INTERNAL;
    std::string message = child.error ? child.error->message : "Delegation ended without a result";

    switch (code) {
        case ErrorCode::DEADLINE_EXCEEDED:
            throw DeadlineExceededError(message);
        case ErrorCode::SHUTDOWN_INTERRUPTED:
            throw ShutdownInterruptedError(message);
        case ErrorCode::CANCELLED:
            context.check_active();   // the whole tree was cancelled
            break;                    // only the sibling group was cancelled
        default:
            break;
    }
    record_delegation_failure(parent, child.id, target, code, message);
}

void Coordinator::record_delegation_failure(WorkUnit& parent, const std::string& child_id,
                                            const std::string& target, ErrorCode code,
                                            const std::string& message) {
    parent.delegation_failures.push_back(DelegationFailure{child_id, target, code, message});
    emit(parent, "delegation_rejected", error_code_to_string(code),
         is_delegation_scoped(code) ? LogLevel::WARN : LogLevel::ERROR,
         {{"child_id", child_id}, {"target", target}, {"error", message}});
}

void Coordinator::settle(WorkUnit& unit, ErrorCode code, const std::string& message) {
    if (unit.is_terminal()) {
        return;
    }
    if (code == ErrorCode::CANCELLED || code == ErrorCode::APPROVAL_REJECTED) {
        unit.cancel(code, message);
    } else {
        unit.fail(code, message);
    }
    update_snapshot(unit);
}

Invocation Coordinator::invocation_for(const std::string& handler) {
    std::lock_guard<std::mutex> lock(compose_mutex_);
    auto it = composed_.find(handler);
    if (it != composed_.end()) {
        return it->second;
    }
    Invocation invocation = chain_.compose(handlers_.get_handler(handler));
    composed_.emplace(handler, invocation);
    return invocation;
}

bool Coordinator::cancel(const std::string& root_id) {
    std::lock_guard<std::mutex> lock(active_mutex_);
    auto it = active_.find(root_id);
    if (it == active_.end()) {
        return false;
    }
    it->second.cancellation->cancel(ErrorCode::CANCELLED);
    return true;
}

bool Coordinator::approve(const std::string& work_unit_id) {
    return approvals_.approve(work_unit_id);
}

bool Coordinator::reject(const std::string& work_unit_id) {
    return approvals_.reject(work_unit_id);
}

std::vector<std::string> Coordinator::awaiting_approval() const {
    return approvals_.pending();
}

void Coordinator::stop_accepting() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    accepting_.store(false);
}

size_t Coordinator::in_flight_count() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_.size();
}

bool Coordinator::wait_for_drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(active_mutex_);
    return drained_.wait_for(lock, timeout, [this]() { return active_.empty(); });
}

std::vector<WorkUnit> Coordinator::interrupt_in_flight(const std::string& reason) {
    std::vector<WorkUnit> interrupted;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        for (auto& [id, active] : active_) {
            active.cancellation->cancel(ErrorCode::SHUTDOWN_INTERRUPTED);
            WorkUnit record = active.snapshot;
            if (!record.is_terminal()) {
                record.fail(ErrorCode::SHUTDOWN_INTERRUPTED, reason);
            }
            ledger_.commit(record);
            if (auto stored = ledger_.find(id)) {
                interrupted.push_back(*stored);
            }
        }
    }
    for (const auto& unit : interrupted) {
        emit(unit, "work_unit_interrupted", status_to_string(unit.status), LogLevel::WARN, {{"reason", reason}});
    }
    return interrupted;
}

Coordinator::Admission Coordinator::try_track(const WorkUnit& unit,
                                              std::shared_ptr<CancellationToken> cancellation) {
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (!accepting_.load()) {
        return Admission::NOT_ACCEPTING;
    }
    if (!active_.emplace(unit.id, ActiveRequest{unit, std::move(cancellation)}).second) {
        return Admission::DUPLICATE;
    }
    return Admission::TRACKED;
}

void Coordinator::update_snapshot(const WorkUnit& unit) {
    std::lock_guard<std::mutex> lock(active_mutex_);
    auto it = active_.find(unit.id);
    if (it != active_.end()) {
        it->second.snapshot = unit;
    }
}

void Coordinator::untrack(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_.erase(id);
    }
    drained_.notify_all();
}

void Coordinator::emit(const WorkUnit& unit, const std::string& name, const std::string& outcome,
                       LogLevel level, std::map<std::string, std::string> attributes, double duration_ms) {
    ObservabilityEvent event(name, outcome);
    event.level = level;
    event.work_unit_id = unit.id;
    event.conversation_id = unit.conversation_id;
    event.duration_ms = duration_ms;
    event.attributes = std::move(attributes);
    events_.emit(event);
}

} // namespace taskweave
