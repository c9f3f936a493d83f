/**
 * @file middleware_chain.hpp
 * @brief Fixed-order composition of cross-cutting stages around every handler
 *
 * Stage order is fixed and validated at construction:
 *
 *   safety_check -> state_load -> [handler] -> cost_accounting
 *                -> output_normalization -> state_save
 *
 * compose() wraps a handler once; the resulting Invocation is reused for every
 * work unit routed to that handler. The invariants per stage:
 * - A BEFORE stage that throws aborts the chain (only safety_check does so;
 *   the handler and all later stages never run).
 * - A handler exception is held while AFTER stages still run, then rethrown
 *   from the invocation.
 * - AFTER stage failures are recorded and logged but never roll back the
 *   handler's result.
 */

#ifndef TASKWEAVE_MIDDLEWARE_CHAIN_HPP
#define TASKWEAVE_MIDDLEWARE_CHAIN_HPP

#include "delegation_context.hpp"
#include "handler_interface.hpp"
#include "observability.hpp"
#include "work_unit.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

namespace stage_names {
constexpr const char* SAFETY_CHECK = "safety_check";
constexpr const char* STATE_LOAD = "state_load";
constexpr const char* COST_ACCOUNTING = "cost_accounting";
constexpr const char* OUTPUT_NORMALIZATION = "output_normalization";
constexpr const char* STATE_SAVE = "state_save";
} // namespace stage_names

/**
 * @brief Record of one stage run, kept on the frame for inspection
 */
struct MiddlewareOutcome {
    std::string stage_name;
    double duration_ms;
    bool success;
    std::optional<std::string> error;
};

/**
 * @brief Mutable state threaded through every stage of one invocation
 */
struct ExecutionFrame {
    WorkUnit& unit;
    const DelegationContext& context;
    std::string handler_name;

    std::optional<HandlerResult> result;   ///< Set when the handler returned
    std::exception_ptr handler_error;      ///< Set when the handler threw
    bool budget_exceeded;                  ///< Set by cost accounting
    bool output_valid;                     ///< Cleared by output normalization
    std::vector<std::string> contract_violations;
    std::vector<MiddlewareOutcome> outcomes;

    ExecutionFrame(WorkUnit& work_unit, const DelegationContext& ctx, std::string handler)
        : unit(work_unit), context(ctx), handler_name(std::move(handler)),
          budget_exceeded(false), output_valid(true) {}
};

enum class StagePhase {
    BEFORE_HANDLER,
    AFTER_HANDLER
};

/**
 * @brief One cross-cutting stage
 */
class IMiddlewareStage {
public:
    virtual ~IMiddlewareStage() = default;

    virtual std::string name() const = 0;
    virtual StagePhase phase() const = 0;

    /**
     * @brief Run the stage against a frame
     *
     * BEFORE stages throw to abort the chain. AFTER stages should recover
     * locally; anything they throw is recorded and swallowed by the chain.
     */
    virtual void run(ExecutionFrame& frame) = 0;
};

using Invocation = std::function<void(ExecutionFrame&)>;

class MiddlewareChain {
public:
    /**
     * @throws ConfigurationError If stages are missing, duplicated or out of order
     */
    MiddlewareChain(std::vector<std::unique_ptr<IMiddlewareStage>> stages, EventEmitter& events);

    /**
     * @brief Wrap a handler with every stage; called once per handler
     *
     * The returned invocation rethrows the handler's exception (if any) after
     * all AFTER stages ran, and propagates BEFORE-stage aborts as thrown.
     */
    Invocation compose(Handler handler) const;

    std::vector<std::string> stage_names() const;

    static const std::vector<std::string>& required_order();

private:
    Invocation wrap_before(IMiddlewareStage* stage, Invocation next) const;
    Invocation wrap_after(IMiddlewareStage* stage, Invocation inner) const;
    void record(ExecutionFrame& frame, const std::string& stage, double duration_ms,
                const std::string& outcome, const std::optional<std::string>& error) const;

    std::vector<std::unique_ptr<IMiddlewareStage>> stages_;
    EventEmitter& events_;
};

} // namespace taskweave

#endif // TASKWEAVE_MIDDLEWARE_CHAIN_HPP
