/**
 * @file middleware_chain.cpp
 * @brief Implementation of MiddlewareChain
 */

#include "middleware_chain.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <chrono>

namespace taskweave {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // anonymous namespace

const std::vector<std::string>& MiddlewareChain::required_order() {
    static const std::vector<std::string> order = {
        stage_names::SAFETY_CHECK,
        stage_names::STATE_LOAD,
        stage_names::COST_ACCOUNTING,
        stage_names::OUTPUT_NORMALIZATION,
        stage_names::STATE_SAVE
    };
    return order;
}

MiddlewareChain::MiddlewareChain(std::vector<std::unique_ptr<IMiddlewareStage>> stages, EventEmitter& events)
    : stages_(std::move(stages)), events_(events) {
    const auto& order = required_order();
    if (stages_.size() != order.size()) {
        throw ConfigurationError("Middleware chain needs exactly " + std::to_string(order.size()) +
                                 " stages, got " + std::to_string(stages_.size()));
    }
    for (size_t i = 0; i < stages_.size(); ++i) {
        if (!stages_[i]) {
            throw ConfigurationError("Middleware stage " + std::to_string(i) + " is null");
        }
        if (stages_[i]->name() != order[i]) {
            throw ConfigurationError("Middleware stage " + std::to_string(i) + " must be '" +
                                     order[i] + "', got '" + stages_[i]->name() + "'");
        }
        StagePhase expected = i < 2 ? StagePhase::BEFORE_HANDLER : StagePhase::AFTER_HANDLER;
        if (stages_[i]->phase() != expected) {
            throw ConfigurationError("Middleware stage '" + order[i] + "' declares the wrong phase");
        }
    }
}

std::vector<std::string> MiddlewareChain::stage_names() const {
    std::vector<std::string> names;
    for (const auto& stage : stages_) {
        names.push_back(stage->name());
    }
    return names;
}

Invocation MiddlewareChain::compose(Handler handler) const {
    Invocation inner = [handler](ExecutionFrame& frame) {
        try {
            frame.result = handler(frame.unit, frame.context);
        } catch (...) {
            // Held for the AFTER stages, rethrown by the outermost wrapper
            frame.handler_error = std::current_exception();
        }
    };

    for (const auto& stage : stages_) {
        if (stage->phase() == StagePhase::AFTER_HANDLER) {
            inner = wrap_after(stage.get(), std::move(inner));
        }
    }
    for (auto it = stages_.rbegin(); it != stages_.rend(); ++it) {
        if ((*it)->phase() == StagePhase::BEFORE_HANDLER) {
            inner = wrap_before(it->get(), std::move(inner));
        }
    }

    return [inner](ExecutionFrame& frame) {
        inner(frame);
        if (frame.handler_error) {
            std::rethrow_exception(frame.handler_error);
        }
    };
}

Invocation MiddlewareChain::wrap_before(IMiddlewareStage* stage, Invocation next) const {
    return [this, stage, next](ExecutionFrame& frame) {
        auto start = std::chrono::steady_clock::now();
        try {
            stage->run(frame);
        } catch (const BlockedInputError& e) {
            record(frame, stage->name(), elapsed_ms(start), "blocked", std::string(e.what()));
            throw;
        } catch (const std::exception& e) {
            record(frame, stage->name(), elapsed_ms(start), "failed", std::string(e.what()));
            throw;
        }
        record(frame, stage->name(), elapsed_ms(start), "ok", std::nullopt);
        next(frame);
    };
}

Invocation MiddlewareChain::wrap_after(IMiddlewareStage* stage, Invocation inner) const {
    return [this, stage, inner](ExecutionFrame& frame) {
        inner(frame);

        auto start = std::chrono::steady_clock::now();
        try {
            stage->run(frame);
        } catch (const std::exception& e) {
            Logger::get_instance().log_warning("middleware", "Stage failed after handler",
                {{"stage", stage->name()}, {"work_unit_id", frame.unit.id}, {"error", e.what()}});
            record(frame, stage->name(), elapsed_ms(start), "failed", std::string(e.what()));
            return;
        }
        record(frame, stage->name(), elapsed_ms(start), "ok", std::nullopt);
    };
}

void MiddlewareChain::record(ExecutionFrame& frame, const std::string& stage, double duration_ms,
                             const std::string& outcome, const std::optional<std::string>& error) const {
    frame.outcomes.push_back(MiddlewareOutcome{stage, duration_ms, !error.has_value(), error});

    ObservabilityEvent event("middleware." + stage, outcome);
    event.level = error ? LogLevel::WARN : LogLevel::DEBUG;
    event.work_unit_id = frame.unit.id;
    event.conversation_id = frame.unit.conversation_id;
    event.duration_ms = duration_ms;
    event.attributes["handler"] = frame.handler_name;
    if (error) {
        event.attributes["error"] = *error;
    }
    events_.emit(event);
}

} // namespace taskweave
