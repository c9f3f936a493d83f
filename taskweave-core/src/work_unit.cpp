/**
 * @file work_unit.cpp
 * @brief Implementation of WorkUnit and its state machine
 */

#include "work_unit.hpp"
#include "context_propagator.hpp"

namespace taskweave {

WorkUnitStatus status_from_string(const std::string& name) {
    static const WorkUnitStatus all_statuses[] = {
        WorkUnitStatus::PENDING, WorkUnitStatus::RUNNING, WorkUnitStatus::AWAITING_APPROVAL,
        WorkUnitStatus::COMPLETED, WorkUnitStatus::FAILED, WorkUnitStatus::CANCELLED
    };
    for (WorkUnitStatus status : all_statuses) {
        if (status_to_string(status) == name) {
            return status;
        }
    }
    throw std::invalid_argument("Unknown work unit status: " + name);
}

bool is_valid_transition(WorkUnitStatus from, WorkUnitStatus to) {
    switch (from) {
        case WorkUnitStatus::PENDING:
            return to == WorkUnitStatus::RUNNING ||
                   to == WorkUnitStatus::FAILED ||
                   to == WorkUnitStatus::CANCELLED;
        case WorkUnitStatus::RUNNING:
            return to == WorkUnitStatus::AWAITING_APPROVAL ||
                   to == WorkUnitStatus::COMPLETED ||
                   to == WorkUnitStatus::FAILED ||
                   to == WorkUnitStatus::CANCELLED;
        case WorkUnitStatus::AWAITING_APPROVAL:
            return to == WorkUnitStatus::RUNNING ||
                   to == WorkUnitStatus::FAILED ||
                   to == WorkUnitStatus::CANCELLED;
        default:
            return false;  // terminal
    }
}

WorkKind kind_from_string(const std::string& name) {
    if (name == "user_request") return WorkKind::USER_REQUEST;
    if (name == "scheduled_job") return WorkKind::SCHEDULED_JOB;
    if (name == "delegated_task") return WorkKind::DELEGATED_TASK;
    if (name == "background_task") return WorkKind::BACKGROUND_TASK;
    throw std::invalid_argument("Unknown work kind: " + name);
}

WorkUnit::WorkUnit()
    : kind(WorkKind::USER_REQUEST),
      status(WorkUnitStatus::PENDING),
      input(nlohmann::json::object()),
      state(nlohmann::json::object()),
      cost(0.0),
      created_at(std::chrono::system_clock::now()),
      updated_at(created_at) {}

WorkUnit WorkUnit::create(WorkKind kind, nlohmann::json input, const std::string& conversation_id) {
    WorkUnit unit;
    unit.id = ContextPropagator::generate_id();
    unit.kind = kind;
    unit.input = std::move(input);
    unit.conversation_id = conversation_id;
    return unit;
}

WorkUnit WorkUnit::spawn_child(WorkKind child_kind, nlohmann::json child_input) const {
    WorkUnit child = create(child_kind, std::move(child_input), conversation_id);
    child.parent_id = id;
    return child;
}

void WorkUnit::transition_to(WorkUnitStatus next) {
    if (!is_valid_transition(status, next)) {
        throw InvalidTransitionError(status, next);
    }
    status = next;
    updated_at = std::chrono::system_clock::now();
    if (taskweave::is_terminal(next)) {
        completed_at = updated_at;
    }
}

void WorkUnit::complete(nlohmann::json result) {
    transition_to(WorkUnitStatus::COMPLETED);
    output = std::move(result);
}

void WorkUnit::fail(ErrorCode code, const std::string& message) {
    transition_to(WorkUnitStatus::FAILED);
    error = WorkUnitError{code, message};
}

void WorkUnit::cancel(ErrorCode code, const std::string& message) {
    transition_to(WorkUnitStatus::CANCELLED);
    error = WorkUnitError{code, message};
}

void WorkUnit::add_trace(const std::string& step_handler, const std::string& event, const std::string& detail) {
    trace.push_back(TraceStep{step_handler, event, detail, std::chrono::system_clock::now()});
}

double WorkUnit::duration_ms() const {
    auto end = completed_at.value_or(std::chrono::system_clock::now());
    return std::chrono::duration<double, std::milli>(end - created_at).count();
}

namespace {

long long to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // anonymous namespace

nlohmann::json WorkUnit::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["kind"] = kind_to_string(kind);
    j["status"] = status_to_string(status);
    j["input"] = input;
    j["output"] = output ? *output : nlohmann::json(nullptr);
    j["parent_id"] = parent_id ? nlohmann::json(*parent_id) : nlohmann::json(nullptr);
    j["conversation_id"] = conversation_id;
    j["handler"] = handler;
    j["cost"] = cost;
    j["created_at_ms"] = to_epoch_ms(created_at);
    j["updated_at_ms"] = to_epoch_ms(updated_at);
    j["duration_ms"] = duration_ms();

    if (error) {
        j["error"] = {{"code", error_code_to_string(error->code)}, {"message", error->message}};
    }

    nlohmann::json trace_json = nlohmann::json::array();
    for (const auto& step : trace) {
        trace_json.push_back({{"handler", step.handler}, {"event", step.event},
                              {"detail", step.detail}, {"at_ms", to_epoch_ms(step.at)}});
    }
    j["trace"] = trace_json;

    nlohmann::json partials = nlohmann::json::array();
    for (const auto& partial : partial_outputs) {
        partials.push_back({{"work_unit_id", partial.work_unit_id},
                            {"handler", partial.handler},
                            {"output", partial.output}});
    }
    j["partial_outputs"] = partials;

    nlohmann::json failures = nlohmann::json::array();
    for (const auto& failure : delegation_failures) {
        failures.push_back({{"work_unit_id", failure.work_unit_id},
                            {"target", failure.target},
                            {"code", error_code_to_string(failure.code)},
                            {"message", failure.message}});
    }
    j["delegation_failures"] = failures;
    return j;
}

std::string flatten_text(const nlohmann::json& payload) {
    if (payload.is_string()) {
        return payload.get<std::string>();
    }
    std::string text;
    if (payload.is_object() || payload.is_array()) {
        for (const auto& item : payload) {
            std::string part = flatten_text(item);
            if (part.empty()) {
                continue;
            }
            if (!text.empty()) {
                text += " ";
            }
            text += part;
        }
    }
    return text;
}

} // namespace taskweave
