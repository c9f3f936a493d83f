/**
 * @file middleware_stages.cpp
 * @brief Implementation of the standard middleware stages
 */

#include "middleware_stages.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>

namespace taskweave {

// ---------------------------------------------------------------------------
// OutputContract
// ---------------------------------------------------------------------------

std::vector<std::string> OutputContract::validate(const nlohmann::json& output) const {
    std::vector<std::string> violations;

    if (type == "object" && !output.is_object()) {
        violations.push_back("expected object, got " + std::string(output.type_name()));
    } else if (type == "array" && !output.is_array()) {
        violations.push_back("expected array, got " + std::string(output.type_name()));
    } else if (type == "string" && !output.is_string()) {
        violations.push_back("expected string, got " + std::string(output.type_name()));
    } else if (type == "number" && !output.is_number()) {
        violations.push_back("expected number, got " + std::string(output.type_name()));
    } else if (type == "boolean" && !output.is_boolean()) {
        violations.push_back("expected boolean, got " + std::string(output.type_name()));
    }

    if (!required.empty()) {
        if (!output.is_object()) {
            if (violations.empty()) {
                violations.push_back("required keys need an object output");
            }
        } else {
            for (const auto& key : required) {
                if (!output.contains(key)) {
                    violations.push_back("missing required key '" + key + "'");
                }
            }
        }
    }
    return violations;
}

// ---------------------------------------------------------------------------
// SafetyCheckStage
// ---------------------------------------------------------------------------

SafetyCheckStage::SafetyCheckStage(const std::vector<std::string>& blocked_patterns) {
    for (const auto& pattern : blocked_patterns) {
        try {
            patterns_.emplace_back(pattern, std::regex(pattern, std::regex::ECMAScript | std::regex::icase));
        } catch (const std::regex_error& e) {
            throw ConfigurationError("Invalid blocked pattern '" + pattern + "': " + e.what());
        }
    }
}

void SafetyCheckStage::run(ExecutionFrame& frame) {
    if (patterns_.empty()) {
        return;
    }
    const std::string text = flatten_text(frame.unit.input);
    for (const auto& [source, pattern] : patterns_) {
        if (std::regex_search(text, pattern)) {
            throw BlockedInputError("input matched blocked pattern '" + source + "'");
        }
    }
}

// ---------------------------------------------------------------------------
// StateLoadStage
// ---------------------------------------------------------------------------

StateLoadStage::StateLoadStage(std::shared_ptr<IStateStore> store, ResiliencePipeline& pipeline,
                               std::string dependency)
    : store_(std::move(store)), pipeline_(pipeline), dependency_(std::move(dependency)) {}

void StateLoadStage::run(ExecutionFrame& frame) {
    WorkUnit& unit = frame.unit;
    if (unit.conversation_id.empty() || !store_) {
        unit.state = nlohmann::json::object();
        return;
    }

    std::shared_ptr<IStateStore> store = store_;
    std::string key = state_key(unit.conversation_id);
    try {
        auto loaded = pipeline_.execute(dependency_, [store, key]() { return store->get(key); });
        unit.state = loaded.value_or(nlohmann::json::object());
    } catch (const std::exception& e) {
        unit.state = nlohmann::json::object();
        Logger::get_instance().log_warning("state_load", "State load failed, continuing with empty state",
            {{"work_unit_id", unit.id}, {"conversation_id", unit.conversation_id}, {"error", e.what()}});
    }
}

// ---------------------------------------------------------------------------
// CostAccountingStage
// ---------------------------------------------------------------------------

CostAccountingStage::CostAccountingStage(std::shared_ptr<IStateStore> ledger, ResiliencePipeline& pipeline,
                                         std::string dependency)
    : ledger_(std::move(ledger)), pipeline_(pipeline), dependency_(std::move(dependency)) {}

void CostAccountingStage::run(ExecutionFrame& frame) {
    if (!frame.result) {
        return;  // handler failed, nothing to account
    }

    WorkUnit& unit = frame.unit;
    double cost = frame.result->usage ? frame.result->usage->cost : 0.0;
    unit.cost += cost;

    double remaining = frame.context.budget ? frame.context.budget->charge(cost)
                                            : frame.context.budget_remaining();
    if (remaining < 0.0) {
        frame.budget_exceeded = true;
    }

    if (!ledger_) {
        return;
    }

    nlohmann::json entry;
    entry["work_unit_id"] = unit.id;
    entry["conversation_id"] = unit.conversation_id;
    entry["handler"] = frame.handler_name;
    entry["cost"] = cost;
    entry["unit_total_cost"] = unit.cost;
    entry["budget_remaining"] = remaining;
    entry["budget_exceeded"] = frame.budget_exceeded;
    if (frame.result->usage) {
        entry["metrics"] = frame.result->usage->metrics;
    }

    std::shared_ptr<IStateStore> ledger = ledger_;
    std::string key = ledger_key(unit.id);
    try {
        pipeline_.execute(dependency_, [ledger, key, entry]() { ledger->put(key, entry); });
    } catch (const std::exception& e) {
        Logger::get_instance().log_warning("cost_accounting", "Cost ledger write failed",
            {{"work_unit_id", unit.id}, {"cost", std::to_string(cost)}, {"error", e.what()}});
    }
}

// ---------------------------------------------------------------------------
// OutputNormalizationStage
// ---------------------------------------------------------------------------

OutputNormalizationStage::OutputNormalizationStage(std::map<std::string, OutputContract> contracts)
    : contracts_(std::move(contracts)) {}

void OutputNormalizationStage::run(ExecutionFrame& frame) {
    if (!frame.result) {
        return;
    }
    auto it = contracts_.find(frame.handler_name);
    if (it == contracts_.end()) {
        return;
    }

    auto violations = it->second.validate(frame.result->output);
    if (violations.empty()) {
        return;
    }

    frame.output_valid = false;
    frame.contract_violations = violations;

    std::string joined;
    for (const auto& violation : violations) {
        if (!joined.empty()) joined += "; ";
        joined += violation;
    }
    Logger::get_instance().log_warning("output_normalization", "Handler output violates its contract",
        {{"work_unit_id", frame.unit.id},
         {"handler", frame.handler_name},
         {"error_code", error_code_to_string(ErrorCode::VALIDATION_FAILURE)},
         {"violations", joined}});
}

// ---------------------------------------------------------------------------
// StateSaveStage
// ---------------------------------------------------------------------------

StateSaveStage::StateSaveStage(std::shared_ptr<IStateStore> store, ResiliencePipeline& pipeline,
                               std::string dependency)
    : store_(std::move(store)), pipeline_(pipeline), dependency_(std::move(dependency)) {}

void StateSaveStage::run(ExecutionFrame& frame) {
    WorkUnit& unit = frame.unit;
    if (!frame.result || unit.conversation_id.empty() || !store_) {
        return;
    }

    nlohmann::json next_state = unit.state.is_object() ? unit.state : nlohmann::json::object();
    next_state["turns"] = next_state.value("turns", 0) + 1;
    next_state["last_work_unit_id"] = unit.id;
    next_state["last_handler"] = frame.handler_name;
    next_state["last_output"] = frame.result->output;

    std::shared_ptr<IStateStore> store = store_;
    std::string key = StateLoadStage::state_key(unit.conversation_id);
    try {
        pipeline_.execute(dependency_, [store, key, next_state]() { store->put(key, next_state); });
        unit.state = next_state;
    } catch (const std::exception& e) {
        Logger::get_instance().log_warning("state_save", "State save failed",
            {{"work_unit_id", unit.id}, {"conversation_id", unit.conversation_id}, {"error", e.what()}});
    }
}

// ---------------------------------------------------------------------------

std::vector<std::unique_ptr<IMiddlewareStage>> build_standard_stages(
    const StageSettings& settings,
    std::shared_ptr<IStateStore> state_store,
    std::shared_ptr<IStateStore> cost_store,
    ResiliencePipeline& pipeline
) {
    std::vector<std::unique_ptr<IMiddlewareStage>> stages;
    stages.push_back(std::make_unique<SafetyCheckStage>(settings.blocked_patterns));
    stages.push_back(std::make_unique<StateLoadStage>(state_store, pipeline, settings.state_store_dependency));
    stages.push_back(std::make_unique<CostAccountingStage>(cost_store, pipeline, settings.cost_store_dependency));
    stages.push_back(std::make_unique<OutputNormalizationStage>(settings.output_contracts));
    stages.push_back(std::make_unique<StateSaveStage>(state_store, pipeline, settings.state_store_dependency));
    return stages;
}

} // namespace taskweave
