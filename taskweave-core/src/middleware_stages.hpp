/**
 * @file middleware_stages.hpp
 * @brief The standard middleware stages
 *
 * Store-backed stages (state load/save, cost accounting) call their store
 * through the Resilience Pipeline under a named dependency and recover from
 * store failures locally: a failed load yields empty state, a failed write
 * is logged and the unit of work still completes.
 */

#ifndef TASKWEAVE_MIDDLEWARE_STAGES_HPP
#define TASKWEAVE_MIDDLEWARE_STAGES_HPP

#include "middleware_chain.hpp"
#include "resilience_pipeline.hpp"
#include "state_store.hpp"
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace taskweave {

/**
 * @brief Declared shape of a handler's output
 */
struct OutputContract {
    std::string type;                    ///< "object", "array", "string", "number", "boolean" or "any"
    std::vector<std::string> required;   ///< Keys an object output must carry

    OutputContract() : type("any") {}

    /**
     * @return Human-readable violations, empty when the output conforms
     */
    std::vector<std::string> validate(const nlohmann::json& output) const;
};

/**
 * @brief Rejects inputs matching any blocked pattern (case-insensitive regex)
 */
class SafetyCheckStage : public IMiddlewareStage {
public:
    /**
     * @throws ConfigurationError If a pattern is not a valid regular expression
     */
    explicit SafetyCheckStage(const std::vector<std::string>& blocked_patterns);

    std::string name() const override { return stage_names::SAFETY_CHECK; }
    StagePhase phase() const override { return StagePhase::BEFORE_HANDLER; }
    void run(ExecutionFrame& frame) override;

private:
    std::vector<std::pair<std::string, std::regex>> patterns_;
};

class StateLoadStage : public IMiddlewareStage {
public:
    StateLoadStage(std::shared_ptr<IStateStore> store, ResiliencePipeline& pipeline, std::string dependency);

    std::string name() const override { return stage_names::STATE_LOAD; }
    StagePhase phase() const override { return StagePhase::BEFORE_HANDLER; }
    void run(ExecutionFrame& frame) override;

    static std::string state_key(const std::string& conversation_id) {
        return "state:" + conversation_id;
    }

private:
    std::shared_ptr<IStateStore> store_;
    ResiliencePipeline& pipeline_;
    std::string dependency_;
};

/**
 * @brief Charges handler usage against the shared budget and writes the cost ledger
 *
 * Marks the frame budget_exceeded when the charge drives the remaining budget
 * below zero.
 */
class CostAccountingStage : public IMiddlewareStage {
public:
    CostAccountingStage(std::shared_ptr<IStateStore> ledger, ResiliencePipeline& pipeline, std::string dependency);

    std::string name() const override { return stage_names::COST_ACCOUNTING; }
    StagePhase phase() const override { return StagePhase::AFTER_HANDLER; }
    void run(ExecutionFrame& frame) override;

    static std::string ledger_key(const std::string& work_unit_id) {
        return "cost:" + work_unit_id;
    }

private:
    std::shared_ptr<IStateStore> ledger_;
    ResiliencePipeline& pipeline_;
    std::string dependency_;
};

/**
 * @brief Validates handler output against its declared contract
 *
 * Violations are logged as ValidationFailure and flagged on the frame; the
 * raw output is kept.
 */
class OutputNormalizationStage : public IMiddlewareStage {
public:
    explicit OutputNormalizationStage(std::map<std::string, OutputContract> contracts);

    std::string name() const override { return stage_names::OUTPUT_NORMALIZATION; }
    StagePhase phase() const override { return StagePhase::AFTER_HANDLER; }
    void run(ExecutionFrame& frame) override;

private:
    std::map<std::string, OutputContract> contracts_;
};

class StateSaveStage : public IMiddlewareStage {
public:
    StateSaveStage(std::shared_ptr<IStateStore> store, ResiliencePipeline& pipeline, std::string dependency);

    std::string name() const override { return stage_names::STATE_SAVE; }
    StagePhase phase() const override { return StagePhase::AFTER_HANDLER; }
    void run(ExecutionFrame& frame) override;

private:
    std::shared_ptr<IStateStore> store_;
    ResiliencePipeline& pipeline_;
    std::string dependency_;
};

/**
 * @brief Settings for build_standard_stages
 */
struct StageSettings {
    std::vector<std::string> blocked_patterns;
    std::map<std::string, OutputContract> output_contracts;
    std::string state_store_dependency;
    std::string cost_store_dependency;

    StageSettings()
        : state_store_dependency("state_store"), cost_store_dependency("cost_store") {}
};

/**
 * @brief Build the five stages in their required order
 */
std::vector<std::unique_ptr<IMiddlewareStage>> build_standard_stages(
    const StageSettings& settings,
    std::shared_ptr<IStateStore> state_store,
    std::shared_ptr<IStateStore> cost_store,
    ResiliencePipeline& pipeline
);

} // namespace taskweave

#endif // TASKWEAVE_MIDDLEWARE_STAGES_HPP
