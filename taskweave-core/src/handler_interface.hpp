/**
 * @file handler_interface.hpp
 * @brief Contract between the engine and registered handlers
 *
 * A handler is a callable taking the work unit (with conversation state
 * already loaded into unit.state) and the delegation context of its
 * invocation. It returns its output, optionally the cost it incurred, and any
 * sub-requests it wants the Coordinator to delegate on its behalf.
 *
 * Handlers reach external services through the ResiliencePipeline and should
 * poll ctx.is_cancelled() during long work.
 */

#ifndef TASKWEAVE_HANDLER_INTERFACE_HPP
#define TASKWEAVE_HANDLER_INTERFACE_HPP

#include "delegation_context.hpp"
#include "work_unit.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

/**
 * @brief Resource usage reported by a handler
 */
struct Usage {
    double cost;
    std::map<std::string, double> metrics;   ///< e.g. input_tokens, output_tokens

    Usage() : cost(0.0) {}
    explicit Usage(double amount) : cost(amount) {}
};

/**
 * @brief A sub-request issued by a handler
 */
struct DelegationRequest {
    std::string target_hint;   ///< Preferred handler; routing rules apply when empty or unknown
    WorkKind kind;
    nlohmann::json input;

    DelegationRequest() : kind(WorkKind::DELEGATED_TASK), input(nlohmann::json::object()) {}
    DelegationRequest(std::string hint, nlohmann::json payload)
        : target_hint(std::move(hint)), kind(WorkKind::DELEGATED_TASK), input(std::move(payload)) {}
};

struct HandlerResult {
    nlohmann::json output;
    std::optional<Usage> usage;
    std::vector<DelegationRequest> delegations;
    bool requires_approval;    ///< Suspend for a human decision before completing

    HandlerResult() : output(nlohmann::json::object()), requires_approval(false) {}
    explicit HandlerResult(nlohmann::json result)
        : output(std::move(result)), requires_approval(false) {}
};

using Handler = std::function<HandlerResult(const WorkUnit&, const DelegationContext&)>;

/**
 * @brief Registry metadata used for routing
 */
struct HandlerDescriptor {
    std::string name;
    std::string description;
    std::vector<WorkKind> kinds;        ///< Kinds this handler claims
    std::vector<std::string> keywords;  ///< Case-insensitive input keywords

    HandlerDescriptor() = default;
    explicit HandlerDescriptor(std::string handler_name) : name(std::move(handler_name)) {}
};

} // namespace taskweave

#endif // TASKWEAVE_HANDLER_INTERFACE_HPP
