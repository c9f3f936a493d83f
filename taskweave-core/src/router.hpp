/**
 * @file router.hpp
 * @brief Resolves a work unit to exactly one registered handler
 *
 * Rules are tried in priority order; the first that yields a registered
 * handler wins:
 *   1. explicit target hint
 *   2. custom rules (add_rule, newest first)
 *   3. keyword match on the input text
 *   4. kind match
 *   5. classifier, called through the Resilience Pipeline
 *   6. configured default handler
 *
 * Classifier failures and unknown classifier answers fall through to the
 * default. If the default is not registered either, resolve() throws
 * ConfigurationError.
 */

#ifndef TASKWEAVE_ROUTER_HPP
#define TASKWEAVE_ROUTER_HPP

#include "handler_registry.hpp"
#include "observability.hpp"
#include "resilience_pipeline.hpp"
#include "work_unit.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

/**
 * @brief External intent classifier
 */
class IClassifier {
public:
    virtual ~IClassifier() = default;

    /**
     * @brief Pick a handler name for the unit among the candidates
     *
     * May block or throw; it is always called through the Resilience Pipeline.
     */
    virtual std::string classify(const WorkUnit& unit, const std::vector<HandlerDescriptor>& candidates) = 0;
};

struct RoutingRule {
    std::string name;
    std::function<std::optional<std::string>(const WorkUnit&)> match;
};

struct RoutingDecision {
    std::string handler;
    std::string rule;    ///< "hint", "keyword", "kind", "classifier", "default" or a custom rule name
};

struct RouterConfig {
    std::string default_handler;
    std::string classifier_dependency;

    RouterConfig() : classifier_dependency("classifier") {}
};

class Router {
public:
    Router(const HandlerRegistry& registry, ResiliencePipeline& pipeline, EventEmitter& events,
           RouterConfig config);

    void set_classifier(std::shared_ptr<IClassifier> classifier);

    /**
     * @brief Add a custom rule, tried before the built-in keyword and kind rules
     */
    void add_rule(RoutingRule rule);

    /**
     * @throws ConfigurationError If nothing matched and no default handler is registered
     */
    RoutingDecision resolve(const WorkUnit& unit, const std::string& target_hint = "") const;

    const RouterConfig& config() const { return config_; }

private:
    std::optional<std::string> match_keyword(const WorkUnit& unit,
                                             const std::vector<HandlerDescriptor>& handlers) const;
    std::optional<std::string> match_kind(const WorkUnit& unit,
                                          const std::vector<HandlerDescriptor>& handlers) const;
    std::optional<std::string> ask_classifier(const WorkUnit& unit,
                                              const std::vector<HandlerDescriptor>& handlers) const;
    RoutingDecision decide(const WorkUnit& unit, const std::string& handler, const std::string& rule) const;

    const HandlerRegistry& registry_;
    ResiliencePipeline& pipeline_;
    EventEmitter& events_;
    RouterConfig config_;

    mutable std::mutex mutex_;
    std::shared_ptr<IClassifier> classifier_;
    std::vector<RoutingRule> rules_;
};

} // namespace taskweave

#endif // TASKWEAVE_ROUTER_HPP
