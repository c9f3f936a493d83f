/**
 * @file router.cpp
 * @brief Implementation of Router
 */

#include "router.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>

namespace taskweave {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // anonymous namespace

Router::Router(const HandlerRegistry& registry, ResiliencePipeline& pipeline, EventEmitter& events,
               RouterConfig config)
    : registry_(registry), pipeline_(pipeline), events_(events), config_(std::move(config)) {}

void Router::set_classifier(std::shared_ptr<IClassifier> classifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    classifier_ = std::move(classifier);
}

void Router::add_rule(RoutingRule rule) {
    if (!rule.match) {
        throw ConfigurationError("Routing rule '" + rule.name + "' has no matcher");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.insert(rules_.begin(), std::move(rule));
}

RoutingDecision Router::resolve(const WorkUnit& unit, const std::string& target_hint) const {
    if (!target_hint.empty()) {
        if (registry_.is_registered(target_hint)) {
            return decide(unit, target_hint, "hint");
        }
        Logger::get_instance().log_warning("router", "Target hint is not a registered handler",
                                           {{"work_unit_id", unit.id}, {"hint", target_hint}});
    }

    std::vector<RoutingRule> rules;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rules = rules_;
    }
    for (const auto& rule : rules) {
        auto match = rule.match(unit);
        if (match && registry_.is_registered(*match)) {
            return decide(unit, *match, rule.name);
        }
    }

    const auto handlers = registry_.list_handlers();

    if (auto match = match_keyword(unit, handlers)) {
        return decide(unit, *match, "keyword");
    }
    if (auto match = match_kind(unit, handlers)) {
        return decide(unit, *match, "kind");
    }
    if (auto match = ask_classifier(unit, handlers)) {
        return decide(unit, *match, "classifier");
    }

    if (!config_.default_handler.empty() && registry_.is_registered(config_.default_handler)) {
        return decide(unit, config_.default_handler, "default");
    }
    throw ConfigurationError("No handler matched work unit " + unit.id +
                             " and default handler '" + config_.default_handler + "' is not registered");
}

std::optional<std::string> Router::match_keyword(const WorkUnit& unit,
                                                 const std::vector<HandlerDescriptor>& handlers) const {
    const std::string text = to_lower(flatten_text(unit.input));
    if (text.empty()) {
        return std::nullopt;
    }
    for (const auto& descriptor : handlers) {
        for (const auto& keyword : descriptor.keywords) {
            if (!keyword.empty() && text.find(to_lower(keyword)) != std::string::npos) {
                return descriptor.name;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> Router::match_kind(const WorkUnit& unit,
                                              const std::vector<HandlerDescriptor>& handlers) const {
    for (const auto& descriptor : handlers) {
        if (std::find(descriptor.kinds.begin(), descriptor.kinds.end(), unit.kind) != descriptor.kinds.end()) {
            return descriptor.name;
        }
    }
    return std::nullopt;
}

std::optional<std::string> Router::ask_classifier(const WorkUnit& unit,
                                                  const std::vector<HandlerDescriptor>& handlers) const {
    std::shared_ptr<IClassifier> classifier;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        classifier = classifier_;
    }
    if (!classifier || handlers.empty()) {
        return std::nullopt;
    }

    try {
        WorkUnit snapshot = unit;
        std::string answer = pipeline_.execute(config_.classifier_dependency,
            [classifier, snapshot, handlers]() { return classifier->classify(snapshot, handlers); });

        if (registry_.is_registered(answer)) {
            return answer;
        }
        Logger::get_instance().log_warning("router", "Classifier returned an unknown handler",
                                           {{"work_unit_id", unit.id}, {"answer", answer}});
    } catch (const std::exception& e) {
        Logger::get_instance().log_warning("router", "Classifier unavailable, using default handler",
                                           {{"work_unit_id", unit.id}, {"error", e.what()}});
    }
    return std::nullopt;
}

RoutingDecision Router::decide(const WorkUnit& unit, const std::string& handler, const std::string& rule) const {
    ObservabilityEvent event("routing", rule);
    event.level = LogLevel::DEBUG;
    event.work_unit_id = unit.id;
    event.conversation_id = unit.conversation_id;
    event.attributes["handler"] = handler;
    event.attributes["kind"] = kind_to_string(unit.kind);
    events_.emit(event);
    return RoutingDecision{handler, rule};
}

} // namespace taskweave
