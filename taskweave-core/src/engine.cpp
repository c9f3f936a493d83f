/**
 * @file engine.cpp
 * @brief Implementation of TaskEngine
 */

#include "engine.hpp"
#include "context_propagator.hpp"
#include "errors.hpp"
#include "http_classifier.hpp"
#include "logger.hpp"
#include "middleware_stages.hpp"
#include <stdexcept>

namespace taskweave {

namespace {

RouterConfig make_router_config(const EngineConfig& config) {
    RouterConfig router;
    router.default_handler = config.engine.default_handler;
    router.classifier_dependency = config.engine.classifier_dependency;
    return router;
}

CoordinatorConfig make_coordinator_config(const EngineConfig& config) {
    CoordinatorConfig coordinator;
    coordinator.max_delegation_depth = config.engine.max_delegation_depth;
    coordinator.cancel_siblings_on_budget_exceeded = config.engine.cancel_siblings_on_budget_exceeded;
    coordinator.approval_timeout = config.engine.approval_timeout;
    coordinator.ledger_capacity = config.engine.ledger_capacity;
    return coordinator;
}

StageSettings make_stage_settings(const EngineConfig& config) {
    StageSettings settings;
    settings.blocked_patterns = config.blocked_patterns;
    settings.output_contracts = config.output_contracts;
    settings.state_store_dependency = config.engine.state_store_dependency;
    settings.cost_store_dependency = config.engine.cost_store_dependency;
    return settings;
}

} // anonymous namespace

TaskEngine::TaskEngine(EngineConfig config,
                       std::shared_ptr<IStateStore> state_store,
                       std::shared_ptr<IStateStore> cost_store)
    : config_(std::move(config)),
      dependencies_(events_),
      pipeline_(dependencies_, events_),
      state_store_(std::move(state_store)),
      cost_store_(std::move(cost_store)) {
    validate_engine_config(config_);
    Logger::get_instance().configure(config_.logging);

    for (const auto& dependency : config_.dependencies) {
        dependencies_.add(dependency);
    }

    if (!state_store_) {
        if (config_.engine.state_directory.empty()) {
            state_store_ = std::make_shared<InMemoryStateStore>();
        } else {
            state_store_ = std::make_shared<FileStateStore>(config_.engine.state_directory);
        }
    }
    if (!cost_store_) {
        cost_store_ = std::make_shared<InMemoryStateStore>();
    }

    router_ = std::make_unique<Router>(handlers_, pipeline_, events_, make_router_config(config_));
    if (!config_.classifier.url.empty()) {
        router_->set_classifier(std::make_shared<HttpClassifier>(config_.classifier));
    }

    chain_ = std::make_unique<MiddlewareChain>(
        build_standard_stages(make_stage_settings(config_), state_store_, cost_store_, pipeline_),
        events_);
    coordinator_ = std::make_unique<Coordinator>(handlers_, *router_, *chain_, events_,
                                                 make_coordinator_config(config_));
    lifecycle_ = std::make_unique<EngineLifecycleManager>(*coordinator_, dependencies_, events_,
                                                          config_.lifecycle);
    worker_pool_ = std::make_unique<WorkerPool>(config_.worker_threads);

    lifecycle_->add_shutdown_hook("worker_pool", [this]() { worker_pool_->shutdown(); });
    lifecycle_->add_shutdown_hook("task_queue", [this]() { task_queue_.stop(); });

    Logger::get_instance().log_info("engine", "Engine created",
        {{"engine", config_.engine.name},
         {"dependencies", std::to_string(config_.dependencies.size())},
         {"worker_threads", std::to_string(config_.worker_threads)}});
}

TaskEngine::~TaskEngine() {
    if (lifecycle_->get_state() == LifecycleState::RUNNING) {
        lifecycle_->shutdown();
    }
    task_queue_.stop();
    worker_pool_->shutdown();
}

void TaskEngine::register_handler(const std::string& name, Handler handler) {
    HandlerDescriptor descriptor(name);
    auto it = config_.handlers.find(name);
    if (it != config_.handlers.end()) {
        descriptor.description = it->second.description;
        descriptor.kinds = it->second.kinds;
        descriptor.keywords = it->second.keywords;
    }
    handlers_.register_handler(descriptor, std::move(handler));
}

void TaskEngine::register_handler(const HandlerDescriptor& descriptor, Handler handler) {
    handlers_.register_handler(descriptor, std::move(handler));
}

void TaskEngine::set_classifier(std::shared_ptr<IClassifier> classifier) {
    router_->set_classifier(std::move(classifier));
}

void TaskEngine::add_routing_rule(RoutingRule rule) {
    router_->add_rule(std::move(rule));
}

void TaskEngine::start() {
    if (!config_.engine.default_handler.empty() && !handlers_.is_registered(config_.engine.default_handler)) {
        std::vector<std::string> problems = {
            "default handler '" + config_.engine.default_handler + "' is not registered"
        };
        Logger::get_instance().log_error("engine", "Startup check failed", {{"problem", problems.front()}});
        throw StartupValidationError(problems);
    }
    lifecycle_->start(required_dependencies(config_));
    task_queue_.start();
}

WorkUnit TaskEngine::submit(WorkKind kind, nlohmann::json input, const std::string& conversation_id) {
    ensure_started();
    return coordinator_->handle(WorkUnit::create(kind, std::move(input), conversation_id),
                                make_root_context());
}

WorkUnit TaskEngine::handle(WorkUnit unit) {
    ensure_started();
    return coordinator_->handle(std::move(unit), make_root_context());
}

WorkUnit TaskEngine::handle(WorkUnit unit, DelegationContext context) {
    ensure_started();
    return coordinator_->handle(std::move(unit), std::move(context));
}

DelegationContext TaskEngine::make_root_context() const {
    return DelegationContext::root(config_.engine.default_budget,
                                   config_.engine.default_deadline,
                                   ContextPropagator::current().correlation_id);
}

ShutdownReport TaskEngine::shutdown() {
    return lifecycle_->shutdown();
}

void TaskEngine::ensure_started() const {
    LifecycleState state = lifecycle_->get_state();
    if (state == LifecycleState::CREATED || state == LifecycleState::STARTING ||
        state == LifecycleState::FAILED) {
        throw std::runtime_error("Engine not started (state " + state_to_string(state) + ")");
    }
}

} // namespace taskweave
