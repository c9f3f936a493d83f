/**
 * @file engine.hpp
 * @brief TaskEngine: one fully wired engine instance
 *
 * Owns one independent instance of every component. Several engines may
 * coexist in a process; only the Logger is shared.
 *
 * Usage Example:
 *   @code
 *   EngineConfig config = parse_engine_config_from_file("engine.json");
 *   TaskEngine engine(config);
 *
 *   engine.register_handler("billing", [](const WorkUnit& unit, const DelegationContext&) {
 *       HandlerResult result({{"answer", "refund issued"}});
 *       result.usage = Usage(0.5);
 *       return result;
 *   });
 *
 *   engine.start();                                   // throws StartupValidationError
 *   WorkUnit done = engine.submit(WorkKind::USER_REQUEST, {{"text", "refund my invoice"}}, "conv-1");
 *   engine.shutdown();
 *   @endcode
 */

#ifndef TASKWEAVE_ENGINE_HPP
#define TASKWEAVE_ENGINE_HPP

#include "coordinator.hpp"
#include "engine_config.hpp"
#include "engine_lifecycle.hpp"
#include "handler_registry.hpp"
#include "middleware_chain.hpp"
#include "observability.hpp"
#include "resilience_pipeline.hpp"
#include "router.hpp"
#include "state_store.hpp"
#include "task_queue.hpp"
#include "worker_pool.hpp"
#include <memory>
#include <string>

namespace taskweave {

class TaskEngine {
public:
    /**
     * @param config Validated engine configuration
     * @param state_store Conversation state store (default: in-memory, or
     *        file-backed when engine.state_directory is set)
     * @param cost_store Cost ledger store (default: in-memory)
     * @throws ConfigurationError If the configuration is invalid
     */
    explicit TaskEngine(EngineConfig config,
                        std::shared_ptr<IStateStore> state_store = nullptr,
                        std::shared_ptr<IStateStore> cost_store = nullptr);
    ~TaskEngine();

    TaskEngine(const TaskEngine&) = delete;
    TaskEngine& operator=(const TaskEngine&) = delete;

    /**
     * @brief Register a handler using the routing metadata from the config
     */
    void register_handler(const std::string& name, Handler handler);
    void register_handler(const HandlerDescriptor& descriptor, Handler handler);

    void set_classifier(std::shared_ptr<IClassifier> classifier);
    void add_routing_rule(RoutingRule rule);

    /**
     * @brief Run startup checks; the engine reports healthy afterwards
     *
     * @throws StartupValidationError Listing every failed check
     */
    void start();

    /**
     * @brief Build a root unit and run it to a terminal status
     *
     * @throws std::runtime_error If start() has not succeeded
     */
    WorkUnit submit(WorkKind kind, nlohmann::json input, const std::string& conversation_id = "");

    /**
     * @brief Run an existing unit under a fresh root context
     */
    WorkUnit handle(WorkUnit unit);
    WorkUnit handle(WorkUnit unit, DelegationContext context);

    /**
     * @brief Root context with the configured budget and deadline
     *
     * The correlation id is taken from the ambient context, or generated.
     */
    DelegationContext make_root_context() const;

    bool cancel(const std::string& root_id) { return coordinator_->cancel(root_id); }
    bool approve(const std::string& work_unit_id) { return coordinator_->approve(work_unit_id); }
    bool reject(const std::string& work_unit_id) { return coordinator_->reject(work_unit_id); }

    ShutdownReport shutdown();

    bool is_healthy() const { return lifecycle_->is_healthy(); }

    const EngineConfig& config() const { return config_; }
    EventEmitter& events() { return events_; }
    DependencyRegistry& dependencies() { return dependencies_; }
    ResiliencePipeline& pipeline() { return pipeline_; }
    HandlerRegistry& handlers() { return handlers_; }
    Coordinator& coordinator() { return *coordinator_; }
    EngineLifecycleManager& lifecycle() { return *lifecycle_; }
    WorkerPool& worker_pool() { return *worker_pool_; }
    TaskQueue& task_queue() { return task_queue_; }

private:
    void ensure_started() const;

    EngineConfig config_;
    EventEmitter events_;
    DependencyRegistry dependencies_;
    ResiliencePipeline pipeline_;
    std::shared_ptr<IStateStore> state_store_;
    std::shared_ptr<IStateStore> cost_store_;
    HandlerRegistry handlers_;
    std::unique_ptr<Router> router_;
    std::unique_ptr<MiddlewareChain> chain_;
    std::unique_ptr<Coordinator> coordinator_;
    std::unique_ptr<EngineLifecycleManager> lifecycle_;
    std::unique_ptr<WorkerPool> worker_pool_;
    TaskQueue task_queue_;
};

} // namespace taskweave

#endif // TASKWEAVE_ENGINE_HPP
