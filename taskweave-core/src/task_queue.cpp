/**
 * @file task_queue.cpp
 * @brief Implementation of TaskQueue
 */

#include "task_queue.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace taskweave {

std::string TaskEnvelope::serialize() const {
    json j;
    j["task"] = task_name;
    j["args"] = args;
    j["context"] = context.to_json();
    return j.dump();
}

TaskEnvelope TaskEnvelope::deserialize(const std::string& payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Malformed task envelope: ") + e.what());
    }
    if (!j.is_object() || !j.contains("task") || !j["task"].is_string()) {
        throw std::invalid_argument("Task envelope missing task name");
    }

    TaskEnvelope envelope;
    envelope.task_name = j["task"].get<std::string>();
    envelope.args = j.value("args", json::object());
    if (j.contains("context")) {
        envelope.context = PropagationToken::from_json(j["context"]);
    }
    return envelope;
}

TaskQueue::TaskQueue()
    : running_(false), stopped_(false), processed_(0), failed_(0) {}

TaskQueue::~TaskQueue() {
    stop();
}

void TaskQueue::register_task(const std::string& name, Task task) {
    if (name.empty()) {
        throw ConfigurationError("Task name cannot be empty");
    }
    if (!task) {
        throw ConfigurationError("Task '" + name + "' has no callable");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.count(name) > 0) {
        throw ConfigurationError("Task already registered: " + name);
    }
    tasks_[name] = std::move(task);
}

void TaskQueue::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || stopped_) {
        return;
    }
    running_ = true;
    consumer_ = std::thread(&TaskQueue::consume_loop, this);
}

void TaskQueue::enqueue(const std::string& name, const json& args) {
    TaskEnvelope envelope;
    envelope.task_name = name;
    envelope.args = args;
    envelope.context = ContextPropagator::capture();
    std::string payload = envelope.serialize();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            throw std::runtime_error("Cannot enqueue task '" + name + "': queue stopped");
        }
        queue_.push_back(std::move(payload));
    }
    cv_.notify_one();
}

void TaskQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    cv_.notify_all();
    if (consumer_.joinable()) {
        consumer_.join();
    }
}

size_t TaskQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskQueue::consume_loop() {
    while (true) {
        std::string payload;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopped_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            payload = std::move(queue_.front());
            queue_.pop_front();
        }
        dispatch(payload);
    }
}

void TaskQueue::dispatch(const std::string& payload) {
    Logger& logger = Logger::get_instance();

    TaskEnvelope envelope;
    try {
        envelope = TaskEnvelope::deserialize(payload);
    } catch (const std::invalid_argument& e) {
        failed_++;
        logger.log_error("task_queue", "Dropped task", {{"error", e.what()}});
        return;
    }

    // Restore before anything logs so entries carry the producer's ids
    ScopedContext scope = ContextPropagator::restore(envelope.context);

    Task task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(envelope.task_name);
        if (it != tasks_.end()) {
            task = it->second;
        }
    }
    if (!task) {
        failed_++;
        logger.log_error("task_queue", "Unknown task", {{"task", envelope.task_name}});
        return;
    }

    logger.log_debug("task_queue", "Running task", {{"task", envelope.task_name}});
    try {
        task(envelope.args);
        processed_++;
    } catch (const std::exception& e) {
        failed_++;
        logger.log_error("task_queue", "Task failed",
                         {{"task", envelope.task_name}, {"error", e.what()}});
    }
}

} // namespace taskweave
