/**
 * @file task_queue.hpp
 * @brief Queued background tasks with serialized context envelopes
 *
 * Producers enqueue a task name plus JSON arguments. The call is serialized
 * into a string envelope carrying the producer's PropagationToken, so the
 * consumer thread sees the same correlation_id in its log entries even though
 * nothing but the string crosses the queue.
 */

#ifndef TASKWEAVE_TASK_QUEUE_HPP
#define TASKWEAVE_TASK_QUEUE_HPP

#include "context_propagator.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace taskweave {

struct TaskEnvelope {
    std::string task_name;
    nlohmann::json args;
    PropagationToken context;

    std::string serialize() const;

    /**
     * @throws std::invalid_argument If the payload is not a valid envelope
     */
    static TaskEnvelope deserialize(const std::string& payload);
};

/**
 * @brief Single-consumer FIFO task queue
 *
 * Unknown task names and exceptions raised by tasks are logged and counted
 * as failures; they never stop the consumer.
 */
class TaskQueue {
public:
    using Task = std::function<void(const nlohmann::json& args)>;

    TaskQueue();
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /**
     * @throws ConfigurationError On an empty name or duplicate registration
     */
    void register_task(const std::string& name, Task task);

    void start();

    /**
     * @brief Serialize the call with the caller's ambient context and queue it
     *
     * @throws std::runtime_error If the queue has been stopped
     */
    void enqueue(const std::string& name, const nlohmann::json& args = nlohmann::json::object());

    /**
     * @brief Process what is queued, then join the consumer (idempotent)
     */
    void stop();

    size_t processed_count() const { return processed_.load(); }
    size_t failed_count() const { return failed_.load(); }
    size_t pending() const;

private:
    void consume_loop();
    void dispatch(const std::string& payload);

    std::map<std::string, Task> tasks_;
    std::deque<std::string> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread consumer_;
    bool running_;
    bool stopped_;
    std::atomic<size_t> processed_;
    std::atomic<size_t> failed_;
};

} // namespace taskweave

#endif // TASKWEAVE_TASK_QUEUE_HPP
