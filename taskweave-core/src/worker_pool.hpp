/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool that propagates ambient context into jobs
 */

#ifndef TASKWEAVE_WORKER_POOL_HPP
#define TASKWEAVE_WORKER_POOL_HPP

#include "context_propagator.hpp"
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace taskweave {

/**
 * @brief FIFO worker pool
 *
 * Every submitted job runs under the ambient context captured on the
 * submitting thread. Submitting after shutdown() throws std::runtime_error.
 * Jobs already queued when shutdown() is called still run before the
 * workers exit.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    auto submit(Fn fn) -> std::future<decltype(fn())> {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(
            ContextPropagator::wrap(std::move(fn)));
        std::future<Result> future = task->get_future();
        enqueue([task]() { (*task)(); });
        return future;
    }

    /**
     * @brief Stop accepting jobs, drain the queue and join workers (idempotent)
     */
    void shutdown();

    size_t thread_count() const { return workers_.size(); }
    size_t pending() const;
    bool is_running() const;

private:
    void enqueue(std::function<void()> job);
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_;
};

} // namespace taskweave

#endif // TASKWEAVE_WORKER_POOL_HPP
