/**
 * @file worker_pool.cpp
 * @brief Implementation of WorkerPool
 */

#include "worker_pool.hpp"
#include <stdexcept>

namespace taskweave {

WorkerPool::WorkerPool(size_t threads)
    : stopping_(false) {
    if (threads == 0) {
        throw std::invalid_argument("WorkerPool requires at least one thread");
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("WorkerPool is shut down; job rejected");
        }
        jobs_.push(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;  // stopping and drained
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        // packaged_task stores any exception in the job's future
        job();
    }
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.clear();
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool WorkerPool::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

} // namespace taskweave
