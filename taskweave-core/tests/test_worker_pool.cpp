/**
 * @file test_worker_pool.cpp
 * @brief Tests for the context-propagating worker pool
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/worker_pool.hpp"
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace taskweave;

TEST_CASE("WorkerPool: Runs jobs and returns results", "[pool]") {
    WorkerPool pool(2);
    REQUIRE(pool.thread_count() == 2);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }

    int sum = 0;
    for (auto& future : futures) {
        sum += future.get();
    }
    REQUIRE(sum == 285);
}

TEST_CASE("WorkerPool: Job exceptions reach the future", "[pool]") {
    WorkerPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("job failed"); });
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);

    // The worker survives a failing job
    REQUIRE(pool.submit([]() { return 5; }).get() == 5);
}

TEST_CASE("WorkerPool: Jobs see the submitter's context", "[pool]") {
    WorkerPool pool(2);

    ContextPropagator::clear();
    ContextPropagator::bind("correlation_id", "corr-pool");
    auto future = pool.submit([]() { return ContextPropagator::current().correlation_id; });
    ContextPropagator::clear();

    REQUIRE(future.get() == "corr-pool");

    // Context does not leak into later jobs on the same worker
    REQUIRE(pool.submit([]() { return ContextPropagator::current().correlation_id; }).get().empty());
}

TEST_CASE("WorkerPool: Shutdown drains queued jobs and rejects new ones", "[pool]") {
    WorkerPool pool(1);
    std::atomic<int> done{0};
    for (int i = 0; i < 5; ++i) {
        pool.submit([&done]() { ++done; });
    }

    pool.shutdown();
    REQUIRE(done.load() == 5);
    REQUIRE_FALSE(pool.is_running());
    REQUIRE_THROWS_AS(pool.submit([]() { return 1; }), std::runtime_error);

    pool.shutdown();
}

TEST_CASE("WorkerPool: Zero threads is rejected", "[pool]") {
    REQUIRE_THROWS_AS(WorkerPool(0), std::invalid_argument);
}
