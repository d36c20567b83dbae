/**
 * @file test_worker_pool_adapter.cpp
 * @brief Unit tests for the worker pool adapters
 */

#include <gtest/gtest.h>

#include <latch/ldata/adapters/worker_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

namespace latch::ldata::test {

using adapters::async_worker_pool;
using adapters::worker_pool_factory;

TEST(AsyncWorkerPoolTest, RunsSubmittedTasks) {
    async_worker_pool pool(4);
    EXPECT_EQ(pool.worker_count(), 4u);
    EXPECT_TRUE(pool.is_running());

    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.submit([&counter] { counter.fetch_add(1); }));
    }
    for (auto& f : futures) f.get();

    EXPECT_EQ(counter.load(), 8);
}

TEST(AsyncWorkerPoolTest, TracksStagePending) {
    async_worker_pool pool(2);
    std::promise<void> gate;
    auto released = gate.get_future().share();

    auto f = pool.submit_to_stage([released] { released.wait(); }, "download");
    EXPECT_EQ(pool.pending_tasks("download"), 1u);
    EXPECT_EQ(pool.pending_tasks("other"), 0u);

    gate.set_value();
    f.get();
    EXPECT_EQ(pool.pending_tasks("download"), 0u);
}

TEST(AsyncWorkerPoolTest, PropagatesTaskException) {
    async_worker_pool pool(1);
    auto f = pool.submit_to_stage([] { throw std::runtime_error("boom"); }, "download");
    EXPECT_THROW(f.get(), std::runtime_error);
    EXPECT_EQ(pool.pending_tasks("download"), 0u);
}

TEST(AsyncWorkerPoolTest, ZeroMeansHardwareDefault) {
    async_worker_pool pool(0);
    EXPECT_GE(pool.worker_count(), 1u);
}

TEST(WorkerPoolFactoryTest, CreatesRunningPool) {
    auto pool = worker_pool_factory::create(3);
    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());

    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 3; ++i) {
        futures.push_back(pool->submit_to_stage([&done] { done.fetch_add(1); }, "download"));
    }
    for (auto& f : futures) f.get();
    EXPECT_EQ(done.load(), 3);
}

}  // namespace latch::ldata::test
