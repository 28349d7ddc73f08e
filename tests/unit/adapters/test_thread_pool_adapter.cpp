/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for transfer executors
 */

#include <gtest/gtest.h>

#include <transfer_queue/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

namespace transfer_queue::adapters::test {

class ThreadPoolAdapterTest : public ::testing::Test {
protected:
    void SetUp() override { executor_ = transfer_executor_factory::create(4, "test_pool"); }

    std::shared_ptr<transfer_executor_interface> executor_;
};

TEST_F(ThreadPoolAdapterTest, Factory_CreatesRunningExecutor) {
    ASSERT_NE(executor_, nullptr);
    EXPECT_TRUE(executor_->is_running());
    EXPECT_EQ(executor_->worker_count(), 4u);
}

TEST_F(ThreadPoolAdapterTest, Submit_RunsTask) {
    std::atomic<int> counter{0};
    auto future = executor_->submit([&counter] { counter.fetch_add(1); }, "download");
    future.get();
    EXPECT_EQ(counter.load(), 1);
}

TEST_F(ThreadPoolAdapterTest, Submit_ManyTasks) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(executor_->submit([&counter] { counter.fetch_add(1); }, "download"));
    }
    for (auto& future : futures) {
        future.get();
    }
    EXPECT_EQ(counter.load(), 20);
    EXPECT_EQ(executor_->active_tasks(), 0u);
}

TEST_F(ThreadPoolAdapterTest, Submit_ExceptionReachesFuture) {
    auto future = executor_->submit([] { throw std::runtime_error("boom"); }, "download");
    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(executor_->active_tasks("download"), 0u);
}

TEST_F(ThreadPoolAdapterTest, ActiveTasks_CountsByLabel) {
    std::promise<void> gate;
    auto released = gate.get_future().share();

    auto a = executor_->submit([released] { released.wait(); }, "download");
    auto b = executor_->submit([released] { released.wait(); }, "verify");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (executor_->active_tasks() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(executor_->active_tasks(), 2u);
    EXPECT_EQ(executor_->active_tasks("download"), 1u);
    EXPECT_EQ(executor_->active_tasks("verify"), 1u);
    EXPECT_EQ(executor_->active_tasks("other"), 0u);

    gate.set_value();
    a.get();
    b.get();
    EXPECT_EQ(executor_->active_tasks(), 0u);
}

TEST(TaskLabelCounterTest, IncrementDecrement) {
    task_label_counter counter;
    counter.increment("x");
    counter.increment("x");
    counter.decrement("x");
    EXPECT_EQ(counter.count("x"), 1u);
    counter.decrement("x");
    counter.decrement("x");
    EXPECT_EQ(counter.count("x"), 0u);
    EXPECT_EQ(counter.count("never"), 0u);
}

TEST(AsyncTransferExecutorTest, DefaultWorkerCountIsPositive) {
    async_transfer_executor executor;
    EXPECT_GT(executor.worker_count(), 0u);
}

}  // namespace transfer_queue::adapters::test
