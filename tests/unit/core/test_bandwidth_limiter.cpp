/**
 * @file test_bandwidth_limiter.cpp
 * @brief Unit tests for bandwidth limiter
 */

#include <gtest/gtest.h>

#include <transfer_queue/core/bandwidth_limiter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

namespace transfer_queue::test {

class BandwidthLimiterTest : public ::testing::Test {
protected:
    static constexpr std::size_t MB = 1024 * 1024;
    static constexpr std::size_t KB = 1024;
};

// Basic construction tests

TEST_F(BandwidthLimiterTest, Construction_WithLimit) {
    bandwidth_limiter limiter(10 * MB);
    EXPECT_EQ(limiter.get_limit(), 10 * MB);
    EXPECT_TRUE(limiter.is_enabled());
}

TEST_F(BandwidthLimiterTest, Construction_ZeroMeansUnlimited) {
    bandwidth_limiter limiter(0);
    EXPECT_EQ(limiter.get_limit(), 0u);
    EXPECT_FALSE(limiter.is_enabled());

    auto start = std::chrono::steady_clock::now();
    limiter.acquire(100 * MB);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(100));
}

// Dynamic limit adjustment tests

TEST_F(BandwidthLimiterTest, SetLimit_ChangesLimit) {
    bandwidth_limiter limiter(10 * MB);
    limiter.set_limit(20 * MB);
    EXPECT_EQ(limiter.get_limit(), 20 * MB);
    EXPECT_TRUE(limiter.is_enabled());
}

TEST_F(BandwidthLimiterTest, SetLimit_ZeroDisables) {
    bandwidth_limiter limiter(10 * MB);
    limiter.set_limit(0);
    EXPECT_EQ(limiter.get_limit(), 0u);
    EXPECT_FALSE(limiter.is_enabled());
}

TEST_F(BandwidthLimiterTest, SetLimit_ZeroWakesBlockedAcquire) {
    bandwidth_limiter limiter(10 * KB);
    limiter.acquire(10 * KB);  // drain

    auto waiter = std::async(std::launch::async, [&limiter] { limiter.acquire(10 * KB); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    limiter.set_limit(0);

    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(500)), std::future_status::ready);
}

// Acquire tests

TEST_F(BandwidthLimiterTest, Acquire_WithinBucketImmediate) {
    bandwidth_limiter limiter(10 * MB);

    auto start = std::chrono::steady_clock::now();
    limiter.acquire(1 * MB);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

TEST_F(BandwidthLimiterTest, Acquire_ExceedsBucketBlocks) {
    bandwidth_limiter limiter(100 * KB);
    limiter.acquire(100 * KB);  // drain

    auto start = std::chrono::steady_clock::now();
    limiter.acquire(50 * KB);
    auto elapsed = std::chrono::steady_clock::now() - start;

    // 50 KB at 100 KB/s needs roughly 500ms
    EXPECT_GE(elapsed, std::chrono::milliseconds(350));
}

TEST_F(BandwidthLimiterTest, ReleaseAll_UnblocksWaiters) {
    bandwidth_limiter limiter(1 * KB);
    limiter.acquire(1 * KB);

    auto waiter = std::async(std::launch::async, [&limiter] { limiter.acquire(1 * MB); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    limiter.release_all();

    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(500)), std::future_status::ready);
}

TEST_F(BandwidthLimiterTest, SetLimit_RearmsAfterReleaseAll) {
    bandwidth_limiter limiter(10 * KB);
    limiter.release_all();
    EXPECT_TRUE(limiter.try_acquire(1 * MB));

    limiter.set_limit(10 * KB);
    EXPECT_FALSE(limiter.try_acquire(1 * MB));
}

// try_acquire tests

TEST_F(BandwidthLimiterTest, TryAcquire_ZeroBytesSucceeds) {
    bandwidth_limiter limiter(1 * KB);
    EXPECT_TRUE(limiter.try_acquire(0));
}

TEST_F(BandwidthLimiterTest, TryAcquire_ExceedsTokensFails) {
    bandwidth_limiter limiter(10 * KB);
    EXPECT_TRUE(limiter.try_acquire(8 * KB));
    EXPECT_FALSE(limiter.try_acquire(8 * KB));
}

TEST_F(BandwidthLimiterTest, TryAcquire_DisabledAlwaysSucceeds) {
    bandwidth_limiter limiter(0);
    EXPECT_TRUE(limiter.try_acquire(100 * MB));
}

// Available tokens tests

TEST_F(BandwidthLimiterTest, AvailableTokens_InitiallyFull) {
    bandwidth_limiter limiter(10 * MB);
    EXPECT_DOUBLE_EQ(limiter.available_tokens(), static_cast<double>(10 * MB));
}

TEST_F(BandwidthLimiterTest, AvailableTokens_RefillsOverTime) {
    bandwidth_limiter limiter(10 * MB);
    limiter.acquire(5 * MB);
    auto initial_tokens = limiter.available_tokens();

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_GT(limiter.available_tokens(), initial_tokens);
}

// Rate limiting accuracy tests

TEST_F(BandwidthLimiterTest, RateLimiting_WithinTolerance) {
    constexpr std::size_t limit = 500 * KB;
    bandwidth_limiter limiter(limit);

    // Drain the initial bucket to start from a known state
    limiter.acquire(limit);

    std::size_t total_acquired = 0;
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < std::chrono::seconds(1)) {
        limiter.acquire(50 * KB);
        total_acquired += 50 * KB;
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    double actual_rate = static_cast<double>(total_acquired) / elapsed.count();
    double expected_rate = static_cast<double>(limit);

    EXPECT_GE(actual_rate, expected_rate * 0.8);
    EXPECT_LE(actual_rate, expected_rate * 1.2);
}

// Thread safety tests

TEST_F(BandwidthLimiterTest, ThreadSafety_SharedAcrossWorkers) {
    constexpr std::size_t limit = 2 * MB;
    bandwidth_limiter limiter(limit);
    limiter.acquire(limit);

    std::atomic<std::size_t> total_acquired{0};
    std::atomic<bool> stop{false};
    std::vector<std::thread> threads;

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            while (!stop.load(std::memory_order_relaxed)) {
                limiter.acquire(64 * KB);
                total_acquired.fetch_add(64 * KB, std::memory_order_relaxed);
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    stop = true;
    limiter.release_all();
    for (auto& t : threads) {
        t.join();
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    double actual_rate = static_cast<double>(total_acquired.load()) / elapsed.count();
    EXPECT_LE(actual_rate, static_cast<double>(limit) * 1.5);
}

}  // namespace transfer_queue::test
