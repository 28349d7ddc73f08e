/**
 * @file test_speed_tracker.cpp
 * @brief Unit tests for transfer rate and ETA tracking
 */

#include <gtest/gtest.h>

#include <transfer_queue/core/speed_tracker.h>

#include <chrono>

namespace transfer_queue::test {

using namespace std::chrono_literals;

class SpeedTrackerTest : public ::testing::Test {
protected:
    speed_tracker::clock::time_point t0_ = speed_tracker::clock::now();
};

TEST_F(SpeedTrackerTest, SingleSampleHasNoRate) {
    speed_tracker tracker;
    EXPECT_DOUBLE_EQ(tracker.update(1000, t0_), 0.0);
    EXPECT_FALSE(tracker.eta(1000).has_value());
}

TEST_F(SpeedTrackerTest, RateFromDeltaOverTime) {
    speed_tracker tracker;
    tracker.update(0, t0_);
    auto rate = tracker.update(1000, t0_ + 500ms);
    EXPECT_DOUBLE_EQ(rate, 2000.0);
    EXPECT_DOUBLE_EQ(tracker.bytes_per_second(), 2000.0);
}

TEST_F(SpeedTrackerTest, OldSamplesLeaveTheWindow) {
    speed_tracker tracker(1000ms);
    tracker.update(0, t0_);
    tracker.update(10'000, t0_ + 100ms);   // burst
    tracker.update(10'100, t0_ + 1500ms);
    auto rate = tracker.update(10'200, t0_ + 2000ms);

    // Only samples from the last second remain: 100 bytes over 0.5s
    EXPECT_DOUBLE_EQ(rate, 200.0);
}

TEST_F(SpeedTrackerTest, EtaFromRemainingBytes) {
    speed_tracker tracker;
    tracker.update(0, t0_);
    tracker.update(1000, t0_ + 1s);

    auto eta = tracker.eta(10'000);
    ASSERT_TRUE(eta.has_value());
    EXPECT_EQ(*eta, 10s);
}

TEST_F(SpeedTrackerTest, EtaIsSmoothed) {
    speed_tracker tracker(2000ms, 0.5);
    tracker.update(0, t0_);
    tracker.update(1000, t0_ + 1s);
    ASSERT_EQ(tracker.eta(10'000), 10s);

    // Rate doubles; the smoothed ETA moves halfway towards the new value
    tracker.update(5000, t0_ + 2s);
    auto eta = tracker.eta(10'000);
    ASSERT_TRUE(eta.has_value());
    EXPECT_GT(*eta, 4s);
    EXPECT_LT(*eta, 10s);
}

TEST_F(SpeedTrackerTest, BackwardsCountResets) {
    speed_tracker tracker;
    tracker.update(0, t0_);
    tracker.update(5000, t0_ + 1s);
    EXPECT_GT(tracker.bytes_per_second(), 0.0);

    EXPECT_DOUBLE_EQ(tracker.update(0, t0_ + 2s), 0.0);
}

TEST_F(SpeedTrackerTest, ResetForgetsEverything) {
    speed_tracker tracker;
    tracker.update(0, t0_);
    tracker.update(1000, t0_ + 1s);
    (void)tracker.eta(100);

    tracker.reset();
    EXPECT_DOUBLE_EQ(tracker.bytes_per_second(), 0.0);
    EXPECT_FALSE(tracker.eta(100).has_value());
}

}  // namespace transfer_queue::test
