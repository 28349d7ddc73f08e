/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <transfer_queue/transfer_queue.h>

namespace transfer_queue::test {

TEST(VersionTest, ComponentsAreCorrect) {
    EXPECT_EQ(version::major, 0);
    EXPECT_EQ(version::minor, 1);
    EXPECT_EQ(version::patch, 0);
}

TEST(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

}  // namespace transfer_queue::test
