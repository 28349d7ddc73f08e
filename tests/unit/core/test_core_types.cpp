/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, error classification and result<T>
 */

#include <gtest/gtest.h>

#include <transfer_queue/core/types.h>

#include <memory>
#include <string>

namespace transfer_queue::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Local file errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::disk_full), -107);

    // Remote file errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::remote_not_found), -120);
    EXPECT_EQ(static_cast<int>(error_code::remote_not_a_file), -124);

    // Integrity errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::checksum_mismatch), -140);

    // Configuration errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -160);

    // Session errors: -180 to -199
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -180);
    EXPECT_EQ(static_cast<int>(error_code::reconnect_exhausted), -185);

    // Queue errors: -200 to -219
    EXPECT_EQ(static_cast<int>(error_code::transfer_not_found), -200);
    EXPECT_EQ(static_cast<int>(error_code::queue_state_corrupted), -204);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::connection_lost), "connection lost");
    EXPECT_STREQ(to_string(error_code::checksum_mismatch), "checksum mismatch");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

// =============================================================================
// Classification Tests
// =============================================================================

class ErrorClassTest : public ::testing::Test {};

TEST_F(ErrorClassTest, TransientRemoteFailures) {
    EXPECT_TRUE(is_transient(error_code::remote_io_error));
    EXPECT_TRUE(is_transient(error_code::remote_unexpected_eof));
    EXPECT_FALSE(is_transient(error_code::remote_not_found));
}

TEST_F(ErrorClassTest, ConnectivityFailures) {
    for (auto code : {error_code::connection_failed, error_code::connection_timeout,
                      error_code::connection_lost, error_code::not_connected,
                      error_code::session_stale}) {
        EXPECT_TRUE(is_connectivity(code)) << to_string(code);
        EXPECT_FALSE(is_transient(code)) << to_string(code);
    }
}

TEST_F(ErrorClassTest, TerminalFailures) {
    for (auto code : {error_code::remote_not_found, error_code::remote_permission_denied,
                      error_code::checksum_mismatch, error_code::file_write_error,
                      error_code::disk_full, error_code::remote_not_a_file}) {
        EXPECT_EQ(classify(code), error_class::terminal) << to_string(code);
    }
}

TEST_F(ErrorClassTest, ExhaustionIsFatal) {
    EXPECT_EQ(classify(error_code::reconnect_exhausted), error_class::fatal);
    EXPECT_EQ(classify(error_code::success), error_class::none);
}

// =============================================================================
// error / result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, ErrorDefaultIsSuccess) {
    error e;
    EXPECT_FALSE(e);
    EXPECT_EQ(e.code, error_code::success);

    error lost(error_code::connection_lost);
    EXPECT_TRUE(lost);
    EXPECT_EQ(lost.message, "connection lost");
}

TEST_F(ResultTest, ValueResult) {
    result<int> r(42);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, ErrorResult) {
    result<int> r = unexpected(error(error_code::transfer_not_found, "no transfer 7"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::transfer_not_found);
    EXPECT_EQ(r.error().message, "no transfer 7");
}

TEST_F(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r(std::make_unique<int>(5));
    ASSERT_TRUE(r);
    auto owned = std::move(r).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 5);
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok);

    result<void> failed = unexpected(error(error_code::invalid_configuration));
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, error_code::invalid_configuration);
}

}  // namespace transfer_queue::test
