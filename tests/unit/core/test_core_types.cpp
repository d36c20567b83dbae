/**
 * @file test_core_types.cpp
 * @brief Unit tests for result, error and transfer value types
 */

#include <gtest/gtest.h>

#include <latch/ldata/core/transfer_types.h>
#include <latch/ldata/core/types.h>

#include <string>

namespace latch::ldata::test {

// =============================================================================
// Error Tests
// =============================================================================

TEST(ErrorTest, DefaultIsSuccess) {
    error err;
    EXPECT_EQ(err.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ErrorTest, CodeOnlyUsesDescription) {
    error err(error_code::missing_content_length);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "missing content length");
}

TEST(ErrorTest, CustomMessage) {
    error err(error_code::remote_api_error, "backend said no");
    EXPECT_EQ(err.code, error_code::remote_api_error);
    EXPECT_EQ(err.message, "backend said no");
}

TEST(ErrorTest, CodeValuesAreStable) {
    EXPECT_EQ(static_cast<int>(error_code::invalid_destination), -100);
    EXPECT_EQ(static_cast<int>(error_code::missing_content_length), -120);
    EXPECT_EQ(static_cast<int>(error_code::invalid_chunk_size), -140);
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -160);
    EXPECT_EQ(static_cast<int>(error_code::remote_api_error), -180);
    EXPECT_EQ(static_cast<int>(error_code::already_initialized), -202);
}

TEST(ErrorTest, ToStringCoversCodes) {
    EXPECT_STREQ(to_string(error_code::transfer_cancelled), "transfer cancelled");
    EXPECT_STREQ(to_string(error_code::destination_not_directory),
                 "destination is not a directory");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, HoldsError) {
    result<std::string> r = unexpected{error{error_code::node_not_found, "missing"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::node_not_found);
    EXPECT_EQ(r.error().message, "missing");
}

TEST(ResultTest, MoveOutValue) {
    result<std::string> r = std::string("payload");
    auto moved = std::move(r).value();
    EXPECT_EQ(moved, "payload");
}

TEST(ResultTest, VoidSuccessAndFailure) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::invalid_configuration}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::invalid_configuration);
}

// =============================================================================
// Transfer Value Types
// =============================================================================

TEST(TransferJobTest, KeepsLocatorAndDestination) {
    transfer_job job("https://host/a?sig=1", "/tmp/out/a.txt");
    EXPECT_EQ(job.source_locator(), "https://host/a?sig=1");
    EXPECT_EQ(job.destination(), std::filesystem::path("/tmp/out/a.txt"));
}

TEST(TransferJobTest, EqualityComparesBothFields) {
    transfer_job a("u", "/x");
    transfer_job b("u", "/x");
    transfer_job c("u", "/y");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(TransferSummaryTest, AverageRate) {
    transfer_summary summary(3, 3000, 2.0);
    EXPECT_EQ(summary.file_count(), 3u);
    EXPECT_EQ(summary.total_bytes(), 3000u);
    EXPECT_DOUBLE_EQ(summary.average_rate(), 1500.0);
}

TEST(TransferSummaryTest, ZeroElapsedHasZeroRate) {
    transfer_summary summary(1, 100, 0.0);
    EXPECT_DOUBLE_EQ(summary.average_rate(), 0.0);
}

TEST(EnumStringTest, PolicyModeAndPhase) {
    EXPECT_EQ(to_string(overwrite_policy::force_overwrite), "force_overwrite");
    EXPECT_EQ(to_string(progress_mode::tasks), "tasks");
    EXPECT_EQ(to_string(transfer_phase::failed), "failed");
}

}  // namespace latch::ldata::test
