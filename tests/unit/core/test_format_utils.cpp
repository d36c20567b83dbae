/**
 * @file test_format_utils.cpp
 * @brief Unit tests for size and duration formatting
 */

#include <gtest/gtest.h>

#include <latch/ldata/core/format_utils.h>

namespace latch::ldata::test {

TEST(WithSiSuffixTest, SmallValuesInBytes) {
    EXPECT_EQ(with_si_suffix(0), "0 B");
    EXPECT_EQ(with_si_suffix(999), "999 B");
}

TEST(WithSiSuffixTest, DecimalUnits) {
    EXPECT_EQ(with_si_suffix(1000), "1.00 KB");
    EXPECT_EQ(with_si_suffix(1500000), "1.50 MB");
    EXPECT_EQ(with_si_suffix(5ULL * 1000 * 1000 * 1000), "5.00 GB");
}

TEST(HumanReadableTimeTest, Seconds) {
    EXPECT_EQ(human_readable_time(0.0), "0.00s");
    EXPECT_EQ(human_readable_time(2.5), "2.50s");
}

TEST(HumanReadableTimeTest, MinutesAndHours) {
    EXPECT_EQ(human_readable_time(61.0), "1m 1s");
    EXPECT_EQ(human_readable_time(3723.4), "1h 2m 3s");
}

TEST(HumanReadableTimeTest, NegativeClampsToZero) {
    EXPECT_EQ(human_readable_time(-3.0), "0.00s");
}

}  // namespace latch::ldata::test
