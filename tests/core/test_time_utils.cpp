#include <gtest/gtest.h>
#include <ctime>
#include "signal_ngin/core/time_utils.hpp"

using namespace signal_ngin::core;
using std::chrono::milliseconds;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpoch) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, SafeLocaltimeValidInput) {
    std::time_t now = std::time(nullptr);
    std::tm result;

    std::tm* ret = safe_localtime(&now, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_GE(result.tm_year, 100);
}

TEST_F(TimeUtilsTest, EpochMillisecondsRoundTrip) {
    int64_t ms = 1741944413589;
    EXPECT_EQ(to_epoch_ms(from_epoch_ms(ms)), ms);
}

TEST_F(TimeUtilsTest, Iso8601WithMilliseconds) {
    EXPECT_EQ(to_iso8601_utc(from_epoch_ms(1741944413589)), "2025-03-14T09:26:53.589Z");
    EXPECT_EQ(to_iso8601_utc(from_epoch_ms(0)), "1970-01-01T00:00:00.000Z");
}

TEST_F(TimeUtilsTest, FormatTimeUsesUtcByDefault) {
    EXPECT_EQ(format_time(from_epoch_ms(1741944413589), "%Y%m%d_%H%M%S"), "20250314_092653");
}

TEST_F(TimeUtilsTest, NextGridInstantIsStrictlyAfterNow) {
    milliseconds cadence(30000);
    EXPECT_EQ(to_epoch_ms(next_grid_instant(from_epoch_ms(61000), cadence)), 90000);
    EXPECT_EQ(to_epoch_ms(next_grid_instant(from_epoch_ms(60000), cadence)), 90000);
    EXPECT_EQ(to_epoch_ms(next_grid_instant(from_epoch_ms(89999), cadence)), 90000);
}

TEST_F(TimeUtilsTest, NextGridInstantIsEpochAnchored) {
    milliseconds cadence(10000);
    auto a = next_grid_instant(from_epoch_ms(1741944413589), cadence);
    EXPECT_EQ(to_epoch_ms(a) % 10000, 0);
    EXPECT_EQ(to_epoch_ms(a), 1741944420000);
}
