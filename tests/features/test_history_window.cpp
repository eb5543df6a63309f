#include "core/test_base.hpp"
#include "core/test_doubles.hpp"
#include "signal_ngin/features/history_window.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;
using std::chrono::milliseconds;

class HistoryWindowTest : public TestBase {};

TEST_F(HistoryWindowTest, EvictsByCount) {
    HistoryWindow window(milliseconds(1000000), 3);
    for (int i = 1; i <= 5; ++i) {
        ASSERT_TRUE(window.push(make_snapshot(at_ms(i * 1000), 100.0 + i)).is_ok());
    }
    ASSERT_EQ(window.size(), 3u);
    EXPECT_EQ(core::to_epoch_ms(window.entries().front()->timestamp), 3000);
    EXPECT_EQ(core::to_epoch_ms(window.newest()->timestamp), 5000);
}

TEST_F(HistoryWindowTest, EvictsByAgeRelativeToNewest) {
    HistoryWindow window(milliseconds(60000), 100);
    ASSERT_TRUE(window.push(make_snapshot(at_ms(0), 100.0)).is_ok());
    ASSERT_TRUE(window.push(make_snapshot(at_ms(30000), 100.0)).is_ok());
    ASSERT_TRUE(window.push(make_snapshot(at_ms(60000), 100.0)).is_ok());
    // Exactly max_age old is kept
    EXPECT_EQ(window.size(), 3u);

    ASSERT_TRUE(window.push(make_snapshot(at_ms(90000), 100.0)).is_ok());
    EXPECT_EQ(window.size(), 3u);
    EXPECT_EQ(core::to_epoch_ms(window.entries().front()->timestamp), 30000);
}

TEST_F(HistoryWindowTest, RejectsNonIncreasingTimestamps) {
    HistoryWindow window(milliseconds(60000), 10);
    ASSERT_TRUE(window.push(make_snapshot(at_ms(5000), 100.0)).is_ok());

    auto same = window.push(make_snapshot(at_ms(5000), 101.0));
    ASSERT_TRUE(same.is_error());
    EXPECT_EQ(same.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_TRUE(window.push(make_snapshot(at_ms(4000), 101.0)).is_error());
    EXPECT_TRUE(window.push(nullptr).is_error());
    EXPECT_EQ(window.size(), 1u);
}

TEST_F(HistoryWindowTest, LatestAtOrBefore) {
    HistoryWindow window(milliseconds(600000), 10);
    for (int64_t t : {10000, 20000, 30000}) {
        ASSERT_TRUE(window.push(make_snapshot(at_ms(t), static_cast<double>(t))).is_ok());
    }

    EXPECT_EQ(window.latest_at_or_before(at_ms(9999)), nullptr);
    EXPECT_EQ(core::to_epoch_ms(window.latest_at_or_before(at_ms(10000))->timestamp), 10000);
    EXPECT_EQ(core::to_epoch_ms(window.latest_at_or_before(at_ms(25000))->timestamp), 20000);
    EXPECT_EQ(core::to_epoch_ms(window.latest_at_or_before(at_ms(99000))->timestamp), 30000);
}

TEST_F(HistoryWindowTest, RejectsZeroBounds) {
    EXPECT_THROW(HistoryWindow(milliseconds(0), 10), std::invalid_argument);
    EXPECT_THROW(HistoryWindow(milliseconds(1000), 0), std::invalid_argument);
}
