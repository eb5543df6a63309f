#include <thread>
#include "core/test_base.hpp"
#include "core/test_doubles.hpp"
#include "signal_ngin/data/latest_snapshot_source.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;
using std::chrono::milliseconds;

class LatestSnapshotSourceTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        clock = std::make_shared<ManualClock>(at_ms(1000000));
        source = std::make_unique<LatestSnapshotSource>(clock, milliseconds(5000));
    }

    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<LatestSnapshotSource> source;
};

TEST_F(LatestSnapshotSourceTest, NothingPublishedIsUnavailable) {
    auto fetched = source->fetch(milliseconds(1));
    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error()->code(), ErrorCode::DATA_UNAVAILABLE);
}

TEST_F(LatestSnapshotSourceTest, FetchReturnsLatestOnce) {
    ASSERT_TRUE(source->publish(make_snapshot(at_ms(999000), 25.0)).is_ok());
    ASSERT_TRUE(source->publish(make_snapshot(at_ms(999500), 25.1)).is_ok());

    auto first = source->fetch(milliseconds(1));
    ASSERT_TRUE(first.is_ok());
    EXPECT_DOUBLE_EQ(first.value()->mid(), 25.1);

    auto second = source->fetch(milliseconds(1));
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error()->code(), ErrorCode::DATA_UNAVAILABLE);
    EXPECT_EQ(source->published_count(), 2u);
}

TEST_F(LatestSnapshotSourceTest, StaleSnapshotIsUnavailable) {
    ASSERT_TRUE(source->publish(make_snapshot(at_ms(990000), 25.0)).is_ok());
    auto fetched = source->fetch(milliseconds(1));
    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error()->code(), ErrorCode::DATA_UNAVAILABLE);
}

TEST_F(LatestSnapshotSourceTest, RejectsOlderAndInvalidSnapshots) {
    ASSERT_TRUE(source->publish(make_snapshot(at_ms(999000), 25.0)).is_ok());
    EXPECT_TRUE(source->publish(make_snapshot(at_ms(999000), 25.2)).is_error());
    EXPECT_TRUE(source->publish(make_snapshot(at_ms(998000), 25.2)).is_error());
    EXPECT_TRUE(source->publish(nullptr).is_error());

    auto crossed = std::make_shared<MarketSnapshot>(*make_snapshot(at_ms(999900), 25.0));
    crossed->best_bid = crossed->best_ask + 0.1;
    EXPECT_TRUE(source->publish(crossed).is_error());
}

TEST_F(LatestSnapshotSourceTest, FetchWakesOnPublishFromAnotherThread) {
    std::thread producer([this]() {
        std::this_thread::sleep_for(milliseconds(20));
        auto published = source->publish(make_snapshot(at_ms(999990), 26.0));
        EXPECT_TRUE(published.is_ok());
    });

    auto fetched = source->fetch(milliseconds(2000));
    producer.join();
    ASSERT_TRUE(fetched.is_ok());
    EXPECT_DOUBLE_EQ(fetched.value()->mid(), 26.0);
}
