#include "core/test_base.hpp"
#include "core/test_doubles.hpp"
#include "signal_ngin/models/lvp_model.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

class LVPModelTest : public TestBase {
protected:
    static FeatureVector features_at(int64_t ms, double mid) {
        FeatureVector fv;
        fv.timestamp = at_ms(ms);
        fv.mid = mid;
        fv[Feature::MID] = mid;
        return fv;
    }

    LVPConfig config() {
        LVPConfig c;
        c.min_returns = 10;
        return c;
    }
};

TEST_F(LVPModelTest, UnavailableUntilEnoughReturns) {
    LVPModel model("lvp", {10, 30, 60}, config());
    double mid = 25.0;
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(model.update(features_at(i * 10000, mid)).is_ok());
        mid *= (i % 2 == 0) ? 1.0003 : 1.0001;
    }
    EXPECT_EQ(model.returns_seen(), 9u);

    auto out = model.score(features_at(100000, mid));
    ASSERT_TRUE(out.is_ok());
    EXPECT_EQ(out.value().available_count(), 0u);
    EXPECT_EQ(out.value().by_horizon.size(), 3u);
}

TEST_F(LVPModelTest, PositiveDriftGivesUpBias) {
    LVPModel model("lvp", {10, 30, 60}, config());
    double mid = 25.0;
    for (int i = 0; i < 30; ++i) {
        ASSERT_TRUE(model.update(features_at(i * 10000, mid)).is_ok());
        mid *= (i % 2 == 0) ? 1.0003 : 1.0001;
    }
    EXPECT_GT(model.drift(), 0.0);

    auto out = model.score(features_at(300000, mid));
    ASSERT_TRUE(out.is_ok());
    for (HorizonKey h : {10, 30, 60}) {
        auto est = out.value().at(h);
        ASSERT_TRUE(est.is_available()) << est.reason;
        EXPECT_GT(*est.p, 0.5);
        EXPECT_LT(*est.p, 1.0);
    }
    // Drift accumulates faster than volatility, so longer horizons lean further
    EXPECT_GT(*out.value().at(60).p, *out.value().at(10).p);
}

TEST_F(LVPModelTest, FlatPriceHasNoVolatility) {
    LVPModel model("lvp", {10}, config());
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(model.update(features_at(i * 10000, 25.0)).is_ok());
    }
    auto out = model.score(features_at(200000, 25.0));
    ASSERT_TRUE(out.is_ok());
    EXPECT_FALSE(out.value().at(10).is_available());
}

TEST_F(LVPModelTest, LongGapsAreNotReturns) {
    LVPModel model("lvp", {10}, config());
    ASSERT_TRUE(model.update(features_at(0, 25.0)).is_ok());
    ASSERT_TRUE(model.update(features_at(10000, 25.1)).is_ok());
    EXPECT_EQ(model.returns_seen(), 1u);

    ASSERT_TRUE(model.update(features_at(610000, 26.0)).is_ok());
    EXPECT_EQ(model.returns_seen(), 1u);

    ASSERT_TRUE(model.update(features_at(620000, 26.1)).is_ok());
    EXPECT_EQ(model.returns_seen(), 2u);
}
