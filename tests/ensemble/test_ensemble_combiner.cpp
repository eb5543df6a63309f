#include <cmath>
#include "core/test_base.hpp"
#include "signal_ngin/ensemble/ensemble_combiner.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

class EnsembleCombinerTest : public TestBase {
protected:
    static ModelOutput output(const std::string& id, std::map<HorizonKey, double> probs,
                              std::vector<HorizonKey> unavailable = {}) {
        ModelOutput out;
        out.model_id = id;
        for (const auto& [h, p] : probs) {
            out.by_horizon[h] = ProbabilityEstimate::of(p);
        }
        for (HorizonKey h : unavailable) {
            out.by_horizon[h] = ProbabilityEstimate::unavailable("warming up");
        }
        return out;
    }

    EnsembleConfig config(CombinationRule rule = CombinationRule::WEIGHTED_MEAN) {
        EnsembleConfig c;
        c.rule = rule;
        c.weights = {{"hcqr", 1.0}, {"lvp", 3.0}, {"rrf", 0.0}};
        return c;
    }
};

TEST_F(EnsembleCombinerTest, WeightedMean) {
    EnsembleCombiner combiner(config());
    auto prediction =
        combiner.combine({output("hcqr", {{30, 0.6}}), output("lvp", {{30, 0.8}})}, {30});

    const auto& blended = prediction.at(30);
    ASSERT_TRUE(blended.raw.is_available());
    EXPECT_NEAR(*blended.raw.p, 0.75, 1e-12);
    // Temperature 1 leaves the value alone inside the floor band
    EXPECT_NEAR(*blended.calibrated.p, 0.75, 1e-12);
    EXPECT_EQ(blended.contributors, (std::vector<std::string>{"hcqr", "lvp"}));
}

TEST_F(EnsembleCombinerTest, RenormalisesOverAvailableModels) {
    EnsembleCombiner combiner(config());
    auto prediction = combiner.combine(
        {output("hcqr", {{10, 0.6}, {30, 0.6}}), output("lvp", {{10, 0.8}}, {30})}, {10, 30});

    EXPECT_NEAR(*prediction.at(10).raw.p, 0.75, 1e-12);
    EXPECT_NEAR(*prediction.at(30).raw.p, 0.6, 1e-12);
    EXPECT_EQ(prediction.at(30).contributors, (std::vector<std::string>{"hcqr"}));
}

TEST_F(EnsembleCombinerTest, ZeroWeightModelIsIgnored) {
    EnsembleCombiner combiner(config());
    auto prediction =
        combiner.combine({output("hcqr", {{60, 0.4}}), output("rrf", {{60, 0.99}})}, {60});
    EXPECT_NEAR(*prediction.at(60).raw.p, 0.4, 1e-12);
    EXPECT_EQ(prediction.at(60).contributors.size(), 1u);
}

TEST_F(EnsembleCombinerTest, AllUnavailableStaysUnavailable) {
    EnsembleCombiner combiner(config());
    auto prediction = combiner.combine(
        {output("hcqr", {}, {10}), output("lvp", {}, {10}), output("rrf", {{10, 0.9}})}, {10, 30});

    for (HorizonKey h : {10, 30}) {
        const auto& blended = prediction.at(h);
        EXPECT_FALSE(blended.raw.is_available());
        EXPECT_FALSE(blended.calibrated.is_available());
        EXPECT_NE(blended.raw.reason.find("ENSEMBLE_UNRESOLVABLE"), std::string::npos);
        EXPECT_TRUE(blended.contributors.empty());
    }
}

TEST_F(EnsembleCombinerTest, WeightedLogOdds) {
    EnsembleConfig c = config(CombinationRule::WEIGHTED_LOG_ODDS);
    c.weights = {};
    EnsembleCombiner combiner(c);

    auto opposed = combiner.blend({{1.0, 0.8}, {1.0, 0.2}});
    ASSERT_TRUE(opposed.is_ok());
    EXPECT_NEAR(opposed.value(), 0.5, 1e-12);

    auto agreeing = combiner.blend({{2.0, 0.8}, {1.0, 0.8}});
    ASSERT_TRUE(agreeing.is_ok());
    EXPECT_NEAR(agreeing.value(), 0.8, 1e-9);

    auto empty = combiner.blend({});
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::ENSEMBLE_UNRESOLVABLE);
}

TEST_F(EnsembleCombinerTest, UnlistedModelsWeighOne) {
    EnsembleCombiner combiner(config());
    EXPECT_DOUBLE_EQ(combiner.weight_of("lvp"), 3.0);
    EXPECT_DOUBLE_EQ(combiner.weight_of("someone_else"), 1.0);
}

TEST_F(EnsembleCombinerTest, CalibrationTemperatureAndFloor) {
    EnsembleConfig c = config();
    c.calibration_temperature = 2.0;
    c.probability_floor = 0.01;
    EnsembleCombiner combiner(c);

    EXPECT_NEAR(combiner.calibrate(0.8), 2.0 / 3.0, 1e-9);
    EXPECT_NEAR(combiner.calibrate(0.5), 0.5, 1e-12);
    EXPECT_NEAR(combiner.calibrate(1.0), 0.99, 1e-12);
    EXPECT_NEAR(combiner.calibrate(0.0), 0.01, 1e-12);
}

TEST_F(EnsembleCombinerTest, RejectsBadConfiguration) {
    EnsembleConfig negative = config();
    negative.weights["lvp"] = -1.0;
    EXPECT_THROW(EnsembleCombiner{negative}, std::invalid_argument);

    EnsembleConfig cold = config();
    cold.calibration_temperature = 0.0;
    EXPECT_THROW(EnsembleCombiner{cold}, std::invalid_argument);

    EnsembleConfig wide = config();
    wide.probability_floor = 0.5;
    EXPECT_THROW(EnsembleCombiner{wide}, std::invalid_argument);

    EnsembleConfig parsed;
    EXPECT_THROW(parsed.from_json({{"rule", "MEDIAN"}}), std::invalid_argument);
}
