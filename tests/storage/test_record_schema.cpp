#include <algorithm>
#include "core/test_base.hpp"
#include "core/test_doubles.hpp"
#include "signal_ngin/storage/record_schema.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

class RecordSchemaTest : public TestBase {
protected:
    RecordSchema schema{{"hcqr", "lvp"}, {30, 10}, 30};

    size_t column(const std::string& name) const {
        const auto& cols = schema.columns();
        auto it = std::find(cols.begin(), cols.end(), name);
        EXPECT_NE(it, cols.end()) << "missing column " << name;
        return static_cast<size_t>(it - cols.begin());
    }

    static PredictionRow sample_row() {
        PredictionRow row;
        row.sequence = 3;
        row.tick_time = at_ms(1741944420000);
        row.snapshot_time = at_ms(1741944419875);
        row.wall_time = at_ms(1741944413589);
        row.entry_mid = 25.0;
        row.features[Feature::MID] = 25.0;
        row.features[Feature::SPREAD] = 0.01;

        ModelOutput hcqr;
        hcqr.model_id = "hcqr";
        hcqr.by_horizon[10] = ProbabilityEstimate::of(0.6);
        hcqr.by_horizon[30] = ProbabilityEstimate::unavailable("warming up");
        row.model_outputs.push_back(hcqr);

        BlendedProbability fused10;
        fused10.raw = ProbabilityEstimate::of(0.6);
        fused10.calibrated = ProbabilityEstimate::of(0.58);
        row.ensemble[10] = fused10;

        HorizonOutcome resolved;
        resolved.status = OutcomeStatus::RESOLVED;
        resolved.realized_return = 0.01;
        resolved.realized_up = true;
        row.outcomes[10] = resolved;
        row.outcomes[30] = HorizonOutcome{};
        return row;
    }
};

TEST_F(RecordSchemaTest, ColumnLayout) {
    const auto& cols = schema.columns();
    ASSERT_EQ(cols.size(), 3 + FEATURE_COUNT + 4 + 4 + 2 + 2 + 6 + 1);
    EXPECT_EQ(cols[0], "wall_time_iso");
    EXPECT_EQ(cols[1], "tick_ts_ms");
    EXPECT_EQ(cols[2], "snapshot_ts_ms");
    EXPECT_EQ(cols[3], "mid");
    EXPECT_EQ(cols[3 + FEATURE_COUNT], "p_hcqr_10s");
    EXPECT_EQ(cols.back(), "row_status");

    // Horizons are sorted; the primary aliases follow the per-horizon block
    EXPECT_LT(column("p_hcqr_10s"), column("p_hcqr_30s"));
    EXPECT_LT(column("p_fused_cal_30s"), column("p_hcqr"));
    EXPECT_LT(column("p_fused_cal"), column("status_10s"));
    EXPECT_EQ(schema.horizons(), (std::vector<HorizonKey>{10, 30}));
}

TEST_F(RecordSchemaTest, HeaderMatchesColumns) {
    auto fields = split_csv(schema.header_line());
    EXPECT_EQ(fields, schema.columns());
}

TEST_F(RecordSchemaTest, FormatsRow) {
    auto fields = split_csv(schema.format_row(sample_row()));
    ASSERT_EQ(fields.size(), schema.columns().size());

    EXPECT_EQ(fields[column("wall_time_iso")], "2025-03-14T09:26:53.589Z");
    EXPECT_EQ(fields[column("tick_ts_ms")], "1741944420000");
    EXPECT_EQ(fields[column("snapshot_ts_ms")], "1741944419875");
    EXPECT_EQ(fields[column("mid")], "25");

    EXPECT_EQ(fields[column("p_hcqr_10s")], "0.600000");
    EXPECT_EQ(fields[column("p_hcqr_30s")], "NA");
    // lvp never reported
    EXPECT_EQ(fields[column("p_lvp_10s")], "NA");
    EXPECT_EQ(fields[column("p_fused_10s")], "0.600000");
    EXPECT_EQ(fields[column("p_fused_cal_10s")], "0.580000");
    EXPECT_EQ(fields[column("p_fused_30s")], "NA");

    // Primary horizon is 30s
    EXPECT_EQ(fields[column("p_hcqr")], "NA");
    EXPECT_EQ(fields[column("p_fused")], "NA");

    EXPECT_EQ(fields[column("status_10s")], "resolved");
    EXPECT_EQ(fields[column("realized_ret_10s")], "0.01");
    EXPECT_EQ(fields[column("realized_up_10s")], "1");
    EXPECT_EQ(fields[column("status_30s")], "pending");
    EXPECT_EQ(fields[column("realized_ret_30s")], "");
    EXPECT_EQ(fields[column("realized_up_30s")], "");
    EXPECT_EQ(fields[column("row_status")], "partial");
}

TEST_F(RecordSchemaTest, RejectsUnknownPrimaryHorizon) {
    EXPECT_THROW(RecordSchema({"hcqr"}, {10, 30}, 60), std::invalid_argument);
}
