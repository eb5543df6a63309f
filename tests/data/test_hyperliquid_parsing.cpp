#include "core/test_base.hpp"
#include "signal_ngin/core/time_utils.hpp"
#include "signal_ngin/data/hyperliquid_snapshot_source.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

class HyperliquidParsingTest : public TestBase {
protected:
    nlohmann::json book_response() {
        return nlohmann::json::parse(R"({
            "coin": "HYPE",
            "time": 1741944413589,
            "levels": [
                [{"px": "24.995", "sz": "120.5", "n": 3},
                 {"px": "24.990", "sz": "80.0", "n": 2},
                 {"px": "24.985", "sz": "50.0", "n": 1}],
                [{"px": "25.005", "sz": "40.0", "n": 1},
                 {"px": "25.010", "sz": "60.0", "n": 4},
                 {"px": "25.015", "sz": "10.0", "n": 1}]
            ]
        })");
    }
};

TEST_F(HyperliquidParsingTest, ParsesTopOfBookAndDepth) {
    auto parsed = HyperliquidSnapshotSource::parse_l2_book(book_response(), 2);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error()->to_string();

    const auto& s = parsed.value();
    EXPECT_EQ(core::to_epoch_ms(s.timestamp), 1741944413589);
    EXPECT_EQ(s.coin, "HYPE");
    EXPECT_DOUBLE_EQ(s.best_bid, 24.995);
    EXPECT_DOUBLE_EQ(s.best_ask, 25.005);
    EXPECT_DOUBLE_EQ(s.bid_size, 120.5);
    EXPECT_DOUBLE_EQ(s.ask_size, 40.0);
    EXPECT_DOUBLE_EQ(s.bid_depth, 200.5);
    EXPECT_DOUBLE_EQ(s.ask_depth, 100.0);
    EXPECT_NEAR(s.mid(), 25.0, 1e-12);
}

TEST_F(HyperliquidParsingTest, DepthIsLimitedByAvailableLevels) {
    auto parsed = HyperliquidSnapshotSource::parse_l2_book(book_response(), 10);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_DOUBLE_EQ(parsed.value().bid_depth, 250.5);
    EXPECT_DOUBLE_EQ(parsed.value().ask_depth, 110.0);
}

TEST_F(HyperliquidParsingTest, RejectsEmptySide) {
    auto response = book_response();
    response["levels"][1] = nlohmann::json::array();
    auto parsed = HyperliquidSnapshotSource::parse_l2_book(response, 5);
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(HyperliquidParsingTest, RejectsCrossedBook) {
    auto response = book_response();
    response["levels"][0][0]["px"] = "25.100";
    auto parsed = HyperliquidSnapshotSource::parse_l2_book(response, 5);
    EXPECT_TRUE(parsed.is_error());
}

TEST_F(HyperliquidParsingTest, RejectsMissingFieldsAndBadNumbers) {
    auto no_time = book_response();
    no_time.erase("time");
    EXPECT_TRUE(HyperliquidSnapshotSource::parse_l2_book(no_time, 5).is_error());

    auto bad_px = book_response();
    bad_px["levels"][0][0]["px"] = "abc";
    auto parsed = HyperliquidSnapshotSource::parse_l2_book(bad_px, 5);
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(HyperliquidParsingTest, SummarizesTradesInsideWindow) {
    auto trades = nlohmann::json::parse(R"([
        {"coin": "HYPE", "side": "B", "px": "25.0", "sz": "10", "time": 1000000},
        {"coin": "HYPE", "side": "A", "px": "25.0", "sz": "4",  "time": 1020000},
        {"coin": "HYPE", "side": "B", "px": "25.0", "sz": "2.5", "time": 1030000},
        {"coin": "HYPE", "side": "A", "px": "25.0", "sz": "7",  "time": 970000},
        {"coin": "HYPE", "side": "B", "px": "25.0", "sz": "100", "time": 1030001}
    ])");

    // Window (1000000, 1030000]: the first trade sits on the open bound and is excluded
    auto flow = HyperliquidSnapshotSource::summarize_trades(
        trades, core::from_epoch_ms(1030000), std::chrono::milliseconds(30000));
    ASSERT_TRUE(flow.is_ok());
    EXPECT_DOUBLE_EQ(flow.value().buy_volume, 2.5);
    EXPECT_DOUBLE_EQ(flow.value().sell_volume, 4.0);
    EXPECT_EQ(flow.value().trade_count, 2);
}

TEST_F(HyperliquidParsingTest, TradesResponseMustBeArray) {
    auto flow = HyperliquidSnapshotSource::summarize_trades(
        nlohmann::json::object(), core::from_epoch_ms(0), std::chrono::milliseconds(1000));
    ASSERT_TRUE(flow.is_error());
    EXPECT_EQ(flow.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(HyperliquidParsingTest, UnreachableEndpointIsDataUnavailable) {
    HyperliquidConfig config;
    config.api_url = "http://127.0.0.1:9/info";  // discard port, nothing listens
    config.request_timeout_ms = 200;
    auto clock = std::make_shared<SystemClock>();
    HyperliquidSnapshotSource source(config, clock);

    auto fetched = source.fetch(std::chrono::milliseconds(500));
    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error()->code(), ErrorCode::DATA_UNAVAILABLE);
    EXPECT_EQ(source.name(), "hyperliquid:HYPE");
}
