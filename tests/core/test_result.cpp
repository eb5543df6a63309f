#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

using namespace signal_ngin;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");
}

TEST_F(ResultTest, ErrorCarriesCodeMessageAndComponent) {
    auto error_result =
        make_error<int>(ErrorCode::DATA_UNAVAILABLE, "Book is stale", "HyperliquidSource");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::DATA_UNAVAILABLE);
    EXPECT_STREQ(error_result.error()->what(), "Book is stale");
    EXPECT_EQ(error_result.error()->component(), "HyperliquidSource");
    EXPECT_EQ(error_result.error()->to_string(),
              "[DATA_UNAVAILABLE] HyperliquidSource: Book is stale");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<int>(ErrorCode::INVALID_ARGUMENT, "bad", "Test");
    EXPECT_THROW(error_result.value(), EngineError);
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    ASSERT_TRUE(result.is_ok());
    std::unique_ptr<int> taken = result.take();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 42);
}

TEST_F(ResultTest, ForwardErrorKeepsCode) {
    auto inner = make_error<int>(ErrorCode::NUMERICAL_ERROR, "singular", "KalmanFilter");
    auto outer = forward_error<std::string>(inner, "LVPModel");

    ASSERT_TRUE(outer.is_error());
    EXPECT_EQ(outer.error()->code(), ErrorCode::NUMERICAL_ERROR);
    EXPECT_STREQ(outer.error()->what(), "singular");
    EXPECT_EQ(outer.error()->component(), "LVPModel");
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());

    auto error = make_error<void>(ErrorCode::FILE_IO_ERROR, "disk full", "Recorder");
    EXPECT_TRUE(error.is_error());
    EXPECT_EQ(error.error()->code(), ErrorCode::FILE_IO_ERROR);

    Result<void> moved = std::move(error);
    EXPECT_TRUE(moved.is_error());
}

TEST_F(ResultTest, ProbabilityEstimateRejectsIllFormedValues) {
    EXPECT_TRUE(ProbabilityEstimate::of(0.0).is_available());
    EXPECT_TRUE(ProbabilityEstimate::of(1.0).is_available());
    EXPECT_FALSE(ProbabilityEstimate::of(1.2).is_available());
    EXPECT_FALSE(ProbabilityEstimate::of(-0.1).is_available());
    EXPECT_FALSE(ProbabilityEstimate::of(std::nan("")).is_available());

    auto missing = ProbabilityEstimate::unavailable("warming up");
    EXPECT_FALSE(missing.is_available());
    EXPECT_EQ(missing.reason, "warming up");
}

TEST_F(ResultTest, ModelOutputUnreportedHorizonIsUnavailable) {
    auto out = ModelOutput::all_unavailable("hcqr", {10, 30}, "timed out");
    EXPECT_EQ(out.by_horizon.size(), 2u);
    EXPECT_EQ(out.available_count(), 0u);
    EXPECT_EQ(out.at(30).reason, "timed out");
    EXPECT_FALSE(out.at(60).is_available());

    out.by_horizon[10] = ProbabilityEstimate::of(0.7);
    EXPECT_EQ(out.available_count(), 1u);
}
