/// @file tests/data/test_indicators.cpp
/// @brief Unit tests for SMA and Wilder RSI kernels.

#include "symphony/market_data.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace symphony;
using symphony::data::IndicatorCalculator;

// ─── SMA ─────────────────────────────────────────────────────────────────────

TEST(Indicators_Sma, WarmupThenRollingMean) {
    const std::vector<double> closes{1.0, 2.0, 3.0, 4.0, 5.0};
    auto sma = IndicatorCalculator::sma(closes, 3);
    ASSERT_EQ(sma.size(), closes.size());
    EXPECT_TRUE(std::isnan(sma[0]));
    EXPECT_TRUE(std::isnan(sma[1]));
    EXPECT_DOUBLE_EQ(sma[2], 2.0);
    EXPECT_DOUBLE_EQ(sma[3], 3.0);
    EXPECT_DOUBLE_EQ(sma[4], 4.0);
}

TEST(Indicators_Sma, ShortSeriesAllUndefined) {
    const std::vector<double> closes{1.0, 2.0};
    for (double v : IndicatorCalculator::sma(closes, 3)) {
        EXPECT_TRUE(std::isnan(v));
    }
}

TEST(Indicators_Sma, WindowOneIsClose) {
    const std::vector<double> closes{7.0, 8.0};
    auto sma = IndicatorCalculator::sma(closes, 1);
    EXPECT_DOUBLE_EQ(sma[0], 7.0);
    EXPECT_DOUBLE_EQ(sma[1], 8.0);
}

// ─── RSI ─────────────────────────────────────────────────────────────────────

TEST(Indicators_Rsi, FirstValueAfterWindowChanges) {
    const std::vector<double> closes{1.0, 2.0, 1.0, 3.0};
    auto rsi = IndicatorCalculator::rsi(closes, 2);
    ASSERT_EQ(rsi.size(), 4u);
    EXPECT_TRUE(std::isnan(rsi[0]));
    EXPECT_TRUE(std::isnan(rsi[1]));
    EXPECT_DOUBLE_EQ(rsi[2], 50.0);
    // Wilder smoothing: gain (0.5 + 2) / 2, loss 0.5 / 2.
    EXPECT_NEAR(rsi[3], 100.0 - 100.0 / 6.0, 1e-12);
}

TEST(Indicators_Rsi, AllGainsIsHundred) {
    std::vector<double> closes;
    for (int i = 0; i < 15; ++i) closes.push_back(100.0 + i);
    auto rsi = IndicatorCalculator::rsi(closes, 10);
    EXPECT_DOUBLE_EQ(rsi[10], 100.0);
    EXPECT_DOUBLE_EQ(rsi[14], 100.0);
}

TEST(Indicators_Rsi, FlatIsFifty) {
    const std::vector<double> closes(12, 42.0);
    auto rsi = IndicatorCalculator::rsi(closes, 10);
    EXPECT_DOUBLE_EQ(rsi[10], 50.0);
    EXPECT_DOUBLE_EQ(rsi[11], 50.0);
}

TEST(Indicators_Rsi, AllLossesIsZero) {
    std::vector<double> closes;
    for (int i = 0; i < 6; ++i) closes.push_back(100.0 - i);
    auto rsi = IndicatorCalculator::rsi(closes, 3);
    EXPECT_DOUBLE_EQ(rsi[3], 0.0);
    EXPECT_DOUBLE_EQ(rsi[5], 0.0);
}

TEST(Indicators_Rsi, BoundedZeroToHundred) {
    const std::vector<double> closes{10, 11, 9, 12, 8, 13, 7, 14, 6, 15, 5, 16};
    for (double v : IndicatorCalculator::rsi(closes, 4)) {
        if (std::isnan(v)) continue;
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 100.0);
    }
}

TEST(Indicators_Rsi, ShortSeriesAllUndefined) {
    const std::vector<double> closes{1.0, 2.0, 3.0};
    for (double v : IndicatorCalculator::rsi(closes, 3)) {
        EXPECT_TRUE(std::isnan(v));
    }
}

// ─── Dispatch ────────────────────────────────────────────────────────────────

TEST(Indicators_Compute, DispatchesByKind) {
    const std::vector<double> closes{1.0, 2.0, 3.0};
    auto ma = IndicatorCalculator::compute(closes, {IndicatorKind::MovingAverage, 2});
    EXPECT_DOUBLE_EQ(ma[2], 2.5);
    auto price = IndicatorCalculator::compute(closes, {IndicatorKind::CurrentPrice, 0});
    EXPECT_EQ(price, closes);
}
