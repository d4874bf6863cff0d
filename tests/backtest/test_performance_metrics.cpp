/// @file tests/backtest/test_performance_metrics.cpp
/// @brief Unit tests for PerformanceCalculator.

#include "symphony/backtest.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <limits>
#include <vector>

using namespace symphony;
using namespace symphony::backtest;

// ─── Returns ─────────────────────────────────────────────────────────────────

TEST(Metrics_Returns, TotalReturn) {
    const std::vector<double> values{100.0, 90.0, 120.0};
    auto r = PerformanceCalculator::total_return(values);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(*r, 0.2, 1e-12);
}

TEST(Metrics_Returns, TotalReturnUndefined) {
    EXPECT_FALSE(PerformanceCalculator::total_return({}).has_value());
    const std::vector<double> zero_start{0.0, 10.0};
    EXPECT_FALSE(PerformanceCalculator::total_return(zero_start).has_value());
}

TEST(Metrics_Returns, DailyReturns) {
    const std::vector<double> values{100.0, 110.0, 99.0};
    auto r = PerformanceCalculator::daily_returns(values);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_NEAR(r[0], 0.10, 1e-12);
    EXPECT_NEAR(r[1], -0.10, 1e-12);
}

TEST(Metrics_Returns, SingleValueHasNoReturns) {
    const std::vector<double> values{100.0};
    EXPECT_TRUE(PerformanceCalculator::daily_returns(values).empty());
}

// ─── Ratios ──────────────────────────────────────────────────────────────────

TEST(Metrics_Sharpe, MatchesDefinition) {
    const std::vector<double> r{0.01, -0.01, 0.02};
    const double mu = (0.01 - 0.01 + 0.02) / 3.0;
    double ss = 0.0;
    for (double x : r) ss += (x - mu) * (x - mu);
    const double sd = std::sqrt(ss / 2.0);

    auto s = PerformanceCalculator::sharpe(r);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(*s, mu / sd * std::sqrt(252.0), 1e-9);
}

TEST(Metrics_Sharpe, ZeroVarianceIsUndefined) {
    const std::vector<double> flat{0.0, 0.0, 0.0, 0.0};
    EXPECT_FALSE(PerformanceCalculator::sharpe(flat).has_value());
    EXPECT_FALSE(PerformanceCalculator::volatility(flat).has_value());
}

TEST(Metrics_Sharpe, TooShortIsUndefined) {
    const std::vector<double> one{0.05};
    EXPECT_FALSE(PerformanceCalculator::sharpe(one).has_value());
}

TEST(Metrics_Sharpe, NonFiniteIsUndefined) {
    const std::vector<double> bad{0.01, std::numeric_limits<double>::quiet_NaN()};
    EXPECT_FALSE(PerformanceCalculator::sharpe(bad).has_value());
}

TEST(Metrics_Sortino, NeedsDownside) {
    const std::vector<double> all_up{0.01, 0.02, 0.03};
    EXPECT_FALSE(PerformanceCalculator::sortino(all_up).has_value());

    const std::vector<double> mixed{0.03, -0.01, 0.02, -0.02};
    auto s = PerformanceCalculator::sortino(mixed);
    ASSERT_TRUE(s.has_value());
    EXPECT_GT(*s, 0.0);
}

TEST(Metrics_Volatility, Annualised) {
    const std::vector<double> r{0.01, -0.01};
    auto v = PerformanceCalculator::volatility(r, 252.0);
    ASSERT_TRUE(v.has_value());
    EXPECT_NEAR(*v, std::sqrt(0.0002) * std::sqrt(252.0), 1e-12);
}

// ─── Drawdown ────────────────────────────────────────────────────────────────

TEST(Metrics_Drawdown, DeepestPeakToTrough) {
    const std::vector<double> values{100.0, 120.0, 90.0, 130.0, 117.0};
    auto dd = PerformanceCalculator::max_drawdown(values);
    ASSERT_TRUE(dd.has_value());
    EXPECT_NEAR(*dd, -0.25, 1e-12);
}

TEST(Metrics_Drawdown, MonotoneIsZero) {
    const std::vector<double> values{100.0, 101.0, 102.0};
    auto dd = PerformanceCalculator::max_drawdown(values);
    ASSERT_TRUE(dd.has_value());
    EXPECT_DOUBLE_EQ(*dd, 0.0);
}

TEST(Metrics_Drawdown, EmptyIsUndefined) {
    EXPECT_FALSE(PerformanceCalculator::max_drawdown({}).has_value());
}

// ─── Summary ─────────────────────────────────────────────────────────────────

TEST(Metrics_Summary, ConstantBookHasNoRatios) {
    std::vector<DailyValuation> history;
    for (int d = 1; d <= 5; ++d) {
        history.push_back(DailyValuation{
            .date  = std::chrono::sys_days{std::chrono::year{2024} / 1 / d},
            .value = 100000.0});
    }
    auto summary = PerformanceCalculator::summarize(history);
    EXPECT_EQ(summary.trading_days, 5u);
    EXPECT_DOUBLE_EQ(summary.initial_value, 100000.0);
    EXPECT_DOUBLE_EQ(summary.final_value, 100000.0);
    ASSERT_TRUE(summary.total_return.has_value());
    EXPECT_DOUBLE_EQ(*summary.total_return, 0.0);
    EXPECT_FALSE(summary.sharpe_ratio.has_value());
    ASSERT_TRUE(summary.max_drawdown.has_value());
    EXPECT_DOUBLE_EQ(*summary.max_drawdown, 0.0);
    EXPECT_NE(summary.to_string().find("n/a"), std::string::npos);
}

TEST(Metrics_Summary, EmptyHistory) {
    auto summary = PerformanceCalculator::summarize({});
    EXPECT_EQ(summary.trading_days, 0u);
    EXPECT_FALSE(summary.total_return.has_value());
    EXPECT_FALSE(summary.max_drawdown.has_value());
}
