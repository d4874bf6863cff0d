/// @file tests/data/test_market_data.cpp
/// @brief Unit tests for MarketData as-of lookups and date alignment.

#include "symphony/market_data.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <vector>

using namespace symphony;
using namespace symphony::data;

namespace {

Date day(int d) {
    return std::chrono::sys_days{std::chrono::year{2024} / 1 / d};
}

OHLCV bar(int d, double close) {
    return OHLCV{day(d), close, close, close, close, 1000.0};
}

}  // namespace

// ─── Closes ──────────────────────────────────────────────────────────────────

TEST(MarketData_Close, AsOfUsesLatestEarlierBar) {
    MarketData market;
    const std::vector<OHLCV> bars{bar(2, 10.0), bar(5, 11.0)};
    market.add_series("SPY", bars);

    EXPECT_FALSE(market.close("SPY", day(1)).has_value());
    EXPECT_DOUBLE_EQ(*market.close("SPY", day(2)), 10.0);
    EXPECT_DOUBLE_EQ(*market.close("SPY", day(4)), 10.0);
    EXPECT_DOUBLE_EQ(*market.close("SPY", day(9)), 11.0);
}

TEST(MarketData_Close, UnknownSymbol) {
    MarketData market;
    EXPECT_FALSE(market.close("NOPE", day(2)).has_value());
    EXPECT_FALSE(market.has_symbol("NOPE"));
}

TEST(MarketData_Close, NaNCloseIsUnavailable) {
    MarketData market;
    market.add_closes("X", {day(2)}, {std::nan("")});
    EXPECT_FALSE(market.close("X", day(2)).has_value());
}

// ─── Indicators ──────────────────────────────────────────────────────────────

TEST(MarketData_Indicator, ComputedColumnLookup) {
    MarketData market;
    market.add_closes("SPY", {day(2), day(3), day(4)}, {1.0, 2.0, 3.0});
    const IndicatorRef sma2{IndicatorKind::MovingAverage, 2};
    market.compute_indicators(sma2, {"SPY", "ABSENT"});

    EXPECT_FALSE(market.indicator("SPY", sma2, day(2)).has_value());
    EXPECT_DOUBLE_EQ(*market.indicator("SPY", sma2, day(3)), 1.5);
    EXPECT_DOUBLE_EQ(*market.indicator("SPY", sma2, day(10)), 2.5);
}

TEST(MarketData_Indicator, MissingColumnIsUnavailable) {
    MarketData market;
    market.add_closes("SPY", {day(2)}, {1.0});
    EXPECT_FALSE(market.indicator("SPY", {IndicatorKind::Rsi, 10}, day(2)).has_value());
}

TEST(MarketData_Indicator, CurrentPriceRoutesToClose) {
    MarketData market;
    market.add_closes("SPY", {day(2)}, {470.0});
    auto v = market.indicator("SPY", {IndicatorKind::CurrentPrice, 0}, day(2));
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 470.0);
}

TEST(MarketData_Indicator, AddIndicatorChecksLength) {
    MarketData market;
    market.add_closes("SPY", {day(2), day(3)}, {1.0, 2.0});
    const IndicatorRef rsi{IndicatorKind::Rsi, 10};
    EXPECT_FALSE(market.add_indicator("SPY", rsi, {50.0}));
    EXPECT_FALSE(market.add_indicator("QQQ", rsi, {50.0, 60.0}));
    EXPECT_TRUE(market.add_indicator("SPY", rsi, {50.0, 60.0}));
    EXPECT_DOUBLE_EQ(*market.indicator("SPY", rsi, day(3)), 60.0);
}

// ─── Alignment ───────────────────────────────────────────────────────────────

TEST(MarketData_Dates, CommonDatesIntersect) {
    MarketData market;
    market.add_closes("A", {day(2), day(3), day(4)}, {1.0, 1.0, 1.0});
    market.add_closes("B", {day(3), day(4), day(5)}, {1.0, 1.0, 1.0});
    EXPECT_EQ(market.common_dates(), (std::vector<Date>{day(3), day(4)}));
    EXPECT_EQ(market.symbols(), (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(market.dates("B").size(), 3u);
    EXPECT_TRUE(market.dates("C").empty());
}

TEST(MarketData_Dates, EmptyMarket) {
    MarketData market;
    EXPECT_TRUE(market.common_dates().empty());
}
