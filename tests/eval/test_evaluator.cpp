/// @file tests/eval/test_evaluator.cpp
/// @brief Unit tests for the strategy-tree Evaluator.

#include "symphony/evaluator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace symphony;
using namespace symphony::ast;
using symphony::data::MarketData;
using symphony::eval::Evaluator;

namespace {

Date day(int d) {
    return std::chrono::sys_days{std::chrono::year{2024} / 1 / d};
}

constexpr IndicatorRef kRsi10{IndicatorKind::Rsi, 10};
constexpr IndicatorRef kSma20{IndicatorKind::MovingAverage, 20};

/// One-day market where each symbol has a close and an RSI(10) value.
MarketData market_with_rsi(const std::vector<std::pair<std::string, double>>& rsi) {
    MarketData market;
    for (const auto& [symbol, value] : rsi) {
        market.add_closes(symbol, {day(2)}, {100.0});
        market.add_indicator(symbol, kRsi10, {value});
    }
    return market;
}

NodePtr rsi_filter(SelectMode mode, std::uint32_t count, std::vector<NodePtr> candidates) {
    return make_filter(kRsi10, Selector{.mode = mode, .count = count}, std::move(candidates));
}

}  // namespace

// ─── Leaves and combinators ──────────────────────────────────────────────────

TEST(Evaluator_Basic, AssetIsFullAllocation) {
    MarketData market;
    Evaluator evaluator(market);
    auto result = evaluator.evaluate(*make_asset("SPY"), day(2));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_DOUBLE_EQ(result->at("SPY"), 1.0);
}

TEST(Evaluator_Basic, GroupIsTransparent) {
    MarketData market;
    Evaluator evaluator(market);
    auto result = evaluator.evaluate(*make_group("Safe Haven", make_asset("TLT")), day(2));
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result->at("TLT"), 1.0);
}

TEST(Evaluator_WeightEqual, DuplicateBranchesAccumulate) {
    MarketData market;
    Evaluator evaluator(market);
    auto tree = make_weight_equal({make_asset("S"), make_asset("S"), make_asset("T")});
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 2u);
    EXPECT_NEAR(result->at("S"), 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(result->at("T"), 1.0 / 3.0, 1e-12);
}

TEST(Evaluator_WeightEqual, EmptyIsAllCash) {
    MarketData market;
    Evaluator evaluator(market);
    auto result = evaluator.evaluate(*make_weight_equal({}), day(2));
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->empty());
}

TEST(Evaluator_WeightEqual, EmptyBranchContributesNothing) {
    MarketData market;
    Evaluator evaluator(market);
    // No RSI data, so every filter candidate is dropped and the branch is {}.
    auto tree = make_weight_equal({
        rsi_filter(SelectMode::Top, 1, {make_asset("A"), make_asset("B")}),
        make_asset("TLT"),
    });
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_DOUBLE_EQ(result->at("TLT"), 1.0);
}

TEST(Evaluator_WeightSpecified, WeightsAreNormalized) {
    MarketData market;
    Evaluator evaluator(market);
    auto tree = make_weight_specified({
        WeightedBranch{.weight = 3.0, .node = make_asset("SPY")},
        WeightedBranch{.weight = 1.0, .node = make_asset("TLT")},
    });
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result->at("SPY"), 0.75);
    EXPECT_DOUBLE_EQ(result->at("TLT"), 0.25);
}

TEST(Evaluator_WeightSpecified, ZeroWeightBranchDropped) {
    MarketData market;
    Evaluator evaluator(market);
    auto tree = make_weight_specified({
        WeightedBranch{.weight = 0.0, .node = make_asset("SPY")},
        WeightedBranch{.weight = 2.0, .node = make_asset("TLT")},
    });
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->count("SPY"), 0u);
    EXPECT_DOUBLE_EQ(result->at("TLT"), 1.0);
}

TEST(Evaluator_WeightSpecified, DuplicateSymbolsAccumulate) {
    MarketData market;
    Evaluator evaluator(market);
    auto tree = make_weight_specified({
        WeightedBranch{.weight = 1.0, .node = make_asset("A")},
        WeightedBranch{.weight = 1.0, .node = make_asset("A")},
        WeightedBranch{.weight = 2.0, .node = make_asset("B")},
    });
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 2u);
    EXPECT_DOUBLE_EQ(result->at("A"), 0.5);
    EXPECT_DOUBLE_EQ(result->at("B"), 0.5);
}

TEST(Evaluator_WeightSpecified, PairWeightAppliesToEverySymbol) {
    MarketData market;
    Evaluator evaluator(market);
    auto tree = make_weight_specified({
        WeightedBranch{.weight = 0.6,
                       .node = make_weight_equal({make_asset("A"), make_asset("B")})},
        WeightedBranch{.weight = 0.4, .node = make_asset("C")},
    });
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 3u);
    EXPECT_NEAR(result->at("A"), 0.6 / 1.6, 1e-12);
    EXPECT_NEAR(result->at("B"), 0.6 / 1.6, 1e-12);
    EXPECT_NEAR(result->at("C"), 0.4 / 1.6, 1e-12);
}

TEST(Evaluator_WeightSpecified, EmptyIsAllCash) {
    MarketData market;
    Evaluator evaluator(market);
    auto result = evaluator.evaluate(*make_weight_specified({}), day(2));
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->empty());
}

// ─── Conditions ──────────────────────────────────────────────────────────────

TEST(Evaluator_If, TakesThenBranchWhenTrue) {
    MarketData market;
    market.add_closes("SPY", {day(2)}, {105.0});
    market.add_indicator("SPY", kSma20, {100.0});
    Evaluator evaluator(market);

    Condition cond{Comparator::Greater, CurrentPrice{"SPY"}, MovingAveragePrice{"SPY", 20}};
    auto tree = make_if(cond, make_asset("X"), make_asset("Y"));
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_DOUBLE_EQ(result->at("X"), 1.0);
}

TEST(Evaluator_If, TakesElseBranchWhenFalse) {
    MarketData market;
    market.add_closes("SPY", {day(2)}, {95.0});
    market.add_indicator("SPY", kSma20, {100.0});
    Evaluator evaluator(market);

    Condition cond{Comparator::Greater, CurrentPrice{"SPY"}, MovingAveragePrice{"SPY", 20}};
    auto result = evaluator.evaluate(*make_if(cond, make_asset("X"), make_asset("Y")), day(2));
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result->at("Y"), 1.0);
}

TEST(Evaluator_If, MissingIndicatorIsDataUnavailable) {
    MarketData market;
    market.add_closes("SPY", {day(2)}, {105.0});
    Evaluator evaluator(market);

    Condition cond{Comparator::Less, Rsi{"SPY", 10}, Literal{30.0}};
    auto result = evaluator.evaluate(*make_if(cond, make_asset("X"), make_asset("Y")), day(2));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::DataUnavailable);
    EXPECT_EQ(result.error().symbol, "SPY");
    ASSERT_TRUE(result.error().indicator.has_value());
    EXPECT_EQ(*result.error().indicator, kRsi10);
}

TEST(Evaluator_If, UntakenBranchIsNotEvaluated) {
    MarketData market;
    Evaluator evaluator(market);

    // The else branch would fail for lack of data; the literal comparison never reaches it.
    Condition always{Comparator::Greater, Literal{2.0}, Literal{1.0}};
    Condition broken{Comparator::Greater, Rsi{"NOPE", 10}, Literal{0.0}};
    auto tree = make_if(always, make_asset("X"),
                        make_if(broken, make_asset("Y"), make_asset("Z")));
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result->at("X"), 1.0);
}

TEST(Evaluator_If, ConditionInAllocationPositionIsMalformed) {
    MarketData market;
    Evaluator evaluator(market);
    auto node = make_condition({Comparator::Equal, Literal{1.0}, Literal{1.0}});
    auto result = evaluator.evaluate(*node, day(2));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::MalformedExpression);
}

TEST(Evaluator_Resolve, CurrentPriceUsesLatestCloseAsOf) {
    MarketData market;
    market.add_closes("QQQ", {day(2), day(4)}, {10.0, 12.0});
    Evaluator evaluator(market);

    auto on_3 = evaluator.resolve(CurrentPrice{"QQQ"}, day(3));
    ASSERT_TRUE(on_3.ok());
    EXPECT_DOUBLE_EQ(*on_3, 10.0);

    auto before = evaluator.resolve(CurrentPrice{"QQQ"}, day(1));
    ASSERT_FALSE(before.ok());
    EXPECT_EQ(before.error().kind, ErrorKind::DataUnavailable);
    EXPECT_FALSE(before.error().indicator.has_value());
}

// ─── Filter ──────────────────────────────────────────────────────────────────

TEST(Evaluator_Filter, TopSelectsHighest) {
    auto market = market_with_rsi({{"A", 30.0}, {"B", 70.0}});
    Evaluator evaluator(market);
    auto tree = rsi_filter(SelectMode::Top, 1, {make_asset("A"), make_asset("B")});
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_DOUBLE_EQ(result->at("B"), 1.0);
}

TEST(Evaluator_Filter, BottomSelectsLowest) {
    auto market = market_with_rsi({{"A", 30.0}, {"B", 70.0}});
    Evaluator evaluator(market);
    auto tree = rsi_filter(SelectMode::Bottom, 1, {make_asset("A"), make_asset("B")});
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_DOUBLE_EQ(result->at("A"), 1.0);
}

TEST(Evaluator_Filter, CountAboveSurvivorsTakesAll) {
    auto market = market_with_rsi({{"A", 30.0}, {"B", 70.0}});
    Evaluator evaluator(market);
    auto tree = rsi_filter(SelectMode::Top, 5, {make_asset("A"), make_asset("B")});
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 2u);
    EXPECT_DOUBLE_EQ(result->at("A"), 0.5);
    EXPECT_DOUBLE_EQ(result->at("B"), 0.5);
}

TEST(Evaluator_Filter, UnrankableCandidateDroppedWithNote) {
    auto market = market_with_rsi({{"A", 30.0}, {"B", 70.0}});
    Evaluator evaluator(market);
    auto tree = rsi_filter(SelectMode::Top, 2,
                           {make_asset("A"), make_asset("GHOST"), make_asset("B")});
    std::vector<std::string> notes;
    auto result = evaluator.evaluate(*tree, day(2), notes);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->count("GHOST"), 0u);
    EXPECT_EQ(result->size(), 2u);
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_NE(notes[0].find("GHOST"), std::string::npos);
}

TEST(Evaluator_Filter, NoSurvivorsIsAllCash) {
    MarketData market;
    Evaluator evaluator(market);
    auto tree = rsi_filter(SelectMode::Top, 1, {make_asset("A"), make_asset("B")});
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->empty());
}

TEST(Evaluator_Filter, TiesKeepCandidateOrder) {
    auto market = market_with_rsi({{"A", 50.0}, {"B", 50.0}, {"C", 50.0}});
    Evaluator evaluator(market);
    auto tree = rsi_filter(SelectMode::Top, 1,
                           {make_asset("C"), make_asset("A"), make_asset("B")});
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ(result->begin()->first, "C");
}

TEST(Evaluator_Filter, NestedCandidatesAreFlattened) {
    auto market = market_with_rsi({{"A", 10.0}, {"B", 20.0}, {"C", 90.0}});
    Evaluator evaluator(market);
    auto tree = rsi_filter(SelectMode::Top, 1, {
        make_asset("A"),
        make_weight_equal({make_asset("B"), make_asset("C")}),
    });
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result->at("C"), 1.0);
}

TEST(Evaluator_Filter, CurrentPriceRanksByClose) {
    MarketData market;
    market.add_closes("A", {day(2)}, {50.0});
    market.add_closes("B", {day(2)}, {400.0});
    Evaluator evaluator(market);
    auto tree = make_filter(IndicatorRef{IndicatorKind::CurrentPrice, 0},
                            Selector{.mode = SelectMode::Bottom, .count = 1},
                            {make_asset("A"), make_asset("B")});
    auto result = evaluator.evaluate(*tree, day(2));
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result->at("A"), 1.0);
}

// ─── Normalisation ───────────────────────────────────────────────────────────

TEST(Evaluator_Normalize, SumsToOne) {
    auto out = Evaluator::normalize({{"A", 2.0}, {"B", 6.0}});
    EXPECT_DOUBLE_EQ(out.at("A"), 0.25);
    EXPECT_DOUBLE_EQ(out.at("B"), 0.75);
}

TEST(Evaluator_Normalize, DropsNonPositive) {
    auto out = Evaluator::normalize({{"A", 0.0}, {"B", -1.0}, {"C", 4.0}});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out.at("C"), 1.0);
}

TEST(Evaluator_Normalize, AllZeroIsEmpty) {
    EXPECT_TRUE(Evaluator::normalize({{"A", 0.0}}).empty());
    EXPECT_TRUE(Evaluator::normalize({}).empty());
}

TEST(Evaluator_Program, NullRootIsMalformed) {
    MarketData market;
    Evaluator evaluator(market);
    Program program{.name = "empty", .description = "", .root = nullptr};
    auto result = evaluator.evaluate(program, day(2));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::MalformedExpression);
}
