/// @file tests/analysis/test_static_analyzer.cpp
/// @brief Unit tests for StaticAnalyzer ticker and indicator discovery.

#include "symphony/analyzer.hpp"
#include "symphony/parser.hpp"

#include <gtest/gtest.h>

using namespace symphony;
using namespace symphony::ast;
using symphony::analysis::StaticAnalyzer;

// ─── Labels ──────────────────────────────────────────────────────────────────

TEST(Analyzer_Label, SplitsOnPlusAndTrims) {
    auto tokens = StaticAnalyzer::split_label(" SPY + TLT+GLD ");
    EXPECT_EQ(tokens, (std::set<std::string>{"GLD", "SPY", "TLT"}));
}

TEST(Analyzer_Label, IgnoresEmptyTokens) {
    auto tokens = StaticAnalyzer::split_label("QQQ++ ");
    EXPECT_EQ(tokens, (std::set<std::string>{"QQQ"}));
    EXPECT_TRUE(StaticAnalyzer::split_label("").empty());
}

// ─── Requirements ────────────────────────────────────────────────────────────

TEST(Analyzer_Walk, CollectsConditionOperands) {
    Condition cond{Comparator::Greater, CurrentPrice{"SPY"}, MovingAveragePrice{"SPY", 200}};
    auto tree = make_if(cond, make_asset("TQQQ"), make_asset("BIL"));
    auto result = StaticAnalyzer::analyze(*tree);

    EXPECT_EQ(result.tickers, (std::set<std::string>{"BIL", "SPY", "TQQQ"}));
    const IndicatorRef sma200{IndicatorKind::MovingAverage, 200};
    ASSERT_EQ(result.indicator_requirements.size(), 1u);
    EXPECT_EQ(*result.indicator_requirements.begin(), sma200);
    EXPECT_EQ(result.indicator_symbols.at(sma200), (std::set<std::string>{"SPY"}));
    EXPECT_EQ(result.max_window(), 200u);
}

TEST(Analyzer_Walk, FilterRequiresIndicatorForEveryCandidate) {
    const IndicatorRef rsi10{IndicatorKind::Rsi, 10};
    auto tree = make_filter(rsi10, Selector{}, {
        make_asset("A"),
        make_group("B+C", make_weight_equal({make_asset("B"), make_asset("C")})),
    });
    auto result = StaticAnalyzer::analyze(*tree);

    EXPECT_EQ(result.indicator_symbols.at(rsi10), (std::set<std::string>{"A", "B", "C"}));
    EXPECT_EQ(result.tickers, (std::set<std::string>{"A", "B", "C"}));
}

TEST(Analyzer_Walk, CurrentPriceFilterNeedsNoColumn) {
    auto tree = make_filter(IndicatorRef{IndicatorKind::CurrentPrice, 0}, Selector{},
                            {make_asset("A"), make_asset("B")});
    auto result = StaticAnalyzer::analyze(*tree);
    EXPECT_TRUE(result.indicator_requirements.empty());
    EXPECT_EQ(result.max_window(), 0u);
    EXPECT_EQ(result.tickers.size(), 2u);
}

TEST(Analyzer_Walk, GroupLabelTokensAreTickers) {
    auto tree = make_group("SPY+TLT", make_asset("QQQ"));
    auto result = StaticAnalyzer::analyze(*tree);
    EXPECT_EQ(result.tickers, (std::set<std::string>{"QQQ", "SPY", "TLT"}));
}

TEST(Analyzer_Walk, LiteralsContributeNothing) {
    Condition cond{Comparator::Less, Rsi{"SPY", 14}, Literal{30.0}};
    auto result = StaticAnalyzer::analyze(*make_condition(cond));
    EXPECT_EQ(result.tickers, (std::set<std::string>{"SPY"}));
    EXPECT_EQ(result.max_window(), 14u);
}

TEST(Analyzer_Program, ParsedProgram) {
    auto program = parser::parse_program_text(R"(
        (defsymphony "Scan" {}
          (weight-specified
            70 (if (< (rsi "QQQ" {:window 10}) 30) [(asset "TQQQ")] [(asset "QQQ")])
            30 (filter (moving-average-price {:window 50}) (select-top 1)
                       [(asset "GLD") (asset "TLT")])))
    )");
    ASSERT_TRUE(program.ok()) << program.error().to_string();
    auto result = StaticAnalyzer::analyze(*program);
    EXPECT_EQ(result.tickers, (std::set<std::string>{"GLD", "QQQ", "TLT", "TQQQ"}));
    EXPECT_EQ(result.indicator_requirements.size(), 2u);
    EXPECT_EQ(result.max_window(), 50u);
}

TEST(Analyzer_Program, NullRootIsEmpty) {
    Program program;
    auto result = StaticAnalyzer::analyze(program);
    EXPECT_TRUE(result.tickers.empty());
    EXPECT_TRUE(result.indicator_requirements.empty());
}
