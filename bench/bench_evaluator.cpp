/**
 * @file  bench/bench_evaluator.cpp
 * @brief Google Benchmark suite for strategy parsing, evaluation and indicators.
 *
 * Benchmarks
 * ----------
 *   BM_Parse_Lisp            s-expression text → Program
 *   BM_Evaluate_Filter       rank N candidates by RSI, keep the top 3
 *   BM_Evaluate_NestedIf     depth-D chain of price/SMA comparisons
 *   BM_Indicator_Rsi         Wilder RSI over N closes
 *   BM_Simulator_Rotation    one year of daily rotation between two symbols
 *
 * Build (CMake):
 *   cmake -DSYMPHONY_BENCH=ON ..
 *   cmake --build build --target bench_evaluator
 *   ./build/bench_evaluator --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "symphony/evaluator.hpp"
#include "symphony/parser.hpp"
#include "symphony/simulator.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

using namespace symphony;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const Date kDay = std::chrono::sys_days{std::chrono::year{2024} / 1 / 2};

static Date nth_day(std::size_t i) {
    return std::chrono::sys_days{std::chrono::year{2023} / 1 / 1} +
           std::chrono::days{static_cast<int>(i)};
}

/// Synthetic closes with a slow sine wave so RSI moves across its range.
static std::vector<double> make_closes(std::size_t n, double phase = 0.0) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = 100.0 + 10.0 * std::sin(phase + static_cast<double>(i) * 0.07);
    }
    return v;
}

static std::string ticker(std::size_t i) {
    return "T" + std::to_string(i);
}

// ── Parsing ────────────────────────────────────────────────────────────────────

static void BM_Parse_Lisp(benchmark::State& state) {
    const std::string text = R"(
        (defsymphony "Bench" {:rebalance-frequency :daily}
          (weight-equal
            [(if (> (current-price "SPY") (moving-average-price "SPY" {:window 200}))
               [(filter (rsi {:window 10}) (select-top 2)
                  [(asset "TQQQ") (asset "SOXL") (asset "TECL") (asset "UPRO")])]
               [(weight-specified 60 (asset "TLT") 40 (asset "GLD"))])
             (group "Cash" [(asset "BIL")])]))
    )";
    for (auto _ : state) {
        auto program = parser::parse_program_text(text, parser::Dialect::Lisp);
        benchmark::DoNotOptimize(program);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Parse_Lisp)->Unit(benchmark::kMicrosecond);

// ── Evaluation ─────────────────────────────────────────────────────────────────

static void BM_Evaluate_Filter(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const IndicatorRef rsi{IndicatorKind::Rsi, 10};

    data::MarketData market;
    std::vector<ast::NodePtr> candidates;
    for (std::size_t i = 0; i < n; ++i) {
        market.add_closes(ticker(i), {kDay}, {100.0});
        market.add_indicator(ticker(i), rsi, {static_cast<double>((i * 37) % 100)});
        candidates.push_back(ast::make_asset(ticker(i)));
    }
    auto tree = ast::make_filter(rsi, ast::Selector{.mode = ast::SelectMode::Top, .count = 3},
                                 std::move(candidates));
    const eval::Evaluator evaluator(market);

    for (auto _ : state) {
        auto result = evaluator.evaluate(*tree, kDay);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Evaluate_Filter)->RangeMultiplier(4)->Range(4, 1024)->Unit(benchmark::kMicrosecond);

static void BM_Evaluate_NestedIf(benchmark::State& state) {
    const std::size_t depth = static_cast<std::size_t>(state.range(0));
    const IndicatorRef sma{IndicatorKind::MovingAverage, 20};

    data::MarketData market;
    market.add_closes("SPY", {kDay}, {100.0});
    market.add_indicator("SPY", sma, {101.0});

    // Price is below its SMA, so every level descends into the else branch.
    ast::NodePtr node = ast::make_asset("BIL");
    for (std::size_t i = 0; i < depth; ++i) {
        ast::Condition cond{ast::Comparator::Greater, ast::CurrentPrice{"SPY"},
                            ast::MovingAveragePrice{"SPY", 20}};
        node = ast::make_if(cond, ast::make_asset("SPY"), node);
    }
    const eval::Evaluator evaluator(market);

    for (auto _ : state) {
        auto result = evaluator.evaluate(*node, kDay);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Evaluate_NestedIf)->RangeMultiplier(4)->Range(1, 256);

// ── Indicators ─────────────────────────────────────────────────────────────────

static void BM_Indicator_Rsi(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto closes = make_closes(n);
    for (auto _ : state) {
        auto out = data::IndicatorCalculator::rsi(closes, 14);
        benchmark::DoNotOptimize(out.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Indicator_Rsi)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Simulation ─────────────────────────────────────────────────────────────────

static void BM_Simulator_Rotation(benchmark::State& state) {
    constexpr std::size_t kDays = 252;
    std::vector<Date> dates;
    for (std::size_t i = 0; i < kDays; ++i) dates.push_back(nth_day(i));

    data::MarketData market;
    market.add_closes("AAA", dates, make_closes(kDays));
    market.add_closes("BBB", dates, make_closes(kDays, 1.5));

    backtest::SimulationConfig config;
    config.transaction_cost_pct = 0.1;
    config.slippage_pct         = 0.05;

    for (auto _ : state) {
        backtest::PortfolioSimulator sim(market, config);
        for (std::size_t i = 0; i < kDays; ++i) {
            const TargetAllocation target{{i % 2 == 0 ? "AAA" : "BBB", 1.0}};
            sim.step(dates[i], target);
        }
        benchmark::DoNotOptimize(sim.state().cash);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(kDays));
}
BENCHMARK(BM_Simulator_Rotation)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
