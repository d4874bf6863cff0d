/**
 * @file  prop_ledger_solvent.cpp
 * @brief Property: random rebalances never overdraw cash or short a position
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_ledger_solvent
 *
 * Each case draws a price path per symbol, a cost and slippage rate, and a
 * sequence of target allocations.  After every step:
 *   cash ≥ 0, every held share count is positive, and nothing outside the
 *   day's target is still held.
 */

#include <rapidcheck.h>

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

#include "symphony/evaluator.hpp"
#include "symphony/simulator.hpp"

using namespace symphony;
using namespace symphony::backtest;

namespace {

const std::vector<std::string> kPool{"AAA", "BBB", "CCC"};
constexpr int kDays = 20;

Date day(int i) {
    return std::chrono::sys_days{std::chrono::year{2024} / 1 / 1} + std::chrono::days{i};
}

}  // namespace

int main() {
    rc::check(
        "ledger_solvent: cash and positions stay non-negative",
        [](const std::vector<std::vector<unsigned>>& raw_targets,
           unsigned raw_cost, unsigned raw_slip, unsigned raw_seed) {
            data::MarketData market;
            std::vector<Date> dates;
            for (int i = 0; i < kDays; ++i) dates.push_back(day(i));
            for (std::size_t s = 0; s < kPool.size(); ++s) {
                std::vector<double> closes;
                for (int i = 0; i < kDays; ++i) {
                    const unsigned wobble = (raw_seed + 31u * s + 7u * i) % 41u;
                    closes.push_back(20.0 + static_cast<double>(wobble) * 2.5);
                }
                market.add_closes(kPool[s], dates, closes);
            }

            SimulationConfig config;
            config.transaction_cost_pct = static_cast<double>(raw_cost % 500) / 100.0;
            config.slippage_pct         = static_cast<double>(raw_slip % 300) / 100.0;
            PortfolioSimulator sim(market, config);

            int i = 0;
            for (const auto& raw : raw_targets) {
                if (i >= kDays) break;
                TargetAllocation target;
                for (unsigned pick : raw) {
                    target[kPool[pick % kPool.size()]] += static_cast<double>(pick % 5);
                }
                target = eval::Evaluator::normalize(std::move(target));

                sim.step(day(i), target);
                const auto& state = sim.state();
                RC_ASSERT(state.cash >= 0.0);
                for (const auto& [symbol, shares] : state.holdings) {
                    RC_ASSERT(shares > 0.0);
                    RC_ASSERT(target.count(symbol) == 1u);
                }
                ++i;
            }
        });

    rc::check(
        "ledger_solvent: frictionless round trip preserves value",
        [](unsigned raw_price, const std::vector<bool>& flips) {
            const double price = 1.0 + static_cast<double>(raw_price % 1000);
            data::MarketData market;
            std::vector<Date> dates;
            for (int i = 0; i < kDays; ++i) dates.push_back(day(i));
            market.add_closes("AAA", dates, std::vector<double>(kDays, price));
            market.add_closes("BBB", dates, std::vector<double>(kDays, price * 2.0));

            PortfolioSimulator sim(market, SimulationConfig{});
            int i = 0;
            for (bool flip : flips) {
                if (i >= kDays) break;
                sim.step(day(i), {{flip ? "AAA" : "BBB", 1.0}});
                RC_ASSERT(std::abs(sim.history().back().value - 100000.0) < 1e-6);
                ++i;
            }
        });

    return 0;
}
