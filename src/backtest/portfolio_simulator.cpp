/// @file src/backtest/portfolio_simulator.cpp
/// @brief PortfolioSimulator: mark, gate, liquidate, rebalance, record.

#include "symphony/simulator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace symphony::backtest {

namespace {

struct PlannedTrade {
    std::string symbol;
    double      delta;  ///< Signed share change
    double      price;  ///< Unadjusted close
};

/// Abort on a ledger defect.  Tiny negative cash from rounding is clamped.
void check_ledger(PortfolioState& state, const Order& order) {
    if (state.cash < -constants::CASH_EPSILON) {
        throw std::logic_error(fmt::format(
            "cash overdrawn to {:.6f} after {}", state.cash, order.to_string()));
    }
    if (state.cash < 0.0) state.cash = 0.0;

    auto it = state.holdings.find(order.symbol);
    if (it == state.holdings.end()) return;
    if (it->second < -constants::SHARE_EPSILON) {
        throw std::logic_error(fmt::format(
            "negative position {:.9f} after {}", it->second, order.to_string()));
    }
    if (it->second <= constants::SHARE_EPSILON) {
        state.holdings.erase(it);
    }
}

void sell(StepResult& out, Date date, const std::string& symbol, double shares,
          double price, const Frictions& frictions) {
    const double exec  = price * (1.0 - frictions.slippage);
    const double gross = shares * exec;
    const double fee   = gross * frictions.transaction_cost_rate;

    Order order{
        .date            = date,
        .symbol          = symbol,
        .side            = Side::Sell,
        .shares          = shares,
        .execution_price = exec,
        .gross           = gross,
        .fee             = fee,
    };
    out.state.cash += gross - fee;
    out.state.holdings[symbol] -= shares;
    check_ledger(out.state, order);
    out.orders.push_back(std::move(order));
}

void buy(StepResult& out, Date date, const std::string& symbol, double wanted,
         double price, const Frictions& frictions) {
    const double exec           = price * (1.0 + frictions.slippage);
    const double cost_per_share = exec * (1.0 + frictions.transaction_cost_rate);
    const double affordable     = std::max(0.0, out.state.cash) / cost_per_share;
    const double shares         = std::min(wanted, affordable);
    if (shares * price <= constants::NOTIONAL_EPSILON) {
        if (wanted * price > constants::NOTIONAL_EPSILON) {
            out.warnings.push_back(
                fmt::format("insufficient cash to buy {}; order skipped", symbol));
        }
        return;
    }

    const double gross = shares * exec;
    const double fee   = gross * frictions.transaction_cost_rate;
    Order order{
        .date            = date,
        .symbol          = symbol,
        .side            = Side::Buy,
        .shares          = shares,
        .execution_price = exec,
        .gross           = gross,
        .fee             = fee,
    };
    out.state.cash -= gross + fee;
    out.state.holdings[symbol] += shares;
    check_ledger(out.state, order);
    out.orders.push_back(std::move(order));
}

}  // namespace

// ─── SimulationConfig ─────────────────────────────────────────────────────────

std::optional<std::string> SimulationConfig::validate() const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        return fmt::format("initial capital must be positive, got {}", initial_capital);
    }
    if (!std::isfinite(transaction_cost_pct) || transaction_cost_pct < 0.0 ||
        transaction_cost_pct >= 100.0) {
        return fmt::format("transaction cost must be in [0, 100) percent, got {}",
                           transaction_cost_pct);
    }
    if (!std::isfinite(slippage_pct) || slippage_pct < 0.0 || slippage_pct >= 100.0) {
        return fmt::format("slippage must be in [0, 100) percent, got {}", slippage_pct);
    }
    if (!std::isfinite(min_trade_size) || min_trade_size < 0.0) {
        return fmt::format("minimum trade size must be non-negative, got {}", min_trade_size);
    }
    if (rebalance_frequency_days == 0) {
        return std::string("rebalance frequency must be at least 1 day");
    }
    if (start_date && end_date && *start_date > *end_date) {
        return fmt::format("start date {} is after end date {}",
                           format_date(*start_date), format_date(*end_date));
    }
    return std::nullopt;
}

Frictions SimulationConfig::frictions() const noexcept {
    return Frictions{
        .transaction_cost_rate = transaction_cost_pct / 100.0,
        .slippage              = slippage_pct / 100.0,
        .min_trade_size        = min_trade_size,
    };
}

// ─── Orders ───────────────────────────────────────────────────────────────────

std::string_view to_string(Side side) noexcept {
    return side == Side::Buy ? "BUY" : "SELL";
}

std::string Order::to_string() const {
    return fmt::format("{} {:<4} {:>14.6f} {:<8} @ {:>10.4f}  gross {:>12.2f}  fee {:>8.2f}",
                       format_date(date), backtest::to_string(side), shares, symbol,
                       execution_price, gross, fee);
}

// ─── PortfolioSimulator ───────────────────────────────────────────────────────

PortfolioSimulator::PortfolioSimulator(const data::MarketDataAccessor& market,
                                       SimulationConfig config)
    : market_(market)
    , config_(std::move(config))
{
    if (auto problem = config_.validate()) {
        throw std::invalid_argument(*problem);
    }
    frictions_  = config_.frictions();
    state_.cash = config_.initial_capital;
}

bool PortfolioSimulator::trades_next_day() const noexcept {
    return !seeded_ || days_since_trade_ + 1 >= config_.rebalance_frequency_days;
}

StepResult PortfolioSimulator::step(Date date, const TargetAllocation& target) {
    if (!trades_next_day()) {
        return hold(date);
    }

    StepResult result = rebalance(state_, date, target, frictions_, market_, !seeded_);
    seeded_           = true;
    days_since_trade_ = 0;

    state_ = result.state;
    orders_.insert(orders_.end(), result.orders.begin(), result.orders.end());
    record(date, result.pre_trade_value);
    return result;
}

StepResult PortfolioSimulator::hold(Date date) {
    StepResult result;
    result.state           = state_;
    result.pre_trade_value = mark_to_market(state_, date, market_, &result.unpriced);
    for (const auto& symbol : result.unpriced) {
        result.warnings.push_back(
            fmt::format("no price for held {} on {}; excluded from valuation",
                        symbol, format_date(date)));
    }
    ++days_since_trade_;
    record(date, result.pre_trade_value);
    return result;
}

void PortfolioSimulator::record(Date date, double value) {
    history_.push_back(DailyValuation{.date = date, .value = value});
}

double PortfolioSimulator::mark_to_market(const PortfolioState& state, Date date,
                                          const data::MarketDataAccessor& market,
                                          std::vector<std::string>* unpriced) {
    double value = state.cash;
    for (const auto& [symbol, shares] : state.holdings) {
        auto price = market.close(symbol, date);
        if (!price) {
            if (unpriced != nullptr) unpriced->push_back(symbol);
            continue;
        }
        value += shares * *price;
    }
    return value;
}

StepResult PortfolioSimulator::rebalance(const PortfolioState& state, Date date,
                                         const TargetAllocation& target,
                                         const Frictions& frictions,
                                         const data::MarketDataAccessor& market,
                                         bool seeding) {
    StepResult out;
    out.state           = state;
    out.rebalanced      = true;
    out.pre_trade_value = mark_to_market(state, date, market, &out.unpriced);
    for (const auto& symbol : out.unpriced) {
        out.warnings.push_back(fmt::format(
            "no price for held {} on {}; excluded from valuation", symbol, format_date(date)));
    }

    // ── Liquidate dropped positions ───────────────────────────────────────────
    std::vector<std::pair<std::string, double>> dropped;
    for (const auto& [symbol, shares] : state.holdings) {
        if (target.find(symbol) == target.end()) dropped.emplace_back(symbol, shares);
    }
    for (const auto& [symbol, shares] : dropped) {
        auto price = market.close(symbol, date);
        if (!price) {
            out.warnings.push_back(
                fmt::format("cannot liquidate {}: no price on {}", symbol, format_date(date)));
            continue;
        }
        sell(out, date, symbol, shares, *price, frictions);
    }

    // ── Size every target from the pre-trade value ───────────────────────────
    std::vector<PlannedTrade> sells;
    std::vector<PlannedTrade> buys;
    for (const auto& [symbol, weight] : target) {
        auto price = market.close(symbol, date);
        if (!price || *price <= 0.0) {
            out.warnings.push_back(
                fmt::format("no price for target {} on {}; trade skipped",
                            symbol, format_date(date)));
            continue;
        }
        double held = 0.0;
        if (auto it = out.state.holdings.find(symbol); it != out.state.holdings.end()) {
            held = it->second;
        }
        const double target_shares = out.pre_trade_value * weight / *price;
        const double delta         = target_shares - held;
        const double notional      = std::abs(delta * *price);
        if (notional <= constants::NOTIONAL_EPSILON) continue;
        if (!seeding && notional < frictions.min_trade_size) continue;

        PlannedTrade trade{.symbol = symbol, .delta = delta, .price = *price};
        if (delta < 0.0) sells.push_back(std::move(trade));
        else             buys.push_back(std::move(trade));
    }

    // ── Sells release cash before any buy ────────────────────────────────────
    for (const auto& trade : sells) {
        sell(out, date, trade.symbol, -trade.delta, trade.price, frictions);
    }
    for (const auto& trade : buys) {
        buy(out, date, trade.symbol, trade.delta, trade.price, frictions);
    }
    return out;
}

}  // namespace symphony::backtest
