#pragma once

/// @file include/symphony/simulator.hpp
/// @brief Portfolio simulator: target allocations to orders against a ledger.
///
/// # Module: Portfolio Simulator
///
/// ## Responsibility
/// Carry a cash-and-holdings ledger through an ordered sequence of trading
/// days.  Each day the ledger is marked to market and, when the rebalance
/// cadence allows, moved toward that day's target allocation with
/// transaction costs, slippage and a minimum trade size applied.
///
/// ## Per-Day Protocol
/// 1. Mark-to-market: `pre_trade_value = cash + Σ shares·close` (unpriced
///    holdings are skipped with a warning)
/// 2. Cadence gate: the day counter must reach `rebalance_frequency_days`;
///    the first trading day of a run always trades
/// 3. Liquidate held symbols absent from the target
/// 4. Rebalance targets: all deltas are sized from `pre_trade_value`, sells
///    execute before buys, buys are capped to what cash affords after fees
/// 5. Append `(date, pre_trade_value)` to the valuation history
///
/// ## Guarantees
/// - `cash ≥ −CASH_EPSILON` after every order; a breach throws
///   `std::logic_error` (a ledger defect, never an input condition)
/// - Share counts never go negative; liquidated entries are removed
/// - Deterministic given (state, date, target, frictions, prices)
///
/// ## NOT Responsible For
/// - Producing targets (see evaluator.hpp)
/// - Return statistics (see backtest.hpp)

#include "symphony/constants.hpp"
#include "symphony/market_data.hpp"
#include "symphony/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace symphony::backtest {

// ─── Ledger Types ─────────────────────────────────────────────────────────────

/// Cash plus fractional share holdings.  A symbol is present in `holdings`
/// only while its share count is positive.
struct PortfolioState {
    double cash = 0.0;
    std::map<std::string, double, std::less<>> holdings;
};

/// Execution costs as fractions (0.001 = 0.1 %).
struct Frictions {
    double transaction_cost_rate = 0.0;  ///< Fee charged on traded notional
    double slippage              = 0.0;  ///< Adverse price shift per execution
    double min_trade_size        = 0.0;  ///< Smallest notional traded after seeding
};

/// Run parameters as a user states them (costs in percent).
struct SimulationConfig {
    double        initial_capital          = constants::DEFAULT_INITIAL_CAPITAL;
    double        transaction_cost_pct     = constants::DEFAULT_TRANSACTION_COST_PCT;
    double        slippage_pct             = constants::DEFAULT_SLIPPAGE_PCT;
    double        min_trade_size           = constants::DEFAULT_MIN_TRADE_SIZE;
    std::uint32_t rebalance_frequency_days = constants::DEFAULT_REBALANCE_FREQUENCY_DAYS;
    std::optional<Date> start_date;
    std::optional<Date> end_date;

    /// First configuration problem found, or `nullopt` if the config is usable.
    [[nodiscard]] std::optional<std::string> validate() const;

    /// Percentages converted to rates.
    [[nodiscard]] Frictions frictions() const noexcept;
};

enum class Side : std::uint8_t { Buy, Sell };

[[nodiscard]] std::string_view to_string(Side side) noexcept;

/// One executed order.
struct Order {
    Date        date;
    std::string symbol;
    Side        side;
    double      shares;           ///< Always positive
    double      execution_price;  ///< Close adjusted by slippage
    double      gross;            ///< shares × execution_price
    double      fee;              ///< gross × transaction_cost_rate

    [[nodiscard]] std::string to_string() const;
};

/// Outcome of one simulated day.
struct StepResult {
    PortfolioState           state;
    std::vector<Order>       orders;
    double                   pre_trade_value = 0.0;
    bool                     rebalanced      = false;
    std::vector<std::string> unpriced;  ///< Held symbols with no close on the date
    std::vector<std::string> warnings;
};

/// A read-only valuation sample.
struct DailyValuation {
    Date   date;
    double value;
};

// ─── PortfolioSimulator ───────────────────────────────────────────────────────

/// Single-writer day-by-day ledger.  Days must be fed in ascending order.
class PortfolioSimulator {
public:
    /// # Panics
    /// Throws `std::invalid_argument` if `config.validate()` reports a problem.
    PortfolioSimulator(const data::MarketDataAccessor& market, SimulationConfig config);

    /// Simulate one day toward `target`.
    ///
    /// # Panics
    /// Throws `std::logic_error` if the ledger invariant is violated.
    StepResult step(Date date, const TargetAllocation& target);

    /// Simulate one day with no trading (no usable target): the ledger is
    /// marked, the cadence counter advances and the valuation is recorded.
    StepResult hold(Date date);

    /// `cash + Σ shares·close(symbol, date)`.  Symbols without a price are
    /// skipped and appended to `unpriced` when given.
    [[nodiscard]] static double
    mark_to_market(const PortfolioState& state, Date date,
                   const data::MarketDataAccessor& market,
                   std::vector<std::string>* unpriced = nullptr);

    /// Pure rebalance of `state` toward `target` (steps 1, 3 and 4 of the
    /// protocol).  `seeding` lifts the minimum trade size.
    ///
    /// # Panics
    /// Throws `std::logic_error` if an order would leave cash below
    /// `-CASH_EPSILON` or a share count negative.
    [[nodiscard]] static StepResult
    rebalance(const PortfolioState& state, Date date, const TargetAllocation& target,
              const Frictions& frictions, const data::MarketDataAccessor& market,
              bool seeding);

    [[nodiscard]] const PortfolioState& state() const noexcept { return state_; }
    [[nodiscard]] const std::vector<DailyValuation>& history() const noexcept { return history_; }
    [[nodiscard]] const std::vector<Order>& orders() const noexcept { return orders_; }
    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }

    /// Whether the cadence gate would open for the next day fed to `step`.
    [[nodiscard]] bool trades_next_day() const noexcept;

private:
    void record(Date date, double value);

    const data::MarketDataAccessor& market_;
    SimulationConfig                config_;
    Frictions                       frictions_;
    PortfolioState                  state_;
    std::vector<DailyValuation>     history_;
    std::vector<Order>              orders_;
    std::uint32_t                   days_since_trade_ = 0;
    bool                            seeded_           = false;
};

}  // namespace symphony::backtest
