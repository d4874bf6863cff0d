#pragma once

/// @file include/symphony/backtest.hpp
/// @brief Performance metrics over a simulated valuation history.
///
/// # Module: Performance Metrics
///
/// ## Responsibility
/// Reduce the simulator's `DailyValuation` series to summary statistics.
///
/// ## Performance Metrics
///   - Total return:       last / first − 1
///   - Sharpe ratio:       (mean − r_f) / σ        (annualised, sample σ)
///   - Sortino ratio:      (mean − r_f) / σ_down   (annualised)
///   - Volatility:         σ · √ann
///   - Maximum drawdown:   min over t of (v_t − peak_t) / peak_t   (≤ 0)
///
/// ## Guarantees
/// - Pure functions; all fallible results are `std::optional`
/// - Fewer than 2 returns, zero variance, or any NaN/Inf → `nullopt`
///
/// ## NOT Responsible For
/// - Producing the valuation series (see simulator.hpp)

#include "symphony/constants.hpp"
#include "symphony/simulator.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace symphony::backtest {

// ─── PerformanceSummary ───────────────────────────────────────────────────────

/// Headline statistics for one run.
struct PerformanceSummary {
    double                initial_value = 0.0;
    double                final_value   = 0.0;
    std::size_t           trading_days  = 0;
    std::optional<double> total_return;   ///< Fraction (0.12 = +12 %)
    std::optional<double> sharpe_ratio;
    std::optional<double> sortino_ratio;
    std::optional<double> volatility;     ///< Annualised σ of daily returns
    std::optional<double> max_drawdown;   ///< Non-positive fraction

    /// Formatted metrics table.  Unavailable values print as `n/a`.
    [[nodiscard]] std::string to_string() const;
};

// ─── PerformanceCalculator ────────────────────────────────────────────────────

/// Stateless utility for computing financial performance metrics.
///
/// All methods are static and operate on `std::span<const double>` for
/// zero-copy access to any contiguous container.
class PerformanceCalculator {
public:
    /// `values.back() / values.front() − 1`.
    ///
    /// # Returns
    /// `nullopt` on empty input, a non-positive first value, or NaN/Inf.
    [[nodiscard]] static std::optional<double>
    total_return(std::span<const double> values) noexcept;

    /// Simple day-over-day returns, length `values.size() − 1`.  A step whose
    /// previous value is not positive is omitted.
    [[nodiscard]] static std::vector<double>
    daily_returns(std::span<const double> values);

    /// Compute annualised Sharpe ratio.
    ///
    /// # Formula
    ///   Sharpe = (mean(R) − r_f) / σ(R) × √ann
    ///
    /// # Returns
    /// `nullopt` if series has fewer than 2 elements, σ = 0, or any NaN/Inf.
    [[nodiscard]] static std::optional<double>
    sharpe(std::span<const double> returns,
           double risk_free_rate  = constants::DEFAULT_RISK_FREE_RATE,
           double annualisation   = constants::ANNUALISATION_FACTOR) noexcept;

    /// Compute annualised Sortino ratio (downside-deviation denominator).
    ///
    /// # Returns
    /// `nullopt` if series is too short, downside-vol is zero, or any NaN/Inf.
    [[nodiscard]] static std::optional<double>
    sortino(std::span<const double> returns,
            double risk_free_rate  = constants::DEFAULT_RISK_FREE_RATE,
            double annualisation   = constants::ANNUALISATION_FACTOR) noexcept;

    /// Annualised standard deviation of returns.
    [[nodiscard]] static std::optional<double>
    volatility(std::span<const double> returns,
               double annualisation = constants::ANNUALISATION_FACTOR) noexcept;

    /// Maximum drawdown of a value series.
    ///
    /// # Formula
    ///   MDD = min over t of { (v_t − peak_t) / peak_t },  peak_t = max_{s ≤ t} v_s
    ///
    /// # Returns
    /// Drawdown in [−1, 0].  `nullopt` on empty input, NaN/Inf, or a
    /// non-positive peak.
    [[nodiscard]] static std::optional<double>
    max_drawdown(std::span<const double> values) noexcept;

    /// All of the above for a valuation history.
    [[nodiscard]] static PerformanceSummary
    summarize(std::span<const DailyValuation> history,
              double risk_free_rate = constants::DEFAULT_RISK_FREE_RATE,
              double annualisation  = constants::ANNUALISATION_FACTOR);

private:
    /// Mean of a span.  Unchecked: caller must ensure non-empty, finite.
    static double mean(std::span<const double> v) noexcept;
    /// Sample std-dev of a span.  Unchecked: caller ensures length ≥ 2.
    static double stddev(std::span<const double> v, double mean_val) noexcept;
    /// Downside std-dev relative to `threshold`.
    static double downside_stddev(std::span<const double> v,
                                  double threshold) noexcept;
};

}  // namespace symphony::backtest
