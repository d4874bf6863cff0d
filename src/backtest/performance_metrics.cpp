/// @file src/backtest/performance_metrics.cpp
/// @brief Implementation of PerformanceCalculator.
///
/// Fallible paths return std::nullopt; no function ever calls abort(),
/// assert(), or throws an exception.

#include "symphony/backtest.hpp"
#include "symphony/constants.hpp"

#include <Eigen/Core>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <span>

namespace symphony::backtest {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

using ConstVectorMap = Eigen::Map<const Eigen::VectorXd>;

[[nodiscard]] ConstVectorMap as_vector(std::span<const double> v) noexcept {
    return ConstVectorMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

/// Return false if any element of `v` is NaN or ±Inf.
[[nodiscard]] bool all_finite(std::span<const double> v) noexcept {
    return v.empty() || as_vector(v).allFinite();
}

[[nodiscard]] std::string percent_or_na(const std::optional<double>& v) {
    return v ? fmt::format("{:+.2f}%", *v * 100.0) : std::string("n/a");
}

[[nodiscard]] std::string ratio_or_na(const std::optional<double>& v) {
    return v ? fmt::format("{:.4f}", *v) : std::string("n/a");
}

}  // namespace

// ─── PerformanceCalculator: private statics ──────────────────────────────────

double PerformanceCalculator::mean(std::span<const double> v) noexcept {
    // Unchecked: caller guarantees non-empty, finite.
    return as_vector(v).mean();
}

double PerformanceCalculator::stddev(std::span<const double> v,
                                     double mean_val) noexcept {
    // Sample std-dev (Bessel-corrected, n−1 denominator).
    const double sq_sum = (as_vector(v).array() - mean_val).square().sum();
    return std::sqrt(sq_sum / static_cast<double>(v.size() - 1));
}

double PerformanceCalculator::downside_stddev(std::span<const double> v,
                                              double threshold) noexcept {
    // RMS of returns below `threshold`, Bessel-corrected; 0 with fewer than 2.
    const auto shortfall = (as_vector(v).array() - threshold).min(0.0);
    const auto count = (shortfall < 0.0).count();
    if (count < 2) return 0.0;
    return std::sqrt(shortfall.square().sum() / static_cast<double>(count - 1));
}

// ─── PerformanceCalculator: returns ─────────────────────────────────────────

std::optional<double>
PerformanceCalculator::total_return(std::span<const double> values) noexcept {
    if (values.empty())        return std::nullopt;
    if (!all_finite(values))   return std::nullopt;
    if (values.front() <= 0.0) return std::nullopt;
    return values.back() / values.front() - 1.0;
}

std::vector<double>
PerformanceCalculator::daily_returns(std::span<const double> values) {
    std::vector<double> out;
    if (values.size() < 2) return out;
    out.reserve(values.size() - 1);
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[i - 1] <= 0.0) continue;
        out.push_back(values[i] / values[i - 1] - 1.0);
    }
    return out;
}

// ─── PerformanceCalculator: Sharpe ──────────────────────────────────────────

std::optional<double>
PerformanceCalculator::sharpe(std::span<const double> returns,
                              double risk_free_rate,
                              double annualisation) noexcept {
    if (returns.size() < constants::MIN_RETURN_SERIES_LENGTH) return std::nullopt;
    if (!all_finite(returns))                                  return std::nullopt;
    if (!std::isfinite(risk_free_rate))                        return std::nullopt;
    if (annualisation <= 0.0)                                  return std::nullopt;

    const double mu = mean(returns);
    const double sd = stddev(returns, mu);

    if (sd <= constants::FLOAT_EPSILON) return std::nullopt;  // zero variance

    // Annualised Sharpe: (μ − r_f) / σ × √ann
    return (mu - risk_free_rate) / sd * std::sqrt(annualisation);
}

// ─── PerformanceCalculator: Sortino ─────────────────────────────────────────

std::optional<double>
PerformanceCalculator::sortino(std::span<const double> returns,
                               double risk_free_rate,
                               double annualisation) noexcept {
    if (returns.size() < constants::MIN_RETURN_SERIES_LENGTH) return std::nullopt;
    if (!all_finite(returns))                                  return std::nullopt;
    if (!std::isfinite(risk_free_rate))                        return std::nullopt;
    if (annualisation <= 0.0)                                  return std::nullopt;

    const double mu    = mean(returns);
    const double sd_dn = downside_stddev(returns, risk_free_rate);

    if (sd_dn <= 0.0) return std::nullopt;

    return (mu - risk_free_rate) / sd_dn * std::sqrt(annualisation);
}

// ─── PerformanceCalculator: Volatility ──────────────────────────────────────

std::optional<double>
PerformanceCalculator::volatility(std::span<const double> returns,
                                  double annualisation) noexcept {
    if (returns.size() < constants::MIN_RETURN_SERIES_LENGTH) return std::nullopt;
    if (!all_finite(returns))                                  return std::nullopt;
    if (annualisation <= 0.0)                                  return std::nullopt;

    const double sd = stddev(returns, mean(returns));
    if (sd <= constants::FLOAT_EPSILON) return std::nullopt;
    return sd * std::sqrt(annualisation);
}

// ─── PerformanceCalculator: MaxDrawdown ──────────────────────────────────────

std::optional<double>
PerformanceCalculator::max_drawdown(std::span<const double> values) noexcept {
    if (values.empty())       return std::nullopt;
    if (!all_finite(values))  return std::nullopt;

    double peak   = values.front();
    double max_dd = 0.0;
    for (double v : values) {
        peak = std::max(peak, v);
        if (peak <= 0.0) return std::nullopt;
        max_dd = std::min(max_dd, (v - peak) / peak);
    }
    return max_dd;
}

// ─── PerformanceCalculator: summary ─────────────────────────────────────────

PerformanceSummary
PerformanceCalculator::summarize(std::span<const DailyValuation> history,
                                 double risk_free_rate,
                                 double annualisation) {
    std::vector<double> values;
    values.reserve(history.size());
    for (const auto& sample : history) values.push_back(sample.value);

    const auto returns = daily_returns(values);

    PerformanceSummary summary;
    summary.trading_days  = history.size();
    summary.initial_value = values.empty() ? 0.0 : values.front();
    summary.final_value   = values.empty() ? 0.0 : values.back();
    summary.total_return  = total_return(values);
    summary.sharpe_ratio  = sharpe(returns, risk_free_rate, annualisation);
    summary.sortino_ratio = sortino(returns, risk_free_rate, annualisation);
    summary.volatility    = volatility(returns, annualisation);
    summary.max_drawdown  = max_drawdown(values);
    return summary;
}

// ─── PerformanceSummary ───────────────────────────────────────────────────────

std::string PerformanceSummary::to_string() const {
    return fmt::format(
        "┌──────────────────────────────────────────┐\n"
        "│            Performance Summary           │\n"
        "├──────────────────────┬───────────────────┤\n"
        "│ Trading Days         │ {:>17} │\n"
        "│ Initial Value        │ {:>17.2f} │\n"
        "│ Final Value          │ {:>17.2f} │\n"
        "│ Total Return         │ {:>17} │\n"
        "│ Sharpe Ratio         │ {:>17} │\n"
        "│ Sortino Ratio        │ {:>17} │\n"
        "│ Volatility (ann.)    │ {:>17} │\n"
        "│ Max Drawdown         │ {:>17} │\n"
        "└──────────────────────┴───────────────────┘\n",
        trading_days, initial_value, final_value,
        percent_or_na(total_return), ratio_or_na(sharpe_ratio),
        ratio_or_na(sortino_ratio), percent_or_na(volatility),
        percent_or_na(max_drawdown));
}

}  // namespace symphony::backtest
