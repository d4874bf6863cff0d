#pragma once

/// @file include/symphony/market_data.hpp
/// @brief In-memory market data with as-of lookups and precomputed indicators.
///
/// # Module: MarketData
///
/// ## Responsibility
/// Hold fully materialized close series and indicator columns per symbol and
/// answer `close(symbol, date)` / `indicator(symbol, ref, date)` queries with
/// as-of semantics: the most recent row on or before `date`.
///
/// ## Guarantees
/// - Read-only after construction; every query is `const` and safe to call
///   from several threads
/// - Warm-up rows of an indicator are stored as NaN and reported unavailable
///
/// ## NOT Responsible For
/// - Fetching data (see data_loader.hpp for CSV files)

#include "symphony/data_loader.hpp"
#include "symphony/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace symphony::data {

// ─── MarketDataAccessor ───────────────────────────────────────────────────────

/// Lookup contract consumed by the evaluator and the simulator.
class MarketDataAccessor {
public:
    virtual ~MarketDataAccessor() = default;

    /// Closing price on or before `date`, or `nullopt` if none is known.
    [[nodiscard]] virtual std::optional<double>
    close(std::string_view symbol, Date date) const = 0;

    /// Indicator value on or before `date`, or `nullopt` if unavailable.
    [[nodiscard]] virtual std::optional<double>
    indicator(std::string_view symbol, IndicatorRef ref, Date date) const = 0;
};

// ─── IndicatorCalculator ──────────────────────────────────────────────────────

/// Stateless indicator kernels over a close series.  Output has the same
/// length as the input; positions without a full window are NaN.
class IndicatorCalculator {
public:
    IndicatorCalculator() = delete;

    /// Simple moving average over `window` closes.
    [[nodiscard]] static std::vector<double>
    sma(std::span<const double> closes, std::uint32_t window);

    /// Wilder relative strength index.
    ///
    /// Average gain/loss are seeded with the mean of the first `window`
    /// changes and smoothed as `avg = (avg·(n−1) + x) / n` afterwards.
    /// The first defined value sits at index `window`.  A window with no
    /// losses scores 100; a flat window scores 50.
    [[nodiscard]] static std::vector<double>
    rsi(std::span<const double> closes, std::uint32_t window);

    /// Dispatch on `ref.kind`.  `CurrentPrice` returns the closes unchanged.
    [[nodiscard]] static std::vector<double>
    compute(std::span<const double> closes, IndicatorRef ref);
};

// ─── MarketData ───────────────────────────────────────────────────────────────

class MarketData final : public MarketDataAccessor {
public:
    MarketData() = default;

    /// Add or replace a symbol's bars.  Bars must be sorted by date
    /// (as produced by DataLoader).  Previously computed indicator columns for
    /// the symbol are discarded.
    void add_series(std::string symbol, std::span<const OHLCV> bars);

    /// Add a close series directly (tests, synthetic data).
    void add_closes(std::string symbol, std::vector<Date> dates, std::vector<double> closes);

    /// Attach a precomputed indicator column aligned with the symbol's dates.
    ///
    /// # Returns
    /// `false` if the symbol is unknown or the column length does not match.
    bool add_indicator(std::string_view symbol, IndicatorRef ref, std::vector<double> values);

    /// Compute `ref` for every listed symbol that has a series.
    void compute_indicators(IndicatorRef ref, const std::set<std::string>& symbols);

    [[nodiscard]] std::optional<double>
    close(std::string_view symbol, Date date) const override;

    [[nodiscard]] std::optional<double>
    indicator(std::string_view symbol, IndicatorRef ref, Date date) const override;

    [[nodiscard]] bool has_symbol(std::string_view symbol) const noexcept;
    [[nodiscard]] std::vector<std::string> symbols() const;

    /// Dates present in every loaded series, ascending.
    [[nodiscard]] std::vector<Date> common_dates() const;

    /// Dates of one symbol's series (empty if unknown).
    [[nodiscard]] std::span<const Date> dates(std::string_view symbol) const noexcept;

private:
    struct Series {
        std::vector<Date>   dates;
        std::vector<double> closes;
        std::map<IndicatorRef, std::vector<double>> indicators;
    };

    /// Index of the last row on or before `date`, if any.
    [[nodiscard]] static std::optional<std::size_t>
    as_of(const Series& series, Date date) noexcept;

    std::map<std::string, Series, std::less<>> series_;
};

}  // namespace symphony::data
