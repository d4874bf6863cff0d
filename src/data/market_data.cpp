/// @file src/data/market_data.cpp
/// @brief MarketData: as-of close and indicator lookups.

#include "symphony/market_data.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace symphony::data {

// ─── Loading ──────────────────────────────────────────────────────────────────

void MarketData::add_series(std::string symbol, std::span<const OHLCV> bars) {
    Series series;
    series.dates.reserve(bars.size());
    series.closes.reserve(bars.size());
    for (const auto& bar : bars) {
        series.dates.push_back(bar.date);
        series.closes.push_back(bar.close);
    }
    series_.insert_or_assign(std::move(symbol), std::move(series));
}

void MarketData::add_closes(std::string symbol, std::vector<Date> dates,
                            std::vector<double> closes) {
    Series series;
    series.dates  = std::move(dates);
    series.closes = std::move(closes);
    series.closes.resize(series.dates.size(), std::nan(""));
    series_.insert_or_assign(std::move(symbol), std::move(series));
}

bool MarketData::add_indicator(std::string_view symbol, IndicatorRef ref,
                               std::vector<double> values) {
    auto it = series_.find(symbol);
    if (it == series_.end() || values.size() != it->second.dates.size()) {
        return false;
    }
    it->second.indicators.insert_or_assign(ref, std::move(values));
    return true;
}

void MarketData::compute_indicators(IndicatorRef ref, const std::set<std::string>& symbols) {
    if (ref.kind == IndicatorKind::CurrentPrice) return;
    for (const auto& symbol : symbols) {
        auto it = series_.find(symbol);
        if (it == series_.end()) continue;
        it->second.indicators.insert_or_assign(
            ref, IndicatorCalculator::compute(it->second.closes, ref));
    }
}

// ─── Queries ──────────────────────────────────────────────────────────────────

std::optional<std::size_t>
MarketData::as_of(const Series& series, Date date) noexcept {
    auto it = std::upper_bound(series.dates.begin(), series.dates.end(), date);
    if (it == series.dates.begin()) return std::nullopt;
    return static_cast<std::size_t>(std::distance(series.dates.begin(), it) - 1);
}

std::optional<double> MarketData::close(std::string_view symbol, Date date) const {
    auto it = series_.find(symbol);
    if (it == series_.end()) return std::nullopt;
    auto row = as_of(it->second, date);
    if (!row) return std::nullopt;
    const double price = it->second.closes[*row];
    if (!std::isfinite(price)) return std::nullopt;
    return price;
}

std::optional<double>
MarketData::indicator(std::string_view symbol, IndicatorRef ref, Date date) const {
    if (ref.kind == IndicatorKind::CurrentPrice) {
        return close(symbol, date);
    }
    auto it = series_.find(symbol);
    if (it == series_.end()) return std::nullopt;
    auto column = it->second.indicators.find(ref);
    if (column == it->second.indicators.end()) return std::nullopt;
    auto row = as_of(it->second, date);
    if (!row) return std::nullopt;
    const double value = column->second[*row];
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

bool MarketData::has_symbol(std::string_view symbol) const noexcept {
    return series_.find(symbol) != series_.end();
}

std::vector<std::string> MarketData::symbols() const {
    std::vector<std::string> out;
    out.reserve(series_.size());
    for (const auto& [symbol, series] : series_) out.push_back(symbol);
    return out;
}

std::vector<Date> MarketData::common_dates() const {
    if (series_.empty()) return {};
    auto it = series_.begin();
    std::vector<Date> common = it->second.dates;
    for (++it; it != series_.end(); ++it) {
        std::vector<Date> next;
        std::set_intersection(common.begin(), common.end(),
                              it->second.dates.begin(), it->second.dates.end(),
                              std::back_inserter(next));
        common = std::move(next);
    }
    return common;
}

std::span<const Date> MarketData::dates(std::string_view symbol) const noexcept {
    auto it = series_.find(symbol);
    if (it == series_.end()) return {};
    return it->second.dates;
}

}  // namespace symphony::data
