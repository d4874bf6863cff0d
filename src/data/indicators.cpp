/// @file src/data/indicators.cpp
/// @brief IndicatorCalculator: SMA and Wilder RSI kernels.

#include "symphony/market_data.hpp"

#include <limits>

namespace symphony::data {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}  // namespace

std::vector<double>
IndicatorCalculator::sma(std::span<const double> closes, std::uint32_t window) {
    std::vector<double> out(closes.size(), kNaN);
    if (window == 0 || closes.size() < window) return out;

    double sum = 0.0;
    for (std::size_t i = 0; i < closes.size(); ++i) {
        sum += closes[i];
        if (i >= window) sum -= closes[i - window];
        if (i + 1 >= window) out[i] = sum / static_cast<double>(window);
    }
    return out;
}

std::vector<double>
IndicatorCalculator::rsi(std::span<const double> closes, std::uint32_t window) {
    std::vector<double> out(closes.size(), kNaN);
    if (window == 0 || closes.size() <= window) return out;

    const auto score = [](double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) return avg_gain == 0.0 ? 50.0 : 100.0;
        const double rs = avg_gain / avg_loss;
        return 100.0 - 100.0 / (1.0 + rs);
    };

    const double n = static_cast<double>(window);
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (std::size_t i = 1; i <= window; ++i) {
        const double change = closes[i] - closes[i - 1];
        if (change > 0.0) avg_gain += change;
        else              avg_loss -= change;
    }
    avg_gain /= n;
    avg_loss /= n;
    out[window] = score(avg_gain, avg_loss);

    for (std::size_t i = window + 1; i < closes.size(); ++i) {
        const double change = closes[i] - closes[i - 1];
        const double gain = change > 0.0 ? change : 0.0;
        const double loss = change < 0.0 ? -change : 0.0;
        avg_gain = (avg_gain * (n - 1.0) + gain) / n;
        avg_loss = (avg_loss * (n - 1.0) + loss) / n;
        out[i] = score(avg_gain, avg_loss);
    }
    return out;
}

std::vector<double>
IndicatorCalculator::compute(std::span<const double> closes, IndicatorRef ref) {
    switch (ref.kind) {
        case IndicatorKind::Rsi:           return rsi(closes, ref.window);
        case IndicatorKind::MovingAverage: return sma(closes, ref.window);
        case IndicatorKind::CurrentPrice:  break;
    }
    return {closes.begin(), closes.end()};
}

}  // namespace symphony::data
