/// @file src/core/types.cpp
/// @brief Date helpers and EvaluationError formatting.

#include "symphony/types.hpp"

#include <fmt/format.h>

#include <charconv>

namespace symphony {

namespace {

/// Parse exactly `width` decimal digits starting at `pos`.
[[nodiscard]] std::optional<int>
parse_fixed(std::string_view text, std::size_t pos, std::size_t width) noexcept {
    if (pos + width > text.size()) return std::nullopt;
    int value = 0;
    const char* first = text.data() + pos;
    const char* last  = first + width;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

}  // namespace

// ─── Calendar ─────────────────────────────────────────────────────────────────

std::optional<Date> parse_date(std::string_view text) noexcept {
    // Trim surrounding whitespace and quotes.
    while (!text.empty() && (text.front() == ' ' || text.front() == '"')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '"' ||
                             text.back() == '\r')) {
        text.remove_suffix(1);
    }

    if (text.size() < 10) return std::nullopt;
    if (text[4] != '-' || text[7] != '-') return std::nullopt;
    if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') return std::nullopt;

    const auto y = parse_fixed(text, 0, 4);
    const auto m = parse_fixed(text, 5, 2);
    const auto d = parse_fixed(text, 8, 2);
    if (!y || !m || !d) return std::nullopt;

    const std::chrono::year_month_day ymd{
        std::chrono::year{*y},
        std::chrono::month{static_cast<unsigned>(*m)},
        std::chrono::day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) return std::nullopt;

    return Date{ymd};
}

std::string format_date(Date date) {
    const std::chrono::year_month_day ymd{date};
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

// ─── Indicators ───────────────────────────────────────────────────────────────

std::string to_string(IndicatorRef ref) {
    switch (ref.kind) {
        case IndicatorKind::Rsi:           return fmt::format("rsi({})", ref.window);
        case IndicatorKind::MovingAverage: return fmt::format("sma({})", ref.window);
        case IndicatorKind::CurrentPrice:  return "current-price";
    }
    return "unknown";
}

// ─── Errors ───────────────────────────────────────────────────────────────────

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::DataUnavailable:     return "DataUnavailable";
        case ErrorKind::MalformedExpression: return "MalformedExpression";
        case ErrorKind::UnknownOperator:     return "UnknownOperator";
        case ErrorKind::InvalidInput:        return "InvalidInput";
    }
    return "Unknown";
}

std::string EvaluationError::to_string() const {
    if (kind == ErrorKind::DataUnavailable) {
        if (indicator) {
            return fmt::format("{}: {} for {}", symphony::to_string(kind),
                               symphony::to_string(*indicator), symbol);
        }
        return fmt::format("{}: no close price for {}",
                           symphony::to_string(kind), symbol);
    }
    return fmt::format("{}: {}", symphony::to_string(kind), message);
}

EvaluationError
EvaluationError::data_unavailable(std::string symbol,
                                  std::optional<IndicatorRef> indicator) {
    return EvaluationError{
        .kind      = ErrorKind::DataUnavailable,
        .message   = {},
        .symbol    = std::move(symbol),
        .indicator = indicator,
    };
}

EvaluationError EvaluationError::malformed(std::string message) {
    return EvaluationError{
        .kind      = ErrorKind::MalformedExpression,
        .message   = std::move(message),
        .symbol    = {},
        .indicator = std::nullopt,
    };
}

EvaluationError EvaluationError::unknown_operator(std::string op) {
    return EvaluationError{
        .kind      = ErrorKind::UnknownOperator,
        .message   = fmt::format("unknown operator '{}'", op),
        .symbol    = {},
        .indicator = std::nullopt,
    };
}

EvaluationError EvaluationError::invalid_input(std::string message) {
    return EvaluationError{
        .kind      = ErrorKind::InvalidInput,
        .message   = std::move(message),
        .symbol    = {},
        .indicator = std::nullopt,
    };
}

}  // namespace symphony
