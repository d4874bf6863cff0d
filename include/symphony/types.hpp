#pragma once

/// @file include/symphony/types.hpp
/// @brief Shared primitive types for the symphony strategy backtester.
///
/// Every module includes this file. It defines the calendar date type, the
/// target-allocation map, indicator references and the error taxonomy shared
/// by the parsers, the evaluator and the run engine.

#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace symphony {

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// A trading date with day resolution.
using Date = std::chrono::sys_days;

/// Parse an ISO `YYYY-MM-DD` date. Trailing time components
/// (`2024-01-02 00:00:00`, `2024-01-02T00:00:00`) are ignored.
///
/// # Returns
/// `nullopt` if the prefix is not a valid calendar date.
[[nodiscard]] std::optional<Date> parse_date(std::string_view text) noexcept;

/// Format a date as `YYYY-MM-DD`.
[[nodiscard]] std::string format_date(Date date);

// ─── Allocation ───────────────────────────────────────────────────────────────

/// Symbol → fractional portfolio weight for one date.
///
/// Weights are non-negative and sum to 1.0 (within ALLOCATION_TOLERANCE)
/// whenever the map is non-empty.  An empty map means "fully in cash".
using TargetAllocation = std::map<std::string, double, std::less<>>;

// ─── Indicators ───────────────────────────────────────────────────────────────

/// Precomputed indicator families known to the evaluator.
enum class IndicatorKind : std::uint8_t {
    Rsi,
    MovingAverage,
    CurrentPrice,  ///< Filter ranking by close; never precomputed
};

/// A (kind, window) pair naming one indicator column.
struct IndicatorRef {
    IndicatorKind kind   = IndicatorKind::Rsi;
    std::uint32_t window = 0;

    auto operator<=>(const IndicatorRef&) const = default;
};

/// Human-readable indicator name, e.g. `rsi(10)` or `sma(200)`.
[[nodiscard]] std::string to_string(IndicatorRef ref);

// ─── Errors ───────────────────────────────────────────────────────────────────

/// Failure classes raised while parsing or evaluating a strategy.
enum class ErrorKind : std::uint8_t {
    DataUnavailable,      ///< Missing price/indicator for a required symbol/date
    MalformedExpression,  ///< Structurally invalid program node
    UnknownOperator,      ///< Operator or dialect tag outside the fixed set
    InvalidInput,         ///< Unusable run input (files, dates, configuration)
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// An evaluation or parse failure with enough context to log it.
struct EvaluationError {
    ErrorKind   kind;
    std::string message;
    std::string symbol;                   ///< Set for DataUnavailable
    std::optional<IndicatorRef> indicator; ///< Set when an indicator was missing

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] static EvaluationError
    data_unavailable(std::string symbol, std::optional<IndicatorRef> indicator);
    [[nodiscard]] static EvaluationError malformed(std::string message);
    [[nodiscard]] static EvaluationError unknown_operator(std::string op);
    [[nodiscard]] static EvaluationError invalid_input(std::string message);
};

// ─── Result ───────────────────────────────────────────────────────────────────

/// Value-or-error return type for operations that must report why they failed.
///
/// ```cpp
/// auto r = evaluator.evaluate(*program.root, date);
/// if (!r) fmt::print(stderr, "{}\n", r.error().to_string());
/// ```
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}                 // NOLINT(google-explicit-constructor)
    Result(EvaluationError error) : data_(std::move(error)) {}   // NOLINT(google-explicit-constructor)

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<T>(data_);
    }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] const EvaluationError& error() const& {
        return std::get<EvaluationError>(data_);
    }

    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }
    const T* operator->() const { return &std::get<T>(data_); }
    T* operator->() { return &std::get<T>(data_); }

private:
    std::variant<T, EvaluationError> data_;
};

}  // namespace symphony
