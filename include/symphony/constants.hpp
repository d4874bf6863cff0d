#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/symphony/constants.hpp
/// @brief Numerical tolerances and simulation defaults.

namespace symphony::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// A normalized allocation must sum to 1.0 within this tolerance.
static constexpr double ALLOCATION_TOLERANCE = 1e-6;

/// Cash may dip below zero by at most this amount (floating error) after an order.
static constexpr double CASH_EPSILON = 1e-6;

/// Trades with |Δshares × price| at or below this notional are no-ops.
static constexpr double NOTIONAL_EPSILON = 1e-9;

/// Share positions at or below this size are treated as fully liquidated.
static constexpr double SHARE_EPSILON = 1e-9;

// ─── Parsing ──────────────────────────────────────────────────────────────────

/// Deepest list nesting accepted by the parsers (bounds recursion on hostile input).
static constexpr std::size_t MAX_NESTING_DEPTH = 256;

// ─── Indicator Defaults ───────────────────────────────────────────────────────

/// Window used when an `rsi` expression omits `:window`.
static constexpr std::uint32_t DEFAULT_RSI_WINDOW = 10;

/// Window used when a `moving-average-price` expression omits `:window`.
static constexpr std::uint32_t DEFAULT_MA_WINDOW = 20;

// ─── Simulation Defaults ──────────────────────────────────────────────────────

static constexpr double DEFAULT_INITIAL_CAPITAL = 100000.0;

/// Percent of traded notional charged as a fee (0.0 = frictionless).
static constexpr double DEFAULT_TRANSACTION_COST_PCT = 0.0;

/// Percent adverse price shift applied to every execution.
static constexpr double DEFAULT_SLIPPAGE_PCT = 0.0;

/// Minimum traded notional for a non-seeding rebalance order.
static constexpr double DEFAULT_MIN_TRADE_SIZE = 0.0;

/// Trade every N days (1 = daily).
static constexpr std::uint32_t DEFAULT_REBALANCE_FREQUENCY_DAYS = 1;

// ─── Metrics ──────────────────────────────────────────────────────────────────

/// Minimum number of daily returns for Sharpe/Sortino/volatility.
static constexpr std::size_t MIN_RETURN_SERIES_LENGTH = 2;

/// Default annualised risk-free rate (excess-return framing).
static constexpr double DEFAULT_RISK_FREE_RATE = 0.0;

/// Default annualisation factor: 252 trading days per year.
static constexpr double ANNUALISATION_FACTOR = 252.0;

}  // namespace symphony::constants
