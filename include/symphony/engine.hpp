#pragma once

/// @file include/symphony/engine.hpp
/// @brief Backtest engine: the per-day evaluate → simulate → validate loop.
///
/// # Module: Engine
///
/// ## Responsibility
/// Orchestrate a complete run:
///   Program → StaticAnalyzer → MarketData (+ indicators) →
///   [per trading day] Evaluator → PortfolioSimulator → AccuracyValidator →
///   PerformanceCalculator → RunReport
///
/// ## Usage
/// ```cpp
/// auto program = parser::load_program("strategy.json");
/// std::vector<Diagnostic> diags;
/// auto market = Engine::load_market(analysis, "data/", diags);
/// Engine engine(config);
/// auto report = engine.run(*program, *market);
/// if (report) fmt::print("{}\n", report->to_string());
/// ```
///
/// ## Error Policy
/// - `DataUnavailable` / `MalformedExpression` from the evaluator skip trading
///   for that day only; valuation and cadence still advance and the day is
///   counted by reason
/// - `UnknownOperator` aborts the run with that error
/// - An unusable configuration or an empty date axis is `InvalidInput`
/// - Ledger invariant violations propagate as `std::logic_error`
///
/// ## NOT Responsible For
/// - Console output beyond the `verbose` trace (the CLI prints reports)

#include "symphony/analyzer.hpp"
#include "symphony/ast.hpp"
#include "symphony/backtest.hpp"
#include "symphony/market_data.hpp"
#include "symphony/simulator.hpp"
#include "symphony/types.hpp"
#include "symphony/validator.hpp"

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace symphony::core {

// ─── Configuration ────────────────────────────────────────────────────────────

struct BacktestConfig {
    backtest::SimulationConfig sim{};

    /// Risk-free rate per period, forwarded to the metrics.
    double risk_free_rate = constants::DEFAULT_RISK_FREE_RATE;

    /// If true, echo diagnostics and orders to stderr as the run proceeds.
    bool verbose = false;
};

// ─── Diagnostics ──────────────────────────────────────────────────────────────

enum class Severity : std::uint8_t { Info, Warning, Error };

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

/// One logged event.  `date` is empty for run-level events.
struct Diagnostic {
    std::optional<Date> date;
    Severity            severity = Severity::Info;
    std::string         message;

    [[nodiscard]] std::string to_string() const;
};

// ─── Report ───────────────────────────────────────────────────────────────────

/// What happened on one trading day.
struct DayRecord {
    Date                     date;
    TargetAllocation         target;       ///< Empty when skipped or all cash
    double                   pre_trade_value = 0.0;
    bool                     rebalanced      = false;
    std::optional<ErrorKind> skip_reason;  ///< Set when evaluation failed
};

struct RunReport {
    std::string                              program_name;
    std::vector<DayRecord>                   days;
    std::vector<backtest::DailyValuation>    history;
    std::vector<backtest::Order>             orders;
    backtest::PortfolioState                 final_state;
    backtest::PerformanceSummary             metrics;
    std::optional<validation::ValidationReport> validation;
    std::map<ErrorKind, std::size_t>         skipped_by_reason;
    std::vector<Diagnostic>                  diagnostics;

    [[nodiscard]] std::size_t skipped_days() const noexcept;

    /// Full human-readable run summary.
    [[nodiscard]] std::string to_string() const;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// Construct with optional configuration.
    explicit Engine(BacktestConfig config = BacktestConfig{});

    /// Run a complete backtest.
    ///
    /// # Returns
    /// - `RunReport` on completion (possibly with skipped days)
    /// - `InvalidInput` for a bad configuration or an empty date axis
    /// - `UnknownOperator` if evaluation meets an operator it cannot run
    ///
    /// # Panics
    /// Rethrows `std::logic_error` from a ledger invariant violation.
    [[nodiscard]] Result<RunReport>
    run(const ast::Program& program,
        const data::MarketData& market,
        const std::optional<validation::GroundTruth>& truth = std::nullopt) const;

    /// Run over an explicit date axis against any accessor.
    [[nodiscard]] Result<RunReport>
    run(const ast::Program& program,
        const data::MarketDataAccessor& market,
        std::span<const Date> dates,
        const std::optional<validation::GroundTruth>& truth = std::nullopt) const;

    /// Trading dates for a run: the common dates of `market`, starting at the
    /// configured start date or, when none is given, after `warmup` rows;
    /// ending at the configured end date.
    [[nodiscard]] static std::vector<Date>
    trading_dates(const data::MarketData& market,
                  const backtest::SimulationConfig& config,
                  std::uint32_t warmup);

    /// Load `<directory>/<TICKER>.csv` for every analysed ticker and
    /// precompute each indicator requirement.
    ///
    /// # Returns
    /// `InvalidInput` if no ticker could be loaded.  Missing tickers are
    /// recorded as warnings in `diagnostics`.
    [[nodiscard]] static Result<data::MarketData>
    load_market(const analysis::AnalysisResult& analysis,
                const std::string& directory,
                std::vector<Diagnostic>& diagnostics);

    /// Precompute every indicator requirement on already-loaded series.
    static void prepare_indicators(data::MarketData& market,
                                   const analysis::AnalysisResult& analysis);

    [[nodiscard]] const BacktestConfig& config() const noexcept { return config_; }

private:
    void log(RunReport& report, Diagnostic diagnostic) const;

    BacktestConfig config_;
};

}  // namespace symphony::core
