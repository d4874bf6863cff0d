/// @file src/core/engine.cpp
/// @brief Backtest engine: per-day evaluate, simulate, validate.

#include "symphony/engine.hpp"
#include "symphony/data_loader.hpp"
#include "symphony/evaluator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace symphony::core {

// ─── Diagnostics ──────────────────────────────────────────────────────────────

std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warn";
        case Severity::Error:   return "error";
    }
    return "?";
}

std::string Diagnostic::to_string() const {
    return fmt::format("[{}] {}{}", core::to_string(severity),
                       date ? format_date(*date) + ": " : std::string{}, message);
}

// ─── RunReport ────────────────────────────────────────────────────────────────

std::size_t RunReport::skipped_days() const noexcept {
    std::size_t total = 0;
    for (const auto& [kind, count] : skipped_by_reason) total += count;
    return total;
}

std::string RunReport::to_string() const {
    std::string out = fmt::format("Strategy: {}\n", program_name);
    if (!history.empty()) {
        out += fmt::format("Period:   {} to {}\n", format_date(history.front().date),
                           format_date(history.back().date));
    }
    out += '\n';
    out += metrics.to_string();

    out += fmt::format("\nOrders executed: {}\n", orders.size());
    out += fmt::format("Cash at end:     {:.2f}\n", final_state.cash);
    for (const auto& [symbol, shares] : final_state.holdings) {
        out += fmt::format("  {:<8} {:>14.6f} shares\n", symbol, shares);
    }

    out += fmt::format("\nSkipped days: {}\n", skipped_days());
    for (const auto& [kind, count] : skipped_by_reason) {
        out += fmt::format("  {:<22} {}\n", symphony::to_string(kind), count);
    }

    if (validation) {
        out += '\n';
        out += validation->to_string();
    }
    return out;
}

// ─── Engine ───────────────────────────────────────────────────────────────────

Engine::Engine(BacktestConfig config)
    : config_(std::move(config))
{}

void Engine::log(RunReport& report, Diagnostic diagnostic) const {
    if (config_.verbose) {
        fmt::print(stderr, "{}\n", diagnostic.to_string());
    }
    report.diagnostics.push_back(std::move(diagnostic));
}

std::vector<Date> Engine::trading_dates(const data::MarketData& market,
                                        const backtest::SimulationConfig& config,
                                        std::uint32_t warmup) {
    std::vector<Date> dates = market.common_dates();
    if (config.start_date) {
        std::erase_if(dates, [&](Date d) { return d < *config.start_date; });
    } else {
        const auto skip = std::min<std::size_t>(warmup, dates.size());
        dates.erase(dates.begin(), dates.begin() + static_cast<std::ptrdiff_t>(skip));
    }
    if (config.end_date) {
        std::erase_if(dates, [&](Date d) { return d > *config.end_date; });
    }
    return dates;
}

void Engine::prepare_indicators(data::MarketData& market,
                                const analysis::AnalysisResult& analysis) {
    for (const auto& ref : analysis.indicator_requirements) {
        auto it = analysis.indicator_symbols.find(ref);
        if (it == analysis.indicator_symbols.end()) continue;
        market.compute_indicators(ref, it->second);
    }
}

Result<data::MarketData>
Engine::load_market(const analysis::AnalysisResult& analysis,
                    const std::string& directory,
                    std::vector<Diagnostic>& diagnostics) {
    const std::vector<std::string> tickers(analysis.tickers.begin(), analysis.tickers.end());
    std::vector<std::string> missing;
    auto series = data::DataLoader::load_directory(directory, tickers, missing);

    for (const auto& symbol : missing) {
        diagnostics.push_back(Diagnostic{
            .date     = std::nullopt,
            .severity = Severity::Warning,
            .message  = fmt::format("no usable price data for {} in {}", symbol, directory),
        });
    }
    if (series.empty()) {
        return EvaluationError::invalid_input(
            fmt::format("no price data found in '{}' for any referenced ticker", directory));
    }

    data::MarketData market;
    for (auto& [symbol, bars] : series) {
        market.add_series(symbol, bars);
    }
    prepare_indicators(market, analysis);
    return market;
}

Result<RunReport> Engine::run(const ast::Program& program,
                              const data::MarketData& market,
                              const std::optional<validation::GroundTruth>& truth) const {
    if (!program.root) {
        return EvaluationError::malformed("program has no root expression");
    }
    const auto analysis = analysis::StaticAnalyzer::analyze(*program.root);
    const auto dates = trading_dates(market, config_.sim, analysis.max_window());
    return run(program, market, dates, truth);
}

Result<RunReport> Engine::run(const ast::Program& program,
                              const data::MarketDataAccessor& market,
                              std::span<const Date> dates,
                              const std::optional<validation::GroundTruth>& truth) const {
    if (!program.root) {
        return EvaluationError::malformed("program has no root expression");
    }
    if (auto problem = config_.sim.validate()) {
        return EvaluationError::invalid_input(*problem);
    }
    if (dates.empty()) {
        return EvaluationError::invalid_input(
            "no trading dates: the loaded series share no dates in the requested window");
    }

    RunReport report;
    report.program_name = program.name;

    const eval::Evaluator evaluator(market);
    backtest::PortfolioSimulator simulator(market, config_.sim);
    std::optional<validation::AccuracyValidator> validator;
    if (truth) validator.emplace(*truth);

    for (const Date date : dates) {
        std::vector<std::string> notes;
        auto target = evaluator.evaluate(*program.root, date, notes);
        for (auto& note : notes) {
            log(report, Diagnostic{.date = date, .severity = Severity::Info,
                                   .message = std::move(note)});
        }

        DayRecord day{.date = date};
        backtest::StepResult step;

        if (!target) {
            const auto& error = target.error();
            if (error.kind == ErrorKind::UnknownOperator) {
                return error;
            }
            log(report, Diagnostic{.date = date, .severity = Severity::Warning,
                                   .message = fmt::format("trading skipped: {}",
                                                          error.to_string())});
            ++report.skipped_by_reason[error.kind];
            day.skip_reason = error.kind;
            step = simulator.hold(date);
        } else {
            if (validator) validator->observe(date, *target);
            step = simulator.step(date, *target);
            day.target = std::move(target).value();
        }

        for (auto& warning : step.warnings) {
            log(report, Diagnostic{.date = date, .severity = Severity::Warning,
                                   .message = std::move(warning)});
        }
        if (config_.verbose) {
            for (const auto& order : step.orders) {
                fmt::print(stderr, "{}\n", order.to_string());
            }
        }
        day.pre_trade_value = step.pre_trade_value;
        day.rebalanced      = step.rebalanced;
        report.days.push_back(std::move(day));
    }

    report.history     = simulator.history();
    report.orders      = simulator.orders();
    report.final_state = simulator.state();
    report.metrics     = backtest::PerformanceCalculator::summarize(
        report.history, config_.risk_free_rate);
    if (validator) report.validation = validator->report();
    return report;
}

}  // namespace symphony::core
