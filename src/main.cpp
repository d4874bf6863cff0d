/// @file src/main.cpp
/// @brief symphony CLI entry point.
///
/// Usage:
///   symphony --backtest --strategy <file> --data-dir <dir> [options]
///   symphony --scan --strategy <file>
///   symphony --help

#include "symphony/analyzer.hpp"
#include "symphony/engine.hpp"
#include "symphony/parser.hpp"
#include "symphony/validator.hpp"

#include <fmt/core.h>

#include <charconv>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using namespace symphony;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  symphony --backtest --strategy <file> --data-dir <dir> [options]\n"
        "  symphony --scan --strategy <file> [--dialect <name>]\n"
        "  symphony --help\n"
        "\n"
        "Options:\n"
        "  --dialect <auto|composer|lisp|quantmage>   Program format (default auto)\n"
        "  --start <YYYY-MM-DD>        First trading date (default: after warm-up)\n"
        "  --end <YYYY-MM-DD>          Last trading date\n"
        "  --capital <amount>          Initial capital (default 100000)\n"
        "  --cost-pct <pct>            Transaction cost, percent of notional\n"
        "  --slippage-pct <pct>        Slippage, percent of price\n"
        "  --min-trade <amount>        Minimum traded notional after the first day\n"
        "  --rebalance-days <n>        Trade every n days (default 1)\n"
        "  --ground-truth <csv>        Validate daily selections against a CSV\n"
        "  --verbose                   Trace diagnostics and orders to stderr\n"
        "\n"
        "Price data: <data-dir>/<TICKER>.csv with header\n"
        "  date,open,high,low,close,volume\n"
    );
}

struct CliOptions {
    std::string         strategy_path;
    std::string         data_dir;
    std::string         ground_truth_path;
    parser::Dialect     dialect = parser::Dialect::Auto;
    core::BacktestConfig config{};
};

template <typename T>
[[nodiscard]] std::optional<T> parse_number(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

/// Parse flags after the mode.  Returns nullopt (after printing why) on error.
std::optional<CliOptions> parse_options(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 2; i < argc; ++i) {
        const std::string_view flag(argv[i]);
        if (flag == "--verbose") {
            opts.config.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string_view value(argv[++i]);
        auto& sim = opts.config.sim;

        bool ok = true;
        if (flag == "--strategy") {
            opts.strategy_path = value;
        } else if (flag == "--data-dir") {
            opts.data_dir = value;
        } else if (flag == "--ground-truth") {
            opts.ground_truth_path = value;
        } else if (flag == "--dialect") {
            auto d = parser::parse_dialect(value);
            ok = d.has_value();
            if (d) opts.dialect = *d;
        } else if (flag == "--start" || flag == "--end") {
            auto d = parse_date(value);
            ok = d.has_value();
            (flag == "--start" ? sim.start_date : sim.end_date) = d;
        } else if (flag == "--capital") {
            auto v = parse_number<double>(value);
            ok = v.has_value();
            if (v) sim.initial_capital = *v;
        } else if (flag == "--cost-pct") {
            auto v = parse_number<double>(value);
            ok = v.has_value();
            if (v) sim.transaction_cost_pct = *v;
        } else if (flag == "--slippage-pct") {
            auto v = parse_number<double>(value);
            ok = v.has_value();
            if (v) sim.slippage_pct = *v;
        } else if (flag == "--min-trade") {
            auto v = parse_number<double>(value);
            ok = v.has_value();
            if (v) sim.min_trade_size = *v;
        } else if (flag == "--rebalance-days") {
            auto v = parse_number<std::uint32_t>(value);
            ok = v.has_value();
            if (v) sim.rebalance_frequency_days = *v;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }

        if (!ok) {
            fmt::print(stderr, "Error: invalid value '{}' for {}\n", value, flag);
            return std::nullopt;
        }
    }

    if (opts.strategy_path.empty()) {
        fmt::print(stderr, "Error: --strategy is required\n");
        return std::nullopt;
    }
    return opts;
}

std::optional<ast::Program> load(const CliOptions& opts) {
    auto program = parser::load_program(opts.strategy_path, opts.dialect);
    if (!program) {
        fmt::print(stderr, "Error: {}: {}\n", opts.strategy_path, program.error().to_string());
        return std::nullopt;
    }
    return std::move(program).value();
}

/// Print the tickers and indicator columns a program needs.
/// Returns 0 on success, 1 on error.
int run_scan(const CliOptions& opts) {
    auto program = load(opts);
    if (!program) return 1;

    const auto needs = analysis::StaticAnalyzer::analyze(*program);
    fmt::print("Strategy: {}\n", program->name);
    fmt::print("Tickers ({}):\n", needs.tickers.size());
    for (const auto& ticker : needs.tickers) {
        fmt::print("  {}\n", ticker);
    }
    fmt::print("Indicators ({}):\n", needs.indicator_requirements.size());
    for (const auto& ref : needs.indicator_requirements) {
        fmt::print("  {:<10}", to_string(ref));
        auto it = needs.indicator_symbols.find(ref);
        if (it != needs.indicator_symbols.end()) {
            for (const auto& symbol : it->second) fmt::print(" {}", symbol);
        }
        fmt::print("\n");
    }
    fmt::print("Warm-up: {} bars\n", needs.max_window());
    return 0;
}

/// Run a full backtest.  Returns 0 on success, 1 on error.
int run_backtest(const CliOptions& opts) {
    if (opts.data_dir.empty()) {
        fmt::print(stderr, "Error: --backtest requires --data-dir\n");
        return 1;
    }
    if (auto problem = opts.config.sim.validate()) {
        fmt::print(stderr, "Error: {}\n", *problem);
        return 1;
    }

    auto program = load(opts);
    if (!program) return 1;

    const auto needs = analysis::StaticAnalyzer::analyze(*program);
    std::vector<core::Diagnostic> load_diagnostics;
    auto market = core::Engine::load_market(needs, opts.data_dir, load_diagnostics);
    for (const auto& d : load_diagnostics) {
        fmt::print(stderr, "{}\n", d.to_string());
    }
    if (!market) {
        fmt::print(stderr, "Error: {}\n", market.error().to_string());
        return 1;
    }
    fmt::print("Loaded {} of {} tickers from '{}'\n",
               market->symbols().size(), needs.tickers.size(), opts.data_dir);

    std::optional<validation::GroundTruth> truth;
    if (!opts.ground_truth_path.empty()) {
        truth = validation::GroundTruthLoader::load_csv(opts.ground_truth_path);
        if (!truth) {
            fmt::print(stderr, "Warning: ground truth '{}' unreadable; validation skipped\n",
                       opts.ground_truth_path);
        }
    }

    core::Engine engine(opts.config);
    try {
        auto report = engine.run(*program, *market, truth);
        if (!report) {
            fmt::print(stderr, "Error: {}\n", report.error().to_string());
            return 1;
        }
        fmt::print("{}\n", report->to_string());
    } catch (const std::logic_error& e) {
        fmt::print(stderr, "Fatal: ledger invariant violated: {}\n", e.what());
        return 1;
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--backtest" && mode != "--scan") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    auto opts = parse_options(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    return mode == "--scan" ? run_scan(*opts) : run_backtest(*opts);
}
