#pragma once

/// @file include/symphony/analyzer.hpp
/// @brief Static analysis of a program: tickers and indicator requirements.
///
/// # Module: StaticAnalyzer
///
/// ## Responsibility
/// Walk an AST once (pre-order) and report every ticker it can reference and
/// every (indicator, window) column evaluation may read, so market data can
/// be loaded and indicators precomputed before the first simulated day.
///
/// ## Guarantees
/// - Deterministic: identical trees yield identical sets
/// - `Group` labels are split on `+`; each token is a ticker whether or not
///   the group's body references it
/// - `CurrentPrice` is read from closes and never appears as a requirement
///
/// ## NOT Responsible For
/// - Loading data (see market_data.hpp)

#include "symphony/ast.hpp"
#include "symphony/types.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace symphony::analysis {

struct AnalysisResult {
    std::set<std::string>  tickers;
    std::set<IndicatorRef> indicator_requirements;

    /// Symbols whose column is needed for each requirement.  Filter
    /// requirements cover every asset reachable from the filter's candidates.
    std::map<IndicatorRef, std::set<std::string>> indicator_symbols;

    /// Longest indicator window (0 when the program reads no indicator).
    [[nodiscard]] std::uint32_t max_window() const noexcept;
};

class StaticAnalyzer {
public:
    StaticAnalyzer() = delete;

    [[nodiscard]] static AnalysisResult analyze(const ast::Node& root);
    [[nodiscard]] static AnalysisResult analyze(const ast::Program& program);

    /// Split a `+`-joined group label into trimmed, non-empty tickers.
    [[nodiscard]] static std::set<std::string> split_label(std::string_view label);
};

}  // namespace symphony::analysis
