#pragma once

/// @file include/symphony/evaluator.hpp
/// @brief Expression evaluator: AST + date → normalized target allocation.
///
/// # Module: Evaluator
///
/// ## Responsibility
/// Interpret a strategy tree for one evaluation date against a
/// `MarketDataAccessor`, producing a `TargetAllocation`.
///
/// ## Dispatch
/// - `Asset`            → `{symbol: 1.0}`
/// - `Group`            → its body, unchanged
/// - `If`               → condition, then exactly one branch
/// - `WeightEqual`      → sum branch outcomes per symbol, renormalize
/// - `WeightSpecified`  → add each pair's weight to its branch's symbols, renormalize
/// - `Filter`           → rank candidate symbols by indicator, keep the first
///                        `min(count, survivors)` at equal weight
/// - `Condition`        → `MalformedExpression` (not an allocation)
///
/// ## Guarantees
/// - Pure: the result depends only on (tree, date, accessor); all methods are
///   `const` and the evaluator may be shared between threads
/// - A non-empty result has non-negative weights summing to 1 ± 1e-6
/// - `DataUnavailable` outside a filter ranking aborts the whole evaluation;
///   no partial allocation is returned
///
/// ## NOT Responsible For
/// - Trading (see simulator.hpp)

#include "symphony/ast.hpp"
#include "symphony/market_data.hpp"
#include "symphony/types.hpp"

#include <string>
#include <vector>

namespace symphony::eval {

class Evaluator {
public:
    explicit Evaluator(const data::MarketDataAccessor& market) noexcept;

    /// Evaluate a subtree at `date`.
    [[nodiscard]] Result<TargetAllocation>
    evaluate(const ast::Node& root, Date date) const;

    /// As above; filter candidates dropped for missing data are described in
    /// `notes`.
    [[nodiscard]] Result<TargetAllocation>
    evaluate(const ast::Node& root, Date date, std::vector<std::string>& notes) const;

    /// Evaluate a program's root expression.
    [[nodiscard]] Result<TargetAllocation>
    evaluate(const ast::Program& program, Date date) const;

    /// Resolve a comparison operand to a number.
    [[nodiscard]] Result<double> resolve(const ast::ValueExpr& expr, Date date) const;

    /// Evaluate a comparison.
    [[nodiscard]] Result<bool> test(const ast::Condition& condition, Date date) const;

    /// Drop non-positive weights and scale the rest to sum to 1.
    /// Returns `{}` when nothing positive remains.
    [[nodiscard]] static TargetAllocation normalize(TargetAllocation weights);

private:
    const data::MarketDataAccessor& market_;
};

/// Convenience wrapper: `Evaluator(market).evaluate(root, date)`.
[[nodiscard]] Result<TargetAllocation>
evaluate(const ast::Node& root, Date date, const data::MarketDataAccessor& market);

}  // namespace symphony::eval
