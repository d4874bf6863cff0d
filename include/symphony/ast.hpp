#pragma once

/// @file include/symphony/ast.hpp
/// @brief Strategy program AST: closed tagged-variant node model.
///
/// # Module: AST
///
/// ## Responsibility
/// Represent a parsed strategy program as an immutable tree.  Nodes are held
/// by `std::shared_ptr<const Node>`; a program's subtrees may be shared but
/// never mutated after parsing.
///
/// ## Node Set
///   Asset, Group, Condition, If, WeightEqual, WeightSpecified, Filter
///
/// The set is closed: every consumer dispatches with `std::visit`, so adding a
/// node type is a compile error at each unhandled site rather than a silent
/// fall-through.
///
/// ## NOT Responsible For
/// - Parsing any source dialect (see parser.hpp, quantmage.hpp)
/// - Evaluation (see evaluator.hpp)

#include "symphony/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace symphony::ast {

struct Node;

/// Shared, immutable handle to a subtree.
using NodePtr = std::shared_ptr<const Node>;

// ─── Value Expressions ────────────────────────────────────────────────────────

/// A numeric literal operand.
struct Literal {
    double value;
};

/// Close price of `symbol` as of the evaluation date.
struct CurrentPrice {
    std::string symbol;
};

/// Simple moving average of closes over `window` bars.
struct MovingAveragePrice {
    std::string   symbol;
    std::uint32_t window;
};

/// Relative strength index over `window` bars.
struct Rsi {
    std::string   symbol;
    std::uint32_t window;
};

/// An operand of a comparison.
using ValueExpr = std::variant<Literal, CurrentPrice, MovingAveragePrice, Rsi>;

// ─── Comparison ───────────────────────────────────────────────────────────────

enum class Comparator : std::uint8_t {
    Greater,       ///< >
    Less,          ///< <
    GreaterEqual,  ///< >=
    LessEqual,     ///< <=
    Equal,         ///< =
};

/// Operator token for a comparator (`">"`, `"<="`, …).
[[nodiscard]] std::string_view to_string(Comparator op) noexcept;

/// Apply `op` to resolved operands.
[[nodiscard]] bool compare(Comparator op, double lhs, double rhs) noexcept;

struct Condition {
    Comparator op;
    ValueExpr  lhs;
    ValueExpr  rhs;
};

// ─── Allocation Nodes ─────────────────────────────────────────────────────────

/// Leaf: a tradable instrument.
struct Asset {
    std::string symbol;
    std::string name;  ///< Display name; may be empty
};

/// Named wrapper.  `label` is a `+`-joined ticker list used only for static
/// discovery; evaluation is transparent to it.
struct Group {
    std::string label;
    NodePtr     body;
};

struct If {
    Condition condition;
    NodePtr   then_branch;
    NodePtr   else_branch;
};

/// Distribute allocation equally across branch outcomes (sum, then renormalize).
struct WeightEqual {
    std::vector<NodePtr> branches;
};

struct WeightedBranch {
    double  weight;
    NodePtr node;
};

/// Explicit per-branch weights.
struct WeightSpecified {
    std::vector<WeightedBranch> pairs;
};

enum class SelectMode : std::uint8_t { Top, Bottom };

struct Selector {
    SelectMode    mode  = SelectMode::Top;
    std::uint32_t count = 1;
};

/// Rank candidates by an indicator and keep the first `selector.count`.
struct Filter {
    IndicatorRef         indicator;
    Selector             selector;
    std::vector<NodePtr> candidates;
};

// ─── Node ─────────────────────────────────────────────────────────────────────

struct Node {
    std::variant<Asset, Group, Condition, If, WeightEqual, WeightSpecified, Filter>
        value;
};

/// A complete program: metadata plus the expression that is evaluated.
struct Program {
    std::string name;
    std::string description;
    NodePtr     root;
};

// ─── Builders ─────────────────────────────────────────────────────────────────
//
// Thin factories used by the parsers and by tests to assemble trees without
// spelling out the variant wrapping.

[[nodiscard]] NodePtr make_asset(std::string symbol, std::string name = {});
[[nodiscard]] NodePtr make_group(std::string label, NodePtr body);
[[nodiscard]] NodePtr make_condition(Condition condition);
[[nodiscard]] NodePtr make_if(Condition condition, NodePtr then_branch, NodePtr else_branch);
[[nodiscard]] NodePtr make_weight_equal(std::vector<NodePtr> branches);
[[nodiscard]] NodePtr make_weight_specified(std::vector<WeightedBranch> pairs);
[[nodiscard]] NodePtr make_filter(IndicatorRef indicator, Selector selector,
                                  std::vector<NodePtr> candidates);

/// Symbol referenced by a value expression, or empty for a literal.
[[nodiscard]] std::string_view symbol_of(const ValueExpr& expr) noexcept;

/// Indicator column a value expression reads, if any.
[[nodiscard]] std::optional<IndicatorRef> indicator_of(const ValueExpr& expr) noexcept;

/// Node type name as it appears in the Composer dialect (`"if"`, `"filter"`, …).
[[nodiscard]] std::string_view kind_name(const Node& node) noexcept;

}  // namespace symphony::ast
