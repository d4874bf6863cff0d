/// @file src/ast/ast.cpp
/// @brief AST builders and small helpers.

#include "symphony/ast.hpp"

#include <utility>

namespace symphony::ast {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

// ─── Comparison ───────────────────────────────────────────────────────────────

std::string_view to_string(Comparator op) noexcept {
    switch (op) {
        case Comparator::Greater:      return ">";
        case Comparator::Less:         return "<";
        case Comparator::GreaterEqual: return ">=";
        case Comparator::LessEqual:    return "<=";
        case Comparator::Equal:        return "=";
    }
    return "?";
}

bool compare(Comparator op, double lhs, double rhs) noexcept {
    switch (op) {
        case Comparator::Greater:      return lhs >  rhs;
        case Comparator::Less:         return lhs <  rhs;
        case Comparator::GreaterEqual: return lhs >= rhs;
        case Comparator::LessEqual:    return lhs <= rhs;
        case Comparator::Equal:        return lhs == rhs;
    }
    return false;
}

// ─── Builders ─────────────────────────────────────────────────────────────────

NodePtr make_asset(std::string symbol, std::string name) {
    return std::make_shared<const Node>(
        Node{Asset{.symbol = std::move(symbol), .name = std::move(name)}});
}

NodePtr make_group(std::string label, NodePtr body) {
    return std::make_shared<const Node>(
        Node{Group{.label = std::move(label), .body = std::move(body)}});
}

NodePtr make_condition(Condition condition) {
    return std::make_shared<const Node>(Node{std::move(condition)});
}

NodePtr make_if(Condition condition, NodePtr then_branch, NodePtr else_branch) {
    return std::make_shared<const Node>(Node{If{
        .condition   = std::move(condition),
        .then_branch = std::move(then_branch),
        .else_branch = std::move(else_branch),
    }});
}

NodePtr make_weight_equal(std::vector<NodePtr> branches) {
    return std::make_shared<const Node>(
        Node{WeightEqual{.branches = std::move(branches)}});
}

NodePtr make_weight_specified(std::vector<WeightedBranch> pairs) {
    return std::make_shared<const Node>(
        Node{WeightSpecified{.pairs = std::move(pairs)}});
}

NodePtr make_filter(IndicatorRef indicator, Selector selector,
                    std::vector<NodePtr> candidates) {
    return std::make_shared<const Node>(Node{Filter{
        .indicator  = indicator,
        .selector   = selector,
        .candidates = std::move(candidates),
    }});
}

// ─── Helpers ──────────────────────────────────────────────────────────────────

std::string_view symbol_of(const ValueExpr& expr) noexcept {
    return std::visit(overloaded{
        [](const Literal&) -> std::string_view { return {}; },
        [](const CurrentPrice& e) -> std::string_view { return e.symbol; },
        [](const MovingAveragePrice& e) -> std::string_view { return e.symbol; },
        [](const Rsi& e) -> std::string_view { return e.symbol; },
    }, expr);
}

std::optional<IndicatorRef> indicator_of(const ValueExpr& expr) noexcept {
    return std::visit(overloaded{
        [](const Literal&) -> std::optional<IndicatorRef> { return std::nullopt; },
        [](const CurrentPrice&) -> std::optional<IndicatorRef> { return std::nullopt; },
        [](const MovingAveragePrice& e) -> std::optional<IndicatorRef> {
            return IndicatorRef{IndicatorKind::MovingAverage, e.window};
        },
        [](const Rsi& e) -> std::optional<IndicatorRef> {
            return IndicatorRef{IndicatorKind::Rsi, e.window};
        },
    }, expr);
}

std::string_view kind_name(const Node& node) noexcept {
    return std::visit(overloaded{
        [](const Asset&) -> std::string_view { return "asset"; },
        [](const Group&) -> std::string_view { return "group"; },
        [](const Condition&) -> std::string_view { return "condition"; },
        [](const If&) -> std::string_view { return "if"; },
        [](const WeightEqual&) -> std::string_view { return "weight-equal"; },
        [](const WeightSpecified&) -> std::string_view { return "weight-specified"; },
        [](const Filter&) -> std::string_view { return "filter"; },
    }, node.value);
}

}  // namespace symphony::ast
