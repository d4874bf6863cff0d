/// @file src/parser/quantmage_normalizer.cpp
/// @brief QuantmageNormalizer: incantation objects to AST.

#include "symphony/quantmage.hpp"
#include "symphony/constants.hpp"
#include "symphony/parser.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace symphony::parser {

using nlohmann::json;

namespace {

[[nodiscard]] std::string string_field(const json& obj, const char* key,
                                       std::string fallback = {}) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

[[nodiscard]] Result<std::uint32_t> window_field(const json& indicator,
                                                 std::uint32_t fallback) {
    auto it = indicator.find("window");
    if (it == indicator.end() || it->is_null()) return fallback;
    if (!it->is_number()) {
        return EvaluationError::malformed(
            fmt::format("indicator window must be a number, got {}", describe_json(*it)));
    }
    const double raw = it->get<double>();
    if (!std::isfinite(raw) || raw < 1.0 || raw != std::floor(raw) || raw > 1e9) {
        return EvaluationError::malformed(
            fmt::format("indicator window must be a positive integer, got {}", raw));
    }
    return static_cast<std::uint32_t>(raw);
}

/// Map an indicator record `{type, window}` to an IndicatorRef.
[[nodiscard]] Result<IndicatorRef> indicator_ref(const json& indicator) {
    if (!indicator.is_object()) {
        return EvaluationError::malformed("indicator must be an object");
    }
    const std::string type = string_field(indicator, "type");
    if (type == "RelativeStrengthIndex") {
        auto window = window_field(indicator, constants::DEFAULT_RSI_WINDOW);
        if (!window) return window.error();
        return IndicatorRef{IndicatorKind::Rsi, *window};
    }
    if (type == "MovingAverage") {
        auto window = window_field(indicator, constants::DEFAULT_MA_WINDOW);
        if (!window) return window.error();
        return IndicatorRef{IndicatorKind::MovingAverage, *window};
    }
    if (type == "CurrentPrice") {
        return IndicatorRef{IndicatorKind::CurrentPrice, 0};
    }
    return EvaluationError::unknown_operator(
        type.empty() ? std::string("<missing indicator type>") : type);
}

[[nodiscard]] ast::ValueExpr value_for(IndicatorRef ref, std::string symbol) {
    switch (ref.kind) {
        case IndicatorKind::Rsi:
            return ast::Rsi{std::move(symbol), ref.window};
        case IndicatorKind::MovingAverage:
            return ast::MovingAveragePrice{std::move(symbol), ref.window};
        case IndicatorKind::CurrentPrice:
            break;
    }
    return ast::CurrentPrice{std::move(symbol)};
}

[[nodiscard]] Result<ast::Condition> condition(const json& cond) {
    if (!cond.is_object()) {
        return EvaluationError::malformed("IfElse requires a condition object");
    }
    const std::string type = string_field(cond, "condition_type");
    if (type != "SingleCondition") {
        return EvaluationError::unknown_operator(
            type.empty() ? std::string("<missing condition type>") : type);
    }

    const std::string lhs_symbol = string_field(cond, "lh_ticker_symbol");
    if (lhs_symbol.empty()) {
        return EvaluationError::malformed("condition requires lh_ticker_symbol");
    }
    auto lhs_it = cond.find("lh_indicator");
    if (lhs_it == cond.end()) {
        return EvaluationError::malformed("condition requires lh_indicator");
    }
    auto lhs_ref = indicator_ref(*lhs_it);
    if (!lhs_ref) return lhs_ref.error();

    bool greater = true;
    if (auto it = cond.find("greater_than"); it != cond.end() && it->is_boolean()) {
        greater = it->get<bool>();
    }

    ast::ValueExpr rhs = ast::Literal{0.0};
    auto rhs_it = cond.find("rh_indicator");
    const bool rhs_indicator = rhs_it != cond.end() && rhs_it->is_object() &&
                               !string_field(*rhs_it, "type").empty();
    if (rhs_indicator) {
        auto rhs_ref = indicator_ref(*rhs_it);
        if (!rhs_ref) return rhs_ref.error();
        rhs = value_for(*rhs_ref, string_field(cond, "rh_ticker_symbol", lhs_symbol));
    } else if (auto it = cond.find("rh_value"); it != cond.end()) {
        if (!it->is_number() || !std::isfinite(it->get<double>())) {
            return EvaluationError::malformed("rh_value must be a finite number");
        }
        rhs = ast::Literal{it->get<double>()};
    }

    return ast::Condition{
        .op  = greater ? ast::Comparator::Greater : ast::Comparator::Less,
        .lhs = value_for(*lhs_ref, lhs_symbol),
        .rhs = std::move(rhs),
    };
}

class Rewriter {
public:
    Result<ast::NodePtr> incantation(const json& inc, std::size_t depth);

private:
    Result<std::vector<ast::NodePtr>> children(const json& inc, std::size_t depth);
    Result<ast::NodePtr> weighted(const json& inc, std::size_t depth);
    Result<ast::NodePtr> if_else(const json& inc, std::size_t depth);
    Result<ast::NodePtr> filtered(const json& inc, std::size_t depth);
};

Result<ast::NodePtr> Rewriter::incantation(const json& inc, std::size_t depth) {
    if (depth > constants::MAX_NESTING_DEPTH) {
        return EvaluationError::malformed("incantation nesting too deep");
    }
    if (!inc.is_object()) {
        return EvaluationError::malformed(
            fmt::format("incantation must be an object, got {}", inc.type_name()));
    }
    const std::string type = string_field(inc, "incantation_type");
    if (type == "Ticker") {
        std::string symbol = string_field(inc, "symbol");
        if (symbol.empty()) {
            return EvaluationError::malformed("Ticker incantation requires a symbol");
        }
        std::string name = string_field(inc, "name", symbol);
        return ast::make_asset(std::move(symbol), std::move(name));
    }
    if (type == "Weighted") return weighted(inc, depth);
    if (type == "IfElse")   return if_else(inc, depth);
    if (type == "Filtered") return filtered(inc, depth);
    return EvaluationError::unknown_operator(
        type.empty() ? std::string("<missing incantation type>") : type);
}

Result<std::vector<ast::NodePtr>>
Rewriter::children(const json& inc, std::size_t depth) {
    std::vector<ast::NodePtr> out;
    auto it = inc.find("incantations");
    if (it == inc.end() || it->is_null()) return out;
    if (!it->is_array()) {
        return EvaluationError::malformed("incantations must be a list");
    }
    out.reserve(it->size());
    for (const auto& sub : *it) {
        auto child = incantation(sub, depth + 1);
        if (!child) return child.error();
        out.push_back(std::move(child).value());
    }
    return out;
}

Result<ast::NodePtr> Rewriter::weighted(const json& inc, std::size_t depth) {
    auto kids = children(inc, depth);
    if (!kids) return kids.error();
    if (kids->size() == 1) return kids->front();
    return ast::make_weight_equal(std::move(kids).value());
}

Result<ast::NodePtr> Rewriter::if_else(const json& inc, std::size_t depth) {
    auto cond_it = inc.find("condition");
    if (cond_it == inc.end()) {
        return EvaluationError::malformed("IfElse requires a condition");
    }
    auto cond = condition(*cond_it);
    if (!cond) return cond.error();

    auto then_it = inc.find("then_incantation");
    auto else_it = inc.find("else_incantation");
    if (then_it == inc.end() || else_it == inc.end()) {
        return EvaluationError::malformed("IfElse requires then and else incantations");
    }
    auto then_branch = incantation(*then_it, depth + 1);
    if (!then_branch) return then_branch.error();
    auto else_branch = incantation(*else_it, depth + 1);
    if (!else_branch) return else_branch.error();

    return ast::make_if(std::move(cond).value(),
                        std::move(then_branch).value(),
                        std::move(else_branch).value());
}

Result<ast::NodePtr> Rewriter::filtered(const json& inc, std::size_t depth) {
    auto sort_it = inc.find("sort_indicator");
    if (sort_it == inc.end()) {
        return EvaluationError::malformed("Filtered requires sort_indicator");
    }
    auto ref = indicator_ref(*sort_it);
    if (!ref) return ref.error();

    ast::Selector selector;
    if (auto it = inc.find("count"); it != inc.end()) {
        auto count = as_positive_count(*it);
        if (!count) {
            return EvaluationError::malformed(fmt::format(
                "Filtered count must be a positive integer, got {}", describe_json(*it)));
        }
        selector.count = *count;
    }
    if (auto it = inc.find("bottom"); it != inc.end() && it->is_boolean() && it->get<bool>()) {
        selector.mode = ast::SelectMode::Bottom;
    }

    auto kids = children(inc, depth);
    if (!kids) return kids.error();
    return ast::make_filter(*ref, selector, std::move(kids).value());
}

}  // namespace

Result<ast::Program> QuantmageNormalizer::normalize(const json& doc) {
    if (!doc.is_object()) {
        return EvaluationError::malformed("Quantmage document must be an object");
    }
    auto it = doc.find("incantation");
    if (it == doc.end()) {
        return EvaluationError::malformed("Quantmage document has no incantation");
    }

    Rewriter rewriter;
    auto root = rewriter.incantation(*it, 1);
    if (!root) return root.error();

    return ast::Program{
        .name        = string_field(doc, "name", "Quantmage Strategy"),
        .description = string_field(doc, "description"),
        .root        = std::move(root).value(),
    };
}

Result<ast::NodePtr> QuantmageNormalizer::normalize_incantation(const json& incantation) {
    Rewriter rewriter;
    return rewriter.incantation(incantation, 0);
}

}  // namespace symphony::parser
