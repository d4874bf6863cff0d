/// @file src/parser/program_parser.cpp
/// @brief ProgramParser: Composer nested-array documents to AST.

#include "symphony/parser.hpp"
#include "symphony/constants.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace symphony::parser {

using nlohmann::json;

namespace {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

constexpr std::size_t DESCRIBE_WIDTH = 80;
constexpr std::size_t DESCRIBE_DEPTH = 4;

void render_bounded(const json& j, std::size_t level, std::string& out) {
    if (out.size() > DESCRIBE_WIDTH) return;
    if (j.is_array() || j.is_object()) {
        const bool array = j.is_array();
        if (j.empty()) {
            out += array ? "[]" : "{}";
            return;
        }
        if (level >= DESCRIBE_DEPTH) {
            out += array ? "[...]" : "{...}";
            return;
        }
        out += array ? '[' : '{';
        bool first = true;
        for (auto it = j.begin(); it != j.end() && out.size() <= DESCRIBE_WIDTH; ++it) {
            if (!first) out += ',';
            first = false;
            if (!array) {
                out += json(it.key()).dump();
                out += ':';
            }
            render_bounded(*it, level + 1, out);
        }
        out += array ? ']' : '}';
        return;
    }
    out += j.dump();
}

[[nodiscard]] bool is_string(const json& j, std::string_view value) {
    return j.is_string() && j.get_ref<const json::string_t&>() == value;
}

/// Read a `:window` parameter in any of the accepted shapes:
///   {":window": 10}   {"window": 10}   [":window", 10]   10
[[nodiscard]] Result<std::uint32_t>
parse_window(const json* params, std::uint32_t fallback) {
    if (params == nullptr || params->is_null()) return fallback;

    const json* raw = nullptr;
    if (params->is_object()) {
        for (const char* key : {":window", "window"}) {
            auto it = params->find(key);
            if (it != params->end()) {
                raw = &*it;
                break;
            }
        }
    } else if (params->is_array()) {
        for (std::size_t i = 0; i + 1 < params->size(); ++i) {
            if (is_string((*params)[i], ":window") || is_string((*params)[i], "window")) {
                raw = &(*params)[i + 1];
                break;
            }
        }
    } else if (params->is_number()) {
        raw = params;
    } else {
        return EvaluationError::malformed(
            fmt::format("invalid indicator parameters {}", describe_json(*params)));
    }

    if (raw == nullptr) return fallback;
    auto window = as_positive_count(*raw);
    if (!window) {
        return EvaluationError::malformed(
            fmt::format("window must be a positive integer, got {}", describe_json(*raw)));
    }
    return *window;
}

[[nodiscard]] std::optional<ast::Comparator> parse_comparator(std::string_view op) {
    if (op == ">")  return ast::Comparator::Greater;
    if (op == "<")  return ast::Comparator::Less;
    if (op == ">=") return ast::Comparator::GreaterEqual;
    if (op == "<=") return ast::Comparator::LessEqual;
    if (op == "=")  return ast::Comparator::Equal;
    return std::nullopt;
}

/// Symbol operand of `["asset", "SPY", ...]` or `["asset", [":ticker", "SPY"], ...]`.
[[nodiscard]] std::optional<std::string> asset_symbol(const json& operand) {
    if (operand.is_string()) {
        return operand.get<std::string>();
    }
    if (operand.is_array() && operand.size() == 2 &&
        is_string(operand[0], ":ticker") && operand[1].is_string()) {
        return operand[1].get<std::string>();
    }
    return std::nullopt;
}

// ─── Recursive descent ────────────────────────────────────────────────────────

class Descent {
public:
    Result<ast::NodePtr> node(const json& expr, std::size_t depth);
    Result<ast::ValueExpr> value(const json& expr);
    Result<ast::Condition> condition(const json& expr);

private:
    Result<ast::NodePtr> block(const json& expr, std::size_t depth);
    Result<ast::NodePtr> asset(const json& expr);
    Result<ast::NodePtr> group(const json& expr, std::size_t depth);
    Result<ast::NodePtr> if_node(const json& expr, std::size_t depth);
    Result<ast::NodePtr> weight_equal(const json& expr, std::size_t depth);
    Result<ast::NodePtr> weight_specified(const json& expr, std::size_t depth);
    Result<ast::NodePtr> filter(const json& expr, std::size_t depth);
    Result<IndicatorRef> indicator(const json& expr);
    Result<ast::Selector> selector(const json& expr);
};

Result<ast::NodePtr> Descent::node(const json& expr, std::size_t depth) {
    if (depth > constants::MAX_NESTING_DEPTH) {
        return EvaluationError::malformed("expression nesting too deep");
    }
    if (!expr.is_array()) {
        return EvaluationError::malformed(
            fmt::format("expected an expression list, got {}", describe_json(expr)));
    }
    if (expr.empty()) {
        return ast::make_weight_equal({});
    }
    if (expr[0].is_array()) {
        return block(expr, depth);
    }
    if (!expr[0].is_string()) {
        return EvaluationError::malformed(
            fmt::format("expression must start with an operator: {}", describe_json(expr)));
    }

    const auto& op = expr[0].get_ref<const json::string_t&>();
    if (op == "asset")            return asset(expr);
    if (op == "group")            return group(expr, depth);
    if (op == "if")               return if_node(expr, depth);
    if (op == "weight-equal" || op == "wt-cash-equal") {
        return weight_equal(expr, depth);
    }
    if (op == "weight-specified" || op == "wt-cash-specified") {
        return weight_specified(expr, depth);
    }
    if (op == "filter")           return filter(expr, depth);
    if (parse_comparator(op)) {
        auto cond = condition(expr);
        if (!cond) return cond.error();
        return ast::make_condition(std::move(cond).value());
    }
    return EvaluationError::unknown_operator(op);
}

Result<ast::NodePtr> Descent::block(const json& expr, std::size_t depth) {
    std::vector<ast::NodePtr> children;
    children.reserve(expr.size());
    for (const auto& item : expr) {
        auto child = node(item, depth + 1);
        if (!child) return child.error();
        children.push_back(std::move(child).value());
    }
    if (children.size() == 1) {
        return children.front();
    }
    return ast::make_weight_equal(std::move(children));
}

Result<ast::NodePtr> Descent::asset(const json& expr) {
    if (expr.size() < 2) {
        return EvaluationError::malformed(
            fmt::format("asset requires a symbol: {}", describe_json(expr)));
    }
    auto symbol = asset_symbol(expr[1]);
    if (!symbol || symbol->empty()) {
        return EvaluationError::malformed(
            fmt::format("asset symbol must be a non-empty string: {}", describe_json(expr)));
    }
    std::string name;
    if (expr.size() > 2) {
        const json& label = expr[2];
        if (label.is_string()) {
            name = label.get<std::string>();
        } else if (label.is_array() && label.size() == 2 && is_string(label[0], ":name") &&
                   label[1].is_string()) {
            name = label[1].get<std::string>();
        }
    }
    return ast::make_asset(std::move(*symbol), std::move(name));
}

Result<ast::NodePtr> Descent::group(const json& expr, std::size_t depth) {
    if (expr.size() != 3 || !expr[1].is_string()) {
        return EvaluationError::malformed(
            fmt::format("group expects [\"group\", label, body]: {}", describe_json(expr)));
    }
    auto body = node(expr[2], depth + 1);
    if (!body) return body.error();
    return ast::make_group(expr[1].get<std::string>(), std::move(body).value());
}

Result<ast::NodePtr> Descent::if_node(const json& expr, std::size_t depth) {
    if (expr.size() != 4) {
        return EvaluationError::malformed(fmt::format(
            "if expects condition, then and else branches: {}", describe_json(expr)));
    }
    auto cond = condition(expr[1]);
    if (!cond) return cond.error();
    auto then_branch = node(expr[2], depth + 1);
    if (!then_branch) return then_branch.error();
    auto else_branch = node(expr[3], depth + 1);
    if (!else_branch) return else_branch.error();

    return ast::make_if(std::move(cond).value(),
                        std::move(then_branch).value(),
                        std::move(else_branch).value());
}

Result<ast::NodePtr> Descent::weight_equal(const json& expr, std::size_t depth) {
    std::vector<ast::NodePtr> branches;
    branches.reserve(expr.size() - 1);
    for (std::size_t i = 1; i < expr.size(); ++i) {
        auto branch = node(expr[i], depth + 1);
        if (!branch) return branch.error();
        branches.push_back(std::move(branch).value());
    }
    return ast::make_weight_equal(std::move(branches));
}

Result<ast::NodePtr> Descent::weight_specified(const json& expr, std::size_t depth) {
    if ((expr.size() - 1) % 2 != 0) {
        return EvaluationError::malformed(fmt::format(
            "weight-specified expects weight/expression pairs: {}", describe_json(expr)));
    }
    std::vector<ast::WeightedBranch> pairs;
    pairs.reserve((expr.size() - 1) / 2);
    for (std::size_t i = 1; i + 1 < expr.size(); i += 2) {
        if (!expr[i].is_number()) {
            return EvaluationError::malformed(
                fmt::format("weight must be a number, got {}", describe_json(expr[i])));
        }
        const double weight = expr[i].get<double>();
        if (!std::isfinite(weight) || weight < 0.0) {
            return EvaluationError::malformed(
                fmt::format("weight must be finite and non-negative, got {}", weight));
        }
        auto branch = node(expr[i + 1], depth + 1);
        if (!branch) return branch.error();
        pairs.push_back(ast::WeightedBranch{
            .weight = weight,
            .node   = std::move(branch).value(),
        });
    }
    return ast::make_weight_specified(std::move(pairs));
}

Result<ast::NodePtr> Descent::filter(const json& expr, std::size_t depth) {
    if (expr.size() < 4) {
        return EvaluationError::malformed(fmt::format(
            "filter expects indicator, selector and candidates: {}", describe_json(expr)));
    }
    auto ind = indicator(expr[1]);
    if (!ind) return ind.error();
    auto sel = selector(expr[2]);
    if (!sel) return sel.error();

    // Candidates arrive either as one list of expressions or spread inline.
    std::vector<const json*> items;
    const json& first = expr[3];
    const bool candidate_list =
        expr.size() == 4 && first.is_array() && (first.empty() || first[0].is_array());
    if (candidate_list) {
        for (const auto& item : first) items.push_back(&item);
    } else {
        for (std::size_t i = 3; i < expr.size(); ++i) items.push_back(&expr[i]);
    }

    std::vector<ast::NodePtr> candidates;
    candidates.reserve(items.size());
    for (const json* item : items) {
        auto candidate = node(*item, depth + 1);
        if (!candidate) return candidate.error();
        candidates.push_back(std::move(candidate).value());
    }
    return ast::make_filter(*ind, *sel, std::move(candidates));
}

Result<IndicatorRef> Descent::indicator(const json& expr) {
    if (!expr.is_array() || expr.empty() || !expr[0].is_string()) {
        return EvaluationError::malformed(
            fmt::format("filter indicator must be [name, params]: {}", describe_json(expr)));
    }
    const auto& name = expr[0].get_ref<const json::string_t&>();
    const json* params = expr.size() > 1 ? &expr[1] : nullptr;

    if (name == "rsi" || name == "relative-strength-index") {
        auto window = parse_window(params, constants::DEFAULT_RSI_WINDOW);
        if (!window) return window.error();
        return IndicatorRef{IndicatorKind::Rsi, *window};
    }
    if (name == "moving-average-price") {
        auto window = parse_window(params, constants::DEFAULT_MA_WINDOW);
        if (!window) return window.error();
        return IndicatorRef{IndicatorKind::MovingAverage, *window};
    }
    if (name == "current-price") {
        return IndicatorRef{IndicatorKind::CurrentPrice, 0};
    }
    return EvaluationError::unknown_operator(name);
}

Result<ast::Selector> Descent::selector(const json& expr) {
    if (!expr.is_array() || expr.empty() || !expr[0].is_string()) {
        return EvaluationError::malformed(
            fmt::format("selector must be [select-top|select-bottom, n]: {}", describe_json(expr)));
    }
    const auto& name = expr[0].get_ref<const json::string_t&>();
    ast::SelectMode mode{};
    if (name == "select-top") {
        mode = ast::SelectMode::Top;
    } else if (name == "select-bottom") {
        mode = ast::SelectMode::Bottom;
    } else {
        return EvaluationError::unknown_operator(name);
    }

    std::uint32_t count = 1;
    if (expr.size() > 1) {
        auto parsed = as_positive_count(expr[1]);
        if (!parsed) {
            return EvaluationError::malformed(
                fmt::format("selector count must be a positive integer: {}", describe_json(expr)));
        }
        count = *parsed;
    }
    return ast::Selector{.mode = mode, .count = count};
}

Result<ast::Condition> Descent::condition(const json& expr) {
    if (!expr.is_array() || expr.size() != 3 || !expr[0].is_string()) {
        return EvaluationError::malformed(
            fmt::format("condition expects [op, lhs, rhs]: {}", describe_json(expr)));
    }
    const auto& op_name = expr[0].get_ref<const json::string_t&>();
    auto op = parse_comparator(op_name);
    if (!op) return EvaluationError::unknown_operator(op_name);

    auto lhs = value(expr[1]);
    if (!lhs) return lhs.error();
    auto rhs = value(expr[2]);
    if (!rhs) return rhs.error();

    return ast::Condition{
        .op  = *op,
        .lhs = std::move(lhs).value(),
        .rhs = std::move(rhs).value(),
    };
}

Result<ast::ValueExpr> Descent::value(const json& expr) {
    if (expr.is_number()) {
        const double v = expr.get<double>();
        if (!std::isfinite(v)) {
            return EvaluationError::malformed("literal operand must be finite");
        }
        return ast::ValueExpr{ast::Literal{v}};
    }
    if (!expr.is_array() || expr.empty() || !expr[0].is_string()) {
        return EvaluationError::malformed(
            fmt::format("invalid comparison operand {}", describe_json(expr)));
    }

    const auto& fn = expr[0].get_ref<const json::string_t&>();
    const bool known = fn == "current-price" || fn == "moving-average-price" ||
                       fn == "rsi" || fn == "relative-strength-index";
    if (!known) return EvaluationError::unknown_operator(fn);

    if (expr.size() < 2 || !expr[1].is_string() ||
        expr[1].get_ref<const json::string_t&>().empty()) {
        return EvaluationError::malformed(
            fmt::format("{} requires a ticker symbol: {}", fn, describe_json(expr)));
    }
    std::string symbol = expr[1].get<std::string>();
    const json* params = expr.size() > 2 ? &expr[2] : nullptr;

    if (fn == "current-price") {
        return ast::ValueExpr{ast::CurrentPrice{std::move(symbol)}};
    }
    if (fn == "moving-average-price") {
        auto window = parse_window(params, constants::DEFAULT_MA_WINDOW);
        if (!window) return window.error();
        return ast::ValueExpr{ast::MovingAveragePrice{std::move(symbol), *window}};
    }
    auto window = parse_window(params, constants::DEFAULT_RSI_WINDOW);
    if (!window) return window.error();
    return ast::ValueExpr{ast::Rsi{std::move(symbol), *window}};
}

}  // namespace

// ─── Shared JSON helpers ──────────────────────────────────────────────────────

std::string describe_json(const json& expr) {
    std::string text;
    render_bounded(expr, 0, text);
    if (text.size() > DESCRIBE_WIDTH) {
        text.resize(DESCRIBE_WIDTH - 3);
        text += "...";
    }
    return text;
}

std::optional<std::uint32_t> as_positive_count(const json& j) {
    if (j.is_number_unsigned()) {
        const auto v = j.get<std::uint64_t>();
        if (v == 0 || v > std::numeric_limits<std::uint32_t>::max()) return std::nullopt;
        return static_cast<std::uint32_t>(v);
    }
    if (j.is_number_integer()) {
        const auto v = j.get<std::int64_t>();
        if (v <= 0 || v > std::numeric_limits<std::uint32_t>::max()) return std::nullopt;
        return static_cast<std::uint32_t>(v);
    }
    if (j.is_number_float()) {
        const double v = j.get<double>();
        if (!std::isfinite(v) || v < 1.0 || v != std::floor(v) ||
            v > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(v);
    }
    return std::nullopt;
}

// ─── ProgramParser ────────────────────────────────────────────────────────────

Result<ast::Program> ProgramParser::parse_program(const json& doc) {
    if (!doc.is_array() || doc.size() < 3) {
        return EvaluationError::malformed(
            "program must be [name, description, expression]");
    }

    ast::Program program;
    if (is_string(doc[0], "defsymphony")) {
        if (doc[1].is_string()) program.name = doc[1].get<std::string>();
        if (doc.size() > 3 && doc[2].is_string()) {
            program.description = doc[2].get<std::string>();
        }
    } else {
        if (doc[0].is_string()) program.name = doc[0].get<std::string>();
        if (doc[1].is_string()) program.description = doc[1].get<std::string>();
    }

    Descent descent;
    auto root = descent.node(doc.back(), 1);
    if (!root) return root.error();
    program.root = std::move(root).value();
    return program;
}

Result<ast::NodePtr> ProgramParser::parse_node(const json& expr) {
    Descent descent;
    return descent.node(expr, 1);
}

Result<ast::ValueExpr> ProgramParser::parse_value(const json& expr) {
    Descent descent;
    return descent.value(expr);
}

Result<ast::Program> ProgramParser::parse_json_text(std::string_view text) {
    json doc;
    try {
        doc = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return EvaluationError::malformed(fmt::format("invalid JSON: {}", e.what()));
    }
    return parse_program(doc);
}

}  // namespace symphony::parser
