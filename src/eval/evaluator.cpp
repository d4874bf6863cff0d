/// @file src/eval/evaluator.cpp
/// @brief Evaluator: recursive std::visit interpreter over the strategy AST.

#include "symphony/evaluator.hpp"
#include "symphony/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>
#include <variant>

namespace symphony::eval {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

struct Ranked {
    std::string symbol;
    double      value;
};

// ─── Interpreter ──────────────────────────────────────────────────────────────

/// One evaluation pass.  Holds only references; constructed per call.
class Interpreter {
public:
    Interpreter(const Evaluator& evaluator,
                const data::MarketDataAccessor& market,
                Date date,
                std::vector<std::string>* notes) noexcept
        : evaluator_(evaluator), market_(market), date_(date), notes_(notes) {}

    Result<TargetAllocation> run(const ast::Node& node) {
        return std::visit(overloaded{
            [&](const ast::Asset& a) -> Result<TargetAllocation> {
                return TargetAllocation{{a.symbol, 1.0}};
            },
            [&](const ast::Group& g) -> Result<TargetAllocation> {
                return run(g.body);
            },
            [&](const ast::Condition&) -> Result<TargetAllocation> {
                return EvaluationError::malformed(
                    "condition used where an allocation is expected");
            },
            [&](const ast::If& i) { return if_node(i); },
            [&](const ast::WeightEqual& w) { return weight_equal(w); },
            [&](const ast::WeightSpecified& w) { return weight_specified(w); },
            [&](const ast::Filter& f) { return filter(f); },
        }, node.value);
    }

private:
    Result<TargetAllocation> run(const ast::NodePtr& node) {
        if (!node) {
            return EvaluationError::malformed("missing subexpression");
        }
        return run(*node);
    }

    Result<TargetAllocation> if_node(const ast::If& node) {
        auto taken = evaluator_.test(node.condition, date_);
        if (!taken) return taken.error();
        return run(*taken ? node.then_branch : node.else_branch);
    }

    Result<TargetAllocation> weight_equal(const ast::WeightEqual& node) {
        TargetAllocation combined;
        for (const auto& branch : node.branches) {
            auto outcome = run(branch);
            if (!outcome) return outcome.error();
            for (const auto& [symbol, weight] : *outcome) {
                combined[symbol] += weight;
            }
        }
        return Evaluator::normalize(std::move(combined));
    }

    Result<TargetAllocation> weight_specified(const ast::WeightSpecified& node) {
        TargetAllocation combined;
        for (const auto& pair : node.pairs) {
            auto outcome = run(pair.node);
            if (!outcome) return outcome.error();
            for (const auto& entry : *outcome) {
                combined[entry.first] += pair.weight;
            }
        }
        return Evaluator::normalize(std::move(combined));
    }

    Result<TargetAllocation> filter(const ast::Filter& node) {
        // Flatten candidates to distinct symbols, first occurrence order.
        std::vector<std::string> symbols;
        for (const auto& candidate : node.candidates) {
            auto outcome = run(candidate);
            if (!outcome) return outcome.error();
            for (const auto& entry : *outcome) {
                if (std::find(symbols.begin(), symbols.end(), entry.first) == symbols.end()) {
                    symbols.push_back(entry.first);
                }
            }
        }

        std::vector<Ranked> ranked;
        ranked.reserve(symbols.size());
        for (auto& symbol : symbols) {
            auto value = node.indicator.kind == IndicatorKind::CurrentPrice
                             ? market_.close(symbol, date_)
                             : market_.indicator(symbol, node.indicator, date_);
            if (!value) {
                note(fmt::format("filter dropped {}: {} unavailable",
                                 symbol, to_string(node.indicator)));
                continue;
            }
            ranked.push_back(Ranked{.symbol = std::move(symbol), .value = *value});
        }
        if (ranked.empty()) {
            return TargetAllocation{};
        }

        if (node.selector.mode == ast::SelectMode::Top) {
            std::stable_sort(ranked.begin(), ranked.end(),
                             [](const Ranked& a, const Ranked& b) { return a.value > b.value; });
        } else {
            std::stable_sort(ranked.begin(), ranked.end(),
                             [](const Ranked& a, const Ranked& b) { return a.value < b.value; });
        }

        const std::size_t taken =
            std::min<std::size_t>(node.selector.count, ranked.size());
        const double weight = 1.0 / static_cast<double>(taken);
        TargetAllocation out;
        for (std::size_t i = 0; i < taken; ++i) {
            out.emplace(ranked[i].symbol, weight);
        }
        return out;
    }

    void note(std::string message) {
        if (notes_ != nullptr) notes_->push_back(std::move(message));
    }

    const Evaluator&                evaluator_;
    const data::MarketDataAccessor& market_;
    Date                            date_;
    std::vector<std::string>*       notes_;
};

}  // namespace

// ─── Evaluator ────────────────────────────────────────────────────────────────

Evaluator::Evaluator(const data::MarketDataAccessor& market) noexcept
    : market_(market)
{}

Result<TargetAllocation> Evaluator::evaluate(const ast::Node& root, Date date) const {
    std::vector<std::string> discarded;
    return evaluate(root, date, discarded);
}

Result<TargetAllocation>
Evaluator::evaluate(const ast::Node& root, Date date, std::vector<std::string>& notes) const {
    Interpreter interpreter(*this, market_, date, &notes);
    auto outcome = interpreter.run(root);
    if (!outcome) return outcome;
    return normalize(std::move(outcome).value());
}

Result<TargetAllocation> Evaluator::evaluate(const ast::Program& program, Date date) const {
    if (!program.root) {
        return EvaluationError::malformed("program has no root expression");
    }
    return evaluate(*program.root, date);
}

Result<double> Evaluator::resolve(const ast::ValueExpr& expr, Date date) const {
    return std::visit(overloaded{
        [](const ast::Literal& l) -> Result<double> { return l.value; },
        [&](const ast::CurrentPrice& p) -> Result<double> {
            auto price = market_.close(p.symbol, date);
            if (!price) return EvaluationError::data_unavailable(p.symbol, std::nullopt);
            return *price;
        },
        [&](const ast::MovingAveragePrice& m) -> Result<double> {
            const IndicatorRef ref{IndicatorKind::MovingAverage, m.window};
            auto value = market_.indicator(m.symbol, ref, date);
            if (!value) return EvaluationError::data_unavailable(m.symbol, ref);
            return *value;
        },
        [&](const ast::Rsi& r) -> Result<double> {
            const IndicatorRef ref{IndicatorKind::Rsi, r.window};
            auto value = market_.indicator(r.symbol, ref, date);
            if (!value) return EvaluationError::data_unavailable(r.symbol, ref);
            return *value;
        },
    }, expr);
}

Result<bool> Evaluator::test(const ast::Condition& condition, Date date) const {
    auto lhs = resolve(condition.lhs, date);
    if (!lhs) return lhs.error();
    auto rhs = resolve(condition.rhs, date);
    if (!rhs) return rhs.error();
    return ast::compare(condition.op, *lhs, *rhs);
}

TargetAllocation Evaluator::normalize(TargetAllocation weights) {
    double total = 0.0;
    for (auto it = weights.begin(); it != weights.end();) {
        if (!(it->second > 0.0)) {
            it = weights.erase(it);
        } else {
            total += it->second;
            ++it;
        }
    }
    if (weights.empty() || total <= constants::FLOAT_EPSILON) {
        return {};
    }
    for (auto& [symbol, weight] : weights) {
        weight /= total;
    }
    return weights;
}

Result<TargetAllocation>
evaluate(const ast::Node& root, Date date, const data::MarketDataAccessor& market) {
    return Evaluator(market).evaluate(root, date);
}

}  // namespace symphony::eval
