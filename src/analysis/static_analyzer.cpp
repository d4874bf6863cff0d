/// @file src/analysis/static_analyzer.cpp
/// @brief StaticAnalyzer: pre-order ticker and indicator discovery.

#include "symphony/analyzer.hpp"

#include <algorithm>
#include <variant>

namespace symphony::analysis {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/// Collects into one AnalysisResult while walking the tree.
class Walker {
public:
    explicit Walker(AnalysisResult& out) : out_(out) {}

    void node(const ast::Node& n) {
        std::visit(overloaded{
            [&](const ast::Asset& a) { out_.tickers.insert(a.symbol); },
            [&](const ast::Group& g) {
                out_.tickers.merge(StaticAnalyzer::split_label(g.label));
                visit_child(g.body);
            },
            [&](const ast::Condition& c) { condition(c); },
            [&](const ast::If& i) {
                condition(i.condition);
                visit_child(i.then_branch);
                visit_child(i.else_branch);
            },
            [&](const ast::WeightEqual& w) {
                for (const auto& branch : w.branches) visit_child(branch);
            },
            [&](const ast::WeightSpecified& w) {
                for (const auto& pair : w.pairs) visit_child(pair.node);
            },
            [&](const ast::Filter& f) {
                for (const auto& candidate : f.candidates) visit_child(candidate);
                if (f.indicator.kind == IndicatorKind::CurrentPrice) return;
                out_.indicator_requirements.insert(f.indicator);
                auto& symbols = out_.indicator_symbols[f.indicator];
                for (const auto& candidate : f.candidates) {
                    if (candidate) collect_assets(*candidate, symbols);
                }
            },
        }, n.value);
    }

private:
    void visit_child(const ast::NodePtr& child) {
        if (child) node(*child);
    }

    void condition(const ast::Condition& c) {
        value(c.lhs);
        value(c.rhs);
    }

    void value(const ast::ValueExpr& v) {
        const auto symbol = ast::symbol_of(v);
        if (symbol.empty()) return;
        out_.tickers.emplace(symbol);
        if (auto ref = ast::indicator_of(v)) {
            out_.indicator_requirements.insert(*ref);
            out_.indicator_symbols[*ref].emplace(symbol);
        }
    }

    /// Every Asset symbol in a subtree (group labels excluded: only assets
    /// can be ranked by a filter).
    static void collect_assets(const ast::Node& n, std::set<std::string>& out) {
        std::visit(overloaded{
            [&](const ast::Asset& a) { out.insert(a.symbol); },
            [&](const ast::Group& g) { if (g.body) collect_assets(*g.body, out); },
            [&](const ast::Condition&) {},
            [&](const ast::If& i) {
                if (i.then_branch) collect_assets(*i.then_branch, out);
                if (i.else_branch) collect_assets(*i.else_branch, out);
            },
            [&](const ast::WeightEqual& w) {
                for (const auto& b : w.branches) if (b) collect_assets(*b, out);
            },
            [&](const ast::WeightSpecified& w) {
                for (const auto& p : w.pairs) if (p.node) collect_assets(*p.node, out);
            },
            [&](const ast::Filter& f) {
                for (const auto& c : f.candidates) if (c) collect_assets(*c, out);
            },
        }, n.value);
    }

    AnalysisResult& out_;
};

}  // namespace

std::uint32_t AnalysisResult::max_window() const noexcept {
    std::uint32_t longest = 0;
    for (const auto& ref : indicator_requirements) {
        longest = std::max(longest, ref.window);
    }
    return longest;
}

AnalysisResult StaticAnalyzer::analyze(const ast::Node& root) {
    AnalysisResult result;
    Walker walker(result);
    walker.node(root);
    return result;
}

AnalysisResult StaticAnalyzer::analyze(const ast::Program& program) {
    if (!program.root) return {};
    return analyze(*program.root);
}

std::set<std::string> StaticAnalyzer::split_label(std::string_view label) {
    std::set<std::string> out;
    while (!label.empty()) {
        const auto plus = label.find('+');
        std::string_view token = label.substr(0, plus);
        const auto first = token.find_first_not_of(" \t");
        const auto last  = token.find_last_not_of(" \t");
        if (first != std::string_view::npos) {
            out.emplace(token.substr(first, last - first + 1));
        }
        if (plus == std::string_view::npos) break;
        label.remove_prefix(plus + 1);
    }
    return out;
}

}  // namespace symphony::analysis
