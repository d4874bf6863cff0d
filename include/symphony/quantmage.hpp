#pragma once

/// @file include/symphony/quantmage.hpp
/// @brief Quantmage object dialect → AST normalizer.
///
/// # Module: QuantmageNormalizer
///
/// ## Responsibility
/// Rewrite a Quantmage strategy object (nested `incantation` records) into the
/// same `ast::Program` the Composer parser produces.  Stateless and pure.
///
/// ## Mapping
/// | Quantmage                         | AST                                   |
/// |-----------------------------------|---------------------------------------|
/// | `Ticker {symbol, name}`           | `Asset`                               |
/// | `Weighted {incantations}`         | the single child, or `WeightEqual`    |
/// | `IfElse {condition, then, else}`  | `If`                                  |
/// | `Filtered {sort_indicator, ...}`  | `Filter`                              |
/// | `RelativeStrengthIndex`           | `Rsi`                                 |
/// | `MovingAverage`                   | `MovingAveragePrice`                  |
/// | `CurrentPrice`                    | `CurrentPrice`                        |
///
/// ## Guarantees
/// - Any incantation, condition or indicator type outside the table yields
///   `UnknownOperator`; nothing is silently replaced with a default
/// - Missing required fields yield `MalformedExpression`

#include "symphony/ast.hpp"
#include "symphony/types.hpp"

#include <nlohmann/json.hpp>

namespace symphony::parser {

/// Converts Quantmage strategy objects into AST programs.
class QuantmageNormalizer {
public:
    QuantmageNormalizer() = delete;

    /// Normalize a complete Quantmage document (`name`, `description`,
    /// `incantation`).  A missing `name` becomes "Quantmage Strategy".
    [[nodiscard]] static Result<ast::Program> normalize(const nlohmann::json& doc);

    /// Normalize a single incantation subtree.
    [[nodiscard]] static Result<ast::NodePtr>
    normalize_incantation(const nlohmann::json& incantation);
};

}  // namespace symphony::parser
