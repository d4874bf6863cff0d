#pragma once

/// @file include/symphony/parser.hpp
/// @brief Strategy program parsers: Composer JSON arrays and Lisp s-expressions.
///
/// # Module: Parser
///
/// ## Responsibility
/// Turn a nested-array strategy document into an `ast::Program`.  Operator
/// names are dispatched here and nowhere else: an unrecognised name becomes
/// `UnknownOperator`, a wrong arity or operand type `MalformedExpression`.
///
/// ## Document Shape
/// ```
/// ["defsymphony", "Name", ["if", [">", ["current-price", "SPY"],
///                                      ["moving-average-price", "SPY", {":window": 200}]],
///                          [["asset", "TQQQ", "..."]],
///                          [["asset", "BIL", "..."]]]]
/// ```
/// The root is `[name, description, root_expression]` (or the `defsymphony`
/// form); the root expression is the last element.
///
/// A list whose first element is itself a list is a *block*: one element
/// stands for that node, several are weighted equally.
///
/// ## Lisp Dialect
/// `LispReader` converts `(defsymphony "Name" {...} (weight-equal [...]))`
/// into the same nested-array document, so both dialects share one parser.
///
/// ## NOT Responsible For
/// - The Quantmage object dialect (see quantmage.hpp)
/// - Evaluation (see evaluator.hpp)

#include "symphony/ast.hpp"
#include "symphony/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace symphony::parser {

/// Source formats accepted by `load_program`.
enum class Dialect : std::uint8_t {
    Auto,       ///< Detect from content
    Composer,   ///< JSON nested arrays
    Lisp,       ///< Composer s-expressions
    Quantmage,  ///< Quantmage JSON object
};

/// Parse a dialect name (`composer`, `lisp`, `quantmage`, `auto`).
[[nodiscard]] std::optional<Dialect> parse_dialect(std::string_view name) noexcept;

// ─── ProgramParser ────────────────────────────────────────────────────────────

/// Parses Composer nested-array documents into AST programs.
///
/// All methods are static; the parser holds no state.
class ProgramParser {
public:
    ProgramParser() = delete;

    /// Parse a complete program document.
    ///
    /// # Returns
    /// - `Program` with name, description and root expression
    /// - `MalformedExpression` if the root is not a list of at least three
    ///   elements or any node is structurally invalid
    /// - `UnknownOperator` for an operator outside the fixed set
    [[nodiscard]] static Result<ast::Program> parse_program(const nlohmann::json& doc);

    /// Parse a single expression (node or block).
    [[nodiscard]] static Result<ast::NodePtr> parse_node(const nlohmann::json& expr);

    /// Parse a comparison operand.
    [[nodiscard]] static Result<ast::ValueExpr> parse_value(const nlohmann::json& expr);

    /// Parse JSON text, then the program it holds.
    [[nodiscard]] static Result<ast::Program> parse_json_text(std::string_view text);
};

// ─── LispReader ───────────────────────────────────────────────────────────────

/// Reads Composer Lisp text into the nested-array JSON document form.
///
/// - `(` `[` `{` open a list; `)` `]` `}` close the matching one
/// - `"..."` is a string (backslash escapes honoured)
/// - numbers become JSON numbers, `true`/`false` booleans
/// - `:keyword` and bare symbols become strings
/// - `;` starts a comment to end of line; commas are whitespace
class LispReader {
public:
    LispReader() = delete;

    /// Read exactly one top-level form.
    ///
    /// # Returns
    /// The document, or `MalformedExpression` on unbalanced brackets,
    /// an unterminated string, or trailing forms.
    [[nodiscard]] static Result<nlohmann::json> read(std::string_view text);
};

// ─── Shared JSON helpers ──────────────────────────────────────────────────────

/// Render an offending expression for an error message, at most 80 characters.
/// Nested lists are rendered only a few levels deep, so arbitrarily deep
/// input is safe to describe.
[[nodiscard]] std::string describe_json(const nlohmann::json& expr);

/// Accept an integral JSON number (an int, or a float with no fractional
/// part) in `[1, UINT32_MAX]`.
[[nodiscard]] std::optional<std::uint32_t> as_positive_count(const nlohmann::json& j);

// ─── Loading ──────────────────────────────────────────────────────────────────

/// Detect the dialect of a program text from its first significant character
/// (`(` → Lisp, `[` → Composer, `{` → Quantmage).
[[nodiscard]] std::optional<Dialect> detect_dialect(std::string_view text) noexcept;

/// Parse program text in the given (or detected) dialect.
[[nodiscard]] Result<ast::Program> parse_program_text(std::string_view text,
                                                      Dialect dialect = Dialect::Auto);

/// Read and parse a program file.
///
/// # Returns
/// `InvalidInput` if the file cannot be read, otherwise as `parse_program_text`.
[[nodiscard]] Result<ast::Program> load_program(const std::string& path,
                                                Dialect dialect = Dialect::Auto);

}  // namespace symphony::parser
