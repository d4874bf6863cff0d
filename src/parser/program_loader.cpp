/// @file src/parser/program_loader.cpp
/// @brief Dialect detection and program file loading.

#include "symphony/parser.hpp"
#include "symphony/quantmage.hpp"

#include <fmt/format.h>

#include <cctype>
#include <fstream>
#include <sstream>

namespace symphony::parser {

std::optional<Dialect> parse_dialect(std::string_view name) noexcept {
    if (name == "auto")      return Dialect::Auto;
    if (name == "composer" || name == "json") return Dialect::Composer;
    if (name == "lisp")      return Dialect::Lisp;
    if (name == "quantmage") return Dialect::Quantmage;
    return std::nullopt;
}

std::optional<Dialect> detect_dialect(std::string_view text) noexcept {
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) continue;
        switch (c) {
            case '(': return Dialect::Lisp;
            case '[': return Dialect::Composer;
            case '{': return Dialect::Quantmage;
            default:  return std::nullopt;
        }
    }
    return std::nullopt;
}

Result<ast::Program> parse_program_text(std::string_view text, Dialect dialect) {
    if (dialect == Dialect::Auto) {
        auto detected = detect_dialect(text);
        if (!detected) {
            return EvaluationError::malformed(
                "cannot detect program dialect (expected '(', '[' or '{')");
        }
        dialect = *detected;
    }

    switch (dialect) {
        case Dialect::Lisp: {
            auto doc = LispReader::read(text);
            if (!doc) return doc.error();
            return ProgramParser::parse_program(*doc);
        }
        case Dialect::Quantmage: {
            nlohmann::json doc;
            try {
                doc = nlohmann::json::parse(text.begin(), text.end());
            } catch (const nlohmann::json::parse_error& e) {
                return EvaluationError::malformed(fmt::format("invalid JSON: {}", e.what()));
            }
            return QuantmageNormalizer::normalize(doc);
        }
        case Dialect::Composer:
        case Dialect::Auto:
            break;
    }
    return ProgramParser::parse_json_text(text);
}

Result<ast::Program> load_program(const std::string& path, Dialect dialect) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return EvaluationError::invalid_input(
            fmt::format("cannot open strategy file '{}'", path));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_program_text(contents.str(), dialect);
}

}  // namespace symphony::parser
