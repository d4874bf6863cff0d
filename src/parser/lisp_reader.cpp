/// @file src/parser/lisp_reader.cpp
/// @brief LispReader: s-expression text to nested-array JSON.

#include "symphony/constants.hpp"
#include "symphony/parser.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <vector>

namespace symphony::parser {

using nlohmann::json;

namespace {

[[nodiscard]] bool is_delimiter(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0 || c == ',' || c == ';' ||
           c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
           c == '"';
}

[[nodiscard]] char closer_for(char open) noexcept {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default:  return '}';
    }
}

/// Single-pass reader over the source text.  Tracks line numbers for errors.
class Reader {
public:
    explicit Reader(std::string_view text) : text_(text) {}

    Result<json> read_top() {
        skip_blank();
        if (at_end()) {
            return EvaluationError::malformed("empty program text");
        }
        auto form = read_form(0);
        if (!form) return form;
        skip_blank();
        if (!at_end()) {
            return error("unexpected trailing content");
        }
        return form;
    }

private:
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

    [[nodiscard]] EvaluationError error(std::string_view what) const {
        return EvaluationError::malformed(fmt::format("line {}: {}", line_, what));
    }

    void skip_blank() noexcept {
        while (!at_end()) {
            const char c = text_[pos_];
            if (c == ';') {
                while (!at_end() && text_[pos_] != '\n') ++pos_;
            } else if (c == ',' || std::isspace(static_cast<unsigned char>(c)) != 0) {
                if (c == '\n') ++line_;
                ++pos_;
            } else {
                return;
            }
        }
    }

    Result<json> read_form(std::size_t depth) {
        if (depth > constants::MAX_NESTING_DEPTH) {
            return error("expression nesting too deep");
        }
        const char c = text_[pos_];
        switch (c) {
            case '(':
            case '[':
            case '{':
                return read_list(closer_for(c), depth);
            case ')':
            case ']':
            case '}':
                return error(fmt::format("unexpected '{}'", c));
            case '"':
                return read_string();
            default:
                return read_atom();
        }
    }

    Result<json> read_list(char closer, std::size_t depth) {
        ++pos_;  // opening bracket
        json list = json::array();
        for (;;) {
            skip_blank();
            if (at_end()) {
                return error(fmt::format("missing closing '{}'", closer));
            }
            const char c = text_[pos_];
            if (c == closer) {
                ++pos_;
                return list;
            }
            if (c == ')' || c == ']' || c == '}') {
                return error(fmt::format("expected '{}' but found '{}'", closer, c));
            }
            auto item = read_form(depth + 1);
            if (!item) return item;
            list.push_back(std::move(item).value());
        }
    }

    Result<json> read_string() {
        const std::size_t start_line = line_;
        ++pos_;  // opening quote
        std::string out;
        while (!at_end()) {
            const char c = text_[pos_++];
            if (c == '"') {
                return json(std::move(out));
            }
            if (c == '\n') ++line_;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (at_end()) break;
            const char esc = text_[pos_++];
            switch (esc) {
                case 'n':  out += '\n'; break;
                case 't':  out += '\t'; break;
                case 'r':  out += '\r'; break;
                default:   out += esc;  break;
            }
        }
        return EvaluationError::malformed(
            fmt::format("line {}: unterminated string", start_line));
    }

    Result<json> read_atom() {
        const std::size_t start = pos_;
        while (!at_end() && !is_delimiter(text_[pos_])) ++pos_;
        const std::string_view token = text_.substr(start, pos_ - start);

        if (token == "true")  return json(true);
        if (token == "false") return json(false);
        if (token == "nil")   return json(nullptr);

        const char first = token.front();
        const bool numeric_start =
            std::isdigit(static_cast<unsigned char>(first)) != 0 ||
            ((first == '-' || first == '+' || first == '.') && token.size() > 1);
        if (numeric_start) {
            std::string_view digits = token;
            if (digits.front() == '+') digits.remove_prefix(1);

            std::int64_t integer = 0;
            auto [iptr, iec] =
                std::from_chars(digits.data(), digits.data() + digits.size(), integer);
            if (iec == std::errc{} && iptr == digits.data() + digits.size()) {
                return json(integer);
            }
            double real = 0.0;
            auto [dptr, dec] =
                std::from_chars(digits.data(), digits.data() + digits.size(), real);
            if (dec == std::errc{} && dptr == digits.data() + digits.size() &&
                std::isfinite(real)) {
                return json(real);
            }
        }
        // Keywords (`:window`) and bare symbols (`weight-equal`, `>`).
        return json(std::string(token));
    }

    std::string_view text_;
    std::size_t      pos_  = 0;
    std::size_t      line_ = 1;
};

}  // namespace

Result<json> LispReader::read(std::string_view text) {
    Reader reader(text);
    return reader.read_top();
}

}  // namespace symphony::parser
