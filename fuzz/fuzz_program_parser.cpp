/**
 * @file  fuzz_program_parser.cpp
 * @brief libFuzzer target for strategy text parsing and evaluation
 *
 * Build:
 *   cmake -DSYMPHONY_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_program_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_program_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence in any dialect.
 *   2. A parsed program has a non-null root.
 *   3. Evaluating a parsed program against an empty market either fails
 *      with a typed error or yields an allocation that is empty or sums to 1.
 *
 * Fuzzer strategy:
 *   The first byte selects the dialect (auto, composer, lisp, quantmage);
 *   the rest is the program text.  Inputs exercise:
 *     • Unbalanced and mismatched brackets, unterminated strings
 *     • Deep nesting beyond the reader's depth limit
 *     • Non-integral and negative windows, counts and weights
 *     • Binary garbage and invalid UTF-8 inside string literals
 */

#include <cassert>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "symphony/analyzer.hpp"
#include "symphony/evaluator.hpp"
#include "symphony/parser.hpp"

using namespace symphony;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;

    const auto dialect = static_cast<parser::Dialect>(data[0] % 4);
    const std::string_view text{reinterpret_cast<const char*>(data + 1), size - 1};

    auto program = parser::parse_program_text(text, dialect);
    if (!program) return 0;

    // Invariant 2
    assert(program->root != nullptr);

    const auto needs = analysis::StaticAnalyzer::analyze(*program);
    (void)needs.max_window();

    // Invariant 3
    const data::MarketData market{};
    const Date day = std::chrono::sys_days{std::chrono::year{2024} / 1 / 2};
    auto result = eval::Evaluator(market).evaluate(*program, day);
    if (result) {
        double total = 0.0;
        for (const auto& [symbol, weight] : *result) {
            assert(weight > 0.0);
            total += weight;
        }
        assert(result->empty() || std::abs(total - 1.0) < 1e-9);
    }
    return 0;
}
