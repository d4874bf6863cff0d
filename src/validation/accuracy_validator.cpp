/// @file src/validation/accuracy_validator.cpp
/// @brief AccuracyValidator: set comparison of daily selections.

#include "symphony/validator.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <utility>

namespace symphony::validation {

// ─── ValidationReport ─────────────────────────────────────────────────────────

std::optional<double> ValidationReport::accuracy_pct() const noexcept {
    if (days_validated == 0) return std::nullopt;
    return 100.0 * static_cast<double>(matches) / static_cast<double>(days_validated);
}

std::string ValidationReport::to_string() const {
    const auto accuracy = accuracy_pct();
    std::string out = fmt::format(
        "Accuracy (set comparison)\n"
        "  Days validated : {}\n"
        "  Set matches    : {}\n"
        "  Set mismatches : {}\n"
        "  Accuracy       : {}\n",
        days_validated, matches, mismatches,
        accuracy ? fmt::format("{:.2f}%", *accuracy) : std::string("n/a"));

    if (details.empty()) return out;

    out += fmt::format("\n{:<12} | {:<30} | {:<30}\n", "Date", "Selected", "Ground Truth");
    out += std::string(78, '-') + '\n';
    for (const auto& m : details) {
        out += fmt::format("{:<12} | {:<30} | {:<30}\n", format_date(m.date),
                           fmt::format("{}", fmt::join(m.predicted, ", ")),
                           fmt::format("{}", fmt::join(m.expected, ", ")));
    }
    return out;
}

// ─── AccuracyValidator ────────────────────────────────────────────────────────

AccuracyValidator::AccuracyValidator(GroundTruth truth)
    : truth_(std::move(truth))
{}

std::set<std::string> AccuracyValidator::held(const TargetAllocation& selection) {
    std::set<std::string> out;
    for (const auto& [symbol, weight] : selection) {
        if (weight > 0.0) out.insert(symbol);
    }
    return out;
}

bool AccuracyValidator::observe(Date date, const TargetAllocation& selection) {
    auto it = truth_.find(date);
    if (it == truth_.end()) return false;

    ++report_.days_validated;
    auto predicted = held(selection);
    if (predicted == it->second) {
        ++report_.matches;
    } else {
        ++report_.mismatches;
        report_.details.push_back(Mismatch{
            .date      = date,
            .predicted = std::move(predicted),
            .expected  = it->second,
        });
    }
    return true;
}

ValidationReport
AccuracyValidator::compare(const std::map<Date, TargetAllocation>& selections,
                           const GroundTruth& truth) {
    AccuracyValidator validator(truth);
    for (const auto& [date, selection] : selections) {
        validator.observe(date, selection);
    }
    return validator.report();
}

}  // namespace symphony::validation
