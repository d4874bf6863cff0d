#pragma once

/// @file include/symphony/validator.hpp
/// @brief Accuracy validation of daily selections against ground truth.
///
/// # Module: Accuracy Validator
///
/// ## Responsibility
/// For every date present in both the evaluator's selections and an external
/// ground-truth table, compare the *sets* of symbols held with strictly
/// positive weight.  Exact set equality is a match; anything else is a
/// mismatch.  There is no partial credit.
///
/// ## Ground-Truth CSV
/// ```
/// Date,Day Traded,SPY,TLT,SQQQ
/// 2024-01-02,Yes,100.0%,-,-
/// 2024-01-03,No,-,50.0%,50.0%
/// ```
/// `Day Traded` is optional and ignored.  A percentage above zero means held;
/// `-`, blank, zero or unparsable cells mean not held.

#include "symphony/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace symphony::validation {

/// Date → symbols held on that date.
using GroundTruth = std::map<Date, std::set<std::string>>;

struct Mismatch {
    Date                  date;
    std::set<std::string> predicted;
    std::set<std::string> expected;
};

struct ValidationReport {
    std::size_t           days_validated = 0;
    std::size_t           matches        = 0;
    std::size_t           mismatches     = 0;
    std::vector<Mismatch> details;

    /// Match percentage, or `nullopt` when no day was validated.
    [[nodiscard]] std::optional<double> accuracy_pct() const noexcept;

    /// Summary block followed by a mismatch table.
    [[nodiscard]] std::string to_string() const;
};

// ─── AccuracyValidator ────────────────────────────────────────────────────────

/// Accumulates a ValidationReport one evaluated day at a time.
class AccuracyValidator {
public:
    explicit AccuracyValidator(GroundTruth truth);

    /// Compare one day's selection.
    ///
    /// # Returns
    /// `true` if the date exists in the ground truth and was scored.
    bool observe(Date date, const TargetAllocation& selection);

    [[nodiscard]] const ValidationReport& report() const noexcept { return report_; }
    [[nodiscard]] const GroundTruth& truth() const noexcept { return truth_; }

    /// Symbols with strictly positive weight.
    [[nodiscard]] static std::set<std::string> held(const TargetAllocation& selection);

    /// Score a full set of daily selections in one call.
    [[nodiscard]] static ValidationReport
    compare(const std::map<Date, TargetAllocation>& selections, const GroundTruth& truth);

private:
    GroundTruth      truth_;
    ValidationReport report_;
};

// ─── GroundTruthLoader ────────────────────────────────────────────────────────

class GroundTruthLoader {
public:
    GroundTruthLoader() = delete;

    /// # Returns
    /// `nullopt` if the file cannot be opened or has no `Date` column.
    [[nodiscard]] static std::optional<GroundTruth> load_csv(const std::string& path);

    /// # Returns
    /// `nullopt` if the header has no `Date` column.  Rows with an
    /// unparsable date are skipped.
    [[nodiscard]] static std::optional<GroundTruth> parse_csv_string(const std::string& content);

    /// Parse an allocation cell such as `"45.5%"`.  `-` and blanks are
    /// `nullopt`.
    [[nodiscard]] static std::optional<double> parse_allocation(std::string_view cell) noexcept;
};

}  // namespace symphony::validation
