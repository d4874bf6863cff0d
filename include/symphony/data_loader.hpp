#pragma once

/// @file include/symphony/data_loader.hpp
/// @brief CSV data loader for daily OHLCV market data.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files of daily OHLCV bars into date-ordered `std::vector<OHLCV>`.
/// Malformed or non-finite rows are skipped; the loader never crashes on bad
/// input.
///
/// ## Expected CSV Format
/// ```
/// date,open,high,low,close,volume
/// 2024-01-02,100.0,105.0,99.0,103.0,1000000
/// 2024-01-03,103.0,107.0,102.0,106.5,1200000
/// ```
/// The first line is treated as a header and skipped.  Dates may carry a
/// trailing time component, which is ignored.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Output is sorted by date with duplicate dates collapsed (last row wins)
/// - Does not modify any file or external state

#include "symphony/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace symphony::data {

// ─── OHLCV ────────────────────────────────────────────────────────────────────

/// A single daily bar of market data.
struct OHLCV {
    Date   date;
    double open;
    double high;
    double low;
    double close;
    double volume;
};

// ─── DataLoader ───────────────────────────────────────────────────────────────

/// Loads OHLCV data from CSV files.
class DataLoader {
public:
    /// Load OHLCV bars from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid data rows
    /// - Date-sorted bars, skipping any malformed or non-finite rows
    [[nodiscard]] static std::optional<std::vector<OHLCV>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse OHLCV bars from a CSV-formatted string (useful for testing).
    [[nodiscard]] static std::vector<OHLCV>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Load `<directory>/<SYMBOL>.csv` for each symbol.
    ///
    /// Symbols whose file is missing or holds no valid rows are omitted from
    /// the result and listed in `missing`.
    [[nodiscard]] static std::map<std::string, std::vector<OHLCV>, std::less<>>
    load_directory(const std::string& directory,
                   const std::vector<std::string>& symbols,
                   std::vector<std::string>& missing);

    /// Validate a single OHLCV bar.
    ///
    /// A bar is valid if:
    /// - All prices and volume are finite
    /// - close > 0
    /// - low <= open, close <= high
    /// - volume >= 0
    [[nodiscard]] static bool validate_bar(const OHLCV& bar) noexcept;

private:
    /// Parse a single CSV data row.  Returns `nullopt` if malformed.
    [[nodiscard]] static std::optional<OHLCV>
    parse_row(const std::string& line) noexcept;
};

}  // namespace symphony::data
