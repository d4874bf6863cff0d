/// @file src/data/data_loader.cpp
/// @brief CSV DataLoader for daily OHLCV market data.

#include "symphony/data_loader.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace symphony::data {

namespace {

[[nodiscard]] std::string_view trim(std::string_view token) noexcept {
    const auto first = token.find_first_not_of(" \t\r\n\"");
    if (first == std::string_view::npos) return {};
    const auto last = token.find_last_not_of(" \t\r\n\"");
    return token.substr(first, last - first + 1);
}

[[nodiscard]] std::optional<double> parse_number(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) return std::nullopt;
    if (token.front() == '+') token.remove_prefix(1);
    double val = 0.0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), val);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;  // trailing garbage
    }
    if (!std::isfinite(val)) return std::nullopt;
    return val;
}

}  // namespace

// ─── DataLoader::validate_bar ─────────────────────────────────────────────────

bool DataLoader::validate_bar(const OHLCV& bar) noexcept {
    // All fields must be finite.
    if (!std::isfinite(bar.open)  ||
        !std::isfinite(bar.high)  ||
        !std::isfinite(bar.low)   ||
        !std::isfinite(bar.close) ||
        !std::isfinite(bar.volume)) {
        return false;
    }

    if (bar.close <= 0.0) return false;

    // OHLC consistency.
    if (bar.high < bar.low)   return false;
    if (bar.open  > bar.high) return false;
    if (bar.open  < bar.low)  return false;
    if (bar.close > bar.high) return false;
    if (bar.close < bar.low)  return false;

    if (bar.volume < 0.0) return false;

    return true;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<OHLCV>
DataLoader::parse_row(const std::string& line) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::string_view rest = line;
    std::vector<std::string_view> tokens;
    tokens.reserve(6);
    for (;;) {
        const auto comma = rest.find(',');
        tokens.push_back(rest.substr(0, comma));
        if (comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    if (tokens.size() != 6) {
        return std::nullopt;
    }

    auto date = parse_date(trim(tokens[0]));
    if (!date) {
        return std::nullopt;
    }

    double fields[5] = {};
    for (std::size_t i = 0; i < 5; ++i) {
        auto val = parse_number(tokens[i + 1]);
        if (!val) {
            return std::nullopt;
        }
        fields[i] = *val;
    }

    OHLCV bar{
        .date   = *date,
        .open   = fields[0],
        .high   = fields[1],
        .low    = fields[2],
        .close  = fields[3],
        .volume = fields[4],
    };

    if (!validate_bar(bar)) {
        return std::nullopt;
    }

    return bar;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

std::vector<OHLCV>
DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<OHLCV> bars;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }

        auto bar = parse_row(line);
        if (bar) {
            bars.push_back(*bar);
        }
    }

    // Date order, last row wins on duplicate dates.
    std::stable_sort(bars.begin(), bars.end(),
                     [](const OHLCV& a, const OHLCV& b) { return a.date < b.date; });
    std::vector<OHLCV> unique;
    unique.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!unique.empty() && unique.back().date == bar.date) {
            unique.back() = bar;
        } else {
            unique.push_back(bar);
        }
    }
    return unique;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<OHLCV>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string contents;
    std::string line;
    while (std::getline(file, line)) {
        contents += line;
        contents += '\n';
    }

    return parse_csv_string(contents);
}

// ─── DataLoader::load_directory ──────────────────────────────────────────────

std::map<std::string, std::vector<OHLCV>, std::less<>>
DataLoader::load_directory(const std::string& directory,
                           const std::vector<std::string>& symbols,
                           std::vector<std::string>& missing) {
    std::map<std::string, std::vector<OHLCV>, std::less<>> out;
    for (const auto& symbol : symbols) {
        const auto path = (std::filesystem::path(directory) / (symbol + ".csv")).string();
        auto bars = load_csv(path);
        if (!bars || bars->empty()) {
            missing.push_back(symbol);
            continue;
        }
        out.emplace(symbol, std::move(*bars));
    }
    return out;
}

}  // namespace symphony::data
