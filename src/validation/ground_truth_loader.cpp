/// @file src/validation/ground_truth_loader.cpp
/// @brief GroundTruthLoader: percentage-allocation CSV to held-symbol sets.

#include "symphony/validator.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>

namespace symphony::validation {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n\"");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n\"");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view line) {
    std::vector<std::string_view> cells;
    for (;;) {
        const auto comma = line.find(',');
        cells.push_back(trim(line.substr(0, comma)));
        if (comma == std::string_view::npos) break;
        line.remove_prefix(comma + 1);
    }
    return cells;
}

}  // namespace

std::optional<double> GroundTruthLoader::parse_allocation(std::string_view cell) noexcept {
    cell = trim(cell);
    if (cell.empty() || cell == "-") return std::nullopt;
    if (cell.back() == '%') cell.remove_suffix(1);
    cell = trim(cell);
    if (!cell.empty() && cell.front() == '+') cell.remove_prefix(1);
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
    if (ec != std::errc{} || ptr != cell.data() + cell.size()) return std::nullopt;
    return value;
}

std::optional<GroundTruth> GroundTruthLoader::parse_csv_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line;

    std::vector<std::string> header;
    while (std::getline(stream, line)) {
        if (trim(line).empty()) continue;
        std::string_view row = line;
        if (row.substr(0, UTF8_BOM.size()) == UTF8_BOM) row.remove_prefix(UTF8_BOM.size());
        for (auto cell : split(row)) header.emplace_back(cell);
        break;
    }

    std::optional<std::size_t> date_col;
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == "Date") date_col = i;
    }
    if (!date_col) return std::nullopt;

    GroundTruth truth;
    while (std::getline(stream, line)) {
        if (trim(line).empty()) continue;
        const auto cells = split(line);
        if (*date_col >= cells.size()) continue;
        auto date = parse_date(cells[*date_col]);
        if (!date) continue;

        auto& held = truth[*date];
        for (std::size_t i = 0; i < cells.size() && i < header.size(); ++i) {
            if (i == *date_col || header[i] == "Day Traded" || header[i].empty()) continue;
            auto allocation = parse_allocation(cells[i]);
            if (allocation && *allocation > 0.0) held.insert(header[i]);
        }
    }
    return truth;
}

std::optional<GroundTruth> GroundTruthLoader::load_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace symphony::validation
