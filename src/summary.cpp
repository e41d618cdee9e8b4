#include "summary.hpp"
#include <iostream>

namespace patterns {

namespace {

// Same fallback as LabeledRow::has.
std::vector<Pattern> rowPatterns(const LabeledRow& row) {
    if (!row.hits.empty()) return row.hits;
    return parseLabel(row.label);
}

} // namespace

PatternSummary getPatternSummary(const std::vector<LabeledRow>& rows) {
    PatternSummary summary;
    for (const auto& row : rows) {
        for (Pattern p : rowPatterns(row)) {
            PatternStats& stats = summary[p];
            ++stats.count;
            stats.dates.push_back(row.candle.date);
        }
    }
    return summary;
}

std::vector<std::string> getPatternDates(const std::vector<LabeledRow>& rows, Pattern pattern) {
    std::vector<std::string> dates;
    for (const auto& row : rows) {
        if (row.has(pattern)) dates.push_back(row.candle.date);
    }
    return dates;
}

std::vector<std::string> getPatternDates(const std::vector<LabeledRow>& rows, const std::string& tag) {
    auto pattern = parsePattern(tag);
    if (!pattern) {
        std::cerr << "Unknown pattern: " << tag << "\n";
        return {};
    }
    return getPatternDates(rows, *pattern);
}

} // namespace patterns
