#include "report.hpp"
#include <fstream>
#include <iomanip>

namespace patterns {

PatternReport::PatternReport(const AnalysisResult& result,
                             const std::string& input_path,
                             const std::string& output_path,
                             const std::string& config_desc)
    : result_(result)
    , input_path_(input_path)
    , output_path_(output_path)
    , config_desc_(config_desc)
    , summary_(getPatternSummary(result.rows)) {}

void PatternReport::printHeader(std::ostream& out) const {
    if (!input_path_.empty()) out << "Input file:  " << input_path_ << "\n";
    if (!output_path_.empty()) out << "Output file: " << output_path_ << "\n";
    if (!config_desc_.empty()) out << "Thresholds:  " << config_desc_ << "\n";
}

void PatternReport::printSummary(std::ostream& out) const {
    out << "\n========== Candlestick Pattern Summary ==========\n";
    printHeader(out);
    out << "Candles analyzed: " << result_.rows.size() << "\n";
    if (!result_.skipped.empty())
        out << "Rows skipped:     " << result_.skipped.size() << "\n";
    if (summary_.empty()) {
        out << "Patterns found:   none\n";
    } else {
        out << "Patterns found:\n";
        for (const auto& [pattern, stats] : summary_)
            out << "  - " << std::left << std::setw(18) << patternName(pattern) << std::right << stats.count << "\n";
    }
    out << "=================================================\n\n";
}

bool PatternReport::writeReport(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Candlestick Pattern Report\n";
    f << "==========================\n\n";
    printHeader(f);
    f << "Candles analyzed: " << result_.rows.size() << "\n";
    if (!result_.rows.empty()) {
        f << "First candle:     " << result_.rows.front().candle.date << "\n";
        f << "Last candle:      " << result_.rows.back().candle.date << "\n";
    }
    f << "\n";

    for (Pattern p : allPatterns()) {
        auto it = summary_.find(p);
        const int count = (it == summary_.end()) ? 0 : it->second.count;
        f << std::left << std::setw(18) << patternName(p) << std::right << std::setw(6) << count << "\n";
        if (it == summary_.end()) continue;
        for (const auto& date : it->second.dates)
            f << "    " << date << "\n";
    }

    if (!result_.skipped.empty()) {
        f << "\nSkipped rows (" << result_.skipped.size() << "):\n";
        for (const auto& s : result_.skipped) {
            f << "  row " << s.row;
            if (!s.date.empty()) f << " (" << s.date << ")";
            f << ": " << s.reason << "\n";
        }
    }
    if (!f) {
        std::cerr << "Failed to write report: " << filepath << "\n";
        return false;
    }
    return true;
}

} // namespace patterns
