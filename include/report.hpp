#pragma once

#include "analyzer.hpp"
#include "summary.hpp"
#include <string>
#include <ostream>
#include <iostream>

namespace patterns {

/// Console and text-file summary of one analysis run.
class PatternReport {
public:
    /// input_path / output_path and config_desc are echoed in the report header.
    PatternReport(const AnalysisResult& result,
                  const std::string& input_path = "",
                  const std::string& output_path = "",
                  const std::string& config_desc = "");

    /// Counts per pattern (computed once at construction).
    const PatternSummary& summary() const { return summary_; }

    /// Print summary to console: files, candles analyzed, non-zero pattern counts.
    void printSummary(std::ostream& out = std::cout) const;

    /// Write full report (counts and dates per pattern, skipped rows) to a text file.
    /// Returns false and logs to stderr on failure.
    bool writeReport(const std::string& filepath) const;

private:
    void printHeader(std::ostream& out) const;

    const AnalysisResult& result_;
    std::string input_path_;
    std::string output_path_;
    std::string config_desc_;
    PatternSummary summary_;
};

} // namespace patterns
