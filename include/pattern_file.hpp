#pragma once

#include "analyzer.hpp"
#include "errors.hpp"
#include "pattern_config.hpp"
#include "table.hpp"
#include <string>

namespace patterns {

/// Name of the label column added to output tables.
constexpr const char* kPatternColumn = "pattern";

struct ProcessOptions {
    PatternConfig config;
    std::string output_path;    // empty = defaultOutputPath(input)
    std::string report_path;    // empty = no text report
    bool print_summary = true;  // console summary on std::cout
};

struct ProcessResult {
    std::string input_path;
    std::string output_path;
    AnalysisResult analysis;
};

/// "data/NIFTY_1.csv" -> "data/NIFTY_1_with_patterns.csv"; other names get the suffix appended.
std::string defaultOutputPath(const std::string& input_path);

/// Input table rows in analyzed (chronological) order with the pattern column set.
/// An existing "pattern" column is overwritten; otherwise one is appended. Skipped rows are dropped.
Table labeledTable(const Table& input, const AnalysisResult& analysis);

/// Read a CSV file, analyze it, write the labeled table (and optional report).
bool processFile(const std::string& input_path, const ProcessOptions& options,
                 ProcessResult& result, PatternError& err);

/// Most recently modified "<prefix>*.csv" regular file in directory. IoError if none.
bool findLatestFile(const std::string& directory, const std::string& prefix,
                    std::string& path, PatternError& err);

/// findLatestFile + processFile.
bool processLatestFile(const std::string& directory, const std::string& prefix,
                       const ProcessOptions& options, ProcessResult& result, PatternError& err);

} // namespace patterns
