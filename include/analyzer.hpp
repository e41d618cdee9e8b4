#pragma once

#include "candle.hpp"
#include "detector.hpp"
#include "errors.hpp"
#include "pattern.hpp"
#include "pattern_config.hpp"
#include "table.hpp"
#include <string>
#include <vector>

namespace patterns {

/// One analyzed candle with every pattern confirmed on it.
struct LabeledRow {
    Candle candle;
    std::vector<Pattern> hits;  // canonical order
    std::string label;          // comma-joined hits, "" when none

    /// Reads the label when hits is empty.
    bool has(Pattern p) const;
};

struct AnalysisResult {
    std::vector<LabeledRow> rows;       // same order as the analyzed candles
    std::vector<SkippedRow> skipped;    // permissive mode only
};

/// Runs every detector over an ordered candle sequence and labels each row.
/// Rows are independent given their trailing window, so with cfg.worker_threads > 1
/// contiguous chunks are labeled on separate threads; output order never changes.
class PatternAnalyzer {
public:
    explicit PatternAnalyzer(const PatternConfig& cfg = PatternConfig{});

    /// Validates config, candles (strict unless cfg.skip_invalid_rows) and ordering,
    /// then labels. On failure returns false, sets err and leaves result empty.
    bool analyze(const std::vector<Candle>& candles, AnalysisResult& result, PatternError& err) const;

    /// Table front end: schema mapping, validation, sorting by date, then analyze().
    bool analyzeTable(const Table& table, AnalysisResult& result, PatternError& err) const;

private:
    void labelRange(const std::vector<Candle>& candles, std::size_t begin, std::size_t end,
                    std::vector<LabeledRow>& rows) const;
    bool checkConfig(PatternError& err) const;

    PatternConfig cfg_;
    DetectorList detectors_;
};

/// Convenience wrapper: strict or permissive per cfg, skipped rows discarded.
bool analyzePatterns(const std::vector<Candle>& candles, const PatternConfig& cfg,
                     std::vector<LabeledRow>& out, PatternError& err);

} // namespace patterns
