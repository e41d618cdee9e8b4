#pragma once

#include <string>
#include <cstddef>

namespace patterns {

/// Detector thresholds and run options. Every field has a documented default.
struct PatternConfig {
    /// Doji: body / range at or below this fraction.
    double doji_body_ratio = 0.1;

    /// Hammer / Shooting Star: long shadow must be >= this multiple of the body.
    double shadow_body_multiple = 2.0;

    /// Hammer / Shooting Star: trend context = SMA of the closes of this many preceding candles.
    int trend_lookback = 3;

    /// Stars: outer candles must have body >= factor * average body of the 3-candle window.
    double star_large_body_factor = 1.0;

    /// Stars: middle candle must have body <= factor * average body of the 3-candle window.
    double star_small_body_factor = 0.5;

    /// Skip rows that fail validation instead of failing the run (diagnostics are returned).
    bool skip_invalid_rows = false;

    /// Rows are split into contiguous chunks across this many threads (1 = sequential).
    int worker_threads = 1;
};

/// Returns false and sets error_msg if a field is out of range.
bool validatePatternConfig(const PatternConfig& cfg, std::string& error_msg);

/// One-line "key=value" description for reports, e.g. "doji=0.1 shadow=2 trend=3 ...".
std::string describeConfig(const PatternConfig& cfg);

} // namespace patterns
