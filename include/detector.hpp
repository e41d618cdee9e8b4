#pragma once

#include "candle_window.hpp"
#include "pattern.hpp"
#include "pattern_config.hpp"
#include <memory>
#include <vector>

namespace patterns {

/// Interface every pattern detector implements.
/// The analyzer calls detect() once per row whose trailing window of windowSize()
/// candles fits in the sequence; the window's last candle is the confirming candle.
/// Detectors are stateless: detect() reads only the window and never fails.
class IPatternDetector {
public:
    virtual ~IPatternDetector() = default;

    /// Candles required, including any trend context before the pattern itself.
    virtual std::size_t windowSize() const = 0;

    /// Append every pattern confirmed at window.last() to hits.
    virtual void detect(const CandleWindow& window, std::vector<Pattern>& hits) const = 0;
};

using DetectorList = std::vector<std::unique_ptr<IPatternDetector>>;

/// Doji, Hammer, Shooting Star, Engulfing and Star detectors built from cfg.
DetectorList createDefaultDetectors(const PatternConfig& cfg);

/// Mean close of every candle in the window except the confirming one (0 for a 1-candle window).
double precedingCloseAverage(const CandleWindow& window);

} // namespace patterns
