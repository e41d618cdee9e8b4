#pragma once

#include "detector.hpp"
#include "candle.hpp"
#include <memory>

namespace patterns {

/// Body-size thresholds for the 3-candle star patterns, relative to the window's average body.
struct StarParams {
    double large_body_factor = 1.0;
    double small_body_factor = 0.5;
};

/// first: large bearish; second: small body entirely below first's body;
/// third: large bullish closing above the midpoint of first's body.
bool isMorningStar(const Candle& first, const Candle& second, const Candle& third,
                   const StarParams& params);

/// first: large bullish; second: small body entirely above first's body;
/// third: large bearish closing below the midpoint of first's body.
bool isEveningStar(const Candle& first, const Candle& second, const Candle& third,
                   const StarParams& params);

/// Factory: 3-candle detector emitting MorningStar / EveningStar.
std::unique_ptr<IPatternDetector> createStarDetector(const PatternConfig& cfg);

} // namespace patterns
