#pragma once

#include "detector.hpp"
#include "candle.hpp"
#include <memory>

namespace patterns {

/// Shape only: upper shadow >= shadow_multiple * body, lower shadow <= body, range > 0.
bool isShootingStarShape(const Candle& c, double shadow_multiple);

/// Factory: Shooting Star after a local uptrend (close above the SMA of the
/// cfg.trend_lookback preceding closes).
std::unique_ptr<IPatternDetector> createShootingStarDetector(const PatternConfig& cfg);

} // namespace patterns
