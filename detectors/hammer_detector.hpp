#pragma once

#include "detector.hpp"
#include "candle.hpp"
#include <memory>

namespace patterns {

/// Shape only: lower shadow >= shadow_multiple * body, upper shadow <= body, range > 0.
bool isHammerShape(const Candle& c, double shadow_multiple);

/// Factory: Hammer after a local downtrend (close below the SMA of the
/// cfg.trend_lookback preceding closes).
std::unique_ptr<IPatternDetector> createHammerDetector(const PatternConfig& cfg);

} // namespace patterns
