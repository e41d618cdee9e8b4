#pragma once

#include "detector.hpp"
#include "candle.hpp"
#include <memory>

namespace patterns {

/// Body at most max_body_ratio of a non-zero range. A flat candle (range 0) is never a Doji.
bool isDoji(const Candle& c, double max_body_ratio);

/// Factory: Doji detector using cfg.doji_body_ratio.
std::unique_ptr<IPatternDetector> createDojiDetector(const PatternConfig& cfg);

} // namespace patterns
