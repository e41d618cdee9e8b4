#pragma once

#include "detector.hpp"
#include "candle.hpp"
#include <memory>

namespace patterns {

/// prev bearish, cur bullish, cur.open <= prev.close, cur.close >= prev.open, and cur body larger.
bool isBullishEngulfing(const Candle& prev, const Candle& cur);

/// prev bullish, cur bearish, cur.open >= prev.close, cur.close <= prev.open, and cur body larger.
bool isBearishEngulfing(const Candle& prev, const Candle& cur);

/// Factory: 2-candle detector emitting BullishEngulfing / BearishEngulfing.
std::unique_ptr<IPatternDetector> createEngulfingDetector();

} // namespace patterns
