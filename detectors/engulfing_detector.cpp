#include "engulfing_detector.hpp"
#include <cmath>

namespace patterns {

namespace {

// Equal bodies touch but do not engulf.
bool largerBody(const Candle& prev, const Candle& cur) {
    return std::abs(cur.close - cur.open) > std::abs(prev.close - prev.open);
}

} // namespace

bool isBullishEngulfing(const Candle& prev, const Candle& cur) {
    if (!prev.isBearish() || !cur.isBullish()) return false;
    return cur.open <= prev.close && cur.close >= prev.open && largerBody(prev, cur);
}

bool isBearishEngulfing(const Candle& prev, const Candle& cur) {
    if (!prev.isBullish() || !cur.isBearish()) return false;
    return cur.open >= prev.close && cur.close <= prev.open && largerBody(prev, cur);
}

class EngulfingDetector : public IPatternDetector {
public:
    std::size_t windowSize() const override { return 2; }

    void detect(const CandleWindow& window, std::vector<Pattern>& hits) const override {
        const Candle& prev = window.back(1);
        const Candle& cur = window.back(0);
        if (isBullishEngulfing(prev, cur)) hits.push_back(Pattern::BullishEngulfing);
        if (isBearishEngulfing(prev, cur)) hits.push_back(Pattern::BearishEngulfing);
    }
};

std::unique_ptr<IPatternDetector> createEngulfingDetector() {
    return std::make_unique<EngulfingDetector>();
}

} // namespace patterns
