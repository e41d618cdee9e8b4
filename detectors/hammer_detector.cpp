#include "hammer_detector.hpp"

namespace patterns {

bool isHammerShape(const Candle& c, double shadow_multiple) {
    const Geometry g = computeGeometry(c);
    if (g.degenerate()) return false;
    return g.lower_shadow >= shadow_multiple * g.body
        && g.upper_shadow <= g.body;
}

class HammerDetector : public IPatternDetector {
public:
    HammerDetector(double shadow_multiple, int trend_lookback)
        : shadow_multiple_(shadow_multiple)
        , trend_lookback_(trend_lookback)
    {}

    std::size_t windowSize() const override { return static_cast<std::size_t>(trend_lookback_) + 1; }

    void detect(const CandleWindow& window, std::vector<Pattern>& hits) const override {
        const Candle& c = window.last();
        if (!isHammerShape(c, shadow_multiple_)) return;
        // Same shape in an uptrend is a hanging man, not a hammer.
        if (c.close < precedingCloseAverage(window))
            hits.push_back(Pattern::Hammer);
    }

private:
    double shadow_multiple_;
    int trend_lookback_;
};

std::unique_ptr<IPatternDetector> createHammerDetector(const PatternConfig& cfg) {
    return std::make_unique<HammerDetector>(cfg.shadow_body_multiple, cfg.trend_lookback);
}

} // namespace patterns
