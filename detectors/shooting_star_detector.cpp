#include "shooting_star_detector.hpp"

namespace patterns {

bool isShootingStarShape(const Candle& c, double shadow_multiple) {
    const Geometry g = computeGeometry(c);
    if (g.degenerate()) return false;
    return g.upper_shadow >= shadow_multiple * g.body
        && g.lower_shadow <= g.body;
}

class ShootingStarDetector : public IPatternDetector {
public:
    ShootingStarDetector(double shadow_multiple, int trend_lookback)
        : shadow_multiple_(shadow_multiple)
        , trend_lookback_(trend_lookback)
    {}

    std::size_t windowSize() const override { return static_cast<std::size_t>(trend_lookback_) + 1; }

    void detect(const CandleWindow& window, std::vector<Pattern>& hits) const override {
        const Candle& c = window.last();
        if (!isShootingStarShape(c, shadow_multiple_)) return;
        // Inverted hammer shape after a decline is not a shooting star.
        if (c.close > precedingCloseAverage(window))
            hits.push_back(Pattern::ShootingStar);
    }

private:
    double shadow_multiple_;
    int trend_lookback_;
};

std::unique_ptr<IPatternDetector> createShootingStarDetector(const PatternConfig& cfg) {
    return std::make_unique<ShootingStarDetector>(cfg.shadow_body_multiple, cfg.trend_lookback);
}

} // namespace patterns
