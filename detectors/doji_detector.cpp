#include "doji_detector.hpp"

namespace patterns {

bool isDoji(const Candle& c, double max_body_ratio) {
    const Geometry g = computeGeometry(c);
    if (g.degenerate()) return false;
    return g.body_ratio <= max_body_ratio;
}

/// Indecision candle: open and close (almost) equal inside a real range.
class DojiDetector : public IPatternDetector {
public:
    explicit DojiDetector(double max_body_ratio) : max_body_ratio_(max_body_ratio) {}

    std::size_t windowSize() const override { return 1; }

    void detect(const CandleWindow& window, std::vector<Pattern>& hits) const override {
        if (isDoji(window.last(), max_body_ratio_))
            hits.push_back(Pattern::Doji);
    }

private:
    double max_body_ratio_;
};

std::unique_ptr<IPatternDetector> createDojiDetector(const PatternConfig& cfg) {
    return std::make_unique<DojiDetector>(cfg.doji_body_ratio);
}

} // namespace patterns
