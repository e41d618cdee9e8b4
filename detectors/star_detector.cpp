#include "star_detector.hpp"

namespace patterns {

namespace {

struct StarShape {
    Geometry first;
    Geometry second;
    Geometry third;
    double large{0};   // minimum body for the outer candles
    double small{0};   // maximum body for the middle candle
    bool valid{false}; // false when every body in the window is 0
};

StarShape measure(const Candle& first, const Candle& second, const Candle& third,
                  const StarParams& params) {
    StarShape s;
    s.first = computeGeometry(first);
    s.second = computeGeometry(second);
    s.third = computeGeometry(third);
    const double avg_body = (s.first.body + s.second.body + s.third.body) / 3.0;
    if (avg_body <= 0) return s;
    s.large = params.large_body_factor * avg_body;
    s.small = params.small_body_factor * avg_body;
    s.valid = true;
    return s;
}

} // namespace

bool isMorningStar(const Candle& first, const Candle& second, const Candle& third,
                   const StarParams& params) {
    const StarShape s = measure(first, second, third, params);
    if (!s.valid) return false;
    if (!s.first.bearish || s.first.body < s.large) return false;
    if (s.second.body > s.small) return false;
    if (!(s.second.body_top < s.first.body_bottom)) return false;  // gap down
    if (!s.third.bullish || s.third.body < s.large) return false;
    return third.close > s.first.bodyMidpoint();
}

bool isEveningStar(const Candle& first, const Candle& second, const Candle& third,
                   const StarParams& params) {
    const StarShape s = measure(first, second, third, params);
    if (!s.valid) return false;
    if (!s.first.bullish || s.first.body < s.large) return false;
    if (s.second.body > s.small) return false;
    if (!(s.second.body_bottom > s.first.body_top)) return false;  // gap up
    if (!s.third.bearish || s.third.body < s.large) return false;
    return third.close < s.first.bodyMidpoint();
}

class StarDetector : public IPatternDetector {
public:
    explicit StarDetector(const StarParams& params) : params_(params) {}

    std::size_t windowSize() const override { return 3; }

    void detect(const CandleWindow& window, std::vector<Pattern>& hits) const override {
        const Candle& first = window[0];
        const Candle& second = window[1];
        const Candle& third = window[2];
        if (isMorningStar(first, second, third, params_)) hits.push_back(Pattern::MorningStar);
        if (isEveningStar(first, second, third, params_)) hits.push_back(Pattern::EveningStar);
    }

private:
    StarParams params_;
};

std::unique_ptr<IPatternDetector> createStarDetector(const PatternConfig& cfg) {
    StarParams params;
    params.large_body_factor = cfg.star_large_body_factor;
    params.small_body_factor = cfg.star_small_body_factor;
    return std::make_unique<StarDetector>(params);
}

} // namespace patterns
