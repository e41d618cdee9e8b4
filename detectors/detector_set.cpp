#include "detector.hpp"
#include "doji_detector.hpp"
#include "hammer_detector.hpp"
#include "shooting_star_detector.hpp"
#include "engulfing_detector.hpp"
#include "star_detector.hpp"

namespace patterns {

DetectorList createDefaultDetectors(const PatternConfig& cfg) {
    DetectorList list;
    list.push_back(createDojiDetector(cfg));
    list.push_back(createHammerDetector(cfg));
    list.push_back(createShootingStarDetector(cfg));
    list.push_back(createEngulfingDetector());
    list.push_back(createStarDetector(cfg));
    return list;
}

double precedingCloseAverage(const CandleWindow& window) {
    if (window.size() < 2) return 0;
    double sum = 0;
    for (std::size_t i = 0; i + 1 < window.size(); ++i) sum += window[i].close;
    return sum / static_cast<double>(window.size() - 1);
}

} // namespace patterns
