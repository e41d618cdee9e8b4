#include "pattern_config.hpp"
#include <cmath>
#include <sstream>

namespace patterns {

namespace {
constexpr int MAX_TREND_LOOKBACK = 250;
constexpr int MAX_WORKER_THREADS = 256;
}

bool validatePatternConfig(const PatternConfig& cfg, std::string& error_msg) {
    if (!std::isfinite(cfg.doji_body_ratio) || cfg.doji_body_ratio < 0 || cfg.doji_body_ratio > 1) {
        error_msg = "doji body ratio must be between 0 and 1";
        return false;
    }
    if (!std::isfinite(cfg.shadow_body_multiple) || cfg.shadow_body_multiple <= 0) {
        error_msg = "shadow/body multiple must be > 0";
        return false;
    }
    if (cfg.trend_lookback < 1 || cfg.trend_lookback > MAX_TREND_LOOKBACK) {
        error_msg = "trend lookback must be between 1 and " + std::to_string(MAX_TREND_LOOKBACK);
        return false;
    }
    if (!std::isfinite(cfg.star_large_body_factor) || cfg.star_large_body_factor <= 0) {
        error_msg = "star large-body factor must be > 0";
        return false;
    }
    if (!std::isfinite(cfg.star_small_body_factor) || cfg.star_small_body_factor < 0) {
        error_msg = "star small-body factor must be >= 0";
        return false;
    }
    if (cfg.star_small_body_factor >= cfg.star_large_body_factor) {
        error_msg = "star small-body factor must be below the large-body factor";
        return false;
    }
    if (cfg.worker_threads < 1 || cfg.worker_threads > MAX_WORKER_THREADS) {
        error_msg = "worker threads must be between 1 and " + std::to_string(MAX_WORKER_THREADS);
        return false;
    }
    return true;
}

std::string describeConfig(const PatternConfig& cfg) {
    std::ostringstream os;
    os << "doji=" << cfg.doji_body_ratio
       << " shadow=" << cfg.shadow_body_multiple
       << " trend=" << cfg.trend_lookback
       << " star_large=" << cfg.star_large_body_factor
       << " star_small=" << cfg.star_small_body_factor;
    if (cfg.skip_invalid_rows) os << " permissive";
    return os.str();
}

} // namespace patterns
