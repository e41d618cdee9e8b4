#pragma once

#include <string>
#include <vector>
#include <optional>
#include <array>

namespace patterns {

/// Pattern tags. Declaration order is the canonical label order:
/// single-candle patterns first, then multi-candle, alphabetical within each group.
enum class Pattern {
    Doji,
    Hammer,
    ShootingStar,
    BearishEngulfing,
    BullishEngulfing,
    EveningStar,
    MorningStar
};

constexpr std::size_t kPatternCount = 7;

/// All tags in canonical order.
const std::array<Pattern, kPatternCount>& allPatterns();

/// Label spelling, e.g. "ShootingStar".
const char* patternName(Pattern p);

/// Accepts "ShootingStar", "shootingstar", "shooting_star", "SHOOTING_STAR".
std::optional<Pattern> parsePattern(const std::string& text);

/// Sorts into canonical order and drops duplicates.
void canonicalize(std::vector<Pattern>& hits);

/// Comma-joined label ("" for no hits). Hits are canonicalized first.
std::string joinLabel(std::vector<Pattern> hits);

/// Split a stored label ("Doji,BullishEngulfing") back into tags. Unknown parts are ignored.
std::vector<Pattern> parseLabel(const std::string& label);

} // namespace patterns
