#include "pattern.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace patterns {

namespace {

// Lowercase with '_', '-' and spaces removed: "Shooting_Star" -> "shootingstar"
std::string normalizeTag(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '_' || c == '-' || c == ' ') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

const std::array<Pattern, kPatternCount>& allPatterns() {
    static const std::array<Pattern, kPatternCount> all = {
        Pattern::Doji, Pattern::Hammer, Pattern::ShootingStar,
        Pattern::BearishEngulfing, Pattern::BullishEngulfing,
        Pattern::EveningStar, Pattern::MorningStar
    };
    return all;
}

const char* patternName(Pattern p) {
    switch (p) {
        case Pattern::Doji: return "Doji";
        case Pattern::Hammer: return "Hammer";
        case Pattern::ShootingStar: return "ShootingStar";
        case Pattern::BearishEngulfing: return "BearishEngulfing";
        case Pattern::BullishEngulfing: return "BullishEngulfing";
        case Pattern::EveningStar: return "EveningStar";
        case Pattern::MorningStar: return "MorningStar";
    }
    return "";
}

std::optional<Pattern> parsePattern(const std::string& text) {
    const std::string key = normalizeTag(text);
    if (key.empty()) return std::nullopt;
    for (Pattern p : allPatterns()) {
        if (normalizeTag(patternName(p)) == key) return p;
    }
    return std::nullopt;
}

void canonicalize(std::vector<Pattern>& hits) {
    std::sort(hits.begin(), hits.end());
    hits.erase(std::unique(hits.begin(), hits.end()), hits.end());
}

std::string joinLabel(std::vector<Pattern> hits) {
    canonicalize(hits);
    std::string label;
    for (std::size_t i = 0; i < hits.size(); ++i) {
        if (i > 0) label += ',';
        label += patternName(hits[i]);
    }
    return label;
}

std::vector<Pattern> parseLabel(const std::string& label) {
    std::vector<Pattern> hits;
    std::istringstream iss(label);
    std::string part;
    while (std::getline(iss, part, ',')) {
        if (auto p = parsePattern(part)) hits.push_back(*p);
    }
    canonicalize(hits);
    return hits;
}

} // namespace patterns
