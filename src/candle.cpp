#include "candle.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <tuple>

namespace patterns {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    return days[month - 1];
}

// Reads exactly `width` digits starting at pos. Advances pos on success.
bool readDigits(const std::string& s, std::size_t& pos, std::size_t width, int& out) {
    if (pos + width > s.size()) return false;
    int v = 0;
    for (std::size_t i = 0; i < width; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    pos += width;
    return true;
}

// Whole remainder from pos is "Z", "+HH:MM" or "+HHMM" (or with '-').
bool isZoneSuffix(const std::string& text, std::size_t pos) {
    if (text[pos] == 'Z') return pos + 1 == text.size();
    if (text[pos] != '+' && text[pos] != '-') return false;
    ++pos;
    int hours = 0;
    int minutes = 0;
    if (!readDigits(text, pos, 2, hours)) return false;
    if (pos < text.size() && text[pos] == ':') ++pos;
    if (!readDigits(text, pos, 2, minutes)) return false;
    return pos == text.size() && hours <= 23 && minutes <= 59;
}

} // namespace

bool Timestamp::operator<(const Timestamp& o) const {
    return std::tie(year, month, day, hour, minute, second)
         < std::tie(o.year, o.month, o.day, o.hour, o.minute, o.second);
}

bool Timestamp::operator==(const Timestamp& o) const {
    return std::tie(year, month, day, hour, minute, second)
        == std::tie(o.year, o.month, o.day, o.hour, o.minute, o.second);
}

bool Candle::sameData(const Candle& o) const {
    return timestamp == o.timestamp && open == o.open && high == o.high
        && low == o.low && close == o.close && volume == o.volume;
}

Geometry computeGeometry(const Candle& c) {
    Geometry g;
    g.body_top = std::max(c.open, c.close);
    g.body_bottom = std::min(c.open, c.close);
    g.body = std::abs(c.close - c.open);
    g.range = c.high - c.low;
    g.upper_shadow = c.high - g.body_top;
    g.lower_shadow = g.body_bottom - c.low;
    g.bullish = c.isBullish();
    g.bearish = c.isBearish();
    if (g.range > 0) {
        g.body_ratio = g.body / g.range;
        g.upper_shadow_ratio = g.upper_shadow / g.range;
        g.lower_shadow_ratio = g.lower_shadow / g.range;
    }
    return g;
}

// Supports: "2025-01-02", "2025/01/02", "2025-01-02T09:15", "2025-01-02 09:15:00",
// "2025-01-02 09:15:00+05:30", "2025-01-02T09:15:00.000Z"
bool parseTimestamp(const std::string& text, Timestamp& out) {
    Timestamp ts;
    std::size_t pos = 0;
    if (!readDigits(text, pos, 4, ts.year)) return false;
    if (pos >= text.size() || (text[pos] != '-' && text[pos] != '/')) return false;
    const char sep = text[pos++];
    if (!readDigits(text, pos, 2, ts.month)) return false;
    if (pos >= text.size() || text[pos] != sep) return false;
    ++pos;
    if (!readDigits(text, pos, 2, ts.day)) return false;

    if (ts.month < 1 || ts.month > 12) return false;
    if (ts.day < 1 || ts.day > daysInMonth(ts.year, ts.month)) return false;

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != ' ') return false;
        ++pos;
        if (!readDigits(text, pos, 2, ts.hour)) return false;
        if (pos >= text.size() || text[pos] != ':') return false;
        ++pos;
        if (!readDigits(text, pos, 2, ts.minute)) return false;
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!readDigits(text, pos, 2, ts.second)) return false;
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
            }
        }
        if (ts.hour > 23 || ts.minute > 59 || ts.second > 60) return false;
        // Zone suffix: "Z", "+05:30", "-0400"
        if (pos < text.size() && !isZoneSuffix(text, pos)) return false;
    }

    out = ts;
    return true;
}

} // namespace patterns
