#pragma once

#include <string>
#include <cstddef>

namespace patterns {

/// Parsed date/time used only for ordering. Zone suffixes are ignored.
struct Timestamp {
    int year{0};
    int month{0};
    int day{0};
    int hour{0};
    int minute{0};
    int second{0};

    bool operator<(const Timestamp& o) const;
    bool operator==(const Timestamp& o) const;
    bool operator!=(const Timestamp& o) const { return !(*this == o); }
};

/// Single validated OHLC candle.
struct Candle {
    std::string date;       // as given in the source, e.g. "2025-01-02" or "2025-01-02 09:15:00+05:30"
    Timestamp timestamp;
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};       // optional in the source, 0 when absent
    std::size_t source_row{0};  // 0-based data row in the input table

    bool isBullish() const { return close > open; }
    bool isBearish() const { return close < open; }

    /// Same timestamp and same OHLCV values.
    bool sameData(const Candle& o) const;
};

/// Derived shape of one candle. Ratios are 0 for a zero-range candle.
struct Geometry {
    double body{0};
    double range{0};
    double upper_shadow{0};
    double lower_shadow{0};
    double body_top{0};
    double body_bottom{0};
    double body_ratio{0};
    double upper_shadow_ratio{0};
    double lower_shadow_ratio{0};
    bool bullish{false};
    bool bearish{false};

    bool degenerate() const { return range <= 0; }
    double bodyMidpoint() const { return (body_top + body_bottom) / 2.0; }
};

Geometry computeGeometry(const Candle& c);

/// Parse "YYYY-MM-DD" / "YYYY/MM/DD" with optional "THH:MM[:SS[.fff]]" or " HH:MM..." part.
/// Returns false if unparseable or not a calendar date.
bool parseTimestamp(const std::string& text, Timestamp& out);

} // namespace patterns
