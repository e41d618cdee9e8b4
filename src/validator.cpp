#include "validator.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace patterns {

namespace {

std::string fmt(double v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

const std::string& cellAt(const std::vector<std::string>& cells, int index) {
    static const std::string empty;
    if (index < 0 || static_cast<std::size_t>(index) >= cells.size()) return empty;
    return cells[static_cast<std::size_t>(index)];
}

bool readPrice(const std::vector<std::string>& cells, int index, const char* name,
               std::size_t row_index, const std::string& date, double& out, PatternError& err) {
    const std::string& cell = cellAt(cells, index);
    if (cell.empty()) {
        err.setAt(ErrorKind::ValidationError, row_index, date, std::string("missing ") + name);
        return false;
    }
    auto v = parseNumber(cell);
    if (!v) {
        err.setAt(ErrorKind::ValidationError, row_index, date,
                  std::string("non-numeric ") + name + " \"" + cell + "\"");
        return false;
    }
    out = *v;
    return true;
}

// Cells past the header have no column to be written back to. Empty ones
// (a trailing comma) are dropped; anything else makes the row invalid.
bool checkRowWidth(const std::vector<std::string>& cells, std::size_t width,
                   const ColumnSchema& schema, std::size_t row_index, PatternError& err) {
    for (std::size_t i = width; i < cells.size(); ++i) {
        if (cells[i].empty()) continue;
        err.setAt(ErrorKind::ValidationError, row_index, cellAt(cells, schema.date),
                  std::to_string(cells.size()) + " cells but the header has "
                  + std::to_string(width) + " columns");
        return false;
    }
    return true;
}

} // namespace

bool validateCandle(const Candle& c, PatternError& err) {
    auto fail = [&](const std::string& msg) {
        err.setAt(ErrorKind::ValidationError, c.source_row, c.date, msg);
        return false;
    };
    if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) || !std::isfinite(c.close))
        return fail("non-finite price");
    if (!std::isfinite(c.volume) || c.volume < 0)
        return fail("negative volume " + fmt(c.volume));
    if (std::floor(c.volume) != c.volume)
        return fail("non-integral volume " + fmt(c.volume));
    if (c.low > c.high)
        return fail("low " + fmt(c.low) + " > high " + fmt(c.high));
    if (c.open < c.low || c.open > c.high)
        return fail("open " + fmt(c.open) + " outside [" + fmt(c.low) + ", " + fmt(c.high) + "]");
    if (c.close < c.low || c.close > c.high)
        return fail("close " + fmt(c.close) + " outside [" + fmt(c.low) + ", " + fmt(c.high) + "]");
    return true;
}

std::optional<Candle> candleFromRow(const std::vector<std::string>& cells,
                                    const ColumnSchema& schema,
                                    std::size_t row_index,
                                    PatternError& err) {
    Candle c;
    c.source_row = row_index;
    c.date = cellAt(cells, schema.date);
    if (c.date.empty()) {
        err.setAt(ErrorKind::ValidationError, row_index, "", "missing date");
        return std::nullopt;
    }
    if (!parseTimestamp(c.date, c.timestamp)) {
        err.setAt(ErrorKind::ValidationError, row_index, c.date, "unparsable date \"" + c.date + "\"");
        return std::nullopt;
    }
    if (!readPrice(cells, schema.open, "open", row_index, c.date, c.open, err)) return std::nullopt;
    if (!readPrice(cells, schema.high, "high", row_index, c.date, c.high, err)) return std::nullopt;
    if (!readPrice(cells, schema.low, "low", row_index, c.date, c.low, err)) return std::nullopt;
    if (!readPrice(cells, schema.close, "close", row_index, c.date, c.close, err)) return std::nullopt;
    // Volume is optional: an absent column or empty cell means 0.
    if (schema.volume >= 0 && !cellAt(cells, schema.volume).empty()) {
        if (!readPrice(cells, schema.volume, "volume", row_index, c.date, c.volume, err))
            return std::nullopt;
    }
    if (!validateCandle(c, err)) return std::nullopt;
    return c;
}

bool ingestTable(const Table& table, const PatternConfig& cfg,
                 IngestResult& result, PatternError& err) {
    result = IngestResult{};
    if (table.empty()) {
        err.set(ErrorKind::EmptyInputError, "no data rows");
        return false;
    }
    ColumnSchema schema;
    if (!resolveSchema(table, schema, err)) return false;

    result.candles.reserve(table.size());
    for (std::size_t i = 0; i < table.size(); ++i) {
        PatternError row_err;
        std::optional<Candle> candle;
        if (checkRowWidth(table.rows[i], table.header.size(), schema, i, row_err))
            candle = candleFromRow(table.rows[i], schema, i, row_err);
        if (candle) {
            result.candles.push_back(std::move(*candle));
            continue;
        }
        if (!cfg.skip_invalid_rows) {
            err = row_err;
            return false;
        }
        std::cerr << "Skipping " << row_err.describe() << "\n";
        result.skipped.push_back({ i, row_err.date, row_err.message });
    }

    if (result.candles.empty()) {
        err.set(ErrorKind::EmptyInputError,
                "all " + std::to_string(table.size()) + " rows were invalid");
        return false;
    }
    return orderCandles(result.candles, err);
}

bool orderCandles(std::vector<Candle>& candles, PatternError& err) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
    return checkOrdered(candles, err);
}

bool checkOrdered(const std::vector<Candle>& candles, PatternError& err) {
    for (std::size_t i = 1; i < candles.size(); ++i) {
        const Candle& prev = candles[i - 1];
        const Candle& cur = candles[i];
        if (cur.timestamp < prev.timestamp) {
            err.setAt(ErrorKind::OrderingError, cur.source_row, cur.date,
                      "date earlier than previous row (" + prev.date + ")");
            return false;
        }
        if (cur.timestamp == prev.timestamp && !cur.sameData(prev)) {
            err.setAt(ErrorKind::OrderingError, cur.source_row, cur.date,
                      "duplicate date with conflicting data (also at row "
                      + std::to_string(prev.source_row) + ")");
            return false;
        }
    }
    return true;
}

} // namespace patterns
