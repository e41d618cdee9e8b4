#pragma once

#include "candle.hpp"
#include "errors.hpp"
#include "pattern_config.hpp"
#include "table.hpp"
#include <vector>
#include <optional>

namespace patterns {

/// Checks prices are finite, volume is a whole number >= 0 and low <= open, close <= high.
/// Fills err with a ValidationError at the candle's source_row.
bool validateCandle(const Candle& c, PatternError& err);

/// Build a Candle from one table row: parse date and numbers, then validateCandle.
std::optional<Candle> candleFromRow(const std::vector<std::string>& cells,
                                    const ColumnSchema& schema,
                                    std::size_t row_index,
                                    PatternError& err);

/// Typed candles from a whole table plus rows skipped in permissive mode.
struct IngestResult {
    std::vector<Candle> candles;       // chronological
    std::vector<SkippedRow> skipped;
};

/// Schema mapping, per-row validation and ordering in one pass.
/// Strict mode fails on the first invalid row; permissive mode (cfg.skip_invalid_rows)
/// records it in result.skipped. A row with non-empty cells past the header is invalid.
/// Fails with EmptyInputError when no candles remain.
bool ingestTable(const Table& table, const PatternConfig& cfg,
                 IngestResult& result, PatternError& err);

/// Stable sort by timestamp. Duplicate timestamps are kept when their data is identical
/// and rejected with an OrderingError when it conflicts.
bool orderCandles(std::vector<Candle>& candles, PatternError& err);

/// True if timestamps never decrease and equal timestamps carry identical data.
bool checkOrdered(const std::vector<Candle>& candles, PatternError& err);

} // namespace patterns
