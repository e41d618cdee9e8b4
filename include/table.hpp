#pragma once

#include "errors.hpp"
#include <string>
#include <vector>
#include <optional>

namespace patterns {

/// Flat tabular row set: header plus string cells. Rows are padded to the header width on read.
struct Table {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    std::size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    /// Case-insensitive column lookup. -1 if absent.
    int findColumn(const std::string& name) const;
};

/// Column indices of the OHLC fields in a Table. volume is -1 when the table has none.
struct ColumnSchema {
    int date{-1};
    int open{-1};
    int high{-1};
    int low{-1};
    int close{-1};
    int volume{-1};
};

/// Resolve required columns (date, open, high, low, close) and optional volume,
/// case-insensitively with synonyms (e.g. "Close", "CLOSE", "c", "Adj Close").
/// Returns false with a SchemaError naming every missing column.
bool resolveSchema(const Table& table, ColumnSchema& schema, PatternError& err);

/// Read a comma-separated file with a header line. Handles quoted fields and a UTF-8 BOM.
bool readCsvTable(const std::string& filepath, Table& table, PatternError& err);

/// Parse CSV text (same rules as readCsvTable).
bool parseCsvText(const std::string& text, Table& table, PatternError& err);

/// Write header and rows, quoting cells that need it.
bool writeCsvTable(const std::string& filepath, const Table& table, PatternError& err);

/// Whole-cell number parse: "101.5" ok, "101.5x" / "" / "nan" rejected.
std::optional<double> parseNumber(const std::string& cell);

} // namespace patterns
