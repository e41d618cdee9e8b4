#pragma once

#include <string>
#include <optional>
#include <cstddef>
#include <utility>

namespace patterns {

enum class ErrorKind {
    None,
    SchemaError,      // missing / unrecognized required column
    ValidationError,  // bad number, bad date, negative volume, OHLC ordering violated
    OrderingError,    // dates not orderable (conflicting duplicates, out of order for analyze)
    EmptyInputError,  // zero rows
    ConfigError,      // threshold out of range
    IoError           // file open / read / write failure
};

const char* errorKindName(ErrorKind kind);

/// Error filled by the bool-returning operations. row is the 0-based data row, when known.
struct PatternError {
    ErrorKind kind{ErrorKind::None};
    std::optional<std::size_t> row;
    std::string date;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    /// "ValidationError at row 4 (2025-01-05): low 101 > high 99"
    std::string describe() const;

    void set(ErrorKind k, std::string msg) {
        kind = k;
        row.reset();
        date.clear();
        message = std::move(msg);
    }
    void setAt(ErrorKind k, std::size_t r, std::string d, std::string msg) {
        kind = k;
        row = r;
        date = std::move(d);
        message = std::move(msg);
    }
};

/// Row dropped in permissive mode.
struct SkippedRow {
    std::size_t row{0};
    std::string date;
    std::string reason;
};

} // namespace patterns
