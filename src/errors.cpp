#include "errors.hpp"

namespace patterns {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "OK";
        case ErrorKind::SchemaError: return "SchemaError";
        case ErrorKind::ValidationError: return "ValidationError";
        case ErrorKind::OrderingError: return "OrderingError";
        case ErrorKind::EmptyInputError: return "EmptyInputError";
        case ErrorKind::ConfigError: return "ConfigError";
        case ErrorKind::IoError: return "IoError";
    }
    return "UnknownError";
}

std::string PatternError::describe() const {
    std::string out = errorKindName(kind);
    if (row) {
        out += " at row " + std::to_string(*row);
        if (!date.empty()) out += " (" + date + ")";
    }
    if (!message.empty()) out += ": " + message;
    return out;
}

} // namespace patterns
