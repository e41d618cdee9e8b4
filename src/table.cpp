#include "table.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace patterns {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

int findColumnAny(const Table& table, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        int i = table.findColumn(name);
        if (i >= 0) return i;
    }
    return -1;
}

// Splits one record. Quoted fields may contain commas, doubled quotes and newlines;
// `pos` is advanced past the record's line terminator.
std::vector<std::string> splitRecord(const std::string& text, std::size_t& pos) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    bool was_quoted = false;
    while (pos < text.size()) {
        char c = text[pos];
        if (quoted) {
            if (c == '"') {
                if (pos + 1 < text.size() && text[pos + 1] == '"') {
                    cell.push_back('"');
                    ++pos;
                } else {
                    quoted = false;
                }
            } else {
                cell.push_back(c);
            }
            ++pos;
            continue;
        }
        if (c == '"' && trim(cell).empty()) {
            cell.clear();
            quoted = true;
            was_quoted = true;
        } else if (c == ',') {
            cells.push_back(was_quoted ? cell : trim(cell));
            cell.clear();
            was_quoted = false;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') ++pos;
            ++pos;
            break;
        } else {
            cell.push_back(c);
        }
        ++pos;
    }
    cells.push_back(was_quoted ? cell : trim(cell));
    return cells;
}

bool isBlank(const std::vector<std::string>& cells) {
    return std::all_of(cells.begin(), cells.end(), [](const std::string& c) { return c.empty(); });
}

void writeCsvCell(std::ostream& out, const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) {
        out << s;
        return;
    }
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\"\"";
        else out << c;
    }
    out << '"';
}

} // namespace

int Table::findColumn(const std::string& name) const {
    const std::string want = toLower(name);
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (toLower(header[i]) == want) return static_cast<int>(i);
    }
    return -1;
}

bool resolveSchema(const Table& table, ColumnSchema& schema, PatternError& err) {
    ColumnSchema s;
    s.date = findColumnAny(table, {"date", "datetime", "timestamp", "time"});
    s.open = findColumnAny(table, {"open", "o"});
    s.high = findColumnAny(table, {"high", "h"});
    s.low = findColumnAny(table, {"low", "l"});
    s.close = findColumnAny(table, {"close", "c", "adj close", "adj_close"});
    s.volume = findColumnAny(table, {"volume", "vol", "v"});

    std::vector<std::string> missing;
    if (s.date < 0) missing.push_back("date");
    if (s.open < 0) missing.push_back("open");
    if (s.high < 0) missing.push_back("high");
    if (s.low < 0) missing.push_back("low");
    if (s.close < 0) missing.push_back("close");
    if (!missing.empty()) {
        std::string msg = "Missing required columns: ";
        for (std::size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += missing[i];
        }
        msg += " (available: ";
        for (std::size_t i = 0; i < table.header.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += table.header[i];
        }
        msg += ")";
        err.set(ErrorKind::SchemaError, msg);
        return false;
    }
    schema = s;
    return true;
}

bool parseCsvText(const std::string& text, Table& table, PatternError& err) {
    table = Table{};
    std::size_t pos = 0;
    // UTF-8 BOM
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF
        && static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF)
        pos = 3;

    while (pos < text.size()) {
        auto header = splitRecord(text, pos);
        if (!isBlank(header)) {
            table.header = std::move(header);
            break;
        }
    }
    if (table.header.empty()) {
        err.set(ErrorKind::SchemaError, "no header line");
        return false;
    }

    while (pos < text.size()) {
        auto cells = splitRecord(text, pos);
        if (isBlank(cells)) continue;
        if (cells.size() < table.header.size())
            cells.resize(table.header.size());
        table.rows.push_back(std::move(cells));
    }
    return true;
}

bool readCsvTable(const std::string& filepath, Table& table, PatternError& err) {
    std::ifstream f(filepath, std::ios::binary);
    if (!f.is_open()) {
        err.set(ErrorKind::IoError, "cannot open " + filepath);
        return false;
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    if (f.bad()) {
        err.set(ErrorKind::IoError, "failed to read " + filepath);
        return false;
    }
    return parseCsvText(buf.str(), table, err);
}

bool writeCsvTable(const std::string& filepath, const Table& table, PatternError& err) {
    std::ofstream f(filepath, std::ios::binary);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        err.set(ErrorKind::IoError, "cannot open " + filepath + " for writing");
        return false;
    }
    auto writeRecord = [&f](const std::vector<std::string>& cells) {
        for (std::size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) f << ',';
            writeCsvCell(f, cells[i]);
        }
        f << "\n";
    };
    writeRecord(table.header);
    for (const auto& row : table.rows) writeRecord(row);
    if (!f) {
        std::cerr << "Failed to write table: " << filepath << "\n";
        err.set(ErrorKind::IoError, "failed to write " + filepath);
        return false;
    }
    return true;
}

std::optional<double> parseNumber(const std::string& cell) {
    const std::string s = trim(cell);
    if (s.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace patterns
