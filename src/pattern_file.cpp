#include "pattern_file.hpp"
#include "report.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace patterns {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string defaultOutputPath(const std::string& input_path) {
    const std::string suffix = "_with_patterns.csv";
    if (endsWith(input_path, ".csv"))
        return input_path.substr(0, input_path.size() - 4) + suffix;
    return input_path + suffix;
}

Table labeledTable(const Table& input, const AnalysisResult& analysis) {
    Table out;
    out.header = input.header;
    int label_col = input.findColumn(kPatternColumn);
    if (label_col < 0) {
        out.header.push_back(kPatternColumn);
        label_col = static_cast<int>(out.header.size()) - 1;
    }
    const std::size_t width = out.header.size();

    out.rows.reserve(analysis.rows.size());
    for (const auto& row : analysis.rows) {
        std::vector<std::string> cells;
        if (row.candle.source_row < input.rows.size())
            cells = input.rows[row.candle.source_row];
        cells.resize(width);
        cells[static_cast<std::size_t>(label_col)] = row.label;
        out.rows.push_back(std::move(cells));
    }
    return out;
}

bool processFile(const std::string& input_path, const ProcessOptions& options,
                 ProcessResult& result, PatternError& err) {
    result = ProcessResult{};
    result.input_path = input_path;

    Table table;
    if (!readCsvTable(input_path, table, err)) return false;

    PatternAnalyzer analyzer(options.config);
    if (!analyzer.analyzeTable(table, result.analysis, err)) return false;

    result.output_path = options.output_path.empty() ? defaultOutputPath(input_path) : options.output_path;
    if (!writeCsvTable(result.output_path, labeledTable(table, result.analysis), err)) return false;

    PatternReport report(result.analysis, input_path, result.output_path, describeConfig(options.config));
    if (options.print_summary) report.printSummary(std::cout);
    if (!options.report_path.empty() && !report.writeReport(options.report_path)) {
        err.set(ErrorKind::IoError, "failed to write report " + options.report_path);
        return false;
    }
    return true;
}

bool findLatestFile(const std::string& directory, const std::string& prefix,
                    std::string& path, PatternError& err) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec) || ec) {
        err.set(ErrorKind::IoError, "not a directory: " + directory);
        return false;
    }

    bool found = false;
    fs::file_time_type latest_time{};
    std::string latest;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec) continue;
        const std::string name = entry.path().filename().string();
        if (!startsWith(name, prefix) || !endsWith(name, ".csv")) continue;
        // Outputs of earlier runs are not inputs.
        if (endsWith(name, "_with_patterns.csv")) continue;
        auto t = entry.last_write_time(entry_ec);
        if (entry_ec) continue;
        if (!found || t > latest_time || (t == latest_time && entry.path().string() > latest)) {
            latest_time = t;
            latest = entry.path().string();
            found = true;
        }
    }
    if (ec) {
        err.set(ErrorKind::IoError, "cannot list " + directory + ": " + ec.message());
        return false;
    }
    if (!found) {
        err.set(ErrorKind::IoError, "No " + prefix + "*.csv files found in " + directory);
        return false;
    }
    path = latest;
    return true;
}

bool processLatestFile(const std::string& directory, const std::string& prefix,
                       const ProcessOptions& options, ProcessResult& result, PatternError& err) {
    std::string path;
    if (!findLatestFile(directory, prefix, path, err)) return false;
    std::cout << "Latest " << prefix << " file: " << path << "\n";
    return processFile(path, options, result, err);
}

} // namespace patterns
