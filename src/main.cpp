#include "pattern_file.hpp"
#include "pattern_config.hpp"
#include "summary.hpp"
#include <iostream>
#include <string>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

constexpr const char* DEFAULT_DATA_PATH = "data/sample_ohlc.csv";
constexpr const char* DEFAULT_LATEST_PREFIX = "NIFTY_";

//-----------------------------------------------------------------------------
// Config: all CLI and run options in one place
//-----------------------------------------------------------------------------
struct Config {
    std::string data_path = DEFAULT_DATA_PATH;
    std::string output_path;
    std::string report_path;
    std::string latest_dir;
    std::string latest_prefix = DEFAULT_LATEST_PREFIX;
    std::string dates_tag;
    bool quiet = false;
    bool show_help = false;

    patterns::PatternConfig patterns;
};

void printUsage(std::ostream& out) {
    out << "Usage: candle_patterns [--data FILE | --latest-dir DIR [--prefix NIFTY_]]\n"
           "                       [--output FILE] [--report FILE] [--dates TAG]\n"
           "                       [--doji-ratio 0.1] [--shadow-multiple 2] [--trend 3]\n"
           "                       [--star-large 1.0] [--star-small 0.5] [--threads 1]\n"
           "                       [--permissive] [--quiet]\n"
           "Tags: Doji, Hammer, ShootingStar, BearishEngulfing, BullishEngulfing, EveningStar, MorningStar\n";
}

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const char* s, double& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("trailing characters");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}
bool parseInt(const char* s, int& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("trailing characters");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg) {
    auto& pc = cfg.patterns;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 >= argc) {
                error_msg = "Missing value for " + arg;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") { cfg.show_help = true; }
        else if (arg == "--data") { if (!next()) return false; cfg.data_path = argv[i]; }
        else if (arg == "--output") { if (!next()) return false; cfg.output_path = argv[i]; }
        else if (arg == "--report") { if (!next()) return false; cfg.report_path = argv[i]; }
        else if (arg == "--latest-dir") { if (!next()) return false; cfg.latest_dir = argv[i]; }
        else if (arg == "--prefix") { if (!next()) return false; cfg.latest_prefix = argv[i]; }
        else if (arg == "--dates") { if (!next()) return false; cfg.dates_tag = argv[i]; }
        else if (arg == "--doji-ratio") { if (!next() || !parseDouble(argv[i], pc.doji_body_ratio, error_msg, "--doji-ratio")) return false; }
        else if (arg == "--shadow-multiple") { if (!next() || !parseDouble(argv[i], pc.shadow_body_multiple, error_msg, "--shadow-multiple")) return false; }
        else if (arg == "--trend") { if (!next() || !parseInt(argv[i], pc.trend_lookback, error_msg, "--trend")) return false; }
        else if (arg == "--star-large") { if (!next() || !parseDouble(argv[i], pc.star_large_body_factor, error_msg, "--star-large")) return false; }
        else if (arg == "--star-small") { if (!next() || !parseDouble(argv[i], pc.star_small_body_factor, error_msg, "--star-small")) return false; }
        else if (arg == "--threads") { if (!next() || !parseInt(argv[i], pc.worker_threads, error_msg, "--threads")) return false; }
        else if (arg == "--permissive") { pc.skip_invalid_rows = true; }
        else if (arg == "--quiet" || arg == "-q") { cfg.quiet = true; }
        else {
            error_msg = "Unknown option: " + arg;
            return false;
        }
    }
    return true;
}

/// Returns false and sets error_msg if config is invalid.
bool validateConfig(const Config& cfg, std::string& error_msg) {
    if (!patterns::validatePatternConfig(cfg.patterns, error_msg)) return false;
    if (!cfg.dates_tag.empty() && !patterns::parsePattern(cfg.dates_tag)) {
        error_msg = "--dates: unknown pattern \"" + cfg.dates_tag + "\"";
        return false;
    }
    if (!cfg.latest_dir.empty() && cfg.latest_prefix.empty()) {
        error_msg = "--prefix must not be empty";
        return false;
    }
    return true;
}

void printDates(const patterns::ProcessResult& result, const std::string& tag) {
    const auto dates = patterns::getPatternDates(result.analysis.rows, tag);
    const auto pattern = patterns::parsePattern(tag);
    std::cout << patterns::patternName(*pattern) << " dates (" << dates.size() << "):\n";
    for (const auto& d : dates) std::cout << "  " << d << "\n";
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    if (!parseArgs(argc, argv, cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return 1;
    }
    if (cfg.show_help) {
        printUsage(std::cout);
        return 0;
    }
    if (!validateConfig(cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    // Resolve default data path when running from build/
    if (cfg.data_path == DEFAULT_DATA_PATH && !fs::is_regular_file(cfg.data_path) &&
        fs::is_regular_file(std::string("../") + DEFAULT_DATA_PATH))
        cfg.data_path = std::string("../") + DEFAULT_DATA_PATH;

    patterns::ProcessOptions options;
    options.config = cfg.patterns;
    options.output_path = cfg.output_path;
    options.report_path = cfg.report_path;
    options.print_summary = !cfg.quiet;

    patterns::ProcessResult result;
    patterns::PatternError err;
    bool ok = cfg.latest_dir.empty()
        ? patterns::processFile(cfg.data_path, options, result, err)
        : patterns::processLatestFile(cfg.latest_dir, cfg.latest_prefix, options, result, err);
    if (!ok) {
        std::cerr << "Pattern analysis failed: " << err.describe() << "\n";
        return 1;
    }

    if (!cfg.dates_tag.empty()) printDates(result, cfg.dates_tag);
    if (!cfg.quiet) {
        std::cout << "Labeled data written to " << result.output_path << "\n";
        if (!cfg.report_path.empty())
            std::cout << "Report written to " << cfg.report_path << "\n";
    }
    return 0;
}
