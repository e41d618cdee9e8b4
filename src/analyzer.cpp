#include "analyzer.hpp"
#include "candle_window.hpp"
#include "validator.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>
#include <thread>

namespace patterns {

bool LabeledRow::has(Pattern p) const {
    if (hits.empty()) {
        // Rows rebuilt from a stored "pattern" column carry only the label.
        const auto parsed = parseLabel(label);
        return std::find(parsed.begin(), parsed.end(), p) != parsed.end();
    }
    return std::find(hits.begin(), hits.end(), p) != hits.end();
}

PatternAnalyzer::PatternAnalyzer(const PatternConfig& cfg)
    : cfg_(cfg)
    , detectors_(createDefaultDetectors(cfg))
{
}

bool PatternAnalyzer::checkConfig(PatternError& err) const {
    std::string msg;
    if (!validatePatternConfig(cfg_, msg)) {
        err.set(ErrorKind::ConfigError, msg);
        return false;
    }
    return true;
}

void PatternAnalyzer::labelRange(const std::vector<Candle>& candles, std::size_t begin, std::size_t end,
                                 std::vector<LabeledRow>& rows) const {
    std::vector<Pattern> hits;
    for (std::size_t i = begin; i < end; ++i) {
        hits.clear();
        for (const auto& detector : detectors_) {
            // Windows that would start before the first candle never fire.
            auto window = CandleWindow::endingAt(candles, i, detector->windowSize());
            if (!window) continue;
            detector->detect(*window, hits);
        }
        canonicalize(hits);
        LabeledRow& row = rows[i];
        row.candle = candles[i];
        row.label = joinLabel(hits);
        row.hits = hits;
    }
}

bool PatternAnalyzer::analyze(const std::vector<Candle>& candles, AnalysisResult& result,
                              PatternError& err) const {
    result = AnalysisResult{};
    if (!checkConfig(err)) return false;
    if (candles.empty()) {
        err.set(ErrorKind::EmptyInputError, "no candles to analyze");
        return false;
    }

    // Validation pass: strict fails on the first bad candle, permissive filters it out.
    std::vector<Candle> seq;
    std::vector<SkippedRow> skipped;
    seq.reserve(candles.size());
    for (const Candle& c : candles) {
        PatternError candle_err;
        if (validateCandle(c, candle_err)) {
            seq.push_back(c);
            continue;
        }
        if (!cfg_.skip_invalid_rows) {
            err = candle_err;
            return false;
        }
        std::cerr << "Skipping " << candle_err.describe() << "\n";
        skipped.push_back({ c.source_row, c.date, candle_err.message });
    }
    if (seq.empty()) {
        err.set(ErrorKind::EmptyInputError, "all " + std::to_string(candles.size()) + " candles were invalid");
        return false;
    }
    if (!checkOrdered(seq, err)) return false;

    std::vector<LabeledRow> rows(seq.size());
    const std::size_t n = seq.size();
    const std::size_t threads = std::min<std::size_t>(static_cast<std::size_t>(cfg_.worker_threads), n);

    if (threads <= 1) {
        labelRange(seq, 0, n, rows);
    } else {
        // Contiguous chunks; each thread writes only rows[begin, end).
        std::vector<std::thread> workers;
        workers.reserve(threads);
        const std::size_t chunk = (n + threads - 1) / threads;
        std::size_t begin = 0;
        for (; begin < n; begin += chunk) {
            const std::size_t end = std::min(n, begin + chunk);
            try {
                workers.emplace_back([this, &seq, &rows, begin, end]() { labelRange(seq, begin, end, rows); });
            } catch (const std::system_error& e) {
                std::cerr << "Worker thread failed to start (" << e.what()
                          << "), labeling rows " << begin << ".." << n << " on the calling thread\n";
                break;
            }
        }
        for (auto& w : workers) w.join();
        if (begin < n) labelRange(seq, begin, n, rows);
    }

    result.rows = std::move(rows);
    result.skipped = std::move(skipped);
    return true;
}

bool PatternAnalyzer::analyzeTable(const Table& table, AnalysisResult& result, PatternError& err) const {
    result = AnalysisResult{};
    if (!checkConfig(err)) return false;
    IngestResult ingest;
    if (!ingestTable(table, cfg_, ingest, err)) return false;
    if (!analyze(ingest.candles, result, err)) return false;
    result.skipped = std::move(ingest.skipped);
    return true;
}

bool analyzePatterns(const std::vector<Candle>& candles, const PatternConfig& cfg,
                     std::vector<LabeledRow>& out, PatternError& err) {
    PatternAnalyzer analyzer(cfg);
    AnalysisResult result;
    if (!analyzer.analyze(candles, result, err)) return false;
    out = std::move(result.rows);
    return true;
}

} // namespace patterns
