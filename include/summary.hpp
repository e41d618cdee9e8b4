#pragma once

#include "analyzer.hpp"
#include "pattern.hpp"
#include <map>
#include <string>
#include <vector>

namespace patterns {

struct PatternStats {
    int count{0};
    std::vector<std::string> dates;  // row order (ascending date)
};

/// Only patterns that fired at least once appear. Keyed in canonical order.
using PatternSummary = std::map<Pattern, PatternStats>;

/// Occurrence count and dates for every pattern present in any row.
/// A row with no hits is read through its label, so rows loaded from a labeled file count too.
PatternSummary getPatternSummary(const std::vector<LabeledRow>& rows);

/// Dates of the rows carrying `pattern`, in row order. Empty if it never fired.
std::vector<std::string> getPatternDates(const std::vector<LabeledRow>& rows, Pattern pattern);

/// Same, with the tag given as text ("Doji", "shooting_star"). Unknown tags give an empty list.
std::vector<std::string> getPatternDates(const std::vector<LabeledRow>& rows, const std::string& tag);

} // namespace patterns
