#ifndef SASMETRICS_COMPLEXITY_CYCLOMATIC_COMPLEXITY_HPP
#define SASMETRICS_COMPLEXITY_CYCLOMATIC_COMPLEXITY_HPP

#pragma once

#include "analysis/metrics.hpp"
#include "analysis/options.hpp"

namespace sasmetrics::complexity {

// McCabe complexity approximated from counted decision points:
// conditionals + loops + 1. Every if-then and every do counts once.
class CyclomaticComplexity {
public:
    explicit CyclomaticComplexity(size_t threshold = analysis::kDefaultComplexityThreshold)
        : threshold_(threshold) {}

    static size_t compute(size_t conditionals, size_t loops) { return conditionals + loops + 1; }

    // Stores the score, raises "high-complexity" above the threshold and
    // freezes the record. A record that is already final is left alone.
    void finalize(analysis::MetricsRecord &record) const;

    size_t threshold() const { return threshold_; }

private:
    size_t threshold_;
};

} // namespace sasmetrics::complexity

#endif // SASMETRICS_COMPLEXITY_CYCLOMATIC_COMPLEXITY_HPP
