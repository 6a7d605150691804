#ifndef SASMETRICS_ANALYSIS_METRICS_HPP
#define SASMETRICS_ANALYSIS_METRICS_HPP

#pragma once

#include "parser/source_lexer.hpp"
#include <string>
#include <vector>

namespace sasmetrics::analysis {

enum class IssueKind {
    ExcessMacroParameters,
    HighComplexity
};

const char* to_string(IssueKind kind);

struct Issue {
    IssueKind kind{IssueKind::ExcessMacroParameters};
    std::string message;
    // Macro name for ExcessMacroParameters, empty otherwise
    std::string subject;
    // Parameter count or complexity score
    size_t value{0};
    // 0 when the issue concerns the whole unit
    size_t line_number{0};
};

struct DecisionPoint {
    std::string description;
    size_t line_number{0};
};

// Everything measured for one source unit. Counts only grow during a scan;
// once `finalized` is set the record is read-only.
struct MetricsRecord {
    std::string unit_name;
    parser::ScanMode scan_mode{parser::ScanMode::Line};
    size_t lines_scanned{0};

    size_t data_steps{0};
    size_t proc_steps{0};
    size_t macro_definitions{0};
    size_t macro_calls{0};
    size_t conditionals{0};
    size_t loops{0};
    size_t data_merges{0};
    size_t query_blocks{0};
    size_t max_nesting_depth{0};
    size_t cyclomatic_complexity{1};

    std::vector<DecisionPoint> decision_points;
    std::vector<Issue> issues;
    bool finalized{false};

    size_t step_headers() const { return data_steps + proc_steps; }
};

bool operator==(const Issue &lhs, const Issue &rhs);
bool operator==(const DecisionPoint &lhs, const DecisionPoint &rhs);
bool operator==(const MetricsRecord &lhs, const MetricsRecord &rhs);
inline bool operator!=(const MetricsRecord &lhs, const MetricsRecord &rhs) { return !(lhs == rhs); }

} // namespace sasmetrics::analysis

#endif // SASMETRICS_ANALYSIS_METRICS_HPP
