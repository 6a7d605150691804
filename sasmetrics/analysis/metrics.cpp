#include "analysis/metrics.hpp"
#include <tuple>

namespace sasmetrics::analysis {

const char* to_string(IssueKind kind) {
    switch (kind) {
        case IssueKind::ExcessMacroParameters:
            return "excess-macro-parameters";
        case IssueKind::HighComplexity:
            return "high-complexity";
    }
    return "unknown";
}

bool operator==(const Issue &lhs, const Issue &rhs) {
    return std::tie(lhs.kind, lhs.message, lhs.subject, lhs.value, lhs.line_number) ==
           std::tie(rhs.kind, rhs.message, rhs.subject, rhs.value, rhs.line_number);
}

bool operator==(const DecisionPoint &lhs, const DecisionPoint &rhs) {
    return lhs.description == rhs.description && lhs.line_number == rhs.line_number;
}

bool operator==(const MetricsRecord &lhs, const MetricsRecord &rhs) {
    return std::tie(lhs.unit_name, lhs.scan_mode, lhs.lines_scanned,
                    lhs.data_steps, lhs.proc_steps, lhs.macro_definitions, lhs.macro_calls,
                    lhs.conditionals, lhs.loops, lhs.data_merges, lhs.query_blocks,
                    lhs.max_nesting_depth, lhs.cyclomatic_complexity,
                    lhs.decision_points, lhs.issues, lhs.finalized) ==
           std::tie(rhs.unit_name, rhs.scan_mode, rhs.lines_scanned,
                    rhs.data_steps, rhs.proc_steps, rhs.macro_definitions, rhs.macro_calls,
                    rhs.conditionals, rhs.loops, rhs.data_merges, rhs.query_blocks,
                    rhs.max_nesting_depth, rhs.cyclomatic_complexity,
                    rhs.decision_points, rhs.issues, rhs.finalized);
}

} // namespace sasmetrics::analysis
