#include "complexity/cyclomatic_complexity.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <utility>

namespace sasmetrics::complexity {

void CyclomaticComplexity::finalize(analysis::MetricsRecord &record) const {
    if (record.finalized) {
        spdlog::warn("Metrics for {} are already final, not recomputing", record.unit_name);
        return;
    }

    record.cyclomatic_complexity = compute(record.conditionals, record.loops);
    spdlog::debug("Cyclomatic complexity of {}: {} ({} conditionals, {} loops)",
                 record.unit_name, record.cyclomatic_complexity,
                 record.conditionals, record.loops);

    if (record.cyclomatic_complexity > threshold_) {
        analysis::Issue issue;
        issue.kind = analysis::IssueKind::HighComplexity;
        issue.value = record.cyclomatic_complexity;
        issue.message = fmt::format("Cyclomatic complexity {} exceeds threshold {}",
                                    record.cyclomatic_complexity, threshold_);
        record.issues.push_back(std::move(issue));
    }

    record.finalized = true;
}

} // namespace sasmetrics::complexity
