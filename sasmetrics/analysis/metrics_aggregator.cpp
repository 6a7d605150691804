#include "analysis/metrics_aggregator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <utility>

namespace sasmetrics::analysis {

using parser::ConstructKind;

MetricsAggregator::MetricsAggregator(std::string unit_name,
                                     parser::ScanMode mode,
                                     size_t max_macro_parameters)
    : max_macro_parameters_(max_macro_parameters)
{
    record_.unit_name = std::move(unit_name);
    record_.scan_mode = mode;
}

void MetricsAggregator::add(const parser::ConstructEvent &event) {
    switch (event.kind) {
        case ConstructKind::StepHeader:
            if (event.step_family == parser::StepFamily::ProcStep) {
                ++record_.proc_steps;
            } else {
                ++record_.data_steps;
            }
            break;
        case ConstructKind::MacroDefinition:
            add_macro_definition(event);
            break;
        case ConstructKind::MacroCall:
            ++record_.macro_calls;
            break;
        case ConstructKind::Conditional:
            ++record_.conditionals;
            add_decision_point("if-then", event.line_number);
            break;
        case ConstructKind::LoopOpen:
            ++record_.loops;
            add_decision_point("do loop", event.line_number);
            break;
        case ConstructKind::DataMerge:
            ++record_.data_merges;
            break;
        case ConstructKind::QueryBlock:
            ++record_.query_blocks;
            break;
        case ConstructKind::BlockClose:
            // Depth only, nothing to count
            break;
    }
}

void MetricsAggregator::add_macro_definition(const parser::ConstructEvent &event) {
    ++record_.macro_definitions;
    if (!event.macro) {
        return;
    }

    const auto& macro = *event.macro;
    spdlog::debug("Macro {} declares {} parameters at line {}",
                 macro.name, macro.parameter_count, event.line_number);

    if (macro.parameter_count > max_macro_parameters_) {
        Issue issue;
        issue.kind = IssueKind::ExcessMacroParameters;
        issue.subject = macro.name;
        issue.value = macro.parameter_count;
        issue.line_number = event.line_number;
        issue.message = fmt::format("Macro '{}' declares {} parameters (limit {})",
                                    macro.name, macro.parameter_count, max_macro_parameters_);
        record_.issues.push_back(std::move(issue));
    }
}

void MetricsAggregator::add_decision_point(const std::string &description, size_t line_number) {
    record_.decision_points.push_back({description, line_number});
    spdlog::debug("Added decision point: +1 for {} at line {}", description, line_number);
}

} // namespace sasmetrics::analysis
