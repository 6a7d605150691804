#ifndef SASMETRICS_ANALYSIS_METRICS_AGGREGATOR_HPP
#define SASMETRICS_ANALYSIS_METRICS_AGGREGATOR_HPP

#pragma once

#include "analysis/metrics.hpp"
#include "parser/construct.hpp"
#include <string>
#include <utility>

namespace sasmetrics::analysis {

class MetricsAggregator {
public:
    MetricsAggregator(std::string unit_name, parser::ScanMode mode, size_t max_macro_parameters);

    void add(const parser::ConstructEvent &event);

    void set_lines_scanned(size_t lines) { record_.lines_scanned = lines; }
    void set_max_nesting_depth(size_t depth) { record_.max_nesting_depth = depth; }

    const MetricsRecord& record() const { return record_; }

    // Hands the record over; the aggregator must not be used afterwards.
    MetricsRecord release() { return std::move(record_); }

private:
    void add_macro_definition(const parser::ConstructEvent &event);
    void add_decision_point(const std::string &description, size_t line_number);

    MetricsRecord record_;
    size_t max_macro_parameters_;
};

} // namespace sasmetrics::analysis

#endif // SASMETRICS_ANALYSIS_METRICS_AGGREGATOR_HPP
