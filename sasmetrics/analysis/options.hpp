#ifndef SASMETRICS_ANALYSIS_OPTIONS_HPP
#define SASMETRICS_ANALYSIS_OPTIONS_HPP

#pragma once

#include "parser/source_lexer.hpp"
#include <cstddef>

namespace sasmetrics::analysis {

constexpr size_t kDefaultComplexityThreshold = 10;
constexpr size_t kDefaultMaxMacroParameters = 3;

struct AnalysisOptions {
    parser::ScanMode mode {parser::ScanMode::Line};
    // A score strictly above this raises "high-complexity"
    size_t complexity_threshold {kDefaultComplexityThreshold};
    // A macro declaring more parameters than this raises "excess-macro-parameters"
    size_t max_macro_parameters {kDefaultMaxMacroParameters};
};

} // namespace sasmetrics::analysis

#endif // SASMETRICS_ANALYSIS_OPTIONS_HPP
