#ifndef SASMETRICS_PARSER_CONSTRUCT_CLASSIFIER_HPP
#define SASMETRICS_PARSER_CONSTRUCT_CLASSIFIER_HPP

#pragma once

#include "parser/construct.hpp"
#include <string>
#include <vector>

namespace sasmetrics::parser {

// Lexical, segment-local construct detection. Keyword matching is
// case-insensitive and never fails: malformed input just matches less.
//
// Events come back in a fixed order: step headers, query block, macro
// definition, macro calls, merge, conditional, loop open, block close.
// Whether a BlockClose actually closes anything is decided by the
// NestingTracker, not here.
class ConstructClassifier {
public:
    std::vector<ConstructEvent> classify(const Segment &segment) const;

    // commas + 1 for a non-blank list, 0 otherwise
    static size_t count_parameters(const std::string &parameter_list);

private:
    void collect_step_headers(const Segment &segment, const std::string &lowered,
                              std::vector<ConstructEvent> &events) const;
    void collect_macro_definition(const Segment &segment, const std::string &lowered,
                                  std::vector<ConstructEvent> &events) const;
    void collect_macro_calls(const Segment &segment, const std::string &lowered,
                             std::vector<ConstructEvent> &events) const;
};

} // namespace sasmetrics::parser

#endif // SASMETRICS_PARSER_CONSTRUCT_CLASSIFIER_HPP
