#ifndef SASMETRICS_PARSER_CONSTRUCT_HPP
#define SASMETRICS_PARSER_CONSTRUCT_HPP

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sasmetrics::parser {

enum class ConstructKind {
    Conditional,
    LoopOpen,
    BlockClose,
    StepHeader,
    MacroDefinition,
    MacroCall,
    DataMerge,
    QueryBlock
};

// The two families of top-level processing blocks
enum class StepFamily {
    DataStep,
    ProcStep
};

struct MacroDefinition {
    std::string name;
    size_t parameter_count{0};
};

struct ConstructEvent {
    ConstructKind kind{ConstructKind::Conditional};
    size_t line_number{0};

    // StepHeader only
    std::optional<StepFamily> step_family;
    // Step identifier for StepHeader, callee for MacroCall
    std::string name;
    // MacroDefinition only
    std::optional<MacroDefinition> macro;
};

// A unit of text handed to the classifier, tagged with the line it starts on
struct Segment {
    std::string text;
    size_t line_number{0};
};

const char* to_string(ConstructKind kind);
const char* to_string(StepFamily family);

} // namespace sasmetrics::parser

#endif // SASMETRICS_PARSER_CONSTRUCT_HPP
