#ifndef SASMETRICS_PARSER_SOURCE_LEXER_HPP
#define SASMETRICS_PARSER_SOURCE_LEXER_HPP

#pragma once

#include "parser/construct.hpp"
#include <string>
#include <vector>

namespace sasmetrics::parser {

enum class ScanMode {
    // One segment per physical line, text untouched
    Line,
    // One segment per ';'-terminated statement, comments and literals blanked
    Statement
};

const char* to_string(ScanMode mode);

class SourceLexer {
public:
    explicit SourceLexer(ScanMode mode) : mode_(mode) {}

    std::vector<Segment> split(const std::string &content) const;

    static std::vector<Segment> split_lines(const std::string &content);
    static std::vector<Segment> split_statements(const std::string &content);

    // Replaces block comments, comment statements and the contents of quoted
    // literals with blanks. Newlines are kept so line numbers stay valid.
    static std::string mask_comments_and_strings(const std::string &content);

private:
    ScanMode mode_;
};

} // namespace sasmetrics::parser

#endif // SASMETRICS_PARSER_SOURCE_LEXER_HPP
