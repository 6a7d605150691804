#include "parser/source_lexer.hpp"
#include <cctype>
#include <spdlog/spdlog.h>

namespace sasmetrics::parser {

namespace {

enum class LexState {
    Code,
    BlockComment,
    CommentStatement,
    Quoted
};

bool is_blank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

const char* to_string(ScanMode mode) {
    switch (mode) {
        case ScanMode::Line:
            return "line";
        case ScanMode::Statement:
            return "statement";
    }
    return "unknown";
}

std::vector<Segment> SourceLexer::split(const std::string &content) const {
    if (mode_ == ScanMode::Statement) {
        return split_statements(content);
    }
    return split_lines(content);
}

std::vector<Segment> SourceLexer::split_lines(const std::string &content) {
    std::vector<Segment> segments;
    size_t line_number = 1;
    size_t start = 0;

    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            end = content.size();
        }

        std::string text = content.substr(start, end - start);
        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
        }
        segments.push_back({std::move(text), line_number});

        ++line_number;
        start = end + 1;
    }

    return segments;
}

std::vector<Segment> SourceLexer::split_statements(const std::string &content) {
    std::vector<Segment> segments;
    const std::string masked = mask_comments_and_strings(content);

    std::string current;
    size_t line_number = 1;
    size_t start_line = 1;

    for (char c : masked) {
        if (c == '\n') {
            ++line_number;
            if (!current.empty()) {
                current += ' ';
            }
            continue;
        }
        if (c == '\r') {
            continue;
        }
        if (current.empty()) {
            if (is_blank(c)) {
                continue;
            }
            start_line = line_number;
        }

        current += c;
        if (c == ';') {
            segments.push_back({std::move(current), start_line});
            current.clear();
        }
    }

    // Trailing text without a terminator is still scanned
    if (!current.empty()) {
        segments.push_back({std::move(current), start_line});
    }

    spdlog::debug("Split {} bytes into {} statements", content.size(), segments.size());
    return segments;
}

std::string SourceLexer::mask_comments_and_strings(const std::string &content) {
    std::string masked = content;
    LexState state = LexState::Code;
    char quote = '\0';
    bool at_statement_start = true;

    auto blank = [&masked](size_t i) {
        if (masked[i] != '\n' && masked[i] != '\r') {
            masked[i] = ' ';
        }
    };

    for (size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        const char next = i + 1 < content.size() ? content[i + 1] : '\0';

        switch (state) {
            case LexState::Code:
                if (c == '/' && next == '*') {
                    state = LexState::BlockComment;
                    blank(i);
                    blank(++i);
                } else if (at_statement_start && c == '*') {
                    state = LexState::CommentStatement;
                    blank(i);
                } else if (at_statement_start && c == '%' && next == '*') {
                    state = LexState::CommentStatement;
                    blank(i);
                    blank(++i);
                } else if (c == '\'' || c == '"') {
                    state = LexState::Quoted;
                    quote = c;
                    at_statement_start = false;
                } else if (c == ';') {
                    at_statement_start = true;
                } else if (!is_blank(c)) {
                    at_statement_start = false;
                }
                break;

            case LexState::BlockComment:
                if (c == '*' && next == '/') {
                    blank(i);
                    blank(++i);
                    state = LexState::Code;
                } else {
                    blank(i);
                }
                break;

            case LexState::CommentStatement:
                // The terminator belongs to the comment
                blank(i);
                if (c == ';') {
                    state = LexState::Code;
                    at_statement_start = true;
                }
                break;

            case LexState::Quoted:
                // A doubled quote closes and immediately reopens the literal
                if (c == quote) {
                    state = LexState::Code;
                } else {
                    blank(i);
                }
                break;
        }
    }

    if (state != LexState::Code) {
        spdlog::debug("Unterminated comment or literal at end of input");
    }

    return masked;
}

} // namespace sasmetrics::parser
