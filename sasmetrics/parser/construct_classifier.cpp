#include "parser/construct_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

namespace sasmetrics::parser {

namespace {

constexpr auto npos = std::string::npos;

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string to_lower(const std::string &text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

size_t skip_spaces(const std::string &text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
        ++pos;
    }
    return pos;
}

size_t identifier_end(const std::string &text, size_t pos) {
    while (pos < text.size() && is_word_char(text[pos])) {
        ++pos;
    }
    return pos;
}

bool keyword_at(const std::string &lowered, size_t pos, const std::string &word) {
    return pos <= lowered.size() && lowered.compare(pos, word.size(), word) == 0;
}

// First whole-word occurrence of `word` at or after `from`
size_t find_word(const std::string &lowered, const std::string &word, size_t from = 0) {
    for (size_t pos = lowered.find(word, from); pos != npos; pos = lowered.find(word, pos + 1)) {
        const size_t end = pos + word.size();
        const bool starts = pos == 0 || !is_word_char(lowered[pos - 1]);
        const bool ends = end == lowered.size() || !is_word_char(lowered[end]);
        if (starts && ends) {
            return pos;
        }
    }
    return npos;
}

// `if` followed anywhere later by `then`
bool has_conditional(const std::string &lowered) {
    const size_t pos = find_word(lowered, "if");
    return pos != npos && find_word(lowered, "then", pos + 2) != npos;
}

// `do` followed anywhere later by `while`, `until` or a terminator
bool has_loop_open(const std::string &lowered) {
    const size_t pos = find_word(lowered, "do");
    if (pos == npos) {
        return false;
    }
    const size_t after = pos + 2;
    return lowered.find(';', after) != npos ||
           find_word(lowered, "while", after) != npos ||
           find_word(lowered, "until", after) != npos;
}

// `end`, optional blanks, terminator
bool has_block_close(const std::string &lowered) {
    for (size_t pos = lowered.find("end"); pos != npos; pos = lowered.find("end", pos + 1)) {
        if (pos > 0 && is_word_char(lowered[pos - 1])) {
            continue;
        }
        const size_t next = skip_spaces(lowered, pos + 3);
        if (next < lowered.size() && lowered[next] == ';') {
            return true;
        }
    }
    return false;
}

// Start of the word after `keyword` at `pos` and at least one blank, npos otherwise
size_t operand_after(const std::string &lowered, size_t pos, const std::string &keyword) {
    if (!keyword_at(lowered, pos, keyword)) {
        return npos;
    }
    const size_t after = pos + keyword.size();
    const size_t operand = skip_spaces(lowered, after);
    return operand > after && operand < lowered.size() ? operand : npos;
}

bool has_query_block(const std::string &lowered) {
    for (size_t pos = find_word(lowered, "proc"); pos != npos; pos = find_word(lowered, "proc", pos + 1)) {
        const size_t operand = operand_after(lowered, pos, "proc");
        if (operand != npos && keyword_at(lowered, operand, "sql") &&
            (operand + 3 == lowered.size() || !is_word_char(lowered[operand + 3]))) {
            return true;
        }
    }
    return false;
}

ConstructEvent make_event(ConstructKind kind, size_t line_number) {
    ConstructEvent event;
    event.kind = kind;
    event.line_number = line_number;
    return event;
}

} // namespace

const char* to_string(ConstructKind kind) {
    switch (kind) {
        case ConstructKind::Conditional:
            return "conditional";
        case ConstructKind::LoopOpen:
            return "loop-open";
        case ConstructKind::BlockClose:
            return "block-close";
        case ConstructKind::StepHeader:
            return "step-header";
        case ConstructKind::MacroDefinition:
            return "macro-definition";
        case ConstructKind::MacroCall:
            return "macro-call";
        case ConstructKind::DataMerge:
            return "data-merge";
        case ConstructKind::QueryBlock:
            return "query-block";
    }
    return "unknown";
}

const char* to_string(StepFamily family) {
    switch (family) {
        case StepFamily::DataStep:
            return "data";
        case StepFamily::ProcStep:
            return "proc";
    }
    return "unknown";
}

std::vector<ConstructEvent> ConstructClassifier::classify(const Segment &segment) const {
    std::vector<ConstructEvent> events;
    const std::string &text = segment.text;

    if (text.empty()) {
        return events;
    }

    const std::string lowered = to_lower(text);

    collect_step_headers(segment, lowered, events);

    if (has_query_block(lowered)) {
        events.push_back(make_event(ConstructKind::QueryBlock, segment.line_number));
    }

    collect_macro_definition(segment, lowered, events);
    collect_macro_calls(segment, lowered, events);

    if (find_word(lowered, "merge") != npos) {
        events.push_back(make_event(ConstructKind::DataMerge, segment.line_number));
    }
    if (has_conditional(lowered)) {
        events.push_back(make_event(ConstructKind::Conditional, segment.line_number));
    }
    if (has_loop_open(lowered)) {
        events.push_back(make_event(ConstructKind::LoopOpen, segment.line_number));
    }
    if (has_block_close(lowered)) {
        events.push_back(make_event(ConstructKind::BlockClose, segment.line_number));
    }

    for (const auto& event : events) {
        spdlog::debug("Line {}: {}", event.line_number, to_string(event.kind));
    }

    return events;
}

size_t ConstructClassifier::count_parameters(const std::string &parameter_list) {
    const bool blank = std::all_of(parameter_list.begin(), parameter_list.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        return 0;
    }
    return static_cast<size_t>(std::count(parameter_list.begin(), parameter_list.end(), ',')) + 1;
}

// Headers only count at the start of a statement. A data step also needs a
// terminator somewhere after its name.
void ConstructClassifier::collect_step_headers(const Segment &segment, const std::string &lowered,
                                               std::vector<ConstructEvent> &events) const {
    const std::string &text = segment.text;

    for (size_t start = 0; start != npos && start < lowered.size();) {
        const size_t keyword = skip_spaces(lowered, start);

        size_t name = operand_after(lowered, keyword, "data");
        if (name != npos && (is_identifier_start(lowered[name]) || lowered[name] == '&')) {
            size_t end = name + 1;
            while (end < lowered.size() &&
                   (is_word_char(lowered[end]) || lowered[end] == '.' || lowered[end] == '&')) {
                ++end;
            }
            if (lowered.find(';', end) != npos) {
                ConstructEvent event = make_event(ConstructKind::StepHeader, segment.line_number);
                event.step_family = StepFamily::DataStep;
                event.name = text.substr(name, end - name);
                events.push_back(std::move(event));
            }
        } else {
            name = operand_after(lowered, keyword, "proc");
            if (name != npos && is_identifier_start(lowered[name])) {
                ConstructEvent event = make_event(ConstructKind::StepHeader, segment.line_number);
                event.step_family = StepFamily::ProcStep;
                event.name = text.substr(name, identifier_end(lowered, name + 1) - name);
                events.push_back(std::move(event));
            }
        }

        start = lowered.find(';', start);
        if (start != npos) {
            ++start;
        }
    }
}

void ConstructClassifier::collect_macro_definition(const Segment &segment, const std::string &lowered,
                                                   std::vector<ConstructEvent> &events) const {
    const std::string &text = segment.text;

    for (size_t pos = lowered.find("%macro"); pos != npos; pos = lowered.find("%macro", pos + 1)) {
        const size_t name = operand_after(lowered, pos, "%macro");
        if (name == npos || !is_identifier_start(lowered[name])) {
            continue;
        }
        const size_t name_end = identifier_end(lowered, name + 1);

        ConstructEvent event = make_event(ConstructKind::MacroDefinition, segment.line_number);
        MacroDefinition macro;
        macro.name = text.substr(name, name_end - name);

        // An unterminated list runs to the end of the segment
        const size_t open = skip_spaces(lowered, name_end);
        if (open < lowered.size() && lowered[open] == '(') {
            const size_t close = lowered.find(')', open + 1);
            const size_t stop = close == npos ? lowered.size() : close;
            macro.parameter_count = count_parameters(text.substr(open + 1, stop - open - 1));
        }
        event.name = macro.name;
        event.macro = std::move(macro);

        events.push_back(std::move(event));
        return;
    }
}

void ConstructClassifier::collect_macro_calls(const Segment &segment, const std::string &lowered,
                                              std::vector<ConstructEvent> &events) const {
    size_t pos = lowered.find('%');
    while (pos != npos) {
        const size_t name = pos + 1;
        if (name < lowered.size() && is_identifier_start(lowered[name])) {
            const size_t name_end = identifier_end(lowered, name + 1);
            if (name_end < lowered.size() && lowered[name_end] == '(') {
                ConstructEvent event = make_event(ConstructKind::MacroCall, segment.line_number);
                event.name = segment.text.substr(name, name_end - name);
                events.push_back(std::move(event));
                pos = lowered.find('%', name_end + 1);
                continue;
            }
        }
        pos = lowered.find('%', pos + 1);
    }
}

} // namespace sasmetrics::parser
