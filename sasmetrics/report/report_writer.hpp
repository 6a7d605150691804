#ifndef SASMETRICS_REPORT_REPORT_WRITER_HPP
#define SASMETRICS_REPORT_REPORT_WRITER_HPP

#pragma once

#include "analysis/metrics.hpp"
#include <string>
#include <vector>
#include <llvm/Support/raw_ostream.h>

namespace sasmetrics::report {

enum class OutputFormat {
    Markdown,
    Json,
    Text
};

constexpr const char* kNoIssuesMarker = "No issues found.";

void write_markdown(const analysis::MetricsRecord &record, llvm::raw_ostream &os, bool verbose = false);
void write_json(const std::vector<analysis::MetricsRecord> &records, llvm::raw_ostream &os);
void write_text(const std::vector<analysis::MetricsRecord> &records, llvm::raw_ostream &os, bool verbose = false);

// Only markdown reports can be written as one file per unit
bool supports_output_dir(OutputFormat format);

// "<stem>_metrics.md"
std::string markdown_file_name(const std::string &unit_name);

// Writes one markdown report per record into output_dir and returns the
// paths written. Throws std::runtime_error when a file cannot be created.
std::vector<std::string> write_markdown_files(const std::vector<analysis::MetricsRecord> &records,
                                              const std::string &output_dir,
                                              bool verbose = false);

} // namespace sasmetrics::report

#endif // SASMETRICS_REPORT_REPORT_WRITER_HPP
