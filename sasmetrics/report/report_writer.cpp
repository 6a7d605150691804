#include "report/report_writer.hpp"
#include <cstdint>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/JSON.h>
#include <spdlog/spdlog.h>

namespace sasmetrics::report {

namespace {

int64_t json_count(size_t value) {
    return static_cast<int64_t>(value);
}

// json::Value only accepts valid UTF-8
std::string json_text(const std::string &text) {
    return llvm::json::isUTF8(text) ? text : llvm::json::fixUTF8(text);
}

size_t total_complexity(const std::vector<analysis::MetricsRecord> &records) {
    size_t total = 0;
    for (const auto& record : records) {
        total += record.cyclomatic_complexity;
    }
    return total;
}

void write_table_row(llvm::raw_ostream &os, const char* metric, size_t value) {
    os << "| " << metric << " | " << value << " |\n";
}

} // namespace

void write_markdown(const analysis::MetricsRecord &record, llvm::raw_ostream &os, bool verbose) {
    os << "# Metrics report: " << record.unit_name << "\n\n"
       << "Scan mode: " << parser::to_string(record.scan_mode) << "  \n"
       << "Lines scanned: " << record.lines_scanned << "\n\n";

    os << "| Metric | Value |\n"
       << "|---|---|\n";
    write_table_row(os, "Data steps", record.data_steps);
    write_table_row(os, "Proc steps", record.proc_steps);
    write_table_row(os, "Macro definitions", record.macro_definitions);
    write_table_row(os, "Macro calls", record.macro_calls);
    write_table_row(os, "Conditionals", record.conditionals);
    write_table_row(os, "Loops", record.loops);
    write_table_row(os, "Merge operations", record.data_merges);
    write_table_row(os, "Query blocks", record.query_blocks);
    write_table_row(os, "Max nesting depth", record.max_nesting_depth);
    write_table_row(os, "Cyclomatic complexity", record.cyclomatic_complexity);

    os << "\n## Issues\n\n";
    if (record.issues.empty()) {
        os << kNoIssuesMarker << "\n";
    } else {
        for (const auto& issue : record.issues) {
            os << "- **" << analysis::to_string(issue.kind) << "**";
            if (issue.line_number > 0) {
                os << " (line " << issue.line_number << ")";
            }
            os << ": " << issue.message << "\n";
        }
    }

    if (verbose && !record.decision_points.empty()) {
        os << "\n## Decision points\n\n";
        for (const auto& point : record.decision_points) {
            os << "- line " << point.line_number << ": " << point.description << "\n";
        }
    }
}

void write_json(const std::vector<analysis::MetricsRecord> &records, llvm::raw_ostream &os) {
    llvm::json::OStream json(os, 2);

    json.object([&] {
        json.attribute("total_complexity", json_count(total_complexity(records)));
        json.attributeArray("results", [&] {
            for (const auto& record : records) {
                json.object([&] {
                    json.attribute("file", json_text(record.unit_name));
                    json.attribute("scan_mode", parser::to_string(record.scan_mode));
                    json.attribute("lines_scanned", json_count(record.lines_scanned));
                    json.attribute("data_steps", json_count(record.data_steps));
                    json.attribute("proc_steps", json_count(record.proc_steps));
                    json.attribute("macro_definitions", json_count(record.macro_definitions));
                    json.attribute("macro_calls", json_count(record.macro_calls));
                    json.attribute("conditionals", json_count(record.conditionals));
                    json.attribute("loops", json_count(record.loops));
                    json.attribute("data_merges", json_count(record.data_merges));
                    json.attribute("query_blocks", json_count(record.query_blocks));
                    json.attribute("max_nesting_depth", json_count(record.max_nesting_depth));
                    json.attribute("complexity", json_count(record.cyclomatic_complexity));
                    json.attributeArray("issues", [&] {
                        for (const auto& issue : record.issues) {
                            json.object([&] {
                                json.attribute("kind", analysis::to_string(issue.kind));
                                json.attribute("message", json_text(issue.message));
                                json.attribute("value", json_count(issue.value));
                                if (!issue.subject.empty()) {
                                    json.attribute("subject", json_text(issue.subject));
                                }
                                if (issue.line_number > 0) {
                                    json.attribute("line_number", json_count(issue.line_number));
                                }
                            });
                        }
                    });
                });
            }
        });
    });
    os << "\n";
}

void write_text(const std::vector<analysis::MetricsRecord> &records, llvm::raw_ostream &os, bool verbose) {
    for (const auto& record : records) {
        os << "File: " << record.unit_name << "\n"
           << "Steps: " << record.data_steps << " data, " << record.proc_steps << " proc\n"
           << "Macros: " << record.macro_definitions << " defined, " << record.macro_calls << " calls\n"
           << "Conditionals: " << record.conditionals << "\n"
           << "Loops: " << record.loops << " (max nesting " << record.max_nesting_depth << ")\n"
           << "Merges: " << record.data_merges << ", query blocks: " << record.query_blocks << "\n"
           << "Complexity: " << record.cyclomatic_complexity << "\n";

        if (verbose && !record.decision_points.empty()) {
            os << "Decision points:\n";
            for (const auto& point : record.decision_points) {
                os << "  - " << point.description << " (line " << point.line_number << ", +1)\n";
            }
        }

        if (record.issues.empty()) {
            os << "Issues: none\n";
        } else {
            os << "Issues:\n";
            for (const auto& issue : record.issues) {
                os << "  - [" << analysis::to_string(issue.kind) << "] " << issue.message << "\n";
            }
        }
        os << "\n";
    }
    // Total complexity
    os << "Total complexity: " << total_complexity(records) << "\n";
}

bool supports_output_dir(OutputFormat format) {
    return format == OutputFormat::Markdown;
}

std::string markdown_file_name(const std::string &unit_name) {
    std::string stem = std::filesystem::path(unit_name).stem().string();
    if (stem.empty()) {
        stem = "unit";
    }
    return stem + "_metrics.md";
}

std::vector<std::string> write_markdown_files(const std::vector<analysis::MetricsRecord> &records,
                                              const std::string &output_dir,
                                              bool verbose) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory: " + output_dir + " (" + ec.message() + ")");
    }

    std::vector<std::string> written;
    std::set<std::string> used_names;

    for (const auto& record : records) {
        std::string name = markdown_file_name(record.unit_name);
        // Units with the same stem in different directories
        for (size_t suffix = 2; used_names.count(name) > 0; ++suffix) {
            name = std::filesystem::path(markdown_file_name(record.unit_name)).stem().string() +
                   "_" + std::to_string(suffix) + ".md";
        }
        used_names.insert(name);

        const std::string path = (std::filesystem::path(output_dir) / name).string();
        llvm::raw_fd_ostream out(path, ec, llvm::sys::fs::OF_Text);
        if (ec) {
            throw std::runtime_error("Failed to open report file: " + path + " (" + ec.message() + ")");
        }

        write_markdown(record, out, verbose);
        out.close();
        if (out.has_error()) {
            out.clear_error();
            throw std::runtime_error("Failed to write report file: " + path);
        }

        spdlog::info("Report written to {}", path);
        written.push_back(path);
    }

    return written;
}

} // namespace sasmetrics::report
