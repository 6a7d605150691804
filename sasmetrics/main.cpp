#include "analysis/analyzer.hpp"
#include "report/report_writer.hpp"
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>
#include <spdlog/spdlog.h>

using namespace llvm;
using sasmetrics::parser::ScanMode;
using sasmetrics::report::OutputFormat;

// Command line options
static cl::OptionCategory SasMetricsCategory("sasmetrics Options");

static cl::opt<std::string> InputPath(
    cl::Positional,
    cl::desc("<input path>"),
    cl::Required,
    cl::cat(SasMetricsCategory));

static cl::opt<ScanMode> SegmentMode(
    "mode",
    cl::desc("How source text is cut into scan segments"),
    cl::values(
        clEnumValN(ScanMode::Line, "line", "One segment per physical line (default)"),
        clEnumValN(ScanMode::Statement, "statement", "One segment per statement, comments and strings ignored")),
    cl::init(ScanMode::Line),
    cl::cat(SasMetricsCategory));

static cl::opt<unsigned> ComplexityThreshold(
    "complexity-threshold",
    cl::desc("Report complexity above this value (default: 10)"),
    cl::init(sasmetrics::analysis::kDefaultComplexityThreshold),
    cl::cat(SasMetricsCategory));

static cl::opt<unsigned> MaxMacroParams(
    "max-macro-params",
    cl::desc("Report macros declaring more parameters than this (default: 3)"),
    cl::init(sasmetrics::analysis::kDefaultMaxMacroParameters),
    cl::cat(SasMetricsCategory));

static cl::opt<OutputFormat> ReportFormat(
    "format",
    cl::desc("Output format"),
    cl::values(
        clEnumValN(OutputFormat::Markdown, "markdown", "Markdown report per file (default)"),
        clEnumValN(OutputFormat::Json, "json", "JSON document"),
        clEnumValN(OutputFormat::Text, "text", "Plain text summary")),
    cl::init(OutputFormat::Markdown),
    cl::cat(SasMetricsCategory));

static cl::opt<std::string> OutputDir(
    "output",
    cl::desc("Write markdown reports into this directory instead of stdout"),
    cl::value_desc("dir"),
    cl::cat(SasMetricsCategory));

static cl::opt<std::string> Extension(
    "extension",
    cl::desc("Source file extension for directory scans (default: sas)"),
    cl::init("sas"),
    cl::cat(SasMetricsCategory));

static cl::list<std::string> IgnorePatterns(
    "ignore",
    cl::desc("Patterns to ignore (can be specified multiple times)"),
    cl::cat(SasMetricsCategory));

static cl::opt<bool> Recursive(
    "recursive",
    cl::desc("Recursively analyze directories"),
    cl::init(false),
    cl::cat(SasMetricsCategory));

static cl::opt<bool> Verbose(
    "verbose",
    cl::desc("Enable verbose output"),
    cl::init(false),
    cl::cat(SasMetricsCategory));

int main(int argc, char **argv) {
    InitLLVM X(argc, argv);

    // Parse command line options
    cl::HideUnrelatedOptions(SasMetricsCategory);
    cl::ParseCommandLineOptions(argc, argv, "sasmetrics - Complexity metrics for SAS programs\n");

    // Configure spdlog
    if (Verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    try {
        sasmetrics::analysis::AnalysisOptions options;
        options.mode = SegmentMode;
        options.complexity_threshold = ComplexityThreshold;
        options.max_macro_parameters = MaxMacroParams;

        sasmetrics::analysis::Analyzer analyzer(options);
        analyzer.set_extension(Extension.getValue());

        if (!IgnorePatterns.empty()) {
            analyzer.set_ignore_patterns(std::vector<std::string>(
                IgnorePatterns.begin(),
                IgnorePatterns.end()
            ));
        }

        auto batch = analyzer.analyze_path(InputPath.getValue(), Recursive);
        if (batch.reports.empty() && batch.failures.empty()) {
            spdlog::warn("No .{} files found under {}", analyzer.extension(), InputPath.getValue());
        }

        if (!OutputDir.empty() && !sasmetrics::report::supports_output_dir(ReportFormat.getValue())) {
            spdlog::warn("--output only applies to markdown reports, writing to stdout instead");
        }

        // Output results
        switch (ReportFormat.getValue()) {
            case OutputFormat::Json:
                sasmetrics::report::write_json(batch.reports, outs());
                break;
            case OutputFormat::Text:
                sasmetrics::report::write_text(batch.reports, outs(), Verbose);
                break;
            case OutputFormat::Markdown:
                if (!OutputDir.empty()) {
                    auto written = sasmetrics::report::write_markdown_files(batch.reports, OutputDir.getValue(), Verbose);
                    outs() << "Wrote " << written.size() << " report(s) to " << OutputDir.getValue() << "\n";
                } else {
                    for (const auto& record : batch.reports) {
                        sasmetrics::report::write_markdown(record, outs(), Verbose);
                        outs() << "\n";
                    }
                }
                break;
        }

        if (!batch.failures.empty()) {
            spdlog::error("{} file(s) could not be analyzed", batch.failures.size());
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("An error occurred: {}", e.what());
        return 1;
    }

    return 0;
}
