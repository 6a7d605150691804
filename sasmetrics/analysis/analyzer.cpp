#include "analysis/analyzer.hpp"
#include "analysis/metrics_aggregator.hpp"
#include "complexity/cyclomatic_complexity.hpp"
#include "complexity/nesting_tracker.hpp"
#include "parser/construct_classifier.hpp"
#include "parser/source_lexer.hpp"
#include "utils/filesystem.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace sasmetrics::analysis {

MetricsRecord analyze_source(const SourceUnit &unit, const AnalysisOptions &options) {
    const parser::SourceLexer lexer(options.mode);
    const parser::ConstructClassifier classifier{};
    complexity::NestingTracker nesting;
    MetricsAggregator aggregator(unit.name, options.mode, options.max_macro_parameters);

    const auto segments = lexer.split(unit.content);
    spdlog::debug("Scanning {} as {} {} segments", unit.name, segments.size(), parser::to_string(options.mode));

    for (const auto& segment : segments) {
        for (const auto& event : classifier.classify(segment)) {
            if (event.kind == parser::ConstructKind::LoopOpen) {
                nesting.open_block();
            } else if (event.kind == parser::ConstructKind::BlockClose) {
                if (!nesting.close_block()) {
                    spdlog::debug("{}:{}: end without an open block", unit.name, event.line_number);
                }
            }
            aggregator.add(event);
        }
    }

    if (nesting.depth() > 0) {
        spdlog::debug("{}: {} blocks still open at end of input", unit.name, nesting.depth());
    }

    aggregator.set_lines_scanned(parser::SourceLexer::split_lines(unit.content).size());
    aggregator.set_max_nesting_depth(nesting.max_depth());

    MetricsRecord record = aggregator.release();
    complexity::CyclomaticComplexity(options.complexity_threshold).finalize(record);
    return record;
}

MetricsRecord Analyzer::analyze_file(const std::string& file_path) const {
    spdlog::info("Analyzing file: {}", file_path);

    SourceUnit unit;
    unit.name = utils::normalize_path(file_path);
    unit.content = utils::read_file_content(file_path);

    return analyze_source(unit, options_);
}

BatchResult Analyzer::analyze_directory(
    const std::string& directory_path,
    bool recursive
) const {
    BatchResult batch;

    auto files = utils::list_files(directory_path, recursive);
    for (const auto& file : files) {
        if (should_analyze_file(file)) {
            analyze_into(file, batch);
        } else {
            spdlog::debug("Skipping file: {}", file);
        }
    }

    std::sort(batch.reports.begin(), batch.reports.end(), [](const auto &a, const auto &b) {
        return a.unit_name < b.unit_name;
    });
    spdlog::info("Analyzed {} files in {} ({} failed)",
                 batch.reports.size(), directory_path, batch.failures.size());
    return batch;
}

BatchResult Analyzer::analyze_path(const std::string& path, bool recursive) const {
    const std::filesystem::path input_path(path);

    if (std::filesystem::is_regular_file(input_path)) {
        BatchResult batch;
        analyze_into(path, batch);
        return batch;
    }
    if (std::filesystem::is_directory(input_path)) {
        spdlog::info("Analyzing directory: {} (recursive: {})", path, recursive ? "yes" : "no");
        return analyze_directory(path, recursive);
    }

    throw std::runtime_error("Invalid input path: " + path);
}

bool Analyzer::should_analyze_file(const std::string& file_path) const {
    // Check if file matches any ignore patterns
    for (const auto& pattern : ignore_patterns_) {
        if (utils::matches_pattern(file_path, pattern)) {
            return false;
        }
    }

    return utils::has_extension(file_path, extension_);
}

void Analyzer::analyze_into(const std::string &file_path, BatchResult &batch) const {
    try {
        batch.reports.push_back(analyze_file(file_path));
    } catch (const std::exception& e) {
        spdlog::error("Failed to analyze file {}: {}", file_path, e.what());
        batch.failures.push_back({file_path, e.what()});
    }
}

} // namespace sasmetrics::analysis
