// analyzer.hpp
#ifndef SASMETRICS_ANALYSIS_ANALYZER_HPP
#define SASMETRICS_ANALYSIS_ANALYZER_HPP

#pragma once

#include "analysis/metrics.hpp"
#include "analysis/options.hpp"
#include <string>
#include <vector>

namespace sasmetrics::analysis {

struct SourceUnit {
    std::string name;
    std::string content;
};

struct AnalysisFailure {
    std::string file_path;
    std::string message;
};

struct BatchResult {
    std::vector<MetricsRecord> reports;
    std::vector<AnalysisFailure> failures;
};

// The metric-extraction engine. Every call starts from a fresh record and
// fresh nesting state, so results never depend on earlier calls. Never
// throws on content; any text yields a finalized record.
MetricsRecord analyze_source(const SourceUnit &unit, const AnalysisOptions &options = {});

// Resolves paths to source units and runs the engine once per unit.
// Holds configuration only.
class Analyzer {
public:
    explicit Analyzer(AnalysisOptions options = {}) : options_(options) {}

    // Analysis methods
    MetricsRecord analyze_file(const std::string &file_path) const;
    BatchResult analyze_directory(const std::string &directory_path, bool recursive = false) const;
    BatchResult analyze_path(const std::string &path, bool recursive = false) const;

    // Configuration
    void set_extension(const std::string &extension) { extension_ = extension; }
    void set_ignore_patterns(const std::vector<std::string> &patterns) { ignore_patterns_ = patterns; }

    const AnalysisOptions& options() const { return options_; }
    const std::string& extension() const { return extension_; }

private:
    bool should_analyze_file(const std::string &file_path) const;
    void analyze_into(const std::string &file_path, BatchResult &batch) const;

    AnalysisOptions options_;
    std::string extension_ {"sas"};
    std::vector<std::string> ignore_patterns_;
};

} // namespace sasmetrics::analysis

#endif // SASMETRICS_ANALYSIS_ANALYZER_HPP
