#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "report/report_writer.hpp"
#include <filesystem>
#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>

using namespace sasmetrics;
using analysis::Issue;
using analysis::IssueKind;
using analysis::MetricsRecord;
using ::testing::HasSubstr;
using ::testing::Not;

namespace fs = std::filesystem;

namespace {

MetricsRecord sample_record(const std::string &name = "programs/load.sas") {
    MetricsRecord record;
    record.unit_name = name;
    record.lines_scanned = 20;
    record.data_steps = 2;
    record.proc_steps = 1;
    record.conditionals = 3;
    record.loops = 1;
    record.max_nesting_depth = 1;
    record.cyclomatic_complexity = 5;
    record.decision_points = {{"if-then", 4}, {"do loop", 9}};
    record.finalized = true;
    return record;
}

Issue macro_issue() {
    Issue issue;
    issue.kind = IssueKind::ExcessMacroParameters;
    issue.subject = "load";
    issue.value = 4;
    issue.line_number = 2;
    issue.message = "Macro 'load' declares 4 parameters (limit 3)";
    return issue;
}

std::string markdown(const MetricsRecord &record, bool verbose = false) {
    std::string out;
    llvm::raw_string_ostream os(out);
    report::write_markdown(record, os, verbose);
    os.flush();
    return out;
}

TEST(ReportWriter, MarkdownWithoutIssuesShowsMarker) {
    auto text = markdown(sample_record());
    EXPECT_THAT(text, HasSubstr("# Metrics report: programs/load.sas"));
    EXPECT_THAT(text, HasSubstr("| Cyclomatic complexity | 5 |"));
    EXPECT_THAT(text, HasSubstr("| Data steps | 2 |"));
    EXPECT_THAT(text, HasSubstr("## Issues"));
    EXPECT_THAT(text, HasSubstr(report::kNoIssuesMarker));
}

TEST(ReportWriter, MarkdownListsIssues) {
    auto record = sample_record();
    record.issues.push_back(macro_issue());
    auto text = markdown(record);
    EXPECT_THAT(text, HasSubstr("**excess-macro-parameters** (line 2)"));
    EXPECT_THAT(text, HasSubstr("Macro 'load' declares 4 parameters"));
    EXPECT_THAT(text, Not(HasSubstr(report::kNoIssuesMarker)));
}

TEST(ReportWriter, MarkdownDecisionPointsOnlyWhenVerbose) {
    EXPECT_THAT(markdown(sample_record()), Not(HasSubstr("Decision points")));
    auto text = markdown(sample_record(), true);
    EXPECT_THAT(text, HasSubstr("## Decision points"));
    EXPECT_THAT(text, HasSubstr("- line 9: do loop"));
}

TEST(ReportWriter, JsonIsValidAndEscaped) {
    auto quoted = sample_record("dir/\"odd\".sas");
    quoted.issues.push_back(macro_issue());
    std::vector<MetricsRecord> records = {sample_record(), quoted};

    std::string out;
    llvm::raw_string_ostream os(out);
    report::write_json(records, os);
    os.flush();

    EXPECT_THAT(out, HasSubstr(R"(dir/\"odd\".sas)"));

    auto parsed = llvm::json::parse(out);
    ASSERT_TRUE(static_cast<bool>(parsed)) << llvm::toString(parsed.takeError());
    const auto* root = parsed->getAsObject();
    ASSERT_NE(root, nullptr);
    auto total = root->getInteger("total_complexity");
    ASSERT_TRUE(static_cast<bool>(total));
    EXPECT_EQ(*total, 10);

    const auto* results = root->getArray("results");
    ASSERT_NE(results, nullptr);
    ASSERT_EQ(results->size(), 2u);
    const auto* second = (*results)[1].getAsObject();
    ASSERT_NE(second, nullptr);
    auto conditionals = second->getInteger("conditionals");
    ASSERT_TRUE(static_cast<bool>(conditionals));
    EXPECT_EQ(*conditionals, 3);
    const auto* issues = second->getArray("issues");
    ASSERT_NE(issues, nullptr);
    ASSERT_EQ(issues->size(), 1u);
    const auto* issue = issues->front().getAsObject();
    ASSERT_NE(issue, nullptr);
    auto kind = issue->getString("kind");
    ASSERT_TRUE(static_cast<bool>(kind));
    EXPECT_EQ(kind->str(), "excess-macro-parameters");
    auto subject = issue->getString("subject");
    ASSERT_TRUE(static_cast<bool>(subject));
    EXPECT_EQ(subject->str(), "load");
}

TEST(ReportWriter, JsonReplacesInvalidUtf8) {
    auto latin1 = sample_record("data/caf\xe9.sas");
    auto issue = macro_issue();
    issue.subject = "l\xf6schen";
    latin1.issues.push_back(issue);

    std::string out;
    llvm::raw_string_ostream os(out);
    report::write_json({latin1}, os);
    os.flush();

    auto parsed = llvm::json::parse(out);
    ASSERT_TRUE(static_cast<bool>(parsed)) << llvm::toString(parsed.takeError());
    const auto* results = parsed->getAsObject()->getArray("results");
    ASSERT_NE(results, nullptr);
    ASSERT_EQ(results->size(), 1u);
    const auto* first = results->front().getAsObject();
    ASSERT_NE(first, nullptr);
    auto file = first->getString("file");
    ASSERT_TRUE(static_cast<bool>(file));
    EXPECT_EQ(file->str(), "data/caf\xEF\xBF\xBD.sas");
    auto subject = first->getArray("issues")->front().getAsObject()->getString("subject");
    ASSERT_TRUE(static_cast<bool>(subject));
    EXPECT_EQ(subject->str(), "l\xEF\xBF\xBDschen");
}

TEST(ReportWriter, TextSummaryTotalsComplexity) {
    auto other = sample_record("b.sas");
    other.cyclomatic_complexity = 2;
    std::vector<MetricsRecord> records = {sample_record(), other};

    std::string out;
    llvm::raw_string_ostream os(out);
    report::write_text(records, os);
    os.flush();

    EXPECT_THAT(out, HasSubstr("File: b.sas"));
    EXPECT_THAT(out, HasSubstr("Issues: none"));
    EXPECT_THAT(out, HasSubstr("Total complexity: 7"));
}

TEST(ReportWriter, MarkdownFileName) {
    EXPECT_EQ(report::markdown_file_name("programs/load.sas"), "load_metrics.md");
    EXPECT_EQ(report::markdown_file_name("LOAD.SAS"), "LOAD_metrics.md");
}

TEST(ReportWriter, OnlyMarkdownSupportsOutputDir) {
    EXPECT_TRUE(report::supports_output_dir(report::OutputFormat::Markdown));
    EXPECT_FALSE(report::supports_output_dir(report::OutputFormat::Json));
    EXPECT_FALSE(report::supports_output_dir(report::OutputFormat::Text));
}

TEST(ReportWriter, WritesOneFilePerUnit) {
    const fs::path dir = fs::temp_directory_path() / "sasmetrics_report_writer_out";
    fs::remove_all(dir);

    std::vector<MetricsRecord> records = {
        sample_record("a/load.sas"),
        sample_record("b/load.sas"),
        sample_record("clean.sas"),
    };
    auto written = report::write_markdown_files(records, dir.string());

    ASSERT_EQ(written.size(), 3u);
    EXPECT_TRUE(fs::exists(dir / "load_metrics.md"));
    EXPECT_TRUE(fs::exists(dir / "load_metrics_2.md"));
    EXPECT_TRUE(fs::exists(dir / "clean_metrics.md"));
    EXPECT_GT(fs::file_size(dir / "clean_metrics.md"), 0u);

    fs::remove_all(dir);
}

} // namespace
