// Segmenting source text into physical lines and into statements.
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "parser/source_lexer.hpp"

using namespace sasmetrics::parser;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace {

TEST(SourceLexer, SplitLinesKeepsPhysicalLineNumbers) {
    auto segments = SourceLexer::split_lines("data a;\r\nset b;\n\nrun;");
    ASSERT_EQ(segments.size(), 4u);
    EXPECT_EQ(segments[0].text, "data a;");
    EXPECT_EQ(segments[0].line_number, 1u);
    EXPECT_EQ(segments[1].text, "set b;");
    EXPECT_EQ(segments[2].text, "");
    EXPECT_EQ(segments[3].text, "run;");
    EXPECT_EQ(segments[3].line_number, 4u);
}

TEST(SourceLexer, TrailingNewlineDoesNotAddALine) {
    EXPECT_EQ(SourceLexer::split_lines("run;\n").size(), 1u);
    EXPECT_THAT(SourceLexer::split_lines(""), IsEmpty());
}

TEST(SourceLexer, StatementsSpanPhysicalLines) {
    auto segments = SourceLexer::split_statements("if x > 1\n  then y = 2;\n\ndata out;\n");
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_THAT(segments[0].text, HasSubstr("if x > 1"));
    EXPECT_THAT(segments[0].text, HasSubstr("then y = 2;"));
    EXPECT_EQ(segments[0].line_number, 1u);
    EXPECT_EQ(segments[1].text, "data out;");
    EXPECT_EQ(segments[1].line_number, 4u);
}

TEST(SourceLexer, SeveralStatementsOnOneLine) {
    auto segments = SourceLexer::split_statements("do; x = 1; end;");
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0].text, "do;");
    EXPECT_EQ(segments[1].text, "x = 1;");
    EXPECT_EQ(segments[2].text, "end;");
    EXPECT_EQ(segments[2].line_number, 1u);
}

TEST(SourceLexer, UnterminatedTrailingStatementIsKept) {
    auto segments = SourceLexer::split_statements("run;\n%report(a)");
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[1].text, "%report(a)");
    EXPECT_EQ(segments[1].line_number, 2u);
}

TEST(SourceLexer, MaskBlanksBlockCommentsButKeepsLength) {
    const std::string source = "x = 1; /* if a then\n do; */ y = 2;";
    const std::string masked = SourceLexer::mask_comments_and_strings(source);
    EXPECT_EQ(masked.size(), source.size());
    EXPECT_EQ(masked.find("then"), std::string::npos);
    EXPECT_EQ(masked.find("do;"), std::string::npos);
    EXPECT_THAT(masked, HasSubstr("y = 2;"));
    EXPECT_EQ(masked.find('\n'), source.find('\n'));
}

TEST(SourceLexer, MaskBlanksCommentStatements) {
    auto segments = SourceLexer::split_statements("* if a then do;\n%* end;\nx = 1;");
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].text, "x = 1;");
    EXPECT_EQ(segments[0].line_number, 3u);
}

TEST(SourceLexer, AsteriskInsideAStatementIsNotAComment) {
    auto segments = SourceLexer::split_statements("y = a\n * b;");
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_THAT(segments[0].text, HasSubstr("* b;"));
}

TEST(SourceLexer, MaskBlanksQuotedLiterals) {
    const std::string masked = SourceLexer::mask_comments_and_strings("put \"do while;\" 'it''s end;';");
    EXPECT_EQ(masked.find("while"), std::string::npos);
    EXPECT_EQ(masked.find("end"), std::string::npos);
    EXPECT_THAT(masked, HasSubstr("put \""));
}

TEST(SourceLexer, SemicolonInsideLiteralDoesNotEndStatement) {
    auto segments = SourceLexer::split_statements("title 'a;b';\nrun;");
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[1].text, "run;");
}

TEST(SourceLexer, UnterminatedCommentRunsToEnd) {
    auto segments = SourceLexer::split_statements("x = 1;\n/* if a then y = 2;");
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].text, "x = 1;");
}

TEST(SourceLexer, LineModeLeavesTextUntouched) {
    const SourceLexer lexer(ScanMode::Line);
    auto segments = lexer.split("/* if a then */");
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].text, "/* if a then */");
}

} // namespace
