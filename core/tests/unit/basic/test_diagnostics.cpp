// test_diagnostics.cpp - Error kinds, results and diagnostic collection
//
#include <gtest/gtest.h>

#include <string>

#include "dockspan/basic/diagnostic.hpp"
#include "dockspan/basic/error.hpp"

namespace dockspan
{

TEST(ParseError, StableCodes)
{
  EXPECT_EQ(error_code(ErrorKind::GenericParseError), "E0001");
  EXPECT_EQ(error_code(ErrorKind::UnexpectedToken), "E0002");
  EXPECT_EQ(error_code(ErrorKind::HeredocTerminatorMismatch), "E0003");
  EXPECT_EQ(error_code(ErrorKind::UnmatchedHeredocTerminator), "E0004");
  EXPECT_EQ(error_code(ErrorKind::UnmatchedHeredocDelimiter), "E0005");
  EXPECT_EQ(error_code(ErrorKind::ConversionError), "E0006");
  EXPECT_EQ(error_code(ErrorKind::SyntaxError), "E0100");
  EXPECT_EQ(to_string(ErrorKind::HeredocTerminatorMismatch), "HeredocTerminatorMismatch");
}

TEST(ParseError, UnmatchedTerminatorMessage)
{
  const auto e = ParseError::unmatched_heredoc_terminator("RUN", "EOF\n", Span(10, 14));
  EXPECT_EQ(e.kind, ErrorKind::UnmatchedHeredocTerminator);
  EXPECT_EQ(e.message, "heredoc terminator 'EOF\\n' in RUN has no matching delimiter");
}

TEST(ParseResult, ValueAndError)
{
  ParseResult<int> ok(42);
  EXPECT_TRUE(ok);
  EXPECT_TRUE(ok.has_value());
  EXPECT_FALSE(ok.has_error());
  EXPECT_EQ(*ok, 42);

  ParseResult<int> failed(ParseError::generic("boom"));
  EXPECT_FALSE(failed);
  EXPECT_TRUE(failed.has_error());
  EXPECT_EQ(failed.error().message, "boom");
  EXPECT_FALSE(failed.error().span.has_value());
}

TEST(Diagnostic, FromParseError)
{
  const auto d = to_diagnostic(
    ParseError::heredoc_terminator_mismatch("COPY", "EOF", "eof\n", Span(31, 35)));

  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E0003");
  EXPECT_EQ(d.message, "invalid heredoc in COPY: terminator 'eof\\n' does not match delimiter 'EOF'");
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_span(), Span(31, 35));
}

TEST(Diagnostic, SpanlessErrorHasNoLabel)
{
  const auto d = to_diagnostic(ParseError::generic("no location"));
  EXPECT_TRUE(d.labels.empty());
  EXPECT_FALSE(d.primary_span().has_value());
}

TEST(DiagnosticBag, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(Span(0, 4), "bad keyword");
    builder.with_code("E0100").with_help("check the spelling");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].code, "E0100");
  EXPECT_EQ(bag.all()[0].help_message, std::string("check the spelling"));
}

TEST(DiagnosticBag, SeverityQueriesAndMerge)
{
  DiagnosticBag bag;
  bag.report_warning(Span(0, 0), "blank line");
  EXPECT_FALSE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());

  DiagnosticBag other;
  other.report(ParseError::generic("missing run expression", Span(0, 3)));
  bag.merge(std::move(other));

  EXPECT_EQ(bag.size(), 2U);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.errors().size(), 1U);
  EXPECT_EQ(bag.errors()[0].code, "E0001");
}

}  // namespace dockspan
