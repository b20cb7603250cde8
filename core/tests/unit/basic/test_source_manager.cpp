// test_source_manager.cpp - Spans and line/column lookup
//
#include <gtest/gtest.h>

#include "dockspan/basic/source_manager.hpp"
#include "dockspan/basic/span.hpp"

namespace dockspan
{

TEST(Span, Basics)
{
  constexpr Span s(4, 12);
  static_assert(s.size() == 8);
  EXPECT_FALSE(s.empty());
  EXPECT_TRUE(s.contains(4U));
  EXPECT_FALSE(s.contains(12U));
  EXPECT_TRUE(s.contains(Span(5, 12)));
  EXPECT_FALSE(s.contains(Span(3, 5)));
  EXPECT_EQ(s.cover(Span(10, 20)), Span(4, 20));
  EXPECT_EQ(s.to_string(), "4..12");
  EXPECT_TRUE(Span::at(7).empty());
  EXPECT_EQ(Span::at(7), Span(7, 7));
}

TEST(SpannedString, EqualityIncludesSpan)
{
  EXPECT_EQ(SpannedString(Span(0, 3), "abc"), SpannedString(Span(0, 3), "abc"));
  EXPECT_NE(SpannedString(Span(0, 3), "abc"), SpannedString(Span(1, 4), "abc"));
  EXPECT_NE(SpannedString(Span(0, 3), "abc"), SpannedString(Span(0, 3), "abd"));
}

TEST(SourceManager, LineColumn)
{
  const SourceManager sm("FROM x\nRUN a \\\n  b\n");
  EXPECT_EQ(sm.get_line_count(), 4U);

  const auto start = sm.get_line_column(0);
  EXPECT_EQ(start.line, 1U);
  EXPECT_EQ(start.column, 1U);

  const auto run = sm.get_line_column(7);
  EXPECT_EQ(run.line, 2U);
  EXPECT_EQ(run.column, 1U);

  const auto b = sm.get_line_column(17);
  EXPECT_EQ(b.line, 3U);
  EXPECT_EQ(b.column, 3U);
}

TEST(SourceManager, LinesExcludeLineBreaks)
{
  const SourceManager sm("a\r\nbc\nd");
  EXPECT_EQ(sm.get_line(0), "a");
  EXPECT_EQ(sm.get_line(1), "bc");
  EXPECT_EQ(sm.get_line(2), "d");
  EXPECT_EQ(sm.get_line(3), "");
}

TEST(SourceManager, SliceAndFullSpan)
{
  const SourceManager sm("FROM x\nRUN make\n");
  EXPECT_EQ(sm.get_slice(Span(7, 10)), "RUN");
  EXPECT_EQ(sm.get_slice(Span(11, 100)), "make\n");

  const FullSpan fs = sm.get_full_span(Span(11, 15));
  ASSERT_TRUE(fs.is_valid());
  EXPECT_EQ(fs.start_line, 2U);
  EXPECT_EQ(fs.start_column, 5U);
  EXPECT_EQ(fs.end_line, 2U);
  EXPECT_EQ(fs.end_column, 9U);
  EXPECT_EQ(fs.to_span(), Span(11, 15));
}

}  // namespace dockspan
