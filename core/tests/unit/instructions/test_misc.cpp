// test_misc.cpp - Instructions without a dedicated record
//
#include <gtest/gtest.h>

#include "dockspan/ast/instructions.hpp"
#include "dockspan/test_support/parse_helpers.hpp"

namespace dockspan
{

using test_support::parse_misc;

TEST(MiscInstruction, From)
{
  auto misc = parse_misc("FROM alpine:3.18");
  ASSERT_TRUE(misc) << misc.error().message;

  EXPECT_EQ(misc->span, Span(0, 16));
  EXPECT_EQ(misc->instruction, SpannedString(Span(0, 4), "FROM"));
  EXPECT_EQ(
    misc->arguments, BreakableString(Span(5, 16)).add_literal(Span(5, 16), "alpine:3.18"));
}

TEST(MiscInstruction, KeepsKeywordCase)
{
  auto misc = parse_misc("workdir /app");
  ASSERT_TRUE(misc) << misc.error().message;
  EXPECT_EQ(misc->instruction.content, "workdir");
}

TEST(MiscInstruction, ContinuedArguments)
{
  auto misc = parse_misc("ENV A=1 \\\n    # the second one\n    B=2");
  ASSERT_TRUE(misc) << misc.error().message;

  ASSERT_EQ(misc->arguments.fragments().size(), 3U);
  EXPECT_TRUE(misc->arguments.fragments()[1].is_comment());
  EXPECT_EQ(misc->arguments.to_string(), "A=1     B=2");
}

TEST(MiscInstruction, NoArguments)
{
  auto misc = parse_misc("HEALTHCHECK");
  ASSERT_TRUE(misc) << misc.error().message;

  EXPECT_EQ(misc->span, Span(0, 11));
  EXPECT_EQ(misc->arguments, BreakableString(Span(11, 11)));
  EXPECT_TRUE(misc->arguments.empty());
}

TEST(MiscInstruction, HeredocMarkerIsText)
{
  auto misc = parse_misc("CMD cat <<EOF");
  ASSERT_TRUE(misc) << misc.error().message;
  EXPECT_EQ(misc->arguments.to_string(), "cat <<EOF");
}

TEST(MiscInstruction, KeywordMustBeFollowedByWhitespace)
{
  auto misc = parse_misc("FROM:alpine");
  ASSERT_FALSE(misc);
  EXPECT_EQ(misc.error().kind, ErrorKind::SyntaxError);
}

}  // namespace dockspan
