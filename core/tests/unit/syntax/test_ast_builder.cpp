// test_ast_builder.cpp - Assembly from hand-made token trees
//
// The recognizer never produces these shapes; they exercise the builder's
// own validation.
//
#include <gtest/gtest.h>

#include "dockspan/syntax/ast_builder.hpp"
#include "dockspan/test_support/parse_helpers.hpp"

namespace dockspan
{

using syntax::Node;
using syntax::RuleKind;
using test_support::branch;
using test_support::leaf;

TEST(AstBuilder, CopyWithoutForm)
{
  const Node copy = branch(RuleKind::Copy, 0, 4, {});
  auto result = AstBuilder().build_copy(copy);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::GenericParseError);
  EXPECT_EQ(result.error().message, "copy instruction expected a field");
}

TEST(AstBuilder, CopyRejectsUnexpectedChild)
{
  // "copy a b" with a run option where a path should be
  const Node copy = branch(
    RuleKind::Copy, 0, 10,
    {branch(
      RuleKind::CopyStandard, 4, 10,
      {leaf(RuleKind::CopyPathspec, 5, "a"), leaf(RuleKind::RunOptionName, 7, "x"),
       leaf(RuleKind::CopyPathspec, 9, "b")})});

  auto result = AstBuilder().build_copy(copy);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::UnexpectedToken);
  EXPECT_EQ(result.error().span, Span(7, 8));
  EXPECT_EQ(result.error().message, "unexpected token run_option_name 'x' at 7..8");
}

TEST(AstBuilder, CopyFlagWithoutName)
{
  const Node copy = branch(
    RuleKind::Copy, 0, 20,
    {branch(
      RuleKind::CopyStandard, 4, 20,
      {branch(RuleKind::CopyFlag, 5, 12, {leaf(RuleKind::CopyFlagValue, 8, "abcd")}),
       leaf(RuleKind::CopyPathspec, 13, "a"), leaf(RuleKind::CopyPathspec, 15, "b")})});

  auto result = AstBuilder().build_copy(copy);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().message, "copy flags require a key");
  EXPECT_EQ(result.error().span, Span(5, 12));
}

TEST(AstBuilder, TerminatorWithoutOpener)
{
  const Node copy = branch(
    RuleKind::Copy, 0, 30,
    {branch(
      RuleKind::CopyHeredoc, 4, 30,
      {leaf(RuleKind::CopyPathspec, 5, "/dst"), leaf(RuleKind::HeredocBody, 10, "x\n"),
       leaf(RuleKind::HeredocTerminator, 12, "EOF\n")})});

  auto result = AstBuilder().build_copy(copy);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::UnmatchedHeredocTerminator);
  EXPECT_EQ(result.error().span, Span(12, 16));
}

TEST(AstBuilder, TerminatorWithoutBody)
{
  const Node copy = branch(
    RuleKind::Copy, 0, 30,
    {branch(
      RuleKind::CopyHeredoc, 4, 30,
      {leaf(RuleKind::HeredocDelimiter, 7, "EOF"), leaf(RuleKind::CopyPathspec, 11, "/dst"),
       leaf(RuleKind::HeredocTerminator, 16, "EOF\n")})});

  auto result = AstBuilder().build_copy(copy);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::UnexpectedToken);
}

TEST(AstBuilder, RunWithoutExpression)
{
  const Node run = branch(RuleKind::Run, 0, 3, {});
  auto result = AstBuilder().build_run(run);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().message, "missing run expression");
}

TEST(AstBuilder, EmptyRunShell)
{
  const Node run = branch(RuleKind::Run, 0, 4, {branch(RuleKind::RunShell, 4, 4, {})});
  auto result = AstBuilder().build_run(run);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().message, "missing run shell expression");
}

TEST(AstBuilder, ChildAfterRunExpression)
{
  const Node run = branch(
    RuleKind::Run, 0, 30,
    {branch(RuleKind::RunExec, 4, 6, {}),
     branch(RuleKind::RunOption, 7, 17, {leaf(RuleKind::RunOptionName, 9, "a")})});
  auto result = AstBuilder().build_run(run);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::UnexpectedToken);
  EXPECT_EQ(result.error().span, Span(7, 17));
}

TEST(AstBuilder, RunOptionWithoutName)
{
  const Node run = branch(
    RuleKind::Run, 0, 30,
    {branch(RuleKind::RunOption, 4, 10, {leaf(RuleKind::RunOptionValue, 7, "abc")}),
     branch(RuleKind::RunExec, 11, 13, {})});
  auto result = AstBuilder().build_run(run);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().message, "run options require a key");
}

TEST(AstBuilder, EmptyExecArray)
{
  const Node run = branch(RuleKind::Run, 0, 6, {branch(RuleKind::RunExec, 4, 6, {})});
  auto result = AstBuilder().build_run(run);
  ASSERT_TRUE(result) << result.error().message;
  ASSERT_NE(result->as_exec(), nullptr);
  EXPECT_TRUE(result->as_exec()->elements.empty());
}

TEST(AstBuilder, BreakableRejectsForeignFragment)
{
  const Node misc = branch(
    RuleKind::Misc, 0, 12,
    {leaf(RuleKind::MiscName, 0, "ENV"),
     branch(RuleKind::AnyBreakable, 4, 12, {leaf(RuleKind::CopyPathspec, 4, "A=1")})});
  auto result = AstBuilder().build_misc(misc);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::UnexpectedToken);
}

TEST(AstBuilder, InstructionDispatchRejectsOtherKinds)
{
  auto result = AstBuilder().build_instruction(leaf(RuleKind::Comment, 0, "# x"));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::UnexpectedToken);
}

TEST(AstBuilder, WrongEntryPoint)
{
  const Node run = branch(RuleKind::Run, 0, 6, {branch(RuleKind::RunExec, 4, 6, {})});
  auto result = AstBuilder().build_copy(run);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::UnexpectedToken);
}

}  // namespace dockspan
