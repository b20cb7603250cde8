// test_instruction_cast.cpp - Narrowing instructions to family records
//
#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "dockspan/ast/instructions.hpp"
#include "dockspan/syntax/frontend.hpp"

namespace dockspan
{

namespace
{

Instruction parse_any(std::string_view src, syntax::RuleKind family)
{
  auto instruction = parse_instruction(src, family);
  EXPECT_TRUE(instruction) << instruction.error().message;
  return std::move(instruction).value();
}

}  // namespace

TEST(InstructionCast, MatchingFamilySucceeds)
{
  const Instruction ins = parse_any("copy foo bar", syntax::RuleKind::Copy);
  EXPECT_EQ(ins.kind(), InstructionKind::Copy);
  ASSERT_NE(ins.as_copy(), nullptr);
  EXPECT_EQ(ins.as_run(), nullptr);
  EXPECT_EQ(ins.as_misc(), nullptr);

  auto copy = instruction_cast<CopyInstruction>(ins);
  ASSERT_TRUE(copy);
  EXPECT_EQ(copy->destination.content, "bar");
  EXPECT_EQ(*copy, *ins.as_copy());
}

TEST(InstructionCast, OtherFamilyFails)
{
  const Instruction ins = parse_any("FROM alpine", syntax::RuleKind::Misc);

  auto run = instruction_cast<RunInstruction>(ins);
  ASSERT_FALSE(run);
  EXPECT_EQ(run.error().kind, ErrorKind::ConversionError);
  EXPECT_EQ(run.error().message, "cannot convert MiscInstruction(FROM) at 0..11 to RunInstruction");
  EXPECT_EQ(run.error().span, Span(0, 11));
}

TEST(InstructionCast, RunToCopyNamesBothShapes)
{
  const Instruction ins = parse_any("RUN make", syntax::RuleKind::Run);

  auto copy = instruction_cast<CopyInstruction>(ins);
  ASSERT_FALSE(copy);
  EXPECT_EQ(copy.error().kind, ErrorKind::ConversionError);
  EXPECT_NE(copy.error().message.find("RunInstruction"), std::string::npos);
  EXPECT_NE(copy.error().message.find("CopyInstruction"), std::string::npos);
}

TEST(Instruction, DescribeAndSpan)
{
  const Instruction ins = parse_any("run echo hi", syntax::RuleKind::Run);
  EXPECT_EQ(ins.span(), Span(0, 11));
  EXPECT_EQ(ins.describe(), "RunInstruction at 0..11");
  EXPECT_EQ(to_string(ins.kind()), "run");
}

TEST(Instruction, WrongFamilyIsASyntaxError)
{
  auto ins = parse_instruction("RUN make", syntax::RuleKind::Copy);
  ASSERT_FALSE(ins);
  EXPECT_EQ(ins.error().kind, ErrorKind::SyntaxError);
}

}  // namespace dockspan
