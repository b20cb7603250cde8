// test_frontend.cpp - Whole-file parsing
//
#include <gtest/gtest.h>

#include <string_view>

#include "dockspan/syntax/frontend.hpp"

namespace dockspan
{

namespace
{

constexpr std::string_view k_dockerfile =
  "# syntax=docker/dockerfile:1\n"
  "FROM golang:1.22 AS build\n"
  "WORKDIR /src\n"
  "COPY go.mod go.sum ./\n"
  "RUN --mount=type=cache,target=/go/pkg/mod \\\n"
  "    go mod download\n"
  "COPY <<EOF /src/main.go\n"
  "package main\n"
  "EOF\n"
  "RUN [\"go\", \"build\", \"-o\", \"/out/app\", \".\"]\n"
  "\n"
  "FROM scratch\n"
  "COPY --from=build /out/app /app\n"
  "ENTRYPOINT [\"/app\"]\n";

}  // namespace

TEST(Frontend, ParsesWholeFile)
{
  auto file = parse_dockerfile(k_dockerfile);
  ASSERT_TRUE(file) << file.error().message;

  EXPECT_EQ(file->span, Span(0, static_cast<uint32_t>(k_dockerfile.size())));
  ASSERT_EQ(file->comments.size(), 1U);
  EXPECT_EQ(file->comments[0].content, "# syntax=docker/dockerfile:1");

  ASSERT_EQ(file->instructions.size(), 9U);
  EXPECT_EQ(file->instructions[0].kind(), InstructionKind::Misc);
  EXPECT_EQ(file->instructions[2].kind(), InstructionKind::Copy);
  EXPECT_EQ(file->instructions[3].kind(), InstructionKind::Run);

  const CopyInstruction * heredoc_copy = file->instructions[4].as_copy();
  ASSERT_NE(heredoc_copy, nullptr);
  ASSERT_EQ(heredoc_copy->sources.size(), 1U);
  EXPECT_EQ(source_value(heredoc_copy->sources[0]).content, "package main\n");

  const RunInstruction * build = file->instructions[5].as_run();
  ASSERT_NE(build, nullptr);
  ASSERT_NE(build->as_exec(), nullptr);
  EXPECT_EQ(build->as_exec()->elements.size(), 5U);

  const CopyInstruction * final_copy = file->instructions[7].as_copy();
  ASSERT_NE(final_copy, nullptr);
  ASSERT_EQ(final_copy->flags.size(), 1U);
  EXPECT_EQ(final_copy->flags[0].value.content, "build");
}

TEST(Frontend, EmptyInput)
{
  auto file = parse_dockerfile("");
  ASSERT_TRUE(file);
  EXPECT_TRUE(file->instructions.empty());
  EXPECT_EQ(file->span, Span(0, 0));
}

TEST(Frontend, ConsecutiveHeredocCopies)
{
  auto file = parse_dockerfile(
    "COPY <<EOF /a.txt\n"
    "first\n"
    "EOF\n"
    "COPY <<EOF /b.txt\n"
    "second\n"
    "EOF\n");
  ASSERT_TRUE(file) << file.error().message;

  ASSERT_EQ(file->instructions.size(), 2U);
  const CopyInstruction * a = file->instructions[0].as_copy();
  const CopyInstruction * b = file->instructions[1].as_copy();
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(source_value(a->sources[0]).content, "first\n");
  EXPECT_EQ(a->destination.content, "/a.txt");
  EXPECT_EQ(source_value(b->sources[0]).content, "second\n");
  EXPECT_EQ(b->destination.content, "/b.txt");
}

TEST(Frontend, FailFastReturnsFirstError)
{
  auto file = parse_dockerfile("FROM alpine\nCOPY onlyone\nRUN <<EOF\nx\neof\n");
  ASSERT_FALSE(file);
  EXPECT_EQ(file.error().kind, ErrorKind::GenericParseError);
  EXPECT_EQ(file.error().span, Span(12, 24));
}

TEST(Frontend, FailFastOrdersSyntaxErrorsBySource)
{
  auto file = parse_dockerfile("FROM alpine\n[oops]\nCOPY onlyone\n");
  ASSERT_FALSE(file);
  EXPECT_EQ(file.error().kind, ErrorKind::SyntaxError);
}

TEST(Frontend, RecoveryKeepsGoodInstructions)
{
  auto result = parse_dockerfile_with_recovery(
    "FROM alpine\n"
    "COPY onlyone\n"
    "[oops]\n"
    "RUN <<EOF\n"
    "x\n"
    "eof\n"
    "RUN echo ok\n");

  ASSERT_EQ(result.dockerfile.instructions.size(), 2U);
  EXPECT_EQ(result.dockerfile.instructions[0].kind(), InstructionKind::Misc);
  EXPECT_EQ(result.dockerfile.instructions[1].kind(), InstructionKind::Run);

  ASSERT_EQ(result.diags.size(), 3U);
  EXPECT_TRUE(result.diags.has_errors());
  EXPECT_FALSE(result.diags.has_warnings());

  bool saw_mismatch = false;
  for (const auto & diag : result.diags) {
    if (diag.code == "E0003") {
      saw_mismatch = true;
      EXPECT_TRUE(diag.help_message.has_value());
    }
  }
  EXPECT_TRUE(saw_mismatch);
}

TEST(Frontend, RecoveryWarnsOnEmptyContinuationLine)
{
  auto result = parse_dockerfile_with_recovery("RUN echo a \\\n\n    b\n");

  ASSERT_EQ(result.dockerfile.instructions.size(), 1U);
  EXPECT_FALSE(result.diags.has_errors());
  ASSERT_TRUE(result.diags.has_warnings());
  ASSERT_EQ(result.diags.size(), 1U);
  EXPECT_EQ(result.diags.all()[0].code, "W0001");
  EXPECT_EQ(result.diags.all()[0].primary_span(), Span(13, 13));
}

TEST(Frontend, SecondRunOpenerKeepsBodiesInsideInstruction)
{
  constexpr std::string_view src = "RUN cat <<FIRST && cat <<SECOND\nx\nFIRST\ny\nSECOND\nFROM alpine\n";

  auto file = parse_dockerfile(src);
  ASSERT_FALSE(file);
  EXPECT_EQ(file.error().kind, ErrorKind::UnexpectedToken);

  auto result = parse_dockerfile_with_recovery(src);
  ASSERT_EQ(result.dockerfile.instructions.size(), 1U);
  EXPECT_EQ(result.dockerfile.instructions[0].describe(), "MiscInstruction(FROM) at 49..60");
  ASSERT_EQ(result.diags.size(), 1U);
  EXPECT_EQ(result.diags.all()[0].code, "E0002");
}

TEST(Frontend, NestedTabIndentedHeredocInRunScript)
{
  auto file = parse_dockerfile("RUN <<EOF\nif true; then\n  cat <<-EOF > /x\n\thi\n\tEOF\nfi\nEOF\n");
  ASSERT_TRUE(file) << file.error().message;
  ASSERT_EQ(file->instructions.size(), 1U);
  EXPECT_EQ(file->instructions[0].kind(), InstructionKind::Run);
}

TEST(Frontend, TabStrippingHeredocIsOneInstruction)
{
  auto file = parse_dockerfile("RUN <<-EOF\n\thello\n\tEOF\nFROM alpine\n");
  ASSERT_TRUE(file) << file.error().message;
  ASSERT_EQ(file->instructions.size(), 2U);
  EXPECT_EQ(file->instructions[0].kind(), InstructionKind::Run);
  EXPECT_EQ(file->instructions[1].kind(), InstructionKind::Misc);
}

}  // namespace dockspan
