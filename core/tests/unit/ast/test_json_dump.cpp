// test_json_dump.cpp - Unit tests for instruction JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "dockspan/ast/json_visitor.hpp"
#include "dockspan/syntax/frontend.hpp"

using nlohmann::json;

namespace dockspan
{

class JsonDumpTest : public ::testing::Test
{
protected:
  static json parse_and_serialize(const std::string & source)
  {
    auto file = parse_dockerfile(source);
    EXPECT_TRUE(file) << file.error().message;
    return to_json(file.value());
  }
};

TEST_F(JsonDumpTest, EmptyFile)
{
  auto j = parse_and_serialize("");
  EXPECT_EQ(j["type"], "Dockerfile");
  EXPECT_TRUE(j["instructions"].is_array());
  EXPECT_EQ(j["instructions"].size(), 0U);
  EXPECT_EQ(j["span"]["start"], 0);
  EXPECT_EQ(j["span"]["end"], 0);
}

TEST_F(JsonDumpTest, CopyInstruction)
{
  auto j = parse_and_serialize("copy --from=alpine:3.10 /usr/lib/libssl.so.1.1 /tmp/");

  ASSERT_EQ(j["instructions"].size(), 1U);
  auto copy = j["instructions"][0];
  EXPECT_EQ(copy["type"], "CopyInstruction");
  EXPECT_EQ(copy["span"]["end"], 52);

  ASSERT_EQ(copy["flags"].size(), 1U);
  EXPECT_EQ(copy["flags"][0]["name"]["content"], "from");
  EXPECT_EQ(copy["flags"][0]["value"]["span"]["start"], 12);

  ASSERT_EQ(copy["sources"].size(), 1U);
  EXPECT_EQ(copy["sources"][0]["type"], "FileName");
  EXPECT_EQ(copy["sources"][0]["value"]["content"], "/usr/lib/libssl.so.1.1");
  EXPECT_EQ(copy["destination"]["content"], "/tmp/");
}

TEST_F(JsonDumpTest, RunShellWithComment)
{
  auto j = parse_and_serialize("run echo \\\n  # note\n  hi\n");

  auto expr = j["instructions"][0]["expr"];
  EXPECT_EQ(expr["type"], "Shell");
  auto shell = expr["shell"];
  EXPECT_EQ(shell["type"], "BreakableString");
  EXPECT_EQ(shell["effective"], "echo   hi");
  ASSERT_EQ(shell["fragments"].size(), 3U);
  EXPECT_EQ(shell["fragments"][1]["type"], "Comment");
  EXPECT_EQ(shell["fragments"][1]["text"], "# note");
}

TEST_F(JsonDumpTest, RunHeredocAndOptions)
{
  auto j = parse_and_serialize("RUN --network=none <<EOF\necho hi\nEOF\n");

  auto run = j["instructions"][0];
  ASSERT_EQ(run["options"].size(), 1U);
  EXPECT_EQ(run["options"][0]["original"], "--network=none");

  auto expr = run["expr"];
  EXPECT_EQ(expr["type"], "ShellWithHeredoc");
  EXPECT_EQ(expr["heredoc"]["delimiter"]["content"], "EOF");
  EXPECT_EQ(expr["heredoc"]["terminator"]["content"], "EOF\n");
  EXPECT_EQ(expr["heredoc"]["body"]["content"], "echo hi\n");
}

TEST_F(JsonDumpTest, ExecAndMiscAndComments)
{
  auto j = parse_and_serialize("# top\nFROM alpine\nCMD [\"sh\"]\nRUN [\"true\"]\n");

  ASSERT_EQ(j["comments"].size(), 1U);
  EXPECT_EQ(j["comments"][0]["content"], "# top");

  ASSERT_EQ(j["instructions"].size(), 3U);
  EXPECT_EQ(j["instructions"][0]["type"], "MiscInstruction");
  EXPECT_EQ(j["instructions"][0]["instruction"]["content"], "FROM");
  EXPECT_EQ(j["instructions"][1]["arguments"]["effective"], "[\"sh\"]");
  EXPECT_EQ(j["instructions"][2]["expr"]["type"], "Exec");
  EXPECT_EQ(j["instructions"][2]["expr"]["array"]["elements"][0]["content"], "true");
}

TEST(JsonDump, ParseError)
{
  const auto j = to_json(ParseError::generic("missing run expression"));
  EXPECT_EQ(j["kind"], "GenericParseError");
  EXPECT_EQ(j["code"], "E0001");
  EXPECT_TRUE(j["span"]["start"].is_null());
}

}  // namespace dockspan
