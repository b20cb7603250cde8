// dockspan/ast/json_visitor.cpp - JSON serialization implementation
//
#include "dockspan/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <variant>

namespace dockspan
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_span(Span s) { return json{{"start", s.start()}, {"end", s.end()}}; }

json j_span(const std::optional<Span> & s)
{
  if (!s) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return j_span(*s);
}

json j_flag(std::string_view type, Span span, const SpannedString & name, const SpannedString & value)
{
  return json{
    {"type", type}, {"span", j_span(span)}, {"name", to_json(name)}, {"value", to_json(value)}};
}

json j_source(const SourceType & source)
{
  return std::visit(
    [](const auto & s) -> json {
      using T = std::decay_t<decltype(s)>;
      if constexpr (std::is_same_v<T, FileName>) {
        return json{{"type", "FileName"}, {"value", to_json(s.value)}};
      } else {
        return json{{"type", "FileContents"}, {"value", to_json(s.value)}};
      }
    },
    source);
}

json j_string_array(const StringArray & array)
{
  json elements = json::array();
  for (const auto & e : array.elements) elements.push_back(to_json(e));
  return json{{"type", "StringArray"}, {"span", j_span(array.span)}, {"elements", elements}};
}

json j_expr(const ShellOrExecExpr & expr)
{
  return std::visit(
    [](const auto & e) -> json {
      using T = std::decay_t<decltype(e)>;
      if constexpr (std::is_same_v<T, StringArray>) {
        return json{{"type", "Exec"}, {"array", j_string_array(e)}};
      } else if constexpr (std::is_same_v<T, BreakableString>) {
        return json{{"type", "Shell"}, {"shell", to_json(e)}};
      } else {
        return json{
          {"type", "ShellWithHeredoc"},
          {"shell", to_json(e.shell)},
          {"heredoc", to_json(e.heredoc)}};
      }
    },
    expr);
}

}  // namespace

// ============================================================================
// Building blocks
// ============================================================================

nlohmann::json to_json(const SpannedString & str)
{
  return json{{"span", j_span(str.span)}, {"content", str.content}};
}

nlohmann::json to_json(const BreakableString & str)
{
  json fragments = json::array();
  for (const auto & f : str.fragments()) {
    fragments.push_back(json{
      {"type", f.is_comment() ? "Comment" : "Literal"}, {"span", j_span(f.span)}, {"text", f.text}});
  }
  return json{
    {"type", "BreakableString"},
    {"span", j_span(str.span())},
    {"fragments", fragments},
    {"effective", str.effective_text()}};
}

nlohmann::json to_json(const Heredoc & heredoc)
{
  return json{
    {"type", "Heredoc"},
    {"span", j_span(heredoc.span)},
    {"delimiter", to_json(heredoc.delimiter)},
    {"terminator", to_json(heredoc.terminator)},
    {"body", to_json(heredoc.body)}};
}

// ============================================================================
// Instructions
// ============================================================================

nlohmann::json to_json(const CopyInstruction & copy)
{
  json flags = json::array();
  for (const auto & f : copy.flags) flags.push_back(j_flag("CopyFlag", f.span, f.name, f.value));

  json sources = json::array();
  for (const auto & s : copy.sources) sources.push_back(j_source(s));

  return json{
    {"type", "CopyInstruction"},
    {"span", j_span(copy.span)},
    {"flags", flags},
    {"sources", sources},
    {"destination", to_json(copy.destination)}};
}

nlohmann::json to_json(const RunInstruction & run)
{
  json options = json::array();
  for (const auto & o : run.options) {
    json j = j_flag("RunOption", o.span, o.name, o.value);
    j["original"] = o.original;
    options.push_back(std::move(j));
  }

  return json{
    {"type", "RunInstruction"},
    {"span", j_span(run.span)},
    {"options", options},
    {"expr", j_expr(run.expr)}};
}

nlohmann::json to_json(const MiscInstruction & misc)
{
  return json{
    {"type", "MiscInstruction"},
    {"span", j_span(misc.span)},
    {"instruction", to_json(misc.instruction)},
    {"arguments", to_json(misc.arguments)}};
}

nlohmann::json to_json(const Instruction & instruction)
{
  return std::visit([](const auto & record) { return to_json(record); }, instruction.variant());
}

nlohmann::json to_json(const Dockerfile & dockerfile)
{
  json instructions = json::array();
  for (const auto & i : dockerfile.instructions) instructions.push_back(to_json(i));

  json comments = json::array();
  for (const auto & c : dockerfile.comments) comments.push_back(to_json(c));

  return json{
    {"type", "Dockerfile"},
    {"span", j_span(dockerfile.span)},
    {"instructions", instructions},
    {"comments", comments}};
}

nlohmann::json to_json(const ParseError & error)
{
  return json{
    {"type", "ParseError"},
    {"kind", std::string(to_string(error.kind))},
    {"code", std::string(error_code(error.kind))},
    {"message", error.message},
    {"span", j_span(error.span)}};
}

}  // namespace dockspan
