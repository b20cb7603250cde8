// dockspan/test_support/parse_helpers.hpp - helpers for unit tests
//
// Single-instruction parsing straight to a family record, and small builders
// for hand-made token trees (used to feed AstBuilder shapes the recognizer
// never produces).
//
#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "dockspan/ast/instructions.hpp"
#include "dockspan/syntax/frontend.hpp"
#include "dockspan/syntax/node.hpp"

namespace dockspan::test_support
{

/// Recognize and assemble one instruction of the record's family.
template <typename T>
[[nodiscard]] ParseResult<T> parse_single(std::string_view src)
{
  syntax::RuleKind family = syntax::RuleKind::Misc;
  if constexpr (std::is_same_v<T, CopyInstruction>) {
    family = syntax::RuleKind::Copy;
  } else if constexpr (std::is_same_v<T, RunInstruction>) {
    family = syntax::RuleKind::Run;
  }

  auto instruction = parse_instruction(src, family);
  if (!instruction) {
    return instruction.error();
  }
  return instruction_cast<T>(*instruction);
}

[[nodiscard]] inline ParseResult<CopyInstruction> parse_copy(std::string_view src)
{
  return parse_single<CopyInstruction>(src);
}

[[nodiscard]] inline ParseResult<RunInstruction> parse_run(std::string_view src)
{
  return parse_single<RunInstruction>(src);
}

[[nodiscard]] inline ParseResult<MiscInstruction> parse_misc(std::string_view src)
{
  return parse_single<MiscInstruction>(src);
}

/// Leaf node whose span starts at `start` and covers `text`.
[[nodiscard]] inline syntax::Node leaf(syntax::RuleKind kind, uint32_t start, std::string_view text)
{
  return {kind, Span(start, start + static_cast<uint32_t>(text.size())), text};
}

/// Interior node spanning [start, end).
[[nodiscard]] inline syntax::Node branch(
  syntax::RuleKind kind, uint32_t start, uint32_t end, std::vector<syntax::Node> children)
{
  return {kind, Span(start, end), std::string_view{}, std::move(children)};
}

}  // namespace dockspan::test_support
