// dockspan/ast/instructions.cpp - Instruction variant helpers
#include "dockspan/ast/instructions.hpp"

#include <type_traits>

namespace dockspan
{

const SpannedString & source_value(const SourceType & source) noexcept
{
  return std::visit(
    [](const auto & s) -> const SpannedString & { return s.value; }, source);
}

std::string_view to_string(InstructionKind kind) noexcept
{
  switch (kind) {
    case InstructionKind::Copy:
      return "copy";
    case InstructionKind::Run:
      return "run";
    case InstructionKind::Misc:
      return "misc";
  }
  return "unknown";
}

InstructionKind Instruction::kind() const noexcept
{
  return std::visit(
    [](const auto & record) {
      using T = std::decay_t<decltype(record)>;
      return InstructionTraits<T>::kind;
    },
    data_);
}

Span Instruction::span() const noexcept
{
  return std::visit([](const auto & record) { return record.span; }, data_);
}

std::string Instruction::describe() const
{
  return std::visit(
    [](const auto & record) {
      using T = std::decay_t<decltype(record)>;
      std::string out(InstructionTraits<T>::name);
      if constexpr (std::is_same_v<T, MiscInstruction>) {
        out += "(" + record.instruction.content + ")";
      }
      out += " at " + record.span.to_string();
      return out;
    },
    data_);
}

}  // namespace dockspan
