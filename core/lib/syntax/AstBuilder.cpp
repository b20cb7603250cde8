// dockspan/syntax/AstBuilder.cpp - Instruction dispatch and the remaining families
#include <optional>
#include <string>

#include "dockspan/syntax/ast_builder.hpp"

namespace dockspan
{

using syntax::Node;
using syntax::RuleKind;

// ============================================================================
// Other instructions
// ============================================================================

ParseResult<MiscInstruction> AstBuilder::build_misc(const Node & misc_node) const
{
  if (misc_node.kind() != RuleKind::Misc) {
    return syntax::unexpected_token(misc_node);
  }

  std::optional<SpannedString> name;
  std::optional<BreakableString> arguments;

  for (const auto & child : misc_node.children()) {
    if (child.kind() == RuleKind::MiscName && !name) {
      name = raw_string(child);
    } else if (child.kind() == RuleKind::AnyBreakable && name && !arguments) {
      auto built = build_breakable(child);
      if (!built) return built.error();
      arguments = std::move(built).value();
    } else {
      return syntax::unexpected_token(child);
    }
  }

  if (!name) {
    return ParseError::generic("instruction name is missing", misc_node.span());
  }
  if (!arguments) {
    // Bare instruction such as `HEALTHCHECK`
    arguments = BreakableString(Span::at(name->span.end()));
  }
  return MiscInstruction{misc_node.span(), std::move(*name), std::move(*arguments)};
}

// ============================================================================
// Dispatch
// ============================================================================

ParseResult<Instruction> AstBuilder::build_instruction(const Node & node) const
{
  switch (node.kind()) {
    case RuleKind::Copy: {
      auto copy = build_copy(node);
      if (!copy) return copy.error();
      return Instruction{std::move(copy).value()};
    }
    case RuleKind::Run: {
      auto run = build_run(node);
      if (!run) return run.error();
      return Instruction{std::move(run).value()};
    }
    case RuleKind::Misc: {
      auto misc = build_misc(node);
      if (!misc) return misc.error();
      return Instruction{std::move(misc).value()};
    }
    default:
      return syntax::unexpected_token(node);
  }
}

ParseResult<Dockerfile> AstBuilder::build_dockerfile(const Node & dockerfile_node) const
{
  if (dockerfile_node.kind() != RuleKind::Dockerfile) {
    return syntax::unexpected_token(dockerfile_node);
  }

  Dockerfile file;
  file.span = dockerfile_node.span();

  for (const auto & item : dockerfile_node.children()) {
    if (item.kind() == RuleKind::Comment) {
      file.comments.push_back(raw_string(item));
      continue;
    }
    auto instruction = build_instruction(item);
    if (!instruction) return instruction.error();
    file.instructions.push_back(std::move(instruction).value());
  }

  return file;
}

}  // namespace dockspan
