// dockspan/syntax/BuildCopy.cpp - COPY instruction assembly
#include <optional>
#include <string>
#include <vector>

#include "dockspan/syntax/ast_builder.hpp"
#include "dockspan/syntax/heredoc_matcher.hpp"

namespace dockspan
{

using syntax::Node;
using syntax::RuleKind;

static constexpr const char * k_copy_arity_message =
  "copy requires at least one source and a destination";

ParseResult<CopyInstruction> AstBuilder::build_copy(const Node & copy_node) const
{
  if (copy_node.kind() != RuleKind::Copy) {
    return syntax::unexpected_token(copy_node);
  }
  if (copy_node.child_count() == 0) {
    return ParseError::generic("copy instruction expected a field", copy_node.span());
  }
  if (copy_node.child_count() > 1) {
    return syntax::unexpected_token(copy_node.child(1));
  }

  const Node & form = copy_node.child(0);
  switch (form.kind()) {
    case RuleKind::CopyStandard:
      return build_copy_standard(form, copy_node.span());
    case RuleKind::CopyHeredoc:
      return build_copy_heredoc(form, copy_node.span());
    default:
      return syntax::unexpected_token(form);
  }
}

ParseResult<CopyFlag> AstBuilder::build_copy_flag(const Node & flag_node) const
{
  std::optional<SpannedString> name;
  std::optional<SpannedString> value;

  for (const auto & field : flag_node.children()) {
    switch (field.kind()) {
      case RuleKind::CopyFlagName:
        name = raw_string(field);
        break;
      case RuleKind::CopyFlagValue:
        value = raw_string(field);
        break;
      default:
        return syntax::unexpected_token(field);
    }
  }

  if (!name) {
    return ParseError::generic("copy flags require a key", flag_node.span());
  }
  if (!value) {
    return ParseError::generic("copy flags require a value", flag_node.span());
  }
  return CopyFlag{flag_node.span(), std::move(*name), std::move(*value)};
}

ParseResult<CopyInstruction> AstBuilder::build_copy_standard(const Node & form, Span span) const
{
  CopyInstruction copy;
  copy.span = span;
  std::vector<SpannedString> paths;

  for (const auto & child : form.children()) {
    switch (child.kind()) {
      case RuleKind::CopyFlag: {
        auto flag = build_copy_flag(child);
        if (!flag) return flag.error();
        copy.flags.push_back(std::move(flag).value());
        break;
      }
      case RuleKind::CopyPathspec: {
        auto path = decode_string(child);
        if (!path) return path.error();
        paths.push_back(std::move(path).value());
        break;
      }
      case RuleKind::Comment:
        break;
      default:
        return syntax::unexpected_token(child);
    }
  }

  if (paths.size() < 2) {
    return ParseError::generic(k_copy_arity_message, span);
  }

  copy.destination = std::move(paths.back());
  paths.pop_back();
  for (auto & p : paths) {
    copy.sources.emplace_back(FileName{std::move(p)});
  }
  return copy;
}

// Openers, paths and flags come first (in source order), then one body and
// terminator pair per opener. The k-th closed block belongs to the k-th
// opener, so sources keep the order in which openers and paths were written.
ParseResult<CopyInstruction> AstBuilder::build_copy_heredoc(const Node & form, Span span) const
{
  struct Slot
  {
    bool is_heredoc = false;
    SpannedString path;
  };

  CopyInstruction copy;
  copy.span = span;
  syntax::HeredocMatcher matcher{"COPY"};
  std::vector<Slot> slots;
  std::vector<SpannedString> contents;
  const Node * body = nullptr;

  for (const auto & child : form.children()) {
    switch (child.kind()) {
      case RuleKind::CopyFlag: {
        auto flag = build_copy_flag(child);
        if (!flag) return flag.error();
        copy.flags.push_back(std::move(flag).value());
        break;
      }
      case RuleKind::CopyPathspec: {
        auto path = decode_string(child);
        if (!path) return path.error();
        slots.push_back(Slot{false, std::move(path).value()});
        break;
      }
      case RuleKind::HeredocDelimiter:
        matcher.open(decode_delimiter(child));
        slots.push_back(Slot{true, {}});
        break;
      case RuleKind::HeredocBody:
        if (body != nullptr) return syntax::unexpected_token(child);
        body = &child;
        break;
      case RuleKind::HeredocTerminator: {
        if (body == nullptr) return syntax::unexpected_token(child);
        auto match = matcher.close(decode_terminator(child));
        if (!match) return match.error();
        contents.push_back(raw_string(*body));
        body = nullptr;
        break;
      }
      case RuleKind::Comment:
        break;
      default:
        return syntax::unexpected_token(child);
    }
  }

  if (auto unmatched = matcher.finish()) {
    return *unmatched;
  }
  if (body != nullptr) {
    return syntax::unexpected_token(*body);
  }

  // The last path is the destination.
  auto dest = slots.end();
  for (auto it = slots.begin(); it != slots.end(); ++it) {
    if (!it->is_heredoc) dest = it;
  }
  if (dest == slots.end() || contents.empty()) {
    return ParseError::generic(k_copy_arity_message, span);
  }
  copy.destination = std::move(dest->path);
  slots.erase(dest);

  size_t next_content = 0;
  for (auto & slot : slots) {
    if (slot.is_heredoc) {
      copy.sources.emplace_back(FileContents{std::move(contents[next_content++])});
    } else {
      copy.sources.emplace_back(FileName{std::move(slot.path)});
    }
  }
  return copy;
}

}  // namespace dockspan
