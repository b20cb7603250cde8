// dockspan/syntax/node.cpp - Token tree helpers
#include "dockspan/syntax/node.hpp"

namespace dockspan::syntax
{

std::string_view to_string(RuleKind kind) noexcept
{
  switch (kind) {
    case RuleKind::Dockerfile:
      return "dockerfile";
    case RuleKind::Comment:
      return "comment";
    case RuleKind::Copy:
      return "copy";
    case RuleKind::CopyStandard:
      return "copy_standard";
    case RuleKind::CopyHeredoc:
      return "copy_heredoc";
    case RuleKind::CopyFlag:
      return "copy_flag";
    case RuleKind::CopyFlagName:
      return "copy_flag_name";
    case RuleKind::CopyFlagValue:
      return "copy_flag_value";
    case RuleKind::CopyPathspec:
      return "copy_pathspec";
    case RuleKind::HeredocDelimiter:
      return "heredoc_delimiter";
    case RuleKind::HeredocBody:
      return "heredoc_body";
    case RuleKind::HeredocTerminator:
      return "heredoc_terminator";
    case RuleKind::Run:
      return "run";
    case RuleKind::RunOption:
      return "run_option";
    case RuleKind::RunOptionName:
      return "run_option_name";
    case RuleKind::RunOptionValue:
      return "run_option_value";
    case RuleKind::RunExec:
      return "run_exec";
    case RuleKind::ExecString:
      return "exec_string";
    case RuleKind::RunShell:
      return "run_shell";
    case RuleKind::RunHeredoc:
      return "run_heredoc";
    case RuleKind::AnyBreakable:
      return "any_breakable";
    case RuleKind::BreakableLiteral:
      return "breakable_literal";
    case RuleKind::Misc:
      return "misc";
    case RuleKind::MiscName:
      return "misc_name";
  }
  return "unknown";
}

ParseError unexpected_token(const Node & node)
{
  return ParseError::unexpected_token(to_string(node.kind()), node.text(), node.span());
}

}  // namespace dockspan::syntax
