// dockspan/syntax/BuildRun.cpp - RUN instruction assembly
#include <optional>
#include <string>

#include "dockspan/syntax/ast_builder.hpp"

namespace dockspan
{

using syntax::Node;
using syntax::RuleKind;

ParseResult<RunInstruction> AstBuilder::build_run(const Node & run_node) const
{
  if (run_node.kind() != RuleKind::Run) {
    return syntax::unexpected_token(run_node);
  }

  RunInstruction run;
  run.span = run_node.span();
  bool has_expr = false;

  for (const auto & child : run_node.children()) {
    if (has_expr) {
      return syntax::unexpected_token(child);
    }
    switch (child.kind()) {
      case RuleKind::RunOption: {
        auto option = build_run_option(child);
        if (!option) return option.error();
        run.options.push_back(std::move(option).value());
        break;
      }
      case RuleKind::Comment:
        break;
      case RuleKind::RunExec: {
        auto exec = build_string_array(child);
        if (!exec) return exec.error();
        run.expr = std::move(exec).value();
        has_expr = true;
        break;
      }
      case RuleKind::RunShell: {
        auto shell = build_run_shell(child);
        if (!shell) return shell.error();
        run.expr = std::move(shell).value();
        has_expr = true;
        break;
      }
      default:
        return syntax::unexpected_token(child);
    }
  }

  if (!has_expr) {
    return ParseError::generic("missing run expression", run_node.span());
  }
  return run;
}

ParseResult<RunOption> AstBuilder::build_run_option(const Node & option_node) const
{
  std::optional<SpannedString> name;
  std::optional<SpannedString> value;

  for (const auto & field : option_node.children()) {
    switch (field.kind()) {
      case RuleKind::RunOptionName:
        name = raw_string(field);
        break;
      case RuleKind::RunOptionValue:
        value = raw_string(field);
        break;
      default:
        return syntax::unexpected_token(field);
    }
  }

  if (!name) {
    return ParseError::generic("run options require a key", option_node.span());
  }
  if (!value) {
    return ParseError::generic("run options require a value", option_node.span());
  }
  return RunOption{
    option_node.span(), std::move(*name), std::move(*value), std::string(option_node.text())};
}

ParseResult<StringArray> AstBuilder::build_string_array(const Node & exec_node) const
{
  StringArray array;
  array.span = exec_node.span();

  for (const auto & element : exec_node.children()) {
    switch (element.kind()) {
      case RuleKind::ExecString: {
        auto value = decode_string(element);
        if (!value) return value.error();
        array.elements.push_back(std::move(value).value());
        break;
      }
      case RuleKind::Comment:
        break;
      default:
        return syntax::unexpected_token(element);
    }
  }
  return array;
}

// Shell text, optionally followed by one heredoc. A heredoc with no text
// before it gets an empty shell string anchored at the heredoc start.
ParseResult<ShellOrExecExpr> AstBuilder::build_run_shell(const Node & shell_node) const
{
  if (shell_node.child_count() == 0) {
    return ParseError::generic("missing run shell expression", shell_node.span());
  }

  const Node & first = shell_node.child(0);
  if (first.kind() == RuleKind::RunHeredoc) {
    if (shell_node.child_count() > 1) {
      return syntax::unexpected_token(shell_node.child(1));
    }
    auto heredoc = build_heredoc(first, "RUN");
    if (!heredoc) return heredoc.error();
    return ShellOrExecExpr{ShellWithHeredoc{
      BreakableString(Span::at(first.span().start())), std::move(heredoc).value()}};
  }
  if (first.kind() != RuleKind::AnyBreakable) {
    return syntax::unexpected_token(first);
  }

  auto shell = build_breakable(first);
  if (!shell) return shell.error();
  if (shell_node.child_count() == 1) {
    return ShellOrExecExpr{std::move(shell).value()};
  }

  const Node & second = shell_node.child(1);
  if (second.kind() != RuleKind::RunHeredoc) {
    return syntax::unexpected_token(second);
  }
  if (shell_node.child_count() > 2) {
    return syntax::unexpected_token(shell_node.child(2));
  }
  auto heredoc = build_heredoc(second, "RUN");
  if (!heredoc) return heredoc.error();
  return ShellOrExecExpr{ShellWithHeredoc{std::move(shell).value(), std::move(heredoc).value()}};
}

}  // namespace dockspan
