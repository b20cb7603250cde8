// dockspan/syntax/ast_builder.hpp - Token tree -> typed instruction records
#pragma once

#include <string_view>

#include "dockspan/ast/instructions.hpp"
#include "dockspan/basic/error.hpp"
#include "dockspan/syntax/node.hpp"

namespace dockspan
{

/**
 * Assembles instruction records from recognized token trees.
 *
 * One entry point per instruction family. Assembly is depth-first and
 * fails fast: the first structural problem is returned and no partial
 * record is produced. The builder holds no state, so independent
 * instructions may be built concurrently.
 */
class AstBuilder
{
public:
  AstBuilder() = default;

  [[nodiscard]] ParseResult<CopyInstruction> build_copy(const syntax::Node & copy_node) const;
  [[nodiscard]] ParseResult<RunInstruction> build_run(const syntax::Node & run_node) const;
  [[nodiscard]] ParseResult<MiscInstruction> build_misc(const syntax::Node & misc_node) const;

  /// Dispatch on the node's rule kind (Copy, Run or Misc)
  [[nodiscard]] ParseResult<Instruction> build_instruction(const syntax::Node & node) const;

  /// Every instruction and top-level comment of a Dockerfile node
  [[nodiscard]] ParseResult<Dockerfile> build_dockerfile(const syntax::Node & dockerfile_node) const;

private:
  // COPY
  [[nodiscard]] ParseResult<CopyInstruction> build_copy_standard(
    const syntax::Node & form, Span span) const;
  [[nodiscard]] ParseResult<CopyInstruction> build_copy_heredoc(
    const syntax::Node & form, Span span) const;
  [[nodiscard]] ParseResult<CopyFlag> build_copy_flag(const syntax::Node & flag_node) const;

  // RUN
  [[nodiscard]] ParseResult<RunOption> build_run_option(const syntax::Node & option_node) const;
  [[nodiscard]] ParseResult<ShellOrExecExpr> build_run_shell(const syntax::Node & shell_node) const;
  [[nodiscard]] ParseResult<StringArray> build_string_array(const syntax::Node & exec_node) const;

  // Shared pieces
  [[nodiscard]] ParseResult<BreakableString> build_breakable(
    const syntax::Node & breakable_node) const;
  [[nodiscard]] ParseResult<Heredoc> build_heredoc(
    const syntax::Node & heredoc_node, std::string_view instruction) const;

  // Value decoding
  [[nodiscard]] static ParseResult<SpannedString> decode_string(const syntax::Node & n);
  [[nodiscard]] static SpannedString raw_string(const syntax::Node & n);
  [[nodiscard]] static SpannedString decode_delimiter(const syntax::Node & n);
  [[nodiscard]] static SpannedString decode_terminator(const syntax::Node & n);
};

}  // namespace dockspan
