// dockspan/syntax/frontend.hpp - High-level parse pipeline entry points
#pragma once

#include <string_view>

#include "dockspan/ast/instructions.hpp"
#include "dockspan/basic/diagnostic.hpp"
#include "dockspan/basic/error.hpp"
#include "dockspan/syntax/rule_kind.hpp"

namespace dockspan
{

struct RecoveredDockerfile
{
  Dockerfile dockerfile;  ///< every instruction that assembled
  DiagnosticBag diags;    ///< one error per failed instruction, plus warnings
};

// Parse pipeline:
// source -> recognizer (token tree) -> AstBuilder (instruction records)

/// Whole file; the first error (recognizer or assembler) in source order wins.
[[nodiscard]] ParseResult<Dockerfile> parse_dockerfile(std::string_view source);

/**
 * Whole file, continuing past failures.
 *
 * Unreadable lines are skipped up to the next line, and instructions that
 * fail to assemble are left out of the result. Each failure becomes one
 * error diagnostic. Blank lines inside a continued instruction are reported
 * as warnings.
 */
[[nodiscard]] RecoveredDockerfile parse_dockerfile_with_recovery(std::string_view source);

/// Exactly one instruction of `family` (Copy, Run or Misc), surrounded by whitespace only.
[[nodiscard]] ParseResult<Instruction> parse_instruction(
  std::string_view source, syntax::RuleKind family);

}  // namespace dockspan
