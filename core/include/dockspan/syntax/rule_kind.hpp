// dockspan/syntax/rule_kind.hpp - Rule tags of the token tree
#pragma once

#include <cstdint>
#include <string_view>

namespace dockspan::syntax
{

/**
 * Tag of a token tree node. Wrapper rules (Copy, Run, ...) group the leaf
 * rules of one instruction family.
 */
enum class RuleKind : uint8_t {
  Dockerfile,
  Comment,

  // COPY
  Copy,
  CopyStandard,
  CopyHeredoc,
  CopyFlag,
  CopyFlagName,
  CopyFlagValue,
  CopyPathspec,

  // Heredocs (COPY and RUN)
  HeredocDelimiter,
  HeredocBody,
  HeredocTerminator,

  // RUN
  Run,
  RunOption,
  RunOptionName,
  RunOptionValue,
  RunExec,
  ExecString,
  RunShell,
  RunHeredoc,

  // Shell text split by continuations
  AnyBreakable,
  BreakableLiteral,

  // Everything else
  Misc,
  MiscName,
};

/// Grammar name of a rule, e.g. "copy_pathspec"
[[nodiscard]] std::string_view to_string(RuleKind kind) noexcept;

}  // namespace dockspan::syntax
