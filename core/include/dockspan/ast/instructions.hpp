// dockspan/ast/instructions.hpp - Typed instruction records
//
// Value types only: every record owns its strings and refers to the source
// buffer solely through spans. Closed variants (SourceType, ShellOrExecExpr,
// Instruction) are matched exhaustively with std::visit by callers.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "dockspan/ast/breakable_string.hpp"
#include "dockspan/ast/heredoc.hpp"
#include "dockspan/basic/error.hpp"
#include "dockspan/basic/span.hpp"

namespace dockspan
{

// ============================================================================
// COPY
// ============================================================================

/**
 * A `--name=value` flag of a COPY instruction, e.g. `--from=builder`.
 */
struct CopyFlag
{
  Span span;
  SpannedString name;
  SpannedString value;

  [[nodiscard]] bool operator==(const CopyFlag & other) const
  {
    return span == other.span && name == other.name && value == other.value;
  }
};

/// A copy source referring to a path in the build context
struct FileName
{
  SpannedString value;

  [[nodiscard]] bool operator==(const FileName & other) const { return value == other.value; }
};

/// A copy source whose content is given inline by a heredoc
struct FileContents
{
  SpannedString value;

  [[nodiscard]] bool operator==(const FileContents & other) const { return value == other.value; }
};

using SourceType = std::variant<FileName, FileContents>;

/// The path or content carried by a source, whichever it is
[[nodiscard]] const SpannedString & source_value(const SourceType & source) noexcept;

struct CopyInstruction
{
  Span span;
  std::vector<CopyFlag> flags;
  std::vector<SourceType> sources;  ///< never empty
  SpannedString destination;

  [[nodiscard]] bool operator==(const CopyInstruction & other) const
  {
    return span == other.span && flags == other.flags && sources == other.sources &&
           destination == other.destination;
  }
};

// ============================================================================
// RUN
// ============================================================================

/**
 * A `--name=value` option of a RUN instruction, e.g. `--mount=type=cache`.
 *
 * `original` keeps the option exactly as written for lossless redisplay.
 */
struct RunOption
{
  Span span;
  SpannedString name;
  SpannedString value;
  std::string original;

  [[nodiscard]] const std::string & to_string() const noexcept { return original; }

  [[nodiscard]] bool operator==(const RunOption & other) const
  {
    return span == other.span && name == other.name && value == other.value &&
           original == other.original;
  }
};

/**
 * A JSON-style string list (`["a", "b"]`). `span` covers the brackets; each
 * element span covers the quoted string while its content is unescaped.
 */
struct StringArray
{
  Span span;
  std::vector<SpannedString> elements;

  [[nodiscard]] bool operator==(const StringArray & other) const
  {
    return span == other.span && elements == other.elements;
  }
};

/// Shell text followed by a heredoc on the same logical line
struct ShellWithHeredoc
{
  BreakableString shell;
  Heredoc heredoc;

  [[nodiscard]] bool operator==(const ShellWithHeredoc & other) const
  {
    return shell == other.shell && heredoc == other.heredoc;
  }
};

/// Exec form, shell form, or shell form with a heredoc
using ShellOrExecExpr = std::variant<StringArray, BreakableString, ShellWithHeredoc>;

struct RunInstruction
{
  Span span;
  std::vector<RunOption> options;
  ShellOrExecExpr expr;

  /// Shell form body, or nullptr for exec form and heredoc bodies
  [[nodiscard]] const BreakableString * as_shell() const noexcept
  {
    return std::get_if<BreakableString>(&expr);
  }

  /// Exec form arguments, or nullptr
  [[nodiscard]] const StringArray * as_exec() const noexcept
  {
    return std::get_if<StringArray>(&expr);
  }

  /// Shell text plus heredoc, or nullptr
  [[nodiscard]] const ShellWithHeredoc * as_shell_with_heredoc() const noexcept
  {
    return std::get_if<ShellWithHeredoc>(&expr);
  }

  [[nodiscard]] bool operator==(const RunInstruction & other) const
  {
    return span == other.span && options == other.options && expr == other.expr;
  }
};

// ============================================================================
// Other instructions
// ============================================================================

/**
 * Any instruction without a dedicated record (FROM, ENV, CMD, ...): the
 * keyword as written plus its argument text.
 */
struct MiscInstruction
{
  Span span;
  SpannedString instruction;
  BreakableString arguments;

  [[nodiscard]] bool operator==(const MiscInstruction & other) const
  {
    return span == other.span && instruction == other.instruction &&
           arguments == other.arguments;
  }
};

// ============================================================================
// Instruction - closed union over the families
// ============================================================================

enum class InstructionKind : uint8_t {
  Copy,
  Run,
  Misc,
};

[[nodiscard]] std::string_view to_string(InstructionKind kind) noexcept;

template <typename T>
struct InstructionTraits;

template <>
struct InstructionTraits<CopyInstruction>
{
  static constexpr InstructionKind kind = InstructionKind::Copy;
  static constexpr std::string_view name = "CopyInstruction";
};

template <>
struct InstructionTraits<RunInstruction>
{
  static constexpr InstructionKind kind = InstructionKind::Run;
  static constexpr std::string_view name = "RunInstruction";
};

template <>
struct InstructionTraits<MiscInstruction>
{
  static constexpr InstructionKind kind = InstructionKind::Misc;
  static constexpr std::string_view name = "MiscInstruction";
};

class Instruction
{
public:
  using Variant = std::variant<CopyInstruction, RunInstruction, MiscInstruction>;

  Instruction(CopyInstruction copy) : data_(std::move(copy)) {}
  Instruction(RunInstruction run) : data_(std::move(run)) {}
  Instruction(MiscInstruction misc) : data_(std::move(misc)) {}

  [[nodiscard]] InstructionKind kind() const noexcept;
  [[nodiscard]] Span span() const noexcept;

  [[nodiscard]] const CopyInstruction * as_copy() const noexcept
  {
    return std::get_if<CopyInstruction>(&data_);
  }
  [[nodiscard]] const RunInstruction * as_run() const noexcept
  {
    return std::get_if<RunInstruction>(&data_);
  }
  [[nodiscard]] const MiscInstruction * as_misc() const noexcept
  {
    return std::get_if<MiscInstruction>(&data_);
  }

  [[nodiscard]] const Variant & variant() const noexcept { return data_; }

  /// Shape and location, e.g. "RunInstruction at 0..12"
  [[nodiscard]] std::string describe() const;

  [[nodiscard]] bool operator==(const Instruction & other) const { return data_ == other.data_; }
  [[nodiscard]] bool operator!=(const Instruction & other) const { return !(*this == other); }

private:
  Variant data_;
};

/**
 * Narrow an instruction to one family record.
 *
 * Fails with ErrorKind::ConversionError naming both shapes when the
 * instruction is of another family.
 */
template <typename T>
[[nodiscard]] ParseResult<T> instruction_cast(const Instruction & instruction)
{
  if (const T * record = std::get_if<T>(&instruction.variant())) {
    return *record;
  }
  return ParseError::conversion_error(
    instruction.describe(), InstructionTraits<T>::name, instruction.span());
}

// ============================================================================
// Dockerfile
// ============================================================================

/**
 * A whole file: instructions in source order plus top-level comment lines.
 */
struct Dockerfile
{
  Span span;
  std::vector<Instruction> instructions;
  std::vector<SpannedString> comments;

  [[nodiscard]] bool operator==(const Dockerfile & other) const
  {
    return span == other.span && instructions == other.instructions &&
           comments == other.comments;
  }
};

}  // namespace dockspan
