// dockspan/basic/error.hpp - Parse error taxonomy and result type
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "dockspan/basic/span.hpp"

namespace dockspan
{

// ============================================================================
// Error Kinds
// ============================================================================

/**
 * Closed set of failure kinds produced while building instructions.
 *
 * SyntaxError is only produced by the recognizer; the remaining kinds come
 * from the instruction assemblers and the conversion surface.
 */
enum class ErrorKind : uint8_t {
  GenericParseError,
  UnexpectedToken,
  HeredocTerminatorMismatch,
  UnmatchedHeredocTerminator,
  UnmatchedHeredocDelimiter,
  ConversionError,
  SyntaxError,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Stable diagnostic code for an error kind (e.g. "E0003")
[[nodiscard]] std::string_view error_code(ErrorKind kind) noexcept;

// ============================================================================
// ParseError
// ============================================================================

/**
 * A single parse failure. Errors are plain values; nothing in the parsing
 * pipeline throws.
 */
struct ParseError
{
  ErrorKind kind = ErrorKind::GenericParseError;
  std::string message;
  std::optional<Span> span;

  /// Shape violation (missing key/value, missing body or destination, ...)
  static ParseError generic(std::string message, std::optional<Span> span = std::nullopt);

  /// A child node whose rule kind the current builder state does not accept
  static ParseError unexpected_token(std::string_view rule, std::string_view text, Span span);

  /// Terminator text differs from `delimiter + "\n"`
  static ParseError heredoc_terminator_mismatch(
    std::string_view instruction, std::string_view delimiter, std::string_view terminator,
    Span span);

  /// Terminator with no pending opener
  static ParseError unmatched_heredoc_terminator(
    std::string_view instruction, std::string_view terminator, Span span);

  /// Instruction ended while openers were still pending
  static ParseError unmatched_heredoc_delimiter(
    std::string_view instruction, std::string_view delimiters, Span span);

  /// Narrowing an instruction to a family it does not have
  static ParseError conversion_error(std::string_view from, std::string_view to, Span span);

  /// Text that does not form an instruction
  static ParseError syntax_error(std::string message, Span span);

  [[nodiscard]] bool operator==(const ParseError & other) const
  {
    return kind == other.kind && message == other.message && span == other.span;
  }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * Parse result holding either a success value T or the first error met.
 */
template <typename T>
class ParseResult
{
public:
  using ValueType = T;
  using ErrorType = ParseError;

  // Construct with success value
  ParseResult(T value) : data_(std::move(value)) {}

  // Construct with an error
  ParseResult(ParseError error) : data_(std::move(error)) {}

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] bool has_error() const { return std::holds_alternative<ErrorType>(data_); }

  // Conversion to bool (true if has value)
  explicit operator bool() const { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<T>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<T>(data_); }
  T && value() && { return std::get<T>(std::move(data_)); }

  // Get the error (undefined behavior if has_value())
  ErrorType & error() & { return std::get<ErrorType>(data_); }
  [[nodiscard]] const ErrorType & error() const & { return std::get<ErrorType>(data_); }
  ErrorType && error() && { return std::get<ErrorType>(std::move(data_)); }

  // Pointer-like access
  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, ErrorType> data_;
};

}  // namespace dockspan
