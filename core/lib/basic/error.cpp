// dockspan/basic/error.cpp - Parse error construction
#include "dockspan/basic/error.hpp"

namespace dockspan
{

std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::GenericParseError:
      return "GenericParseError";
    case ErrorKind::UnexpectedToken:
      return "UnexpectedToken";
    case ErrorKind::HeredocTerminatorMismatch:
      return "HeredocTerminatorMismatch";
    case ErrorKind::UnmatchedHeredocTerminator:
      return "UnmatchedHeredocTerminator";
    case ErrorKind::UnmatchedHeredocDelimiter:
      return "UnmatchedHeredocDelimiter";
    case ErrorKind::ConversionError:
      return "ConversionError";
    case ErrorKind::SyntaxError:
      return "SyntaxError";
  }
  return "UnknownError";
}

std::string_view error_code(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::GenericParseError:
      return "E0001";
    case ErrorKind::UnexpectedToken:
      return "E0002";
    case ErrorKind::HeredocTerminatorMismatch:
      return "E0003";
    case ErrorKind::UnmatchedHeredocTerminator:
      return "E0004";
    case ErrorKind::UnmatchedHeredocDelimiter:
      return "E0005";
    case ErrorKind::ConversionError:
      return "E0006";
    case ErrorKind::SyntaxError:
      return "E0100";
  }
  return "E9999";
}

// Render a terminator line so its trailing newline stays visible in messages.
static std::string escape_line(std::string_view text)
{
  std::string out;
  out.reserve(text.size() + 2);
  for (const char c : text) {
    if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

ParseError ParseError::generic(std::string message, std::optional<Span> span)
{
  return ParseError{ErrorKind::GenericParseError, std::move(message), span};
}

ParseError ParseError::unexpected_token(std::string_view rule, std::string_view text, Span span)
{
  std::string msg = "unexpected token ";
  msg += rule;
  if (!text.empty()) {
    msg += " '" + escape_line(text) + "'";
  }
  msg += " at " + span.to_string();
  return ParseError{ErrorKind::UnexpectedToken, std::move(msg), span};
}

ParseError ParseError::heredoc_terminator_mismatch(
  std::string_view instruction, std::string_view delimiter, std::string_view terminator,
  Span span)
{
  std::string msg = "invalid heredoc in ";
  msg += instruction;
  msg += ": terminator '" + escape_line(terminator) + "' does not match delimiter '";
  msg += delimiter;
  msg += "'";
  return ParseError{ErrorKind::HeredocTerminatorMismatch, std::move(msg), span};
}

ParseError ParseError::unmatched_heredoc_terminator(
  std::string_view instruction, std::string_view terminator, Span span)
{
  std::string msg = "heredoc terminator '" + escape_line(terminator) + "' in ";
  msg += instruction;
  msg += " has no matching delimiter";
  return ParseError{ErrorKind::UnmatchedHeredocTerminator, std::move(msg), span};
}

ParseError ParseError::unmatched_heredoc_delimiter(
  std::string_view instruction, std::string_view delimiters, Span span)
{
  std::string msg = "unmatched heredoc delimiters in ";
  msg += instruction;
  msg += ": ";
  msg += delimiters;
  return ParseError{ErrorKind::UnmatchedHeredocDelimiter, std::move(msg), span};
}

ParseError ParseError::conversion_error(std::string_view from, std::string_view to, Span span)
{
  std::string msg = "cannot convert ";
  msg += from;
  msg += " to ";
  msg += to;
  return ParseError{ErrorKind::ConversionError, std::move(msg), span};
}

ParseError ParseError::syntax_error(std::string message, Span span)
{
  return ParseError{ErrorKind::SyntaxError, std::move(message), span};
}

}  // namespace dockspan
