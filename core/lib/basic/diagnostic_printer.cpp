// dockspan/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "dockspan/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace dockspan
{

static std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  // The caller has already decided whether the stream wants colors.
  rang::setControlMode(use_color_ ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  // Convert to relative path for cleaner output
  std::string filename = "<input>";
  if (source.has_file_path()) {
    const auto & path = source.get_file_path();
    std::error_code ec;
    auto rel_path = std::filesystem::relative(path, std::filesystem::current_path(), ec);
    filename = (ec || rel_path.empty()) ? path.string() : rel_path.string();
  }

  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  const std::optional<Span> primary = diag.primary_span();
  const FullSpan primary_fs = primary ? source.get_full_span(*primary) : FullSpan{};
  if (primary_fs.is_valid()) {
    fmt::print(
      os_, "{} {}\n", gutter_arrow(),
      fmt::format("{}:{}:{}", filename, primary_fs.start_line, primary_fs.start_column));
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  // === Empty gutter line ===
  fmt::print(os_, "{}\n", gutter_pipe());

  // === Labels (source snippets) ===
  for (const auto & label : diag.labels) {
    print_label_context(label, source);
  }

  // === Help message ===
  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  // Sort by primary start location (stable); spanless diagnostics go last
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      const auto sa = a.primary_span();
      const auto sb = b.primary_span();
      if (!sa || !sb) return sa.has_value() && !sb.has_value();
      return sa->start() < sb->start();
    });

  for (const auto & d : sorted_diags) {
    print(d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << name;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", name, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", name, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceManager & source)
{
  if (!label.span) {
    // No location - print as a note if message exists
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const FullSpan fs = source.get_full_span(*label.span);
  if (!fs.is_valid()) {
    return;
  }

  // Multi-line spans are marked up to the end of their first line.
  uint32_t end_col = fs.start_column + 1;
  if (fs.end_line == fs.start_line && fs.end_column > fs.start_column) {
    end_col = fs.end_column;
  } else if (fs.end_line > fs.start_line) {
    const auto first_line = source.get_line(fs.start_line - 1);
    end_col = std::max<uint32_t>(
      static_cast<uint32_t>(first_line.size()) + 1, fs.start_column + 1);
  }

  print_source_line(source, fs.start_line - 1, fs.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);

  const uint32_t line_num = line_index + 1;

  // Build cleaned line (tabs -> spaces)
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";  // 4 spaces per tab
    } else if (c != '\r' && c != '\n') {
      cleaned_line += c;
    }
  }

  // Print line number and source line
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  // Print marker line
  fmt::print(os_, "      {} ", gutter_pipe_only());

  // Skip to start column (tabs are four columns wide)
  std::string marker_prefix;
  uint32_t col = 1;
  for (size_t i = 0; col < start_col && i < line.size(); ++i, ++col) {
    marker_prefix += (line[i] == '\t') ? "    " : " ";
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;

  fmt::print(os_, "{}", marker_prefix);

  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace dockspan
