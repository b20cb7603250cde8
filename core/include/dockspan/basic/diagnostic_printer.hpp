// dockspan/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "dockspan/basic/diagnostic.hpp"
#include "dockspan/basic/source_manager.hpp"

namespace dockspan
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0003]: invalid heredoc in COPY: terminator 'eof\n' does not match delimiter 'EOF'
 *     --> Dockerfile:4:1
 *      |
 *    4 | eof
 *      | ^^^ heredoc_terminator_mismatch
 *      |
 *      = help: the terminator line must repeat the delimiter exactly, on a line of its own
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print a single diagnostic against the file it was reported for.
  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print all diagnostics from a DiagnosticBag, ordered by position.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceManager & source);

  void print_source_line(
    const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace dockspan
