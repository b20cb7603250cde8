// dockspan/syntax/recognizer.hpp - Dockerfile text -> token tree
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dockspan/basic/error.hpp"
#include "dockspan/syntax/node.hpp"

namespace dockspan::syntax
{

struct RecognizeOutput
{
  Node document;                               ///< RuleKind::Dockerfile
  std::vector<ParseError> errors;              ///< SyntaxError only
  std::vector<Span> empty_continuation_lines;  ///< blank lines inside a continued instruction
};

/**
 * Hand-written single-pass recognizer for the Dockerfile grammar.
 *
 * Produces the fully materialized token tree consumed by AstBuilder. It only
 * decides the shape of the text; value decoding and heredoc validation are
 * left to the builder, so a misspelled terminator still yields a tree.
 *
 * Line rules:
 * - `\` followed by blanks and a line break continues the instruction;
 *   blank lines and `#` comment lines right after it are skipped (comments
 *   become Comment nodes).
 * - COPY and RUN heredoc openers (`<<EOF`, `<<-EOF`, `<<"EOF"`) make the
 *   instruction extend over the following lines until every opened block
 *   has its terminator line. A terminator line is the delimiter alone on
 *   its line (tab-indented for `<<-`). When no such line exists, the first
 *   line that matches ignoring case and blanks is taken instead so the
 *   builder can report the mismatch.
 */
class Recognizer
{
public:
  explicit Recognizer(std::string_view src) : src_(src) {}

  /**
   * Recognize a whole file.
   *
   * A line that does not form an instruction is reported and skipped, so
   * later instructions are still recognized.
   */
  [[nodiscard]] RecognizeOutput recognize_document();

  /**
   * Recognize exactly one instruction of the given family (Copy, Run or
   * Misc). Only whitespace may precede or follow it.
   */
  [[nodiscard]] ParseResult<Node> recognize_instruction(RuleKind family);

private:
  // Cursor
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept
  {
    return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
  }
  void advance(size_t n = 1) noexcept { pos_ += n; }

  // Line structure
  [[nodiscard]] size_t line_break_at(size_t i) const noexcept;
  [[nodiscard]] bool at_line_break() const noexcept { return line_break_at(pos_) != 0; }
  [[nodiscard]] bool at_continuation() const noexcept;
  [[nodiscard]] bool at_token_end() const noexcept;
  void skip_line_break() noexcept { advance(line_break_at(pos_)); }
  void skip_inline_whitespace() noexcept;
  void skip_blank_lines() noexcept;
  void skip_continuation() noexcept;
  void skip_line_trivia(std::vector<Node> & comments);
  bool skip_separators(std::vector<Node> & comments);
  void skip_to_next_line() noexcept;

  // Rules
  [[nodiscard]] ParseResult<Node> instruction();
  [[nodiscard]] ParseResult<Node> copy_instruction(size_t start, size_t keyword_end);
  [[nodiscard]] Node run_instruction(size_t start);
  [[nodiscard]] Node misc_instruction(size_t start, size_t keyword_end);

  [[nodiscard]] Node comment_line();
  [[nodiscard]] Node flag(RuleKind flag_kind, RuleKind name_kind, RuleKind value_kind);
  [[nodiscard]] ParseResult<Node> path_token();
  [[nodiscard]] std::optional<Node> exec_array();
  [[nodiscard]] Node breakable(bool allow_heredoc);
  [[nodiscard]] Node run_heredoc();

  /// An opened block waiting for its terminator line
  struct PendingHeredoc
  {
    std::string name;
    bool strip_tabs = false;  ///< `<<-` form: the terminator may be tab-indented
  };

  /// A line that closes pending[index]
  struct TerminatorLine
  {
    size_t index = 0;
    size_t line_start = 0;
    size_t terminator_start = 0;
    size_t next = 0;
  };

  [[nodiscard]] size_t heredoc_word_end(
    size_t opener, size_t & word_start, bool & strip_tabs) const noexcept;
  [[nodiscard]] bool at_heredoc_opener() const noexcept;
  [[nodiscard]] std::optional<Node> heredoc_opener(std::vector<PendingHeredoc> & pending);
  [[nodiscard]] std::optional<TerminatorLine> find_terminator(
    size_t from, const std::vector<PendingHeredoc> & pending, bool exact) const;
  void heredoc_bodies(std::vector<PendingHeredoc> pending, std::vector<Node> & out);

  [[nodiscard]] Node make(RuleKind kind, size_t start, size_t end) const;
  [[nodiscard]] Node make(RuleKind kind, size_t start, size_t end, std::vector<Node> children) const;
  [[nodiscard]] Span span(size_t start, size_t end) const noexcept
  {
    return {static_cast<uint32_t>(start), static_cast<uint32_t>(end)};
  }

  std::string_view src_;
  size_t pos_ = 0;
  std::vector<Span> empty_continuation_lines_;
};

/// Delimiter name of an opener token: surrounding blanks and quotes removed
[[nodiscard]] std::string_view heredoc_delimiter_name(std::string_view raw) noexcept;

}  // namespace dockspan::syntax
