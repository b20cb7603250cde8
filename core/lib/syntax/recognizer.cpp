// dockspan/syntax/recognizer.cpp - Hand-written Dockerfile grammar
#include "dockspan/syntax/recognizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>

namespace dockspan::syntax
{
namespace
{

bool is_blank(char c) { return c == ' ' || c == '\t'; }

bool is_keyword_char(unsigned char c) { return std::isalpha(c) != 0; }

bool is_delimiter_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }

bool is_delimiter_continue(unsigned char c)
{
  return (std::isalnum(c) != 0) || c == '_' || c == '-' || c == '.';
}

char ascii_lower(char c)
{
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool iequals(std::string_view a, std::string_view b)
{
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return ascii_lower(x) == ascii_lower(y);
         });
}

std::string_view trim_line(std::string_view s)
{
  while (!s.empty() && (is_blank(s.front()) || s.front() == '\r')) s.remove_prefix(1);
  while (!s.empty() && (is_blank(s.back()) || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

}  // namespace

std::string_view heredoc_delimiter_name(std::string_view raw) noexcept
{
  while (!raw.empty() && is_blank(raw.front())) raw.remove_prefix(1);
  while (!raw.empty() && is_blank(raw.back())) raw.remove_suffix(1);
  if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'') && raw.back() == raw.front()) {
    raw = raw.substr(1, raw.size() - 2);
  }
  return raw;
}

// ============================================================================
// Entry points
// ============================================================================

RecognizeOutput Recognizer::recognize_document()
{
  pos_ = 0;
  empty_continuation_lines_.clear();

  RecognizeOutput out;
  std::vector<Node> items;

  while (!eof()) {
    skip_inline_whitespace();
    if (eof()) break;
    if (at_line_break()) {
      skip_line_break();
      continue;
    }
    if (peek() == '#') {
      items.push_back(comment_line());
      continue;
    }

    auto ins = instruction();
    if (!ins) {
      out.errors.push_back(std::move(ins).error());
      skip_to_next_line();
      continue;
    }
    items.push_back(std::move(ins).value());
  }

  out.document = make(RuleKind::Dockerfile, 0, src_.size(), std::move(items));
  out.empty_continuation_lines = std::move(empty_continuation_lines_);
  return out;
}

ParseResult<Node> Recognizer::recognize_instruction(RuleKind family)
{
  pos_ = 0;
  empty_continuation_lines_.clear();

  skip_blank_lines();
  auto ins = instruction();
  if (!ins) {
    return ins;
  }
  if (ins->kind() != family) {
    return ParseError::syntax_error(
      "expected a " + std::string(to_string(family)) + " instruction, found " +
        std::string(to_string(ins->kind())),
      ins->span());
  }

  skip_blank_lines();
  if (!eof()) {
    return ParseError::syntax_error("unexpected input after instruction", span(pos_, src_.size()));
  }
  return ins;
}

// ============================================================================
// Line structure
// ============================================================================

size_t Recognizer::line_break_at(size_t i) const noexcept
{
  if (i < src_.size() && src_[i] == '\n') return 1;
  if (i + 1 < src_.size() && src_[i] == '\r' && src_[i + 1] == '\n') return 2;
  return 0;
}

bool Recognizer::at_continuation() const noexcept
{
  if (peek() != '\\') {
    return false;
  }
  size_t i = pos_ + 1;
  while (i < src_.size() && is_blank(src_[i])) ++i;
  return i >= src_.size() || line_break_at(i) != 0;
}

bool Recognizer::at_token_end() const noexcept
{
  return eof() || is_blank(peek()) || at_line_break() || at_continuation();
}

void Recognizer::skip_inline_whitespace() noexcept
{
  while (!eof() && is_blank(peek())) advance();
}

void Recognizer::skip_blank_lines() noexcept
{
  while (!eof() && (is_blank(peek()) || at_line_break())) {
    advance(is_blank(peek()) ? 1 : line_break_at(pos_));
  }
}

void Recognizer::skip_continuation() noexcept
{
  advance();  // '\'
  skip_inline_whitespace();
  skip_line_break();
}

void Recognizer::skip_line_trivia(std::vector<Node> & comments)
{
  while (!eof()) {
    const size_t line_start = pos_;
    size_t i = pos_;
    while (i < src_.size() && is_blank(src_[i])) ++i;

    if (i >= src_.size()) {
      pos_ = i;
      return;
    }
    if (const size_t n = line_break_at(i); n != 0) {
      empty_continuation_lines_.push_back(span(line_start, i));
      pos_ = i + n;
      continue;
    }
    if (src_[i] == '#') {
      pos_ = i;
      comments.push_back(comment_line());
      skip_line_break();
      continue;
    }

    // Content line: its indentation belongs to what follows.
    pos_ = line_start;
    return;
  }
}

bool Recognizer::skip_separators(std::vector<Node> & comments)
{
  bool consumed = false;
  while (!eof()) {
    if (is_blank(peek())) {
      advance();
      consumed = true;
      continue;
    }
    if (at_continuation()) {
      skip_continuation();
      skip_line_trivia(comments);
      consumed = true;
      continue;
    }
    break;
  }
  return consumed;
}

void Recognizer::skip_to_next_line() noexcept
{
  while (!eof()) {
    if (at_continuation()) {
      skip_continuation();
      continue;
    }
    if (at_line_break()) {
      skip_line_break();
      return;
    }
    advance();
  }
}

// ============================================================================
// Instructions
// ============================================================================

ParseResult<Node> Recognizer::instruction()
{
  const size_t start = pos_;
  while (!eof() && is_keyword_char(static_cast<unsigned char>(peek()))) advance();

  if (pos_ == start) {
    return ParseError::syntax_error(
      "expected an instruction keyword", span(start, std::min(start + 1, src_.size())));
  }
  const size_t keyword_end = pos_;
  if (!eof() && !is_blank(peek()) && !at_line_break() && !at_continuation()) {
    return ParseError::syntax_error(
      "expected whitespace after instruction keyword", span(start, keyword_end + 1));
  }

  const std::string_view keyword = src_.substr(start, keyword_end - start);
  if (iequals(keyword, "copy")) {
    return copy_instruction(start, keyword_end);
  }
  if (iequals(keyword, "run")) {
    return run_instruction(start);
  }
  return misc_instruction(start, keyword_end);
}

ParseResult<Node> Recognizer::copy_instruction(size_t start, size_t keyword_end)
{
  std::vector<Node> children;
  std::vector<PendingHeredoc> pending;
  bool flags_allowed = true;

  while (true) {
    const bool separated = skip_separators(children);
    if (eof() || at_line_break()) break;
    if (!separated) {
      return ParseError::syntax_error(
        "expected whitespace between copy arguments", span(pos_, pos_ + 1));
    }

    if (flags_allowed && starts_with("--")) {
      children.push_back(flag(RuleKind::CopyFlag, RuleKind::CopyFlagName, RuleKind::CopyFlagValue));
      continue;
    }
    flags_allowed = false;

    if (auto opener = heredoc_opener(pending)) {
      children.push_back(std::move(*opener));
      continue;
    }

    auto path = path_token();
    if (!path) {
      return path.error();
    }
    children.push_back(std::move(path).value());
  }

  const RuleKind form = pending.empty() ? RuleKind::CopyStandard : RuleKind::CopyHeredoc;
  if (!pending.empty()) {
    heredoc_bodies(std::move(pending), children);
  }

  std::vector<Node> wrapper;
  wrapper.push_back(make(form, keyword_end, pos_, std::move(children)));
  return make(RuleKind::Copy, start, pos_, std::move(wrapper));
}

Node Recognizer::run_instruction(size_t start)
{
  std::vector<Node> children;

  // Options. A continuation is only taken here when an option follows it;
  // otherwise it belongs to the shell text.
  while (true) {
    const size_t before = pos_;
    const size_t empty_lines = empty_continuation_lines_.size();
    skip_inline_whitespace();
    const size_t after_blanks = pos_;

    std::vector<Node> trivia;
    const bool separated = skip_separators(trivia) || after_blanks > before;
    if (separated && starts_with("--")) {
      std::move(trivia.begin(), trivia.end(), std::back_inserter(children));
      children.push_back(
        flag(RuleKind::RunOption, RuleKind::RunOptionName, RuleKind::RunOptionValue));
      continue;
    }

    pos_ = after_blanks;
    empty_continuation_lines_.resize(empty_lines);
    break;
  }

  // Exec form: a complete string list ending the instruction.
  const size_t body_start = pos_;
  const size_t empty_lines = empty_continuation_lines_.size();
  {
    std::vector<Node> trivia;
    (void)skip_separators(trivia);
    if (peek() == '[') {
      if (auto exec = exec_array()) {
        skip_inline_whitespace();
        if (eof() || at_line_break()) {
          std::move(trivia.begin(), trivia.end(), std::back_inserter(children));
          children.push_back(std::move(*exec));
          return make(RuleKind::Run, start, pos_, std::move(children));
        }
      }
    }
    pos_ = body_start;
    empty_continuation_lines_.resize(empty_lines);
  }

  // Shell form, optionally ending in a heredoc.
  std::vector<Node> shell;
  Node text = breakable(true);
  if (text.child_count() > 0) {
    shell.push_back(std::move(text));
  }
  if (at_heredoc_opener()) {
    shell.push_back(run_heredoc());
  }
  if (!shell.empty()) {
    const size_t shell_start = shell.front().span().start();
    children.push_back(make(RuleKind::RunShell, shell_start, pos_, std::move(shell)));
  }

  return make(RuleKind::Run, start, pos_, std::move(children));
}

Node Recognizer::misc_instruction(size_t start, size_t keyword_end)
{
  std::vector<Node> children;
  children.push_back(make(RuleKind::MiscName, start, keyword_end));

  skip_inline_whitespace();
  Node arguments = breakable(false);
  if (arguments.child_count() > 0) {
    children.push_back(std::move(arguments));
  }
  return make(RuleKind::Misc, start, pos_, std::move(children));
}

// ============================================================================
// Tokens
// ============================================================================

Node Recognizer::comment_line()
{
  const size_t start = pos_;
  while (!eof() && !at_line_break()) advance();
  return make(RuleKind::Comment, start, pos_);
}

Node Recognizer::flag(RuleKind flag_kind, RuleKind name_kind, RuleKind value_kind)
{
  const size_t start = pos_;
  advance(2);  // "--"

  std::vector<Node> parts;
  const size_t name_start = pos_;
  while (!at_token_end() && peek() != '=') advance();
  if (pos_ > name_start) {
    parts.push_back(make(name_kind, name_start, pos_));
  }

  if (peek() == '=') {
    advance();
    const size_t value_start = pos_;
    while (!at_token_end()) advance();
    if (pos_ > value_start) {
      parts.push_back(make(value_kind, value_start, pos_));
    }
  }

  return make(flag_kind, start, pos_, std::move(parts));
}

ParseResult<Node> Recognizer::path_token()
{
  const size_t start = pos_;
  if (peek() != '"') {
    while (!at_token_end()) advance();
    return make(RuleKind::CopyPathspec, start, pos_);
  }

  advance();
  while (true) {
    if (eof() || at_line_break()) {
      return ParseError::syntax_error("unterminated quoted path", span(start, pos_));
    }
    const char c = peek();
    if (c == '\\' && line_break_at(pos_ + 1) == 0 && pos_ + 1 < src_.size()) {
      advance(2);
      continue;
    }
    advance();
    if (c == '"') break;
  }
  return make(RuleKind::CopyPathspec, start, pos_);
}

std::optional<Node> Recognizer::exec_array()
{
  const size_t start = pos_;
  advance();  // '['

  std::vector<Node> items;
  (void)skip_separators(items);
  if (peek() == ']') {
    advance();
    return make(RuleKind::RunExec, start, pos_, std::move(items));
  }

  while (true) {
    if (peek() != '"') {
      return std::nullopt;
    }
    const size_t item_start = pos_;
    advance();
    while (true) {
      if (eof() || at_line_break()) {
        return std::nullopt;
      }
      const char c = peek();
      advance();
      if (c == '\\') {
        if (eof() || at_line_break()) {
          return std::nullopt;
        }
        advance();
        continue;
      }
      if (c == '"') break;
    }
    items.push_back(make(RuleKind::ExecString, item_start, pos_));

    (void)skip_separators(items);
    if (peek() == ',') {
      advance();
      (void)skip_separators(items);
      continue;
    }
    if (peek() == ']') {
      advance();
      return make(RuleKind::RunExec, start, pos_, std::move(items));
    }
    return std::nullopt;
  }
}

Node Recognizer::breakable(bool allow_heredoc)
{
  const size_t start = pos_;
  std::vector<Node> parts;
  size_t fragment_start = pos_;
  char quote = 0;

  const auto flush = [&](size_t end) {
    if (end > fragment_start) {
      parts.push_back(make(RuleKind::BreakableLiteral, fragment_start, end));
    }
  };

  while (!eof()) {
    if (at_line_break()) break;
    if (at_continuation()) {
      flush(pos_);
      skip_continuation();
      skip_line_trivia(parts);
      fragment_start = pos_;
      continue;
    }
    if (allow_heredoc && quote == 0 && at_heredoc_opener()) break;

    const char c = peek();
    if (c == '\\' && quote != '\'') {
      advance();
      if (!eof() && !at_line_break()) advance();
      continue;
    }
    if (c == '"' && quote != '\'') {
      quote = (quote == '"') ? 0 : '"';
    } else if (c == '\'' && quote != '"') {
      quote = (quote == '\'') ? 0 : '\'';
    }
    advance();
  }
  flush(pos_);

  return make(RuleKind::AnyBreakable, start, pos_, std::move(parts));
}

// ============================================================================
// Heredocs
// ============================================================================

// Returns the end of the delimiter word of an opener at `opener` ("<<" or
// "<<-"), or 0 when no valid word follows. `word_start` receives the word's
// first byte.
size_t Recognizer::heredoc_word_end(
  size_t opener, size_t & word_start, bool & strip_tabs) const noexcept
{
  if (src_.substr(opener, 2) != "<<") return 0;
  if (opener > 0 && src_[opener - 1] == '<') return 0;  // "<<<" here-string

  size_t i = opener + 2;
  strip_tabs = i < src_.size() && src_[i] == '-';
  if (strip_tabs) ++i;
  while (i < src_.size() && is_blank(src_[i])) ++i;
  if (i >= src_.size()) return 0;

  word_start = i;
  const char first = src_[i];
  if (first == '"' || first == '\'') {
    size_t j = i + 1;
    while (j < src_.size() && src_[j] != first && line_break_at(j) == 0) ++j;
    if (j >= src_.size() || src_[j] != first || j == i + 1) return 0;
    return j + 1;
  }
  if (!is_delimiter_start(static_cast<unsigned char>(first))) return 0;

  size_t j = i + 1;
  while (j < src_.size() && is_delimiter_continue(static_cast<unsigned char>(src_[j]))) ++j;
  return j;
}

bool Recognizer::at_heredoc_opener() const noexcept
{
  size_t word_start = 0;
  bool strip_tabs = false;
  return heredoc_word_end(pos_, word_start, strip_tabs) != 0;
}

std::optional<Node> Recognizer::heredoc_opener(std::vector<PendingHeredoc> & pending)
{
  size_t word_start = 0;
  bool strip_tabs = false;
  const size_t word_end = heredoc_word_end(pos_, word_start, strip_tabs);
  if (word_end == 0) {
    return std::nullopt;
  }
  pos_ = word_end;
  Node delimiter = make(RuleKind::HeredocDelimiter, word_start, word_end);
  pending.push_back({std::string(heredoc_delimiter_name(delimiter.text())), strip_tabs});
  return delimiter;
}

Node Recognizer::run_heredoc()
{
  const size_t start = pos_;
  std::vector<Node> parts;
  std::vector<PendingHeredoc> pending;
  if (auto opener = heredoc_opener(pending)) {
    parts.push_back(std::move(*opener));
  }

  // The rest of the opener line (redirections, arguments) stays in the
  // heredoc span without a node of its own. Every further unquoted opener
  // on it starts a block too.
  char quote = 0;
  while (!eof() && !at_line_break()) {
    if (quote == 0) {
      if (auto opener = heredoc_opener(pending)) {
        parts.push_back(std::move(*opener));
        continue;
      }
    }

    const char c = peek();
    if (c == '\\' && quote != '\'') {
      advance();
      if (!eof() && !at_line_break()) advance();
      continue;
    }
    if (c == '"' && quote != '\'') {
      quote = (quote == '"') ? 0 : '"';
    } else if (c == '\'' && quote != '"') {
      quote = (quote == '\'') ? 0 : '\'';
    }
    advance();
  }

  heredoc_bodies(std::move(pending), parts);
  return make(RuleKind::RunHeredoc, start, pos_, std::move(parts));
}

// Exact: the line is a pending delimiter followed by a line break (leading
// tabs allowed for `<<-`). Otherwise: the line equals a pending delimiter
// ignoring surrounding blanks and ASCII case.
std::optional<Recognizer::TerminatorLine> Recognizer::find_terminator(
  size_t from, const std::vector<PendingHeredoc> & pending, bool exact) const
{
  size_t line_start = from;
  while (line_start < src_.size()) {
    const size_t newline = src_.find('\n', line_start);
    if (exact && newline == std::string_view::npos) break;

    const size_t content_end = (newline == std::string_view::npos) ? src_.size() : newline;
    const size_t next = (newline == std::string_view::npos) ? src_.size() : newline + 1;
    const std::string_view line = src_.substr(line_start, content_end - line_start);

    for (size_t i = 0; i < pending.size(); ++i) {
      if (!exact) {
        if (iequals(trim_line(line), pending[i].name)) {
          return TerminatorLine{i, line_start, line_start, next};
        }
        continue;
      }

      std::string_view content = line;
      if (!content.empty() && content.back() == '\r') content.remove_suffix(1);
      size_t indent = 0;
      if (pending[i].strip_tabs) {
        while (indent < content.size() && content[indent] == '\t') ++indent;
      }
      if (content.substr(indent) == pending[i].name) {
        return TerminatorLine{i, line_start, line_start + indent, next};
      }
    }
    line_start = next;
  }
  return std::nullopt;
}

// Scan block lines after the opener line. Each block closes at the first
// exact terminator line of any pending delimiter; the near-miss rule only
// applies when no exact line is left. Exact validation and ordering are
// checked by HeredocMatcher.
void Recognizer::heredoc_bodies(std::vector<PendingHeredoc> pending, std::vector<Node> & out)
{
  skip_line_break();

  while (!pending.empty()) {
    const size_t body_start = pos_;
    auto line = find_terminator(body_start, pending, true);
    if (!line) {
      line = find_terminator(body_start, pending, false);
    }

    if (!line) {
      pos_ = src_.size();
      out.push_back(make(RuleKind::HeredocBody, body_start, pos_));
      return;
    }

    out.push_back(make(RuleKind::HeredocBody, body_start, line->line_start));
    out.push_back(make(RuleKind::HeredocTerminator, line->terminator_start, line->next));
    pending.erase(pending.begin() + static_cast<std::ptrdiff_t>(line->index));
    pos_ = line->next;
  }
}

// ============================================================================
// Node construction
// ============================================================================

Node Recognizer::make(RuleKind kind, size_t start, size_t end) const
{
  return {kind, span(start, end), src_.substr(start, end - start)};
}

Node Recognizer::make(RuleKind kind, size_t start, size_t end, std::vector<Node> children) const
{
  return {kind, span(start, end), src_.substr(start, end - start), std::move(children)};
}

}  // namespace dockspan::syntax
