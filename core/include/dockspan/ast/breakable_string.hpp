// dockspan/ast/breakable_string.hpp - Shell text split by line continuations
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dockspan/basic/span.hpp"

namespace dockspan
{

enum class FragmentKind : uint8_t {
  Literal,
  Comment,
};

/**
 * One literal or comment chunk of a breakable expression.
 */
struct Fragment
{
  Span span;
  FragmentKind kind = FragmentKind::Literal;
  std::string text;

  [[nodiscard]] bool is_literal() const noexcept { return kind == FragmentKind::Literal; }
  [[nodiscard]] bool is_comment() const noexcept { return kind == FragmentKind::Comment; }

  [[nodiscard]] bool operator==(const Fragment & other) const
  {
    return span == other.span && kind == other.kind && text == other.text;
  }
};

/**
 * A shell-form body that may be continued over several physical lines with
 * interleaved comment lines.
 *
 * Literal fragments keep their text exactly as written (indentation and
 * trailing blanks included); the continuation markers themselves are not
 * part of any fragment. Comment fragments are kept for source mapping but
 * never contribute to effective_text().
 *
 * @code
 *     auto s = BreakableString(Span(4, 20))
 *                .add_literal(Span(4, 9), "echo ")
 *                .add_comment(Span(10, 15), "# hey")
 *                .add_literal(Span(16, 20), "  hi");
 *     s.effective_text();  // "echo   hi"
 * @endcode
 */
class BreakableString
{
public:
  BreakableString() = default;
  explicit BreakableString(Span span) : span_(span) {}

  /// Append a literal fragment, returning the extended value
  [[nodiscard]] BreakableString add_literal(Span span, std::string text) const &;
  [[nodiscard]] BreakableString add_literal(Span span, std::string text) &&;

  /// Append a comment fragment, returning the extended value
  [[nodiscard]] BreakableString add_comment(Span span, std::string text) const &;
  [[nodiscard]] BreakableString add_comment(Span span, std::string text) &&;

  [[nodiscard]] Span span() const noexcept { return span_; }
  [[nodiscard]] const std::vector<Fragment> & fragments() const noexcept { return fragments_; }
  [[nodiscard]] bool empty() const noexcept { return fragments_.empty(); }

  /// Concatenation of the literal fragments, in order
  [[nodiscard]] std::string effective_text() const;

  [[nodiscard]] std::string to_string() const { return effective_text(); }

  [[nodiscard]] bool operator==(const BreakableString & other) const
  {
    return span_ == other.span_ && fragments_ == other.fragments_;
  }
  [[nodiscard]] bool operator!=(const BreakableString & other) const { return !(*this == other); }

private:
  Span span_;
  std::vector<Fragment> fragments_;
};

}  // namespace dockspan
