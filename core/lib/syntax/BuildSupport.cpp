// dockspan/syntax/BuildSupport.cpp - Value decoding, breakable strings and heredocs
#include <cstdint>
#include <optional>
#include <string>

#include "dockspan/syntax/ast_builder.hpp"
#include "dockspan/syntax/heredoc_matcher.hpp"
#include "dockspan/syntax/recognizer.hpp"

namespace dockspan
{

using syntax::Node;
using syntax::RuleKind;

static bool is_hex_digit(char c)
{
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

static uint32_t hex_value(char c)
{
  if (c >= '0' && c <= '9') return static_cast<uint32_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint32_t>(10 + (c - 'a'));
  return static_cast<uint32_t>(10 + (c - 'A'));
}

static void append_utf8(uint32_t cp, std::string & out)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Four hex digits of a \uXXXX escape starting at s[i].
static std::optional<uint32_t> read_hex4(std::string_view s, size_t i)
{
  if (i + 4 > s.size()) return std::nullopt;
  uint32_t v = 0;
  for (size_t k = i; k < i + 4; ++k) {
    if (!is_hex_digit(s[k])) return std::nullopt;
    v = (v << 4) | hex_value(s[k]);
  }
  return v;
}

// JSON string body (without the quotes) -> UTF-8 text.
static bool unescape_json(std::string_view s, std::string & out, std::string & err)
{
  out.clear();
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    if (i + 1 >= s.size()) {
      err = "unterminated escape sequence";
      return false;
    }

    const char e = s[++i];
    switch (e) {
      case '"':
      case '\\':
      case '/':
        out.push_back(e);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        auto cp = read_hex4(s, i + 1);
        if (!cp) {
          err = "expected four hex digits after \\u";
          return false;
        }
        i += 4;
        if (*cp >= 0xD800 && *cp <= 0xDBFF) {
          // High surrogate: a low surrogate escape must follow.
          std::optional<uint32_t> low;
          if (i + 2 < s.size() && s[i + 1] == '\\' && s[i + 2] == 'u') {
            low = read_hex4(s, i + 3);
          }
          if (!low || *low < 0xDC00 || *low > 0xDFFF) {
            err = "unpaired surrogate in \\u escape";
            return false;
          }
          i += 6;
          *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
        } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
          err = "unpaired surrogate in \\u escape";
          return false;
        }
        append_utf8(*cp, out);
        break;
      }
      default:
        err = std::string("unknown escape sequence '\\") + e + "'";
        return false;
    }
  }
  return true;
}

// ============================================================================
// Value decoding
// ============================================================================

ParseResult<SpannedString> AstBuilder::decode_string(const Node & n)
{
  const std::string_view text = n.text();
  if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
    return raw_string(n);
  }

  std::string out;
  std::string err;
  if (!unescape_json(text.substr(1, text.size() - 2), out, err)) {
    return ParseError::generic("invalid string " + std::string(text) + ": " + err, n.span());
  }
  return SpannedString{n.span(), std::move(out)};
}

SpannedString AstBuilder::raw_string(const Node & n) { return {n.span(), std::string(n.text())}; }

SpannedString AstBuilder::decode_delimiter(const Node & n)
{
  return {n.span(), std::string(syntax::heredoc_delimiter_name(n.text()))};
}

SpannedString AstBuilder::decode_terminator(const Node & n)
{
  std::string text(n.text());
  if (text.size() >= 2 && text.compare(text.size() - 2, 2, "\r\n") == 0) {
    text.erase(text.size() - 2, 1);
  }
  return {n.span(), std::move(text)};
}

// ============================================================================
// Breakable strings
// ============================================================================

ParseResult<BreakableString> AstBuilder::build_breakable(const Node & breakable_node) const
{
  BreakableString result(breakable_node.span());

  for (const auto & fragment : breakable_node.children()) {
    switch (fragment.kind()) {
      case RuleKind::BreakableLiteral:
        result = std::move(result).add_literal(fragment.span(), std::string(fragment.text()));
        break;
      case RuleKind::Comment:
        result = std::move(result).add_comment(fragment.span(), std::string(fragment.text()));
        break;
      default:
        return syntax::unexpected_token(fragment);
    }
  }

  return result;
}

// ============================================================================
// Heredocs
// ============================================================================

ParseResult<Heredoc> AstBuilder::build_heredoc(
  const Node & heredoc_node, std::string_view instruction) const
{
  syntax::HeredocMatcher matcher{std::string(instruction)};
  std::optional<SpannedString> delimiter;
  std::optional<SpannedString> terminator;
  const Node * body = nullptr;

  for (const auto & part : heredoc_node.children()) {
    switch (part.kind()) {
      case RuleKind::HeredocDelimiter:
        if (delimiter) return syntax::unexpected_token(part);
        delimiter = decode_delimiter(part);
        matcher.open(*delimiter);
        break;
      case RuleKind::HeredocBody:
        if (body != nullptr) return syntax::unexpected_token(part);
        body = &part;
        break;
      case RuleKind::HeredocTerminator: {
        if (body == nullptr || terminator) return syntax::unexpected_token(part);
        auto match = matcher.close(decode_terminator(part));
        if (!match) return match.error();
        terminator = std::move(match->terminator);
        break;
      }
      default:
        return syntax::unexpected_token(part);
    }
  }

  if (auto unmatched = matcher.finish()) {
    return *unmatched;
  }
  if (!delimiter || body == nullptr || !terminator) {
    return ParseError::generic("incomplete heredoc", heredoc_node.span());
  }

  return Heredoc{heredoc_node.span(), std::move(*delimiter), std::move(*terminator), raw_string(*body)};
}

}  // namespace dockspan
