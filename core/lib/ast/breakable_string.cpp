// dockspan/ast/breakable_string.cpp - Fluent fragment accumulation
#include "dockspan/ast/breakable_string.hpp"

#include <utility>

namespace dockspan
{

BreakableString BreakableString::add_literal(Span span, std::string text) const &
{
  BreakableString copy = *this;
  return std::move(copy).add_literal(span, std::move(text));
}

BreakableString BreakableString::add_literal(Span span, std::string text) &&
{
  fragments_.push_back(Fragment{span, FragmentKind::Literal, std::move(text)});
  return std::move(*this);
}

BreakableString BreakableString::add_comment(Span span, std::string text) const &
{
  BreakableString copy = *this;
  return std::move(copy).add_comment(span, std::move(text));
}

BreakableString BreakableString::add_comment(Span span, std::string text) &&
{
  fragments_.push_back(Fragment{span, FragmentKind::Comment, std::move(text)});
  return std::move(*this);
}

std::string BreakableString::effective_text() const
{
  size_t total = 0;
  for (const auto & f : fragments_) {
    if (f.is_literal()) total += f.text.size();
  }

  std::string out;
  out.reserve(total);
  for (const auto & f : fragments_) {
    if (f.is_literal()) {
      out += f.text;
    }
  }
  return out;
}

}  // namespace dockspan
