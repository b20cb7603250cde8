// dockspan/syntax/heredoc_matcher.cpp - FIFO heredoc pairing
#include "dockspan/syntax/heredoc_matcher.hpp"

#include <utility>

namespace dockspan::syntax
{

void HeredocMatcher::open(SpannedString delimiter) { pending_.push_back(std::move(delimiter)); }

ParseResult<HeredocMatch> HeredocMatcher::close(SpannedString terminator)
{
  if (pending_.empty()) {
    return ParseError::unmatched_heredoc_terminator(
      instruction_, terminator.content, terminator.span);
  }

  SpannedString delimiter = std::move(pending_.front());
  pending_.pop_front();

  if (terminator.content != delimiter.content + "\n") {
    return ParseError::heredoc_terminator_mismatch(
      instruction_, delimiter.content, terminator.content, terminator.span);
  }

  return HeredocMatch{std::move(delimiter), std::move(terminator)};
}

std::optional<ParseError> HeredocMatcher::finish() const
{
  if (pending_.empty()) {
    return std::nullopt;
  }

  std::string names;
  for (const auto & d : pending_) {
    if (!names.empty()) names += ", ";
    names += d.content;
  }
  return ParseError::unmatched_heredoc_delimiter(instruction_, names, pending_.front().span);
}

}  // namespace dockspan::syntax
