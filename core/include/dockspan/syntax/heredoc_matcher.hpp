// dockspan/syntax/heredoc_matcher.hpp - FIFO pairing of heredoc openers and terminators
#pragma once

#include <deque>
#include <optional>
#include <string>

#include "dockspan/basic/error.hpp"
#include "dockspan/basic/span.hpp"

namespace dockspan::syntax
{

/// An opener paired with the terminator line that closed it
struct HeredocMatch
{
  SpannedString delimiter;
  SpannedString terminator;
};

/**
 * Pairs the heredoc openers of one instruction with their terminator lines.
 *
 * Openers are queued in source order and every terminator closes the oldest
 * pending opener, so `COPY <<A <<B /dst` expects the A block before the B
 * block. A terminator must equal `delimiter + "\n"` byte for byte.
 */
class HeredocMatcher
{
public:
  /// @param instruction Instruction name cited by error messages (e.g. "COPY")
  explicit HeredocMatcher(std::string instruction) : instruction_(std::move(instruction)) {}

  /// Queue a decoded opener delimiter
  void open(SpannedString delimiter);

  /**
   * Close the oldest pending opener with a decoded terminator line.
   *
   * Fails with UnmatchedHeredocTerminator when nothing is pending and with
   * HeredocTerminatorMismatch when the text differs.
   */
  [[nodiscard]] ParseResult<HeredocMatch> close(SpannedString terminator);

  /// UnmatchedHeredocDelimiter, at the oldest pending opener, if any is left
  [[nodiscard]] std::optional<ParseError> finish() const;

  [[nodiscard]] size_t pending() const noexcept { return pending_.size(); }

private:
  std::string instruction_;
  std::deque<SpannedString> pending_;
};

}  // namespace dockspan::syntax
