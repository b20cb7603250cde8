// dockspan/ast/heredoc.hpp - Inline here-document blocks
#pragma once

#include "dockspan/basic/span.hpp"

namespace dockspan
{

/**
 * A here-document introduced by `<<DELIM` and closed by a `DELIM` line.
 *
 * `span` runs from the `<<` marker through the end of the terminator line.
 * `body` is the unprocessed block content between the opener line and the
 * terminator line; it ends with a newline unless the block is empty.
 * `terminator` holds the terminator line including its newline.
 */
struct Heredoc
{
  Span span;
  SpannedString delimiter;
  SpannedString terminator;
  SpannedString body;

  [[nodiscard]] bool operator==(const Heredoc & other) const
  {
    return span == other.span && delimiter == other.delimiter &&
           terminator == other.terminator && body == other.body;
  }
};

}  // namespace dockspan
