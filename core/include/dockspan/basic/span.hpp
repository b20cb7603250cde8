// dockspan/basic/span.hpp - Byte spans and span-tagged strings
//
// Every AST value records the byte range it occupied in the original
// Dockerfile text. Offsets are never normalized: a Span always points into
// the caller's buffer exactly as it was read.
//
#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace dockspan
{

// ============================================================================
// Span - Half-open byte range
// ============================================================================

/**
 * A half-open byte range [start, end) into the source buffer.
 *
 * start <= end always holds; a zero-width span marks a position.
 */
class Span
{
public:
  constexpr Span() noexcept = default;

  constexpr Span(uint32_t start, uint32_t end) noexcept : start_(start), end_(end) {}

  /// Zero-width span at an offset
  [[nodiscard]] static constexpr Span at(uint32_t offset) noexcept { return {offset, offset}; }

  [[nodiscard]] constexpr uint32_t start() const noexcept { return start_; }
  [[nodiscard]] constexpr uint32_t end() const noexcept { return end_; }

  [[nodiscard]] constexpr uint32_t size() const noexcept { return end_ - start_; }
  [[nodiscard]] constexpr bool empty() const noexcept { return start_ == end_; }

  /// Check if an offset falls inside this span
  [[nodiscard]] constexpr bool contains(uint32_t offset) const noexcept
  {
    return offset >= start_ && offset < end_;
  }

  /// Check if another span is fully contained within this span
  [[nodiscard]] constexpr bool contains(Span other) const noexcept
  {
    return other.start_ >= start_ && other.end_ <= end_;
  }

  /// Smallest span covering both
  [[nodiscard]] constexpr Span cover(Span other) const noexcept
  {
    return {start_ < other.start_ ? start_ : other.start_, end_ > other.end_ ? end_ : other.end_};
  }

  [[nodiscard]] constexpr bool operator==(Span other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(Span other) const noexcept { return !(*this == other); }

  /// Human-readable form, e.g. "4..12"
  [[nodiscard]] std::string to_string() const
  {
    return std::to_string(start_) + ".." + std::to_string(end_);
  }

private:
  uint32_t start_ = 0;
  uint32_t end_ = 0;
};

// ============================================================================
// SpannedString - Decoded text with its raw source extent
// ============================================================================

/**
 * A decoded string value tagged with the raw span it was read from.
 *
 * `content` has quotes and escapes resolved where applicable, so the span
 * may be longer than the content.
 */
struct SpannedString
{
  Span span;
  std::string content;

  SpannedString() = default;
  SpannedString(Span s, std::string c) : span(s), content(std::move(c)) {}

  [[nodiscard]] bool operator==(const SpannedString & other) const
  {
    return span == other.span && content == other.content;
  }
  [[nodiscard]] bool operator!=(const SpannedString & other) const { return !(*this == other); }
};

}  // namespace dockspan
