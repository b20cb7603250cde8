// dockspan/basic/source_manager.hpp - Source text ownership and line lookup
//
// Spans carry byte offsets only; line and column information is computed on
// demand here, for diagnostics.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "dockspan/basic/span.hpp"

namespace dockspan
{

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * Span with pre-computed line/column information.
 */
struct FullSpan
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] Span to_span() const noexcept { return {start_byte, end_byte}; }

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

/**
 * Owns one Dockerfile's text and converts byte offsets to line/column.
 *
 * Line starts are indexed once per content change. Both "\n" and "\r\n"
 * terminate a line; the "\r" is not part of get_line().
 */
class SourceManager
{
public:
  SourceManager() = default;

  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }
  [[nodiscard]] bool has_file_path() const noexcept { return !file_path_.empty(); }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] size_t size() const noexcept { return source_.size(); }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Get the content of a specific line (0-indexed), without its line break
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Get a slice of source by span, clamped to the buffer
  [[nodiscard]] std::string_view get_slice(Span span) const noexcept;

  /// Expand a Span to include full line/column info
  [[nodiscard]] FullSpan get_full_span(Span span) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace dockspan
