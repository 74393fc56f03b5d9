// pks/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking source code locations and ranges,
// and the per-file line table that maps parser byte offsets to rows/columns.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pks
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A compact representation of a source location.
 *
 * Internally stores a byte offset into the source file. Line and column
 * information can be computed on demand via SourceFile.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  /// Create an invalid location
  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}

  /// Create a location from byte offset
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }

  /// Get the byte offset
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A range of source code defined by start and end locations.
 *
 * The range is inclusive of the start and exclusive of the end,
 * following the half-open interval convention [start, end).
 */
class SourceRange
{
public:
  /// Create an invalid range
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  /// Create a range from byte offsets
  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 *
 * Columns count bytes, matching the offsets tree-sitter reports.
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }

  [[nodiscard]] constexpr bool operator==(const LineColumn & other) const noexcept
  {
    return line == other.line && column == other.column;
  }
};

// ============================================================================
// FullSourceRange - Complete range with line/column info
// ============================================================================

/**
 * Source range with pre-computed line/column information.
 *
 * This is the location reported for every reference. The end position is the
 * position of the first byte past the range.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] SourceRange to_source_range() const noexcept { return {start_byte, end_byte}; }

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }

  [[nodiscard]] bool operator==(const FullSourceRange & other) const noexcept
  {
    return start_line == other.start_line && start_column == other.start_column &&
           end_line == other.end_line && end_column == other.end_column &&
           start_byte == other.start_byte && end_byte == other.end_byte;
  }
  [[nodiscard]] bool operator!=(const FullSourceRange & other) const noexcept
  {
    return !(*this == other);
  }
};

// ============================================================================
// SourceFile - Source content and line table
// ============================================================================

/**
 * Owns the content of one source file and converts byte offsets into
 * line/column positions.
 *
 * Line start offsets are pre-computed for O(log n) lookups.
 */
class SourceFile
{
public:
  SourceFile() = default;

  explicit SourceFile(std::string content);

  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Replace the content and rebuild the line table
  void set_content(std::string new_content);

  /// Convert byte offset to line/column (1-indexed). Offsets past the end clamp.
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Get the content of a specific line (0-indexed), without its newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Get a slice of source by range
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  /// Expand a SourceRange to include full line/column info
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace pks
