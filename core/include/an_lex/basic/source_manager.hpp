// an_lex/basic/source_manager.hpp - Source positions, ranges and files
//
// Every token tree node carries a SourceRange; SourceFile turns byte offsets
// back into line/column pairs for diagnostics.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace an_lex
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset into the source buffer.
 *
 * Line and column information is computed on demand via SourceFile.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(SourceLocation other) const noexcept
  {
    return offset_ <= other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Half-open byte range
// ============================================================================

/**
 * A range of source bytes [begin, end).
 *
 * Token tree spans are plain values of this type; they never alias the
 * source buffer.
 */
class SourceRange
{
public:
  /// Create an invalid range
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }

  constexpr SourceRange(uint32_t begin_offset, uint32_t end_offset) noexcept
  : begin_(SourceLocation(begin_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr uint32_t begin_offset() const noexcept { return begin_.get_offset(); }
  [[nodiscard]] constexpr uint32_t end_offset() const noexcept { return end_.get_offset(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  /// Check if another range is fully contained within this range
  [[nodiscard]] constexpr bool contains(SourceRange other) const noexcept
  {
    return begin_ <= other.begin_ && other.end_ <= end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.get_offset() - begin_.get_offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed byte column (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile - One compilation unit
// ============================================================================

/**
 * Owns the text of one compilation unit and its line table.
 *
 * The lexer borrows the content as a string_view for the whole run, so a
 * SourceFile must outlive every lex call made on it.
 */
class SourceFile
{
public:
  SourceFile() { build_line_table(); }

  explicit SourceFile(std::string content) : content_(std::move(content)) { build_line_table(); }

  SourceFile(std::filesystem::path path, std::string content)
  : path_(std::move(path)), content_(std::move(content))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  /// File name for display; "<input>" when the buffer has no path
  [[nodiscard]] std::string display_name() const;

  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed); offsets past the end clamp
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line (0-indexed), without its line terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace an_lex
