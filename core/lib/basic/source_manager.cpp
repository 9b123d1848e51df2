// an_lex/basic/source_manager.cpp - Source file line table
#include "an_lex/basic/source_manager.hpp"

#include <algorithm>

namespace an_lex
{

std::string SourceFile::display_name() const
{
  if (path_.empty()) {
    return "<input>";
  }
  return path_.string();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  if (offset > content_.size()) {
    offset = static_cast<uint32_t>(content_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
  }
  // Strip "\n", "\r\n" or "\r"
  if (end > start && content_[end - 1] == '\n') {
    --end;
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(content_).substr(start, end - start);
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const auto start = range.begin_offset();
  auto end = range.end_offset();
  if (start > content_.size() || end < start) {
    return {};
  }
  if (end > content_.size()) {
    end = static_cast<uint32_t>(content_.size());
  }
  return std::string_view(content_).substr(start, end - start);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (!range.is_valid()) {
    return result;
  }

  result.start_byte = range.begin_offset();
  result.end_byte = range.end_offset();

  const auto start_lc = get_line_column(result.start_byte);
  const auto end_lc = get_line_column(result.end_byte);

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < content_.size(); ++i) {
    const char c = content_[i];
    if (c == '\r' && i + 1 < content_.size() && content_[i + 1] == '\n') {
      continue;  // the '\n' of a CRLF pair starts the next line
    }
    if (c == '\n' || c == '\r') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace an_lex
