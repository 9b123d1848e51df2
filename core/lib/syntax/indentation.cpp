// an_lex/syntax/indentation.cpp - Indentation block folding
#include "an_lex/syntax/indentation.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace an_lex::syntax
{

IndentationGrouper::IndentationGrouper(uint32_t max_depth) : max_depth_(max_depth)
{
  levels_.push_back(Level{});
}

bool IndentationGrouper::add_line(
  std::string_view indent, SourceRange content, std::vector<TokenTree> items)
{
  // Match open levels by prefix; the root's empty segment always matches.
  std::string_view rest = indent;
  size_t matched = 1;
  while (matched < levels_.size()) {
    const std::string_view segment = levels_[matched].segment;
    if (rest.substr(0, segment.size()) != segment) {
      break;
    }
    rest.remove_prefix(segment.size());
    ++matched;
  }

  const auto line_begin = content.begin_offset();
  const bool dedent = matched < levels_.size();

  if (dedent && !rest.empty()) {
    failure_ = LexError{};
    failure_.kind = LexErrorKind::InconsistentIndentation;
    failure_.position = line_begin;
    failure_.start = line_begin;
    failure_.range = {line_begin - static_cast<uint32_t>(indent.size()), line_begin};
    failure_.expected = {"indentation of an enclosing block"};
    return false;
  }

  close_to(matched);

  if (!rest.empty()) {
    if (depth() >= max_depth_) {
      failure_ = LexError{};
      failure_.kind = LexErrorKind::NestingTooDeep;
      failure_.position = line_begin;
      failure_.start = line_begin;
      failure_.range = {line_begin, line_begin};
      return false;
    }
    levels_.push_back(Level{rest, line_begin, content.end_offset(), std::move(items)});
    return true;
  }

  Level & top = levels_.back();
  if (!items.empty()) {
    top.end = std::max(top.end, content.end_offset());
  }
  std::move(items.begin(), items.end(), std::back_inserter(top.items));
  return true;
}

TokenTree IndentationGrouper::finish(SourceRange whole)
{
  close_to(1);
  Level root = std::move(levels_.front());
  levels_.clear();
  levels_.push_back(Level{});
  return TokenTree::group(DelimiterKind::Block, std::move(root.items), whole);
}

void IndentationGrouper::close_to(size_t count)
{
  while (levels_.size() > count) {
    Level level = std::move(levels_.back());
    levels_.pop_back();

    Level & parent = levels_.back();
    parent.end = std::max(parent.end, level.end);
    parent.items.push_back(
      TokenTree::group(DelimiterKind::Block, std::move(level.items), {level.begin, level.end}));
  }
}

}  // namespace an_lex::syntax
