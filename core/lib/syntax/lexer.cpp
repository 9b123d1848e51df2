#include "an_lex/syntax/lexer.hpp"

#include <algorithm>
#include <utility>

namespace an_lex::syntax
{
namespace
{

std::vector<std::string> token_tree_starts()
{
  return {"'\"'", "'('", "'+'", "'.'", "'='", "comment", "identifier", "integer"};
}

std::vector<std::string> sorted_unique(std::vector<std::string> v)
{
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
  return v;
}

}  // namespace

LexResult Lexer::lex_all()
{
  const std::string_view src = scanner_.source();

  // Padding around the whole file is not part of any line, so the first line
  // with content sits at the root level whatever its indentation.
  content_end_ = Scanner::end_of_content(src);
  scanner_.skip_whitespace();

  while (scanner_.pos() < content_end_) {
    const uint32_t line_start = scanner_.pos();
    scanner_.skip_inline_whitespace();
    const uint32_t content_start = scanner_.pos();

    std::vector<TokenTree> items;
    if (!lex_line(items)) {
      return error_;
    }

    const uint32_t content_end =
      items.empty() ? content_start : items.back().range().end_offset();
    const std::string_view indent = src.substr(line_start, content_start - line_start);

    if (!grouper_.add_line(indent, {content_start, content_end}, std::move(items))) {
      return grouper_.failure();
    }

    if (!scanner_.skip_newline()) {
      break;  // end of input
    }
  }

  return grouper_.finish({0, static_cast<uint32_t>(src.size())});
}

bool Lexer::lex_line(std::vector<TokenTree> & out)
{
  frames_.clear();
  frames_.push_back(Frame{FrameKind::Line, DelimiterKind::Block, scanner_.pos(), {}});

  while (true) {
    bool ok = true;
    switch (frames_.back().kind) {
      case FrameKind::Line:
        scanner_.skip_inline_whitespace();
        if (scanner_.pos() >= content_end_ || scanner_.at_newline()) {
          out = std::move(frames_.back().children);
          frames_.clear();
          return true;
        }
        if (!at_token_tree_start()) {
          auto expected = token_tree_starts();
          expected.emplace_back("newline");
          expected.emplace_back("end of input");
          return fail_unexpected(std::move(expected));
        }
        ok = step_token_tree();
        break;
      case FrameKind::Group:
        ok = step_group();
        break;
      case FrameKind::String:
        ok = step_string();
        break;
    }
    if (!ok) {
      return false;
    }
  }
}

bool Lexer::step_group()
{
  // Newlines are padding inside groups; the logical line continues.
  scanner_.skip_whitespace();

  const Frame & frame = frames_.back();
  const char closer = (frame.delimiter == DelimiterKind::Curly) ? '}' : ')';
  if (!scanner_.eof() && scanner_.peek() == closer) {
    scanner_.advance(1);
    close_frame();
    return true;
  }
  if (scanner_.eof() || !at_token_tree_start()) {
    return fail_unterminated_group(frame);
  }
  return step_token_tree();
}

bool Lexer::step_string()
{
  if (scanner_.eof()) {
    const uint32_t at = scanner_.pos();
    error_ = LexError{};
    error_.kind = LexErrorKind::UnterminatedString;
    error_.position = at;
    error_.start = frames_.back().start;
    error_.expected = {"'\"'"};
    error_.found = "end of input";
    error_.range = {at, at};
    return false;
  }

  if (scanner_.peek() == '"') {
    scanner_.advance(1);
    close_frame();
    return true;
  }
  if (scanner_.at_interpolation()) {
    return open_frame(FrameKind::Group, DelimiterKind::Curly, 2);
  }

  auto run = scanner_.scan_literal_run();
  if (!run) {
    return fail_scan();
  }
  emit(TokenTree::leaf(std::move(run->token), run->range));
  return true;
}

bool Lexer::at_token_tree_start() const noexcept
{
  const char c = scanner_.peek();
  return Scanner::is_ident_start(c) || Scanner::is_digit(c) || Scanner::is_operator_char(c) ||
         c == '"' || c == '(' || scanner_.at_comment();
}

bool Lexer::step_token_tree()
{
  const char c = scanner_.peek();

  if (Scanner::is_ident_start(c)) {
    auto r = scanner_.scan_identifier();
    const Adjacency adjacency =
      scanner_.bare_token_follows() ? Adjacency::Sequential : Adjacency::Terminal;
    emit(TokenTree::leaf(std::move(r.token), r.range, adjacency));
    return true;
  }

  if (Scanner::is_digit(c)) {
    auto r = scanner_.scan_integer();
    if (!r) {
      return fail_scan();
    }
    const Adjacency adjacency =
      scanner_.bare_token_follows() ? Adjacency::Sequential : Adjacency::Terminal;
    emit(TokenTree::leaf(std::move(r->token), r->range, adjacency));
    return true;
  }

  if (Scanner::is_operator_char(c)) {
    auto r = scanner_.scan_operator();
    emit(TokenTree::leaf(std::move(r.token), r.range));
    return true;
  }

  if (c == '"') {
    return open_frame(FrameKind::String, DelimiterKind::Interpolation, 1);
  }
  if (c == '(') {
    return open_frame(FrameKind::Group, DelimiterKind::Parenthesis, 1);
  }

  auto r = scanner_.scan_comment();
  if (!r) {
    return fail_scan();
  }
  if (options_.keep_comments) {
    emit(TokenTree::leaf(std::move(r->token), r->range));
  }
  return true;
}

bool Lexer::open_frame(FrameKind kind, DelimiterKind delimiter, size_t opener_width)
{
  const uint32_t start = scanner_.pos();

  // frames_[0] is the line itself
  if (frames_.size() - 1 >= options_.max_nesting_depth) {
    error_ = LexError{};
    error_.kind = LexErrorKind::NestingTooDeep;
    error_.position = start;
    error_.start = start;
    error_.delimiter = delimiter;
    error_.range = {start, start + static_cast<uint32_t>(opener_width)};
    return false;
  }

  scanner_.advance(opener_width);
  frames_.push_back(Frame{kind, delimiter, start, {}});
  return true;
}

void Lexer::close_frame()
{
  Frame frame = std::move(frames_.back());
  frames_.pop_back();
  emit(TokenTree::group(frame.delimiter, std::move(frame.children), {frame.start, scanner_.pos()}));
}

bool Lexer::fail_scan()
{
  error_ = scanner_.failure();
  return false;
}

bool Lexer::fail_unexpected(std::vector<std::string> expected)
{
  const uint32_t at = scanner_.pos();
  error_ = LexError{};
  error_.kind = LexErrorKind::UnexpectedCharacter;
  error_.position = at;
  error_.start = at;
  error_.expected = sorted_unique(std::move(expected));
  error_.found = describe_char_at(scanner_.source(), at);
  error_.range = {at, scanner_.eof() ? at : at + 1};
  return false;
}

bool Lexer::fail_unterminated_group(const Frame & frame)
{
  const uint32_t at = scanner_.pos();
  auto expected = token_tree_starts();
  expected.emplace_back(frame.delimiter == DelimiterKind::Curly ? "'}'" : "')'");

  error_ = LexError{};
  error_.kind = LexErrorKind::UnterminatedGroup;
  error_.position = at;
  error_.start = frame.start;
  error_.delimiter = frame.delimiter;
  error_.expected = sorted_unique(std::move(expected));
  error_.found = describe_char_at(scanner_.source(), at);
  error_.range = {at, scanner_.eof() ? at : at + 1};
  return false;
}

LexResult lex(std::string_view source, const LexOptions & options)
{
  Lexer lexer(source, options);
  return lexer.lex_all();
}

}  // namespace an_lex::syntax
