// an_lex/syntax/scanner.cpp - Atomic scanners
//
#include "an_lex/syntax/scanner.hpp"

#include <fmt/core.h>

#include <limits>

namespace an_lex::syntax
{

bool Scanner::is_ident_start(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool Scanner::is_ident_continue(char c) noexcept { return is_ident_start(c) || is_digit(c); }

size_t Scanner::padding_width(std::string_view src, size_t pos) noexcept
{
  if (pos >= src.size()) {
    return 0;
  }

  const auto byte = [&](size_t i) -> unsigned char {
    return (pos + i < src.size()) ? static_cast<unsigned char>(src[pos + i]) : 0;
  };

  const unsigned char b0 = byte(0);
  if (b0 == ' ' || (b0 >= '\t' && b0 <= '\r')) {
    return 1;
  }
  if (b0 == 0xC2) {
    return (byte(1) == 0x85 || byte(1) == 0xA0) ? 2 : 0;
  }
  if (b0 == 0xE1) {
    return (byte(1) == 0x9A && byte(2) == 0x80) ? 3 : 0;
  }
  if (b0 == 0xE2) {
    if (byte(1) == 0x80) {
      const unsigned char b2 = byte(2);
      const bool space = (b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF;
      return space ? 3 : 0;
    }
    return (byte(1) == 0x81 && byte(2) == 0x9F) ? 3 : 0;
  }
  if (b0 == 0xE3) {
    return (byte(1) == 0x80 && byte(2) == 0x80) ? 3 : 0;
  }
  return 0;
}

size_t Scanner::end_of_content(std::string_view src) noexcept
{
  size_t end = src.size();
  while (end > 0) {
    // UTF-8 continuation bytes never start a sequence, so a suffix that
    // decodes as whitespace is exactly one character.
    size_t width = 0;
    for (size_t w = 1; w <= 3 && w <= end; ++w) {
      if (padding_width(src.substr(0, end), end - w) == w) {
        width = w;
        break;
      }
    }
    if (width == 0) {
      break;
    }
    end -= width;
  }
  return end;
}

bool Scanner::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Scanner::skip_inline_whitespace() noexcept
{
  while (!eof() && is_inline_whitespace(peek())) {
    advance(1);
  }
}

void Scanner::skip_whitespace() noexcept
{
  while (!eof()) {
    const size_t width = padding_width(src_, pos_);
    if (width == 0) {
      break;
    }
    advance(width);
  }
}

bool Scanner::skip_newline() noexcept
{
  if (starts_with("\r\n")) {
    advance(2);
    return true;
  }
  if (at_newline()) {
    advance(1);
    return true;
  }
  return false;
}

bool Scanner::bare_token_follows() const noexcept
{
  size_t i = pos_;
  while (i < src_.size() && is_inline_whitespace(src_[i])) {
    ++i;
  }
  return i < src_.size() && (is_ident_start(src_[i]) || is_digit(src_[i]));
}

ScanResult Scanner::scan_identifier()
{
  const auto start = pos();
  advance(1);
  while (!eof() && is_ident_continue(peek())) {
    advance(1);
  }
  const auto end = pos();
  return {Token::identifier(std::string(src_.substr(start, end - start))), {start, end}};
}

std::optional<ScanResult> Scanner::scan_integer()
{
  const auto start = pos();
  constexpr uint64_t k_max = std::numeric_limits<uint64_t>::max();

  uint64_t value = 0;
  bool overflow = false;
  while (!eof() && is_digit(peek())) {
    const auto digit = static_cast<uint64_t>(peek() - '0');
    if (value > (k_max - digit) / 10) {
      overflow = true;
    } else {
      value = value * 10 + digit;
    }
    advance(1);
  }

  if (overflow) {
    fail(LexErrorKind::NumericOverflow, start, start, {start, pos()});
    return std::nullopt;
  }

  // A suffix counts only when the whole identifier-shaped run matches;
  // otherwise the run is left for the identifier scanner.
  std::optional<IntegerKind> suffix;
  if (!eof() && is_ident_start(peek())) {
    size_t end = pos_ + 1;
    while (end < src_.size() && is_ident_continue(src_[end])) {
      ++end;
    }
    suffix = integer_kind_from_suffix(src_.substr(pos_, end - pos_));
    if (suffix) {
      pos_ = end;
    }
  }

  return ScanResult{Token::integer(value, suffix), {start, pos()}};
}

ScanResult Scanner::scan_operator()
{
  const auto start = pos();
  const char c = peek();
  advance(1);

  Operator op = Operator::Add;
  if (c == '=') {
    op = Operator::Equals;
  } else if (c == '.') {
    op = Operator::MemberAccess;
  }
  return {Token::make_operator(op), {start, pos()}};
}

std::optional<ScanResult> Scanner::scan_comment()
{
  const auto start = pos();

  if (starts_with("//")) {
    advance(2);
    while (!eof() && !at_newline()) {
      advance(1);
    }
    return ScanResult{Token::comment(), {start, pos()}};
  }

  // Block comment, non-nesting
  advance(2);
  while (!eof() && !starts_with("*/")) {
    advance(1);
  }
  if (eof()) {
    fail(LexErrorKind::UnterminatedComment, pos(), start, {pos(), pos()});
    return std::nullopt;
  }
  advance(2);
  return ScanResult{Token::comment(), {start, pos()}};
}

std::optional<ScanResult> Scanner::scan_literal_run()
{
  const auto start = pos();
  std::string decoded;

  while (!eof()) {
    const char c = peek();
    if (c == '"' || at_interpolation()) {
      break;
    }
    if (c != '\\') {
      decoded += c;
      advance(1);
      continue;
    }

    // A trailing backslash ends the run; the string is then unterminated.
    if (pos_ + 1 >= src_.size()) {
      advance(1);
      break;
    }

    const char e = peek(1);
    switch (e) {
      case '\\':
      case '$':
      case '"':
        decoded += e;
        break;
      case 'n':
        decoded += '\n';
        break;
      case 'r':
        decoded += '\r';
        break;
      case 't':
        decoded += '\t';
        break;
      case '0':
        decoded += '\0';
        break;
      default: {
        const auto at = pos();
        fail(LexErrorKind::InvalidEscape, at, at, {at, at + 2});
        failure_.expected = {"'\"'", "'$'", "'0'", "'\\'", "'n'", "'r'", "'t'"};
        failure_.found = describe_char_at(src_, at + 1);
        return std::nullopt;
      }
    }
    advance(2);
  }

  return ScanResult{Token::string_literal(std::move(decoded)), {start, pos()}};
}

void Scanner::fail(LexErrorKind kind, uint32_t position, uint32_t start, SourceRange range)
{
  failure_ = LexError{};
  failure_.kind = kind;
  failure_.position = position;
  failure_.start = start;
  failure_.range = range;
}

std::string describe_char_at(std::string_view src, uint32_t pos)
{
  if (pos >= src.size()) {
    return "end of input";
  }
  const auto c = static_cast<unsigned char>(src[pos]);
  if (c == '\n' || c == '\r') {
    return "newline";
  }
  if (c == '\t') {
    return "tab";
  }
  if (c >= 0x20 && c < 0x7f) {
    return fmt::format("'{}'", static_cast<char>(c));
  }
  return fmt::format("byte 0x{:02X}", static_cast<unsigned>(c));
}

}  // namespace an_lex::syntax
