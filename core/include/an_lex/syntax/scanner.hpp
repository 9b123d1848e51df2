// an_lex/syntax/scanner.hpp - Atomic scanners over a borrowed source buffer
//
// The Scanner owns the cursor. Each scan_* method starts at the current
// position, which must hold the first character of the construct (callers
// dispatch on peek()), and leaves the cursor just past it. The cursor never
// moves backwards.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "an_lex/basic/source_manager.hpp"
#include "an_lex/syntax/lex_error.hpp"
#include "an_lex/syntax/token.hpp"

namespace an_lex::syntax
{

struct ScanResult
{
  Token token;
  SourceRange range;
};

class Scanner
{
public:
  explicit Scanner(std::string_view src) : src_(src) {}

  // Character classes
  [[nodiscard]] static bool is_ident_start(char c) noexcept;
  [[nodiscard]] static bool is_ident_continue(char c) noexcept;
  [[nodiscard]] static bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
  [[nodiscard]] static bool is_inline_whitespace(char c) noexcept { return c == ' ' || c == '\t'; }
  [[nodiscard]] static bool is_operator_char(char c) noexcept
  {
    return c == '+' || c == '=' || c == '.';
  }

  /**
   * Byte length of the whitespace character encoded at `src[pos]`, or 0.
   *
   * Accepts ASCII whitespace (space, \t, \n, \v, \f, \r) and the UTF-8
   * encoded Unicode White_Space characters (U+0085, U+00A0, U+1680,
   * U+2000..U+200A, U+2028, U+2029, U+202F, U+205F, U+3000).
   */
  [[nodiscard]] static size_t padding_width(std::string_view src, size_t pos) noexcept;

  /// Offset just past the last byte of `src` that is not padding
  [[nodiscard]] static size_t end_of_content(std::string_view src) noexcept;

  // Cursor
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;
  [[nodiscard]] uint32_t pos() const noexcept { return static_cast<uint32_t>(pos_); }
  [[nodiscard]] std::string_view source() const noexcept { return src_; }
  void advance(size_t n = 1) noexcept { pos_ += n; }

  [[nodiscard]] bool at_newline() const noexcept { return peek() == '\n' || peek() == '\r'; }
  [[nodiscard]] bool at_comment() const noexcept { return starts_with("//") || starts_with("/*"); }
  [[nodiscard]] bool at_interpolation() const noexcept { return starts_with("${"); }

  /// Skip spaces and tabs
  void skip_inline_whitespace() noexcept;
  /// Skip any padding (see padding_width()), newlines included. Used inside
  /// groups and splices, and before the first line of the file.
  void skip_whitespace() noexcept;
  /// Consume one "\n", "\r\n" or "\r"; returns false when not at a newline
  bool skip_newline() noexcept;

  /**
   * Single-token lookahead for juxtaposition: true when an identifier or
   * integer starts after inline whitespace on the current line. Does not
   * move the cursor.
   */
  [[nodiscard]] bool bare_token_follows() const noexcept;

  // Atomic scanners
  [[nodiscard]] ScanResult scan_identifier();
  /// nullopt on overflow (see failure())
  [[nodiscard]] std::optional<ScanResult> scan_integer();
  [[nodiscard]] ScanResult scan_operator();
  /// nullopt on an unterminated block comment (see failure())
  [[nodiscard]] std::optional<ScanResult> scan_comment();
  /**
   * One maximal literal run inside a string: stops before `"`, before `${`
   * or at end of input, decoding escapes. nullopt on an invalid escape.
   */
  [[nodiscard]] std::optional<ScanResult> scan_literal_run();

  /// The error behind the last nullopt scan
  [[nodiscard]] const LexError & failure() const noexcept { return failure_; }

private:
  void fail(LexErrorKind kind, uint32_t position, uint32_t start, SourceRange range);

  std::string_view src_;
  size_t pos_ = 0;
  LexError failure_;
};

/// Human-readable form of the byte at `pos` for "unexpected ..." messages
[[nodiscard]] std::string describe_char_at(std::string_view src, uint32_t pos);

}  // namespace an_lex::syntax
