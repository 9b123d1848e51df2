// an_lex/syntax/lex_error.hpp - Fatal lexing failures and the lex result type
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "an_lex/basic/diagnostic.hpp"
#include "an_lex/basic/source_manager.hpp"
#include "an_lex/syntax/token_tree.hpp"

namespace an_lex::syntax
{

enum class LexErrorKind : uint8_t {
  UnexpectedCharacter,
  UnterminatedString,
  UnterminatedComment,
  UnterminatedGroup,
  InvalidEscape,
  NumericOverflow,
  InconsistentIndentation,
  NestingTooDeep,
};

/**
 * The single error a failed run produces.
 *
 * `position` is the furthest byte the lexer reached. `start` is the opening
 * quote, comment or delimiter for the Unterminated* kinds, and equals
 * `position` otherwise. `expected` is sorted and free of duplicates.
 */
struct LexError
{
  LexErrorKind kind = LexErrorKind::UnexpectedCharacter;
  uint32_t position = 0;
  uint32_t start = 0;
  std::optional<DelimiterKind> delimiter;
  std::vector<std::string> expected;
  std::string found;  ///< e.g. "'}'", "end of input"; empty when not applicable
  SourceRange range;  ///< bytes to underline; at least one byte unless at end of input

  [[nodiscard]] std::string message() const;
};

[[nodiscard]] std::string_view to_string(LexErrorKind k) noexcept;

/// Stable diagnostic code, "L0001" ... "L0008"
[[nodiscard]] std::string_view error_code(LexErrorKind k) noexcept;

/// Add `error` to `diags` with labels for the failure point and any opener
void report_lex_error(const LexError & error, DiagnosticBag & diags);

// ============================================================================
// LexResult (C++17 compatible)
// ============================================================================

/**
 * Holds either the top-level Block tree or the error that stopped the run.
 */
class LexResult
{
public:
  LexResult(TokenTree tree) : data_(std::move(tree)) {}
  LexResult(LexError error) : data_(std::move(error)) {}

  [[nodiscard]] bool has_value() const { return std::holds_alternative<TokenTree>(data_); }
  [[nodiscard]] bool has_error() const { return std::holds_alternative<LexError>(data_); }

  explicit operator bool() const { return has_value(); }

  // Undefined behavior if has_error()
  [[nodiscard]] const TokenTree & value() const & { return std::get<TokenTree>(data_); }
  TokenTree && value() && { return std::get<TokenTree>(std::move(data_)); }

  // Undefined behavior if has_value()
  [[nodiscard]] const LexError & error() const & { return std::get<LexError>(data_); }

  const TokenTree * operator->() const { return &value(); }
  const TokenTree & operator*() const & { return value(); }

private:
  std::variant<TokenTree, LexError> data_;
};

}  // namespace an_lex::syntax
