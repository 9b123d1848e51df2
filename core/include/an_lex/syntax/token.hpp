// an_lex/syntax/token.hpp - Leaf lexical units
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace an_lex::syntax
{

enum class TokenKind : uint8_t {
  Identifier,
  StringLiteral,  // text is the decoded fragment
  Integer,
  Operator,
  Comment,  // no payload; kept so indentation measurement sees the line
};

/// Integer literal type suffix (`12u8`, `0usz`)
enum class IntegerKind : uint8_t {
  I8,
  I16,
  I32,
  I64,
  Isz,
  U8,
  U16,
  U32,
  U64,
  Usz,
};

enum class Operator : uint8_t {
  Add,           ///< +
  Equals,        ///< =
  MemberAccess,  ///< .
};

/**
 * One leaf token.
 *
 * Only the fields matching `kind` are meaningful: `text` for Identifier and
 * StringLiteral, `value`/`suffix` for Integer, `op` for Operator.
 */
struct Token
{
  TokenKind kind = TokenKind::Comment;
  std::string text;
  uint64_t value = 0;
  std::optional<IntegerKind> suffix;
  Operator op = Operator::Add;

  [[nodiscard]] static Token identifier(std::string name)
  {
    Token t;
    t.kind = TokenKind::Identifier;
    t.text = std::move(name);
    return t;
  }

  [[nodiscard]] static Token string_literal(std::string decoded)
  {
    Token t;
    t.kind = TokenKind::StringLiteral;
    t.text = std::move(decoded);
    return t;
  }

  [[nodiscard]] static Token integer(uint64_t v, std::optional<IntegerKind> kind = std::nullopt)
  {
    Token t;
    t.kind = TokenKind::Integer;
    t.value = v;
    t.suffix = kind;
    return t;
  }

  [[nodiscard]] static Token make_operator(Operator o)
  {
    Token t;
    t.kind = TokenKind::Operator;
    t.op = o;
    return t;
  }

  [[nodiscard]] static Token comment() { return Token{}; }

  [[nodiscard]] bool operator==(const Token & other) const;
  [[nodiscard]] bool operator!=(const Token & other) const { return !(*this == other); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Identifier:
      return "Identifier";
    case TokenKind::StringLiteral:
      return "StringLiteral";
    case TokenKind::Integer:
      return "Integer";
    case TokenKind::Operator:
      return "Operator";
    case TokenKind::Comment:
      return "Comment";
  }
  return "";
}

/// Source spelling of a suffix, e.g. "u16"
[[nodiscard]] constexpr std::string_view to_string(IntegerKind k) noexcept
{
  switch (k) {
    case IntegerKind::I8:
      return "i8";
    case IntegerKind::I16:
      return "i16";
    case IntegerKind::I32:
      return "i32";
    case IntegerKind::I64:
      return "i64";
    case IntegerKind::Isz:
      return "isz";
    case IntegerKind::U8:
      return "u8";
    case IntegerKind::U16:
      return "u16";
    case IntegerKind::U32:
      return "u32";
    case IntegerKind::U64:
      return "u64";
    case IntegerKind::Usz:
      return "usz";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Operator o) noexcept
{
  switch (o) {
    case Operator::Add:
      return "+";
    case Operator::Equals:
      return "=";
    case Operator::MemberAccess:
      return ".";
  }
  return "";
}

/// Inverse of to_string(IntegerKind); nullopt for anything outside the list
[[nodiscard]] std::optional<IntegerKind> integer_kind_from_suffix(std::string_view s) noexcept;

}  // namespace an_lex::syntax
