#include "an_lex/syntax/token.hpp"

#include <array>

namespace an_lex::syntax
{

bool Token::operator==(const Token & other) const
{
  if (kind != other.kind) {
    return false;
  }
  switch (kind) {
    case TokenKind::Identifier:
    case TokenKind::StringLiteral:
      return text == other.text;
    case TokenKind::Integer:
      return value == other.value && suffix == other.suffix;
    case TokenKind::Operator:
      return op == other.op;
    case TokenKind::Comment:
      return true;
  }
  return false;
}

std::optional<IntegerKind> integer_kind_from_suffix(std::string_view s) noexcept
{
  static constexpr std::array<IntegerKind, 10> k_kinds = {
    IntegerKind::I8,  IntegerKind::I16, IntegerKind::I32, IntegerKind::I64, IntegerKind::Isz,
    IntegerKind::U8,  IntegerKind::U16, IntegerKind::U32, IntegerKind::U64, IntegerKind::Usz,
  };
  for (const IntegerKind k : k_kinds) {
    if (to_string(k) == s) {
      return k;
    }
  }
  return std::nullopt;
}

}  // namespace an_lex::syntax
