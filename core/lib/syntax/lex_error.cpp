#include "an_lex/syntax/lex_error.hpp"

#include <fmt/core.h>

namespace an_lex::syntax
{
namespace
{

std::string describe_expected(const std::vector<std::string> & expected)
{
  if (expected.empty()) {
    return {};
  }
  std::string out = "expected " + expected.front();
  for (size_t i = 1; i < expected.size(); ++i) {
    out += (i + 1 == expected.size()) ? " or " : ", ";
    out += expected[i];
  }
  return out;
}

std::string_view group_name(std::optional<DelimiterKind> d)
{
  if (d == DelimiterKind::Curly) {
    return "interpolation splice";
  }
  return "parenthesis group";
}

// Width of the opening token underlined by the secondary label
uint32_t opener_width(const LexError & e)
{
  switch (e.kind) {
    case LexErrorKind::UnterminatedComment:
      return 2;  // /*
    case LexErrorKind::UnterminatedGroup:
      return e.delimiter == DelimiterKind::Curly ? 2 : 1;  // ${ or (
    default:
      return 1;
  }
}

}  // namespace

std::string LexError::message() const
{
  switch (kind) {
    case LexErrorKind::UnexpectedCharacter:
      return found.empty() ? "unexpected character" : fmt::format("unexpected {}", found);
    case LexErrorKind::UnterminatedString:
      return "unterminated string literal";
    case LexErrorKind::UnterminatedComment:
      return "unterminated block comment";
    case LexErrorKind::UnterminatedGroup:
      return fmt::format("unterminated {}", group_name(delimiter));
    case LexErrorKind::InvalidEscape:
      return "invalid escape sequence";
    case LexErrorKind::NumericOverflow:
      return "integer literal does not fit in 64 bits";
    case LexErrorKind::InconsistentIndentation:
      return "inconsistent indentation";
    case LexErrorKind::NestingTooDeep:
      return "nesting exceeds the maximum depth";
  }
  return "lexing failed";
}

std::string_view to_string(LexErrorKind k) noexcept
{
  switch (k) {
    case LexErrorKind::UnexpectedCharacter:
      return "UnexpectedCharacter";
    case LexErrorKind::UnterminatedString:
      return "UnterminatedString";
    case LexErrorKind::UnterminatedComment:
      return "UnterminatedComment";
    case LexErrorKind::UnterminatedGroup:
      return "UnterminatedGroup";
    case LexErrorKind::InvalidEscape:
      return "InvalidEscape";
    case LexErrorKind::NumericOverflow:
      return "NumericOverflow";
    case LexErrorKind::InconsistentIndentation:
      return "InconsistentIndentation";
    case LexErrorKind::NestingTooDeep:
      return "NestingTooDeep";
  }
  return "";
}

std::string_view error_code(LexErrorKind k) noexcept
{
  switch (k) {
    case LexErrorKind::UnexpectedCharacter:
      return "L0001";
    case LexErrorKind::UnterminatedString:
      return "L0002";
    case LexErrorKind::UnterminatedComment:
      return "L0003";
    case LexErrorKind::UnterminatedGroup:
      return "L0004";
    case LexErrorKind::InvalidEscape:
      return "L0005";
    case LexErrorKind::NumericOverflow:
      return "L0006";
    case LexErrorKind::InconsistentIndentation:
      return "L0007";
    case LexErrorKind::NestingTooDeep:
      return "L0008";
  }
  return "";
}

void report_lex_error(const LexError & error, DiagnosticBag & diags)
{
  auto builder = diags.report_error(error.range, error.message(), describe_expected(error.expected));
  builder.with_code(std::string(error_code(error.kind)));

  switch (error.kind) {
    case LexErrorKind::UnterminatedString:
      builder.with_secondary_label(
        SourceRange(error.start, error.start + opener_width(error)), "string starts here");
      break;
    case LexErrorKind::UnterminatedComment:
      builder.with_secondary_label(
        SourceRange(error.start, error.start + opener_width(error)), "comment starts here");
      break;
    case LexErrorKind::UnterminatedGroup:
      builder.with_secondary_label(
        SourceRange(error.start, error.start + opener_width(error)), "group opened here");
      break;
    case LexErrorKind::InvalidEscape:
      builder.with_help(R"(supported escapes are \\, \$, \", \n, \r, \t and \0)");
      break;
    case LexErrorKind::InconsistentIndentation:
      builder.with_help("dedent to the indentation of an enclosing block");
      break;
    case LexErrorKind::NestingTooDeep:
      builder.with_help("raise lexer.max_nesting_depth in anlex.yaml");
      break;
    default:
      break;
  }
}

}  // namespace an_lex::syntax
