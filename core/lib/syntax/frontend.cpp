// an_lex/syntax/frontend.cpp - High-level lexing pipeline
#include "an_lex/syntax/frontend.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <iostream>

#include "an_lex/syntax/lexer.hpp"

namespace an_lex
{

syntax::LexResult lex_source(
  const SourceFile & source, DiagnosticBag & diags, const LexOptions & options)
{
  if (options.verbose) {
    fmt::print(
      std::cerr, "lexing {} ({} bytes, {} lines)\n", source.display_name(), source.size(),
      source.line_count());
  }

  syntax::LexResult result = syntax::lex(source.content(), options);

  if (result.has_error()) {
    syntax::report_lex_error(result.error(), diags);
    if (options.verbose) {
      const LineColumn lc = source.get_line_column(result.error().position);
      fmt::print(
        std::cerr, "lexing failed: {} at {}:{}\n", syntax::error_code(result.error().kind),
        lc.line, lc.column);
    }
    return result;
  }

  if (options.verbose) {
    fmt::print(std::cerr, "lexed {} top-level items\n", result.value().children().size());
  }
  return result;
}

}  // namespace an_lex
