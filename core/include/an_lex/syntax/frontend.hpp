// an_lex/syntax/frontend.hpp - High-level lexing entry point
#pragma once

#include "an_lex/basic/diagnostic.hpp"
#include "an_lex/basic/source_manager.hpp"
#include "an_lex/syntax/lex_error.hpp"
#include "an_lex/syntax/lex_options.hpp"

namespace an_lex
{

// Pipeline:
// source -> frame machine per logical line -> indentation blocks -> diagnostics
//
// On failure the error is also reported into `diags`. `source` must outlive
// the call; the returned tree holds no references into it.
[[nodiscard]] syntax::LexResult lex_source(
  const SourceFile & source, DiagnosticBag & diags, const LexOptions & options = {});

}  // namespace an_lex
