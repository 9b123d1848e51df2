// an_lex/test_support/lex_helpers.hpp - helpers for unit tests
//
// A lightweight single-file lexing pipeline: the unit owns the source text
// and the diagnostics so tests can inspect slices and printed output.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "an_lex/basic/diagnostic.hpp"
#include "an_lex/basic/source_manager.hpp"
#include "an_lex/syntax/frontend.hpp"
#include "an_lex/syntax/lex_error.hpp"
#include "an_lex/syntax/lex_options.hpp"
#include "an_lex/syntax/token_tree.hpp"

namespace an_lex::test_support
{

struct TestLexUnit
{
  SourceFile source;
  DiagnosticBag diags;
  std::optional<syntax::LexResult> result;

  [[nodiscard]] bool ok() const { return result && result->has_value(); }

  /// Top-level Block; only valid when ok()
  [[nodiscard]] const syntax::TokenTree & tree() const { return result->value(); }

  /// Only valid when !ok()
  [[nodiscard]] const syntax::LexError & error() const { return result->error(); }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return source.get_slice(r);
  }
};

[[nodiscard]] inline std::unique_ptr<TestLexUnit> lex(
  std::string src, const LexOptions & options = {},
  const std::filesystem::path & virtual_path = "<test>.an")
{
  auto out = std::make_unique<TestLexUnit>();
  out->source = SourceFile(virtual_path, std::move(src));
  out->result.emplace(lex_source(out->source, out->diags, options));
  return out;
}

/// Children of the top-level Block
[[nodiscard]] inline gsl::span<const syntax::TokenTree> top_level(const TestLexUnit & unit)
{
  return unit.tree().children();
}

}  // namespace an_lex::test_support
