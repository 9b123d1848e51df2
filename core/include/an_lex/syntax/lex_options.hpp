// an_lex/syntax/lex_options.hpp - Lexer knobs
#pragma once

#include <cstdint>

namespace an_lex
{

/// Hard ceiling for LexOptions::max_nesting_depth. Tree consumers (destruction,
/// JSON, dumps) recurse per level, so their stack use stays bounded by it.
inline constexpr uint32_t k_max_nesting_depth_limit = 1024;

struct LexOptions
{
  /// Bound on open groups/strings on one line, and separately on open blocks.
  /// Values above k_max_nesting_depth_limit are clamped to it.
  uint32_t max_nesting_depth = 256;

  /// Keep Comment leaves in the result (indentation is measured either way)
  bool keep_comments = true;

  /// Print progress lines to stderr from lex_source()
  bool verbose = false;
};

}  // namespace an_lex
