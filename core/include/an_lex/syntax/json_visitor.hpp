// an_lex/syntax/json_visitor.hpp - JSON serialization for token trees
//
// Returns nlohmann::json objects for trees and lexing errors, for tooling
// and golden tests.
//
#pragma once

#include <nlohmann/json.hpp>

#include "an_lex/syntax/lex_error.hpp"
#include "an_lex/syntax/token_tree.hpp"

namespace an_lex::syntax
{

/**
 * Serialize a token tree.
 *
 * Leaves: {"kind": "Identifier", "text": "f", "adjacency": "sequential", "range": {...}}
 * Trees:  {"kind": "Tree", "delimiter": "Block", "children": [...], "range": {...}}
 */
[[nodiscard]] nlohmann::json to_json(const TokenTree & tree);

/// {"kind": "UnterminatedGroup", "code": "L0004", "position": 2, "expected": [...], ...}
[[nodiscard]] nlohmann::json to_json(const LexError & error);

}  // namespace an_lex::syntax
