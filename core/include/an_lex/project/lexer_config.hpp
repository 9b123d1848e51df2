// an_lex/project/lexer_config.hpp - Lexer configuration (anlex.yaml)
//
// Example:
//
//   lexer:
//     max_nesting_depth: 64
//     keep_comments: false
//     verbose: true
//
// Every key is optional; missing keys keep the LexOptions defaults.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "an_lex/syntax/lex_options.hpp"

namespace an_lex
{

/**
 * Result of loading a configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded options (only valid if success == true)
  LexOptions options;

  /// Directory containing the file
  std::filesystem::path config_root;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(LexOptions opts, std::filesystem::path root)
  {
    ConfigLoadResult r;
    r.options = opts;
    r.config_root = std::move(root);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Load lexer options from a YAML file.
 *
 * @param config_path Path to anlex.yaml
 * @return ConfigLoadResult with the options or an error message
 */
[[nodiscard]] ConfigLoadResult load_lexer_config(const std::filesystem::path & config_path);

/// Same as load_lexer_config() for in-memory YAML text
[[nodiscard]] ConfigLoadResult parse_lexer_config(const std::string & yaml_text);

/**
 * Search for anlex.yaml from start_dir up to the filesystem root.
 *
 * @return Path to the nearest anlex.yaml, std::nullopt if there is none
 */
[[nodiscard]] std::optional<std::filesystem::path> find_lexer_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_lexer_config_file_name = "anlex.yaml";

}  // namespace an_lex
