// an_lex/project/lexer_config.cpp - Lexer configuration implementation
//
#include "an_lex/project/lexer_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

namespace an_lex
{

namespace
{

ConfigLoadResult from_yaml(const YAML::Node & root, std::filesystem::path config_root)
{
  LexOptions options;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(options, std::move(config_root));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  const YAML::Node lexer = root["lexer"];
  if (!lexer) {
    return ConfigLoadResult::ok(options, std::move(config_root));
  }
  if (!lexer.IsMap()) {
    return ConfigLoadResult::fail("'lexer' must be a map");
  }

  try {
    if (lexer["max_nesting_depth"]) {
      const auto depth = lexer["max_nesting_depth"].as<int64_t>();
      if (depth <= 0 || depth > k_max_nesting_depth_limit) {
        return ConfigLoadResult::fail(
          "lexer.max_nesting_depth must be between 1 and " +
          std::to_string(k_max_nesting_depth_limit) + ", got " + std::to_string(depth));
      }
      options.max_nesting_depth = static_cast<uint32_t>(depth);
    }
    if (lexer["keep_comments"]) {
      options.keep_comments = lexer["keep_comments"].as<bool>();
    }
    if (lexer["verbose"]) {
      options.verbose = lexer["verbose"].as<bool>();
    }
  } catch (const YAML::BadConversion & e) {
    return ConfigLoadResult::fail("invalid value in 'lexer': " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(options, std::move(config_root));
}

}  // namespace

ConfigLoadResult load_lexer_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return from_yaml(root, fs::absolute(config_path).parent_path());
}

ConfigLoadResult parse_lexer_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return from_yaml(root, {});
}

std::optional<std::filesystem::path> find_lexer_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_lexer_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;  // filesystem root
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace an_lex
