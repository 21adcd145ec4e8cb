// galaxy_ast/project/project_config.hpp - Project configuration (galaxy.yaml)
//
// Parses and validates galaxy.yaml. Relative paths are resolved against the
// directory holding the file.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace galaxy_ast
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct ScanConfig
{
  /// Directory to scan
  std::filesystem::path root = ".";

  /// Keep only DSL files and the folders containing them
  bool dsl_only = false;
};

struct ParsersConfig
{
  /// Directories searched for libtree-sitter-<lang>.so
  std::vector<std::filesystem::path> grammar_dirs;

  /// Shared objects exporting several tree_sitter_<lang> symbols
  std::vector<std::filesystem::path> grammar_bundles;

  bool system_loader = true;
};

struct OutputConfig
{
  std::filesystem::path tree = "docs/ast_summary.json";
  std::filesystem::path graph = "docs/ast_graph.graphml";

  /// Optional JSON rendering of the graph (empty = not written)
  std::filesystem::path graph_json;

  bool include_variables = false;
};

/**
 * Complete project configuration (galaxy.yaml).
 */
struct ProjectConfig
{
  ScanConfig scan;
  ParsersConfig parsers;
  OutputConfig output;

  /// Directory containing galaxy.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  std::string error;

  /// 1-based line of the offending YAML, when known
  std::optional<uint32_t> error_line;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg, std::optional<uint32_t> line = std::nullopt)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.error_line = line;
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a galaxy.yaml file.
 *
 * Fails on a missing file, YAML syntax errors, or a section of the wrong shape.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Search upward from start_dir (or its parent, for a file) to the filesystem
 * root for galaxy.yaml.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "galaxy.yaml";

}  // namespace galaxy_ast
