// galaxy_ast/driver/scanner.hpp - Scan driver
//
// Single entry point for the walk -> filter -> graph -> artifacts pipeline.
// Used by the CLI and usable from other tools.
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <vector>

#include "galaxy_ast/basic/diagnostic.hpp"
#include "galaxy_ast/graph/graph.hpp"
#include "galaxy_ast/language/grammar_registry.hpp"
#include "galaxy_ast/project/project_config.hpp"
#include "galaxy_ast/tree/source_tree.hpp"
#include "galaxy_ast/tree/tree_stats.hpp"

namespace galaxy_ast
{

// ============================================================================
// Scan Options
// ============================================================================

struct ScanOptions
{
  /// Directory (or single file) to scan
  std::filesystem::path root = ".";

  /// Keep only DSL files and the folders containing them
  bool dsl_only = false;

  /// Where tree-sitter grammars are looked up
  GrammarOptions grammars;

  /// Artifacts; an empty path means "do not write"
  std::filesystem::path tree_output;
  std::filesystem::path graph_output;
  std::filesystem::path graph_json_output;

  /// Emit `uses` edges to variables
  bool include_variables = false;

  /// Progress lines (one per parsed file); null for silence
  std::ostream * progress = nullptr;
};

/// Options equivalent to a loaded galaxy.yaml.
[[nodiscard]] ScanOptions scan_options_from_config(const ProjectConfig & config);

// ============================================================================
// Scan Result
// ============================================================================

struct ScanResult
{
  /// Never null; an empty root folder when the DSL-only filter removed everything
  std::unique_ptr<TreeNode> tree;

  Graph graph;
  TreeStats stats;

  /// Walk, registry and artifact diagnostics
  DiagnosticBag diagnostics;

  std::vector<std::filesystem::path> generated_files;
};

// ============================================================================
// Scanner
// ============================================================================

class Scanner
{
public:
  /**
   * Build a grammar registry from `options.grammars` and run the pipeline.
   *
   * @throws IoError if the root does not exist or an artifact cannot be written
   */
  [[nodiscard]] static ScanResult scan(const ScanOptions & options);

  /// Run the pipeline with an already-initialized registry.
  [[nodiscard]] static ScanResult scan(const ScanOptions & options, const GrammarRegistry & registry);

private:
  static void write_artifacts(const ScanOptions & options, ScanResult & result);
};

}  // namespace galaxy_ast
