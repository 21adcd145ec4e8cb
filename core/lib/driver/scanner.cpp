// galaxy_ast/driver/scanner.cpp - Scan driver implementation
#include "galaxy_ast/driver/scanner.hpp"

#include "galaxy_ast/graph/graph_builder.hpp"
#include "galaxy_ast/serialize/graph_writer.hpp"
#include "galaxy_ast/serialize/tree_json.hpp"
#include "galaxy_ast/tree/walker.hpp"

namespace galaxy_ast
{

namespace fs = std::filesystem;

ScanOptions scan_options_from_config(const ProjectConfig & config)
{
  ScanOptions options;
  options.root = config.scan.root;
  options.dsl_only = config.scan.dsl_only;
  options.grammars.search_dirs = config.parsers.grammar_dirs;
  options.grammars.bundles = config.parsers.grammar_bundles;
  options.grammars.use_system_loader = config.parsers.system_loader;
  options.tree_output = config.output.tree;
  options.graph_output = config.output.graph;
  options.graph_json_output = config.output.graph_json;
  options.include_variables = config.output.include_variables;
  return options;
}

ScanResult Scanner::scan(const ScanOptions & options)
{
  const GrammarRegistry registry(options.grammars);
  return scan(options, registry);
}

ScanResult Scanner::scan(const ScanOptions & options, const GrammarRegistry & registry)
{
  ScanResult result;
  registry.report_unavailable(result.diagnostics);

  // 1. Walk
  DirectoryWalker walker(registry, result.diagnostics, WalkOptions{options.progress});
  result.tree = walker.walk(options.root);

  // 2. Optional DSL-only filter
  if (options.dsl_only) {
    std::string name = result.tree->name;
    std::string path = result.tree->path;
    result.tree = filter_dsl_only(std::move(result.tree));
    if (!result.tree) {
      result.tree = std::make_unique<FolderNode>(std::move(name), std::move(path));
    }
  }

  // 3. Graph
  result.stats = collect_stats(*result.tree);
  result.graph = build_graph(*result.tree, GraphOptions{options.include_variables});

  // 4. Artifacts
  write_artifacts(options, result);
  return result;
}

void Scanner::write_artifacts(const ScanOptions & options, ScanResult & result)
{
  if (!options.tree_output.empty()) {
    write_text_file(options.tree_output, tree_to_json(*result.tree).dump(2));
    result.generated_files.push_back(options.tree_output);
  }
  if (!options.graph_output.empty()) {
    write_text_file(options.graph_output, graph_to_graphml(result.graph));
    result.generated_files.push_back(options.graph_output);
  }
  if (!options.graph_json_output.empty()) {
    write_text_file(options.graph_json_output, graph_to_json(result.graph).dump(2));
    result.generated_files.push_back(options.graph_json_output);
  }
}

}  // namespace galaxy_ast
