// galaxy-ast - Source tree scanner command line interface
//
// Usage:
//   galaxy-ast scan [root] [--project] [--tree out.json] [--graph out.graphml]
//   galaxy-ast graph <tree.json> [-o out.graphml] [--variables]
//   galaxy-ast dump <file.metta>
//   galaxy-ast languages [--grammar-dir DIR]...
//
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "galaxy_ast/ast/json_visitor.hpp"
#include "galaxy_ast/basic/diagnostic_printer.hpp"
#include "galaxy_ast/basic/source_file.hpp"
#include "galaxy_ast/driver/scanner.hpp"
#include "galaxy_ast/graph/graph_builder.hpp"
#include "galaxy_ast/project/project_config.hpp"
#include "galaxy_ast/serialize/graph_writer.hpp"
#include "galaxy_ast/serialize/tree_json.hpp"
#include "galaxy_ast/syntax/frontend.hpp"
#include "galaxy_ast/tree/walker.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "galaxy-ast v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  scan [root]              Walk a directory and write tree/graph artifacts\n"
            << "  graph <tree.json>        Rebuild the graph from a saved tree\n"
            << "  dump <file.metta>        Print the DSL syntax tree as JSON\n"
            << "  languages                List languages and parser availability\n\n"
            << "Options:\n"
            << "  --project                Read settings from galaxy.yaml\n"
            << "  --tree <path>            Tree JSON output (default docs/ast_summary.json)\n"
            << "  --graph <path>           GraphML output (default docs/ast_graph.graphml)\n"
            << "  --graph-json <path>      Graph JSON output\n"
            << "  -o, --output <path>      Output file (graph command)\n"
            << "  --dsl-only               Keep only DSL files\n"
            << "  --variables              Add variable nodes and 'uses' edges\n"
            << "  --grammar-dir <dir>      Search for tree-sitter grammars (repeatable)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const galaxy_ast::DiagnosticBag & diagnostics, bool verbose)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  galaxy_ast::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(
    diagnostics, verbose ? galaxy_ast::Severity::Hint : galaxy_ast::Severity::Warning);
}

void print_summary(const galaxy_ast::TreeStats & stats)
{
  std::cout << "\nSummary:\n"
            << "   Total files: " << stats.total_files << "\n"
            << "   DSL files: " << stats.dsl_files << "\n"
            << "   Other files: " << stats.other_files << "\n"
            << "   Parse errors: " << stats.errors << "\n";
}

std::string joined_languages()
{
  std::string out;
  for (const auto lang : galaxy_ast::available_languages()) {
    if (!out.empty()) out += ", ";
    out += std::string(galaxy_ast::to_string(lang));
  }
  return out;
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input;
  std::string output_path;
  std::string tree_path;
  std::string graph_path;
  std::string graph_json_path;
  std::vector<std::string> grammar_dirs;
  bool use_project = false;
  bool dsl_only = false;
  bool variables = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--tree") {
      if (i + 1 < argc) {
        args.tree_path = argv[++i];
      }
    } else if (arg == "--graph") {
      if (i + 1 < argc) {
        args.graph_path = argv[++i];
      }
    } else if (arg == "--graph-json") {
      if (i + 1 < argc) {
        args.graph_json_path = argv[++i];
      }
    } else if (arg == "--grammar-dir") {
      if (i + 1 < argc) {
        args.grammar_dirs.emplace_back(argv[++i]);
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--dsl-only") {
      args.dsl_only = true;
    } else if (arg == "--variables") {
      args.variables = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input.empty()) {
      args.input = arg;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_scan(const CommandArgs & args)
{
  galaxy_ast::ScanOptions options;
  options.tree_output = "docs/ast_summary.json";
  options.graph_output = "docs/ast_graph.graphml";

  if (args.use_project) {
    const fs::path start = args.input.empty() ? fs::current_path() : fs::path(args.input);
    auto config_path = galaxy_ast::find_project_config(start);
    if (!config_path) {
      std::cerr << "error: no " << galaxy_ast::k_project_config_file_name
                << " found in " << start.string() << " or its parents\n";
      return 1;
    }

    const auto config_result = galaxy_ast::load_project_config(*config_path);
    if (!config_result.success) {
      galaxy_ast::DiagnosticBag diags;
      {
        auto builder = diags.report_error(*config_path, config_result.error);
        builder.with_code(galaxy_ast::diag_codes::k_config_invalid);
        if (config_result.error_line) {
          builder.with_line(*config_result.error_line);
        }
      }
      print_diagnostics(diags, args.verbose);
      return diags.has_errors() ? 1 : 0;
    }

    if (args.verbose) {
      std::cerr << "Using project: " << config_path->string() << "\n";
    }
    options = galaxy_ast::scan_options_from_config(config_result.config);
  } else if (!args.input.empty()) {
    options.root = args.input;
  }

  // Command-line flags override the project file.
  if (!args.tree_path.empty()) options.tree_output = args.tree_path;
  if (!args.graph_path.empty()) options.graph_output = args.graph_path;
  if (!args.graph_json_path.empty()) options.graph_json_output = args.graph_json_path;
  if (args.dsl_only) options.dsl_only = true;
  if (args.variables) options.include_variables = true;
  for (const auto & dir : args.grammar_dirs) {
    options.grammars.search_dirs.emplace_back(dir);
  }
  if (args.verbose) {
    options.progress = &std::cerr;
  }

  if (!fs::exists(options.root)) {
    std::cerr << "error: path not found: " << options.root.string() << "\n";
    return 1;
  }

  std::cout << "Scanning: " << galaxy_ast::normalize_root(options.root).string() << "\n";
  std::cout << "Languages supported: " << joined_languages() << "\n";
  if (options.dsl_only) {
    std::cout << "DSL-only mode enabled\n";
  }

  const galaxy_ast::ScanResult result = galaxy_ast::Scanner::scan(options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, args.verbose);
  }

  print_summary(result.stats);
  for (const auto & file : result.generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }
  return 0;
}

int cmd_graph(const CommandArgs & args)
{
  if (args.input.empty()) {
    std::cerr << "error: input tree JSON required\n";
    std::cerr << "usage: galaxy-ast graph <tree.json> [-o out.graphml] [--variables]\n";
    return 1;
  }

  const galaxy_ast::SourceFile source = galaxy_ast::load_source_file(args.input);
  const auto doc = nlohmann::json::parse(std::string(source.bytes()));
  const auto tree = galaxy_ast::tree_from_json(doc);
  const galaxy_ast::Graph graph =
    galaxy_ast::build_graph(*tree, galaxy_ast::GraphOptions{args.variables});

  const std::string graphml = galaxy_ast::graph_to_graphml(graph);
  if (args.output_path.empty()) {
    std::cout << graphml;
  } else {
    galaxy_ast::write_text_file(args.output_path, graphml);
    std::cerr << "Graph saved to: " << args.output_path << " (" << graph.node_count()
              << " nodes, " << graph.edge_count() << " edges)\n";
  }
  return 0;
}

int cmd_dump(const CommandArgs & args)
{
  if (args.input.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: galaxy-ast dump <file.metta>\n";
    return 1;
  }

  const galaxy_ast::SourceFile source = galaxy_ast::load_source_file(args.input);
  const auto ast = galaxy_ast::parse_dsl(source.bytes());
  std::cout << galaxy_ast::to_json(*ast).dump(2) << "\n";
  return 0;
}

int cmd_languages(const CommandArgs & args)
{
  galaxy_ast::GrammarOptions options;
  for (const auto & dir : args.grammar_dirs) {
    options.search_dirs.emplace_back(dir);
  }
  const galaxy_ast::GrammarRegistry registry(options);

  for (const auto lang : galaxy_ast::available_languages()) {
    const auto & info = galaxy_ast::language_info(lang);
    std::cout << info.id << "\t" << galaxy_ast::to_string(info.parser) << "\t";
    if (registry.is_available(lang)) {
      std::cout << "available\t" << registry.language_version(lang) << "\n";
    } else {
      std::cout << "unavailable\t" << registry.unavailable_reason(lang) << "\n";
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    if (args.command == "scan") {
      return cmd_scan(args);
    }

    if (args.command == "graph") {
      return cmd_graph(args);
    }

    if (args.command == "dump") {
      return cmd_dump(args);
    }

    if (args.command == "languages") {
      return cmd_languages(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
