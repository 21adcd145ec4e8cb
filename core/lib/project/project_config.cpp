// galaxy_ast/project/project_config.cpp - Project configuration implementation
//
#include "galaxy_ast/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace galaxy_ast
{

namespace fs = std::filesystem;

namespace
{

std::optional<uint32_t> mark_line(const YAML::Exception & e)
{
  if (e.mark.is_null()) return std::nullopt;
  return static_cast<uint32_t>(e.mark.line + 1);
}

fs::path resolve(const fs::path & base, const std::string & value)
{
  const fs::path p(value);
  return p.is_absolute() ? p.lexically_normal() : (base / p).lexically_normal();
}

/// Parse a list of paths; returns false (with `error`) when `node` is not a list.
bool parse_path_list(
  const YAML::Node & node, const char * what, const fs::path & base, std::vector<fs::path> & out,
  std::string & error)
{
  if (!node.IsSequence()) {
    error = std::string(what) + " must be a list";
    return false;
  }
  for (const auto & item : node) {
    out.push_back(resolve(base, item.as<std::string>()));
  }
  return true;
}

bool check_map(const YAML::Node & node, const char * what, std::string & error)
{
  if (!node.IsMap()) {
    error = std::string(what) + " must be a map";
    return false;
  }
  return true;
}

}  // namespace

ConfigLoadResult load_project_config(const fs::path & config_path)
{
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()), mark_line(e));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();
  const fs::path & base = config.project_root;
  config.scan.root = base;
  config.output.tree = base / config.output.tree;
  config.output.graph = base / config.output.graph;

  // An empty document is a valid, all-defaults configuration.
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }

  std::string error;
  if (!check_map(root, "configuration root", error)) {
    return ConfigLoadResult::fail(error);
  }

  try {
    // 'scan' section
    if (const auto scan = root["scan"]) {
      if (!check_map(scan, "scan", error)) return ConfigLoadResult::fail(error);
      if (scan["root"]) {
        config.scan.root = resolve(base, scan["root"].as<std::string>());
      }
      if (scan["dsl_only"]) {
        config.scan.dsl_only = scan["dsl_only"].as<bool>();
      }
    }

    // 'parsers' section
    if (const auto parsers = root["parsers"]) {
      if (!check_map(parsers, "parsers", error)) return ConfigLoadResult::fail(error);
      if (parsers["grammar_dirs"] &&
          !parse_path_list(
            parsers["grammar_dirs"], "parsers.grammar_dirs", base, config.parsers.grammar_dirs,
            error)) {
        return ConfigLoadResult::fail(error);
      }
      if (parsers["grammar_bundles"] &&
          !parse_path_list(
            parsers["grammar_bundles"], "parsers.grammar_bundles", base,
            config.parsers.grammar_bundles, error)) {
        return ConfigLoadResult::fail(error);
      }
      if (parsers["system_loader"]) {
        config.parsers.system_loader = parsers["system_loader"].as<bool>();
      }
    }

    // 'output' section
    if (const auto output = root["output"]) {
      if (!check_map(output, "output", error)) return ConfigLoadResult::fail(error);
      if (output["tree"]) {
        config.output.tree = resolve(base, output["tree"].as<std::string>());
      }
      if (output["graph"]) {
        config.output.graph = resolve(base, output["graph"].as<std::string>());
      }
      if (output["graph_json"]) {
        const auto value = output["graph_json"].as<std::string>();
        config.output.graph_json = value.empty() ? fs::path() : resolve(base, value);
      }
      if (output["include_variables"]) {
        config.output.include_variables = output["include_variables"].as<bool>();
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail(
      "invalid configuration value: " + std::string(e.what()), mark_line(e));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<fs::path> find_project_config(const fs::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace galaxy_ast
