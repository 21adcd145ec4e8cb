// galaxy_ast/serialize/tree_json.cpp - Source tree <-> JSON document
#include "galaxy_ast/serialize/tree_json.hpp"

#include <stdexcept>
#include <string>

namespace galaxy_ast
{

using json = nlohmann::json;

namespace
{

// ============================================================================
// Writing
// ============================================================================

json function_to_json(const FunctionDef & fn)
{
  return json{
    {"name", fn.name},
    {"line", fn.line},
    {"variables", fn.variables},
    {"line_count", fn.line_count}};
}

json conventional_to_json(const ConventionalDefinitions & defs)
{
  json classes = json::array();
  for (const auto & cls : defs.classes) {
    json fns = json::array();
    for (const auto & fn : cls.functions) {
      fns.push_back(function_to_json(fn));
    }
    classes.push_back(
      json{{"type", "class"}, {"name", cls.name}, {"line", cls.line}, {"functions", fns}});
  }

  json functions = json::array();
  for (const auto & fn : defs.functions) {
    functions.push_back(function_to_json(fn));
  }
  return json{{"classes", classes}, {"functions", functions}};
}

json dsl_to_json(const DslDefinitions & defs)
{
  json functions = json::array();
  for (const auto & fn : defs.functions) {
    functions.push_back(json{
      {"name", fn.name},
      {"start_line", fn.start_line},
      {"end_line", fn.end_line},
      {"parameters", fn.parameters},
      {"param_count", fn.parameters.size()}});
  }

  json executions = json::array();
  for (const auto & ex : defs.executions) {
    executions.push_back(json{{"line", ex.line}, {"expression", ex.expression}});
  }

  json facts = json::array();
  for (const auto & f : defs.facts) {
    facts.push_back(json{{"line", f.line}, {"pattern", f.pattern}, {"subject", f.subject}});
  }

  json expressions = json::array();
  for (const auto & e : defs.expressions) {
    expressions.push_back(json{{"line", e.line}, {"signature", e.signature}});
  }

  const DslSummary s = defs.summary();
  return json{
    {"functions", functions},
    {"executions", executions},
    {"facts", facts},
    {"expressions", expressions},
    // std::set iterates sorted
    {"variables", json(defs.variables)},
    {"atomspaces", json(defs.atomspaces)},
    {"summary",
     {{"function_count", s.function_count},
      {"expression_count", s.expression_count},
      {"execution_count", s.execution_count},
      {"fact_count", s.fact_count},
      {"variable_count", s.variable_count},
      {"atomspace_count", s.atomspace_count}}}};
}

// ============================================================================
// Reading
// ============================================================================

FunctionDef function_from_json(const json & j)
{
  FunctionDef fn;
  fn.name = j.at("name").get<std::string>();
  fn.line = j.at("line").get<uint32_t>();
  fn.variables = j.value("variables", std::vector<std::string>{});
  fn.line_count = j.value("line_count", 0U);
  return fn;
}

ConventionalDefinitions conventional_from_json(const json & j)
{
  ConventionalDefinitions defs;
  for (const auto & c : j.at("classes")) {
    ClassDef cls;
    cls.name = c.at("name").get<std::string>();
    cls.line = c.at("line").get<uint32_t>();
    for (const auto & f : c.value("functions", json::array())) {
      cls.functions.push_back(function_from_json(f));
    }
    defs.classes.push_back(std::move(cls));
  }
  for (const auto & f : j.value("functions", json::array())) {
    defs.functions.push_back(function_from_json(f));
  }
  return defs;
}

DslDefinitions dsl_from_json(const json & j)
{
  DslDefinitions defs;
  for (const auto & f : j.value("functions", json::array())) {
    DslFunctionDef fn;
    fn.name = f.at("name").get<std::string>();
    fn.start_line = f.at("start_line").get<uint32_t>();
    fn.end_line = f.at("end_line").get<uint32_t>();
    fn.parameters = f.value("parameters", std::vector<std::string>{});
    defs.functions.push_back(std::move(fn));
  }
  for (const auto & e : j.value("executions", json::array())) {
    defs.executions.push_back({e.at("line").get<uint32_t>(), e.at("expression").get<std::string>()});
  }
  for (const auto & f : j.value("facts", json::array())) {
    defs.facts.push_back(
      {f.at("line").get<uint32_t>(), f.at("pattern").get<std::string>(),
       f.at("subject").get<std::string>()});
  }
  for (const auto & e : j.value("expressions", json::array())) {
    defs.expressions.push_back({e.at("line").get<uint32_t>(), e.at("signature").get<std::string>()});
  }
  for (const auto & v : j.value("variables", json::array())) {
    defs.variables.insert(v.get<std::string>());
  }
  for (const auto & a : j.value("atomspaces", json::array())) {
    defs.atomspaces.insert(a.get<std::string>());
  }
  return defs;
}

std::unique_ptr<TreeNode> node_from_json(const json & j)
{
  const std::string type = j.at("type").get<std::string>();
  std::string name = j.at("name").get<std::string>();
  std::string path = j.value("path", std::string());

  if (type == "folder") {
    auto folder = std::make_unique<FolderNode>(std::move(name), std::move(path));
    for (const auto & child : j.value("children", json::array())) {
      folder->children.push_back(node_from_json(child));
    }
    return folder;
  }

  if (type != "file") {
    throw std::runtime_error("unknown tree node type '" + type + "'");
  }

  auto file = std::make_unique<FileNode>(std::move(name), std::move(path));
  if (j.contains("language")) {
    file->language = j.at("language").get<std::string>();
  }
  if (j.contains("parser_kind")) {
    const std::string pk = j.at("parser_kind").get<std::string>();
    file->parser_kind = parser_kind_from_string(pk);
    if (!file->parser_kind) {
      throw std::runtime_error("unknown parser_kind '" + pk + "'");
    }
  }
  if (j.contains("parse_error")) {
    file->parse_error = j.at("parse_error").get<std::string>();
  }
  if (j.contains("definitions")) {
    const json & d = j.at("definitions");
    if (d.contains("classes")) {
      file->definitions = conventional_from_json(d);
    } else {
      file->definitions = dsl_from_json(d);
    }
  }
  return file;
}

}  // namespace

json definitions_to_json(const Definitions & defs)
{
  if (const auto * conv = std::get_if<ConventionalDefinitions>(&defs)) {
    return conventional_to_json(*conv);
  }
  return dsl_to_json(std::get<DslDefinitions>(defs));
}

json tree_to_json(const TreeNode & tree)
{
  json j{
    {"name", tree.name},
    {"path", tree.path},
    {"type", std::string(to_string(tree.get_kind()))}};

  if (const auto * folder = dyn_cast<FolderNode>(&tree)) {
    json children = json::array();
    for (const auto & child : folder->children) {
      children.push_back(tree_to_json(*child));
    }
    j["children"] = std::move(children);
    return j;
  }

  const auto * file = cast<FileNode>(&tree);
  if (file->language) {
    j["language"] = *file->language;
  }
  if (file->definitions) {
    j["definitions"] = definitions_to_json(*file->definitions);
  }
  if (file->parser_kind) {
    j["parser_kind"] = std::string(to_string(*file->parser_kind));
  }
  if (file->parse_error) {
    j["parse_error"] = *file->parse_error;
  }
  return j;
}

std::unique_ptr<TreeNode> tree_from_json(const json & j)
{
  try {
    return node_from_json(j);
  } catch (const json::exception & e) {
    throw std::runtime_error(std::string("invalid tree document: ") + e.what());
  }
}

}  // namespace galaxy_ast
