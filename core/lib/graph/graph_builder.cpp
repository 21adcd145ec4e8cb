// galaxy_ast/graph/graph_builder.cpp - Source tree to graph conversion
#include "galaxy_ast/graph/graph_builder.hpp"

#include <stdexcept>
#include <variant>

namespace galaxy_ast
{

namespace
{

class GraphBuilder
{
public:
  GraphBuilder(Graph & graph, const GraphOptions & options) : graph_(graph), options_(options) {}

  void visit(const TreeNode & node, const std::string * parent_id)
  {
    const std::string id = node.path.empty() ? node.name : node.path;

    GraphNodeAttrs attrs{std::string(to_string(node.get_kind())), node.name, std::nullopt};
    if (const auto * file = dyn_cast<FileNode>(&node)) {
      attrs.language = file->language;
    }
    graph_.add_node(id, std::move(attrs));

    if (parent_id) {
      graph_.add_edge(*parent_id, id, Relation::Contains);
    }

    if (const auto * file = dyn_cast<FileNode>(&node)) {
      if (file->definitions && file->parse_error) {
        throw std::logic_error("file '" + id + "' carries both definitions and a parse error");
      }
      if (file->definitions) {
        std::visit([&](const auto & defs) { add_definitions(id, defs); }, *file->definitions);
      }
      return;
    }

    for (const auto & child : cast<FolderNode>(&node)->children) {
      visit(*child, &id);
    }
  }

private:
  void add_definitions(const std::string & file_id, const ConventionalDefinitions & defs)
  {
    for (const auto & cls : defs.classes) {
      const std::string class_id = file_id + ":" + cls.name;
      graph_.add_node(class_id, {"class", cls.name, std::nullopt});
      graph_.add_edge(file_id, class_id, Relation::Defines);

      for (const auto & fn : cls.functions) {
        const std::string func_id = class_id + ":" + fn.name;
        add_function(class_id, func_id, fn.name, Relation::HasMethod);
        add_variables(func_id, fn.variables);
      }
    }

    for (const auto & fn : defs.functions) {
      const std::string func_id = file_id + ":" + fn.name;
      add_function(file_id, func_id, fn.name, Relation::Defines);
      add_variables(func_id, fn.variables);
    }
  }

  void add_definitions(const std::string & file_id, const DslDefinitions & defs)
  {
    for (const auto & fn : defs.functions) {
      const std::string func_id = file_id + ":" + fn.name;
      add_function(file_id, func_id, fn.name, Relation::Defines);
      add_variables(func_id, fn.parameters);
    }
  }

  void add_function(
    const std::string & owner_id, const std::string & func_id, const std::string & name,
    Relation relation)
  {
    graph_.add_node(func_id, {"function", name, std::nullopt});
    graph_.add_edge(owner_id, func_id, relation);
  }

  void add_variables(const std::string & func_id, const std::vector<std::string> & vars)
  {
    if (!options_.include_variables) return;
    for (const auto & var : vars) {
      const std::string var_id = func_id + "::var::" + var;
      graph_.add_node(var_id, {"variable", var, std::nullopt});
      graph_.add_edge(func_id, var_id, Relation::Uses);
    }
  }

  Graph & graph_;
  const GraphOptions & options_;
};

}  // namespace

Graph build_graph(const TreeNode & tree, const GraphOptions & options)
{
  Graph graph;
  GraphBuilder(graph, options).visit(tree, nullptr);
  return graph;
}

}  // namespace galaxy_ast
