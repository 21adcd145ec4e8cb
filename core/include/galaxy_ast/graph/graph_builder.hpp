// galaxy_ast/graph/graph_builder.hpp - Source tree to graph conversion
#pragma once

#include "galaxy_ast/graph/graph.hpp"
#include "galaxy_ast/tree/source_tree.hpp"

namespace galaxy_ast
{

struct GraphOptions
{
  /// Emit one `uses` edge per collected variable (DSL: per parameter).
  bool include_variables = false;
};

/**
 * Mirror the tree as a graph. Ids are derived from paths only:
 *
 *   folder/file      absolute path (name when the path is empty)
 *   class            {file_id}:{class}
 *   method           {class_id}:{function}
 *   function         {file_id}:{function}
 *   variable         {function_id}::var::{variable}
 *
 * @throws std::logic_error if a file carries both definitions and a parse error
 */
[[nodiscard]] Graph build_graph(const TreeNode & tree, const GraphOptions & options = {});

}  // namespace galaxy_ast
