// galaxy_ast/ast/json_visitor.hpp - JSON serialization for DSL AST nodes
#pragma once

#include <nlohmann/json.hpp>

#include "galaxy_ast/ast/ast.hpp"

namespace galaxy_ast
{

/**
 * Serialize a DSL AST subtree to JSON:
 *   {"type": "...", "value": "...", "start_line": n, "end_line": n, "children": [...]}
 *
 * `value` is omitted when empty and `children` when there are none.
 */
[[nodiscard]] nlohmann::json to_json(const DslNode & node);

}  // namespace galaxy_ast
