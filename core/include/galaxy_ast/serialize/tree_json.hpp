// galaxy_ast/serialize/tree_json.hpp - Source tree <-> JSON document
#pragma once

#include <nlohmann/json.hpp>

#include <memory>

#include "galaxy_ast/tree/source_tree.hpp"

namespace galaxy_ast
{

/**
 * Folders: {name, path, type, children}
 * Files:   {name, path, type, language?, definitions?, parser_kind?, parse_error?}
 */
[[nodiscard]] nlohmann::json tree_to_json(const TreeNode & tree);

[[nodiscard]] nlohmann::json definitions_to_json(const Definitions & defs);

/**
 * Rebuild a tree from tree_to_json() output.
 *
 * @throws std::runtime_error if the document does not have that shape
 */
[[nodiscard]] std::unique_ptr<TreeNode> tree_from_json(const nlohmann::json & j);

}  // namespace galaxy_ast
