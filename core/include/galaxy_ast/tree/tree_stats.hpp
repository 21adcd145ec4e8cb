// galaxy_ast/tree/tree_stats.hpp - Summary counts and DSL-only filtering
#pragma once

#include <cstddef>
#include <memory>

#include "galaxy_ast/tree/source_tree.hpp"

namespace galaxy_ast
{

struct TreeStats
{
  size_t total_files = 0;
  size_t dsl_files = 0;
  size_t other_files = 0;
  size_t errors = 0;  // files carrying a parse_error
};

[[nodiscard]] TreeStats collect_stats(const TreeNode & tree);

/**
 * Keep DSL files and the folders that (transitively) contain one.
 * Returns null when nothing remains.
 */
[[nodiscard]] std::unique_ptr<TreeNode> filter_dsl_only(std::unique_ptr<TreeNode> tree);

}  // namespace galaxy_ast
