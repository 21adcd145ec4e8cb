// galaxy_ast/tree/tree_stats.cpp - Summary counts and DSL-only filtering
#include "galaxy_ast/tree/tree_stats.hpp"

#include <utility>
#include <vector>

namespace galaxy_ast
{

namespace
{

bool is_dsl_file(const FileNode & file)
{
  if (!file.language) return false;
  const auto lang = language_from_string(*file.language);
  return lang && is_dsl(*lang);
}

void count(const TreeNode & node, TreeStats & stats)
{
  if (const auto * file = dyn_cast<FileNode>(&node)) {
    ++stats.total_files;
    if (is_dsl_file(*file)) {
      ++stats.dsl_files;
    } else {
      ++stats.other_files;
    }
    if (file->parse_error) {
      ++stats.errors;
    }
    return;
  }

  for (const auto & child : cast<FolderNode>(&node)->children) {
    count(*child, stats);
  }
}

}  // namespace

TreeStats collect_stats(const TreeNode & tree)
{
  TreeStats stats;
  count(tree, stats);
  return stats;
}

std::unique_ptr<TreeNode> filter_dsl_only(std::unique_ptr<TreeNode> tree)
{
  if (!tree) return nullptr;

  if (const auto * file = dyn_cast<FileNode>(tree.get())) {
    return is_dsl_file(*file) ? std::move(tree) : nullptr;
  }

  auto * folder = cast<FolderNode>(tree.get());
  std::vector<std::unique_ptr<TreeNode>> kept;
  for (auto & child : folder->children) {
    if (auto filtered = filter_dsl_only(std::move(child))) {
      kept.push_back(std::move(filtered));
    }
  }
  if (kept.empty()) {
    return nullptr;
  }
  folder->children = std::move(kept);
  return tree;
}

}  // namespace galaxy_ast
