// galaxy_ast/tree/source_tree.hpp - Hierarchical folder/file tree with per-file definitions
//
// Built once by the DirectoryWalker and read-only afterwards. Folders own
// their children; children are ordered by name.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "galaxy_ast/basic/casting.hpp"
#include "galaxy_ast/extract/definitions.hpp"
#include "galaxy_ast/language/language.hpp"

namespace galaxy_ast
{

enum class TreeNodeKind : uint8_t {
  File,
  Folder,
};

[[nodiscard]] constexpr std::string_view to_string(TreeNodeKind k) noexcept
{
  return k == TreeNodeKind::Folder ? "folder" : "file";
}

class TreeNode
{
public:
  TreeNode(const TreeNode &) = delete;
  TreeNode & operator=(const TreeNode &) = delete;
  virtual ~TreeNode() = default;

  [[nodiscard]] TreeNodeKind get_kind() const noexcept { return kind_; }

  std::string name;
  std::string path;  // absolute; may be empty for hand-built trees

protected:
  TreeNode(TreeNodeKind kind, std::string n, std::string p)
  : name(std::move(n)), path(std::move(p)), kind_(kind)
  {
  }

private:
  TreeNodeKind kind_;
};

class FileNode : public TreeNode
{
public:
  FileNode(std::string n, std::string p) : TreeNode(TreeNodeKind::File, std::move(n), std::move(p))
  {
  }

  static bool classof(const TreeNode * node) { return node->get_kind() == TreeNodeKind::File; }

  /// Language id, e.g. "python"; kept as text so saved trees may name any language.
  std::optional<std::string> language;
  std::optional<ParserKind> parser_kind;
  // Once processed, exactly one of these is set (neither without a language).
  std::optional<Definitions> definitions;
  std::optional<std::string> parse_error;

  [[nodiscard]] bool is_dsl() const noexcept { return parser_kind == ParserKind::Dsl; }
};

class FolderNode : public TreeNode
{
public:
  FolderNode(std::string n, std::string p)
  : TreeNode(TreeNodeKind::Folder, std::move(n), std::move(p))
  {
  }

  static bool classof(const TreeNode * node) { return node->get_kind() == TreeNodeKind::Folder; }

  std::vector<std::unique_ptr<TreeNode>> children;

  template <typename T>
  T & add(std::unique_ptr<T> child)
  {
    T & ref = *child;
    children.push_back(std::move(child));
    return ref;
  }
};

}  // namespace galaxy_ast
