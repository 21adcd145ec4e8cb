// galaxy_ast/ast/ast.hpp - AST of the MeTTa-style DSL
//
// The AST is strictly tree-shaped: each node owns its children and there are
// no back-references. The root (kind Program) is owned by the parse result.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace galaxy_ast
{

enum class NodeKind : uint8_t {
  Program,
  Comment,
  Execution,
  Expression,
  EmptyExpression,
  FunctionDefinition,
  FunctionSignature,
  Variable,
  AtomspaceRef,
  String,
  Number,
  Operator,
  Atom,
  Unknown,
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
    case NodeKind::Program:
      return "program";
    case NodeKind::Comment:
      return "comment";
    case NodeKind::Execution:
      return "execution";
    case NodeKind::Expression:
      return "expression";
    case NodeKind::EmptyExpression:
      return "empty_expression";
    case NodeKind::FunctionDefinition:
      return "function_definition";
    case NodeKind::FunctionSignature:
      return "function_signature";
    case NodeKind::Variable:
      return "variable";
    case NodeKind::AtomspaceRef:
      return "atomspace_ref";
    case NodeKind::String:
      return "string";
    case NodeKind::Number:
      return "number";
    case NodeKind::Operator:
      return "operator";
    case NodeKind::Atom:
      return "atom";
    case NodeKind::Unknown:
      return "unknown";
  }
  return "unknown";
}

/**
 * One node of the DSL AST.
 *
 * Invariant: end_line >= start_line, and end_line >= the end_line of every
 * child. add_child() maintains it as children are attached; close_at()
 * moves end_line to the line of the closing token.
 */
class DslNode
{
public:
  DslNode(NodeKind kind, std::string value, uint32_t start_line)
  : kind_(kind), value_(std::move(value)), start_line_(start_line), end_line_(start_line)
  {
  }

  DslNode(const DslNode &) = delete;
  DslNode & operator=(const DslNode &) = delete;

  [[nodiscard]] NodeKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string & value() const noexcept { return value_; }
  [[nodiscard]] uint32_t start_line() const noexcept { return start_line_; }
  [[nodiscard]] uint32_t end_line() const noexcept { return end_line_; }

  [[nodiscard]] const std::vector<std::unique_ptr<DslNode>> & children() const noexcept
  {
    return children_;
  }
  [[nodiscard]] size_t child_count() const noexcept { return children_.size(); }
  [[nodiscard]] const DslNode * child(size_t i) const noexcept
  {
    return i < children_.size() ? children_[i].get() : nullptr;
  }

  DslNode & add_child(std::unique_ptr<DslNode> child)
  {
    if (child->end_line_ > end_line_) {
      end_line_ = child->end_line_;
    }
    children_.push_back(std::move(child));
    return *children_.back();
  }

  /// Record the line of the token that closes this node.
  void close_at(uint32_t line) noexcept
  {
    if (line > end_line_) {
      end_line_ = line;
    }
  }

private:
  NodeKind kind_;
  std::string value_;
  uint32_t start_line_;
  uint32_t end_line_;
  std::vector<std::unique_ptr<DslNode>> children_;
};

}  // namespace galaxy_ast
