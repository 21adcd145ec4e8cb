// galaxy_ast/extract/generic_extractor.hpp - Definitions extraction for tree-sitter trees
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "galaxy_ast/basic/source_file.hpp"
#include "galaxy_ast/extract/definitions.hpp"
#include "galaxy_ast/extract/syntax_table.hpp"
#include "galaxy_ast/language/language.hpp"

namespace galaxy_ast
{

namespace ts_ll
{
class Tree;
}

/**
 * Depth-first harvest of classes, functions and variables.
 *
 * `Node` needs the capability surface of ts_ll::Node:
 *   kind(), start_row(), end_row(), child_count(), child(i),
 *   child_by_field(name), is_null(), text(source).
 *
 * The enclosing class is passed down by value: a nested class scopes its own
 * subtree only, and functions found after it in the outer body still belong
 * to the outer class.
 */
template <typename Node>
class GenericExtractor
{
public:
  GenericExtractor(const SyntaxTable & table, std::string_view source)
  : table_(table), source_(source)
  {
  }

  [[nodiscard]] ConventionalDefinitions extract(const Node & root)
  {
    out_ = {};
    walk(root, k_no_class);
    return std::move(out_);
  }

private:
  static constexpr size_t k_no_class = static_cast<size_t>(-1);

  void walk(const Node & node, size_t current_class)
  {
    switch (table_.role_of(node.kind())) {
      case NodeRole::ClassLike:
        if (auto name = name_of(node)) {
          out_.classes.push_back(ClassDef{std::move(*name), node.start_row() + 1, {}});
          current_class = out_.classes.size() - 1;
        }
        break;
      case NodeRole::FunctionLike:
        if (auto name = name_of(node)) {
          FunctionDef fn{
            std::move(*name), node.start_row() + 1, collect_variables(node),
            node.end_row() - node.start_row() + 1};
          if (current_class != k_no_class) {
            out_.classes[current_class].functions.push_back(std::move(fn));
          } else {
            out_.functions.push_back(std::move(fn));
          }
        }
        break;
      default:
        break;
    }

    const uint32_t n = node.child_count();
    for (uint32_t i = 0; i < n; ++i) {
      walk(node.child(i), current_class);
    }
  }

  [[nodiscard]] std::optional<std::string> name_of(const Node & node) const
  {
    const Node name = node.child_by_field("name");
    if (name.is_null()) {
      return std::nullopt;
    }
    return decode_utf8_lossy(name.text(source_));
  }

  [[nodiscard]] std::vector<std::string> collect_variables(const Node & fn) const
  {
    std::vector<std::string> vars;
    collect_variables_into(fn, vars);
    return vars;
  }

  void collect_variables_into(const Node & node, std::vector<std::string> & vars) const
  {
    if (table_.role_of(node.kind()) == NodeRole::VariableLike) {
      if (table_.variable_name == VariableNameSource::FirstChild) {
        if (node.child_count() >= 1) {
          vars.push_back(decode_utf8_lossy(node.child(0).text(source_)));
        }
      } else if (auto name = name_of(node)) {
        vars.push_back(std::move(*name));
      }
    }

    const uint32_t n = node.child_count();
    for (uint32_t i = 0; i < n; ++i) {
      collect_variables_into(node.child(i), vars);
    }
  }

  const SyntaxTable & table_;
  std::string_view source_;
  ConventionalDefinitions out_;
};

/**
 * Extract definitions from a parsed conventional-language file.
 *
 * @throws ExtractionError if the tree has no root or `lang` is the DSL
 */
[[nodiscard]] ConventionalDefinitions extract_definitions(
  const ts_ll::Tree & tree, const SourceFile & source, Language lang);

}  // namespace galaxy_ast
