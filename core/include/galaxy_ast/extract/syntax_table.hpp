// galaxy_ast/extract/syntax_table.hpp - Per-language node-kind roles
#pragma once

#include <gsl/span>

#include <cstdint>
#include <string_view>

#include "galaxy_ast/language/language.hpp"

namespace galaxy_ast
{

enum class NodeRole : uint8_t {
  Other,
  ClassLike,
  FunctionLike,
  VariableLike,
};

/// Where a VariableLike node keeps the declared name.
enum class VariableNameSource : uint8_t {
  FirstChild,  // python `assignment`: left-hand side
  NameField,   // `variable_declarator`: the `name` field
};

struct RoleRule
{
  std::string_view node_kind;
  NodeRole role;
};

/**
 * Static description of one conventional language, resolved once per file.
 * The traversal itself is language-agnostic.
 */
struct SyntaxTable
{
  gsl::span<const RoleRule> rules;
  VariableNameSource variable_name = VariableNameSource::NameField;

  [[nodiscard]] NodeRole role_of(std::string_view node_kind) const noexcept
  {
    for (const auto & r : rules) {
      if (r.node_kind == node_kind) return r.role;
    }
    return NodeRole::Other;
  }
};

/**
 * @throws ExtractionError for the DSL, which has no tree-sitter grammar
 */
[[nodiscard]] const SyntaxTable & syntax_table(Language lang);

}  // namespace galaxy_ast
