// galaxy_ast/extract/syntax_table.cpp - Role tables for the tree-sitter grammars
#include "galaxy_ast/extract/syntax_table.hpp"

#include <string>

#include "galaxy_ast/basic/error.hpp"

namespace galaxy_ast
{

namespace
{

constexpr RoleRule k_python_rules[] = {
  {"class_definition", NodeRole::ClassLike},
  {"function_definition", NodeRole::FunctionLike},
  {"assignment", NodeRole::VariableLike},
};

// Shared by javascript and typescript.
constexpr RoleRule k_ecmascript_rules[] = {
  {"class_declaration", NodeRole::ClassLike},
  {"class_definition", NodeRole::ClassLike},
  {"function_declaration", NodeRole::FunctionLike},
  {"method_definition", NodeRole::FunctionLike},
  {"variable_declarator", NodeRole::VariableLike},
};

constexpr RoleRule k_java_rules[] = {
  {"class_declaration", NodeRole::ClassLike},
  {"method_declaration", NodeRole::FunctionLike},
  {"constructor_declaration", NodeRole::FunctionLike},
  {"variable_declarator", NodeRole::VariableLike},
};

const SyntaxTable k_python_table{k_python_rules, VariableNameSource::FirstChild};
const SyntaxTable k_ecmascript_table{k_ecmascript_rules, VariableNameSource::NameField};
const SyntaxTable k_java_table{k_java_rules, VariableNameSource::NameField};

}  // namespace

const SyntaxTable & syntax_table(Language lang)
{
  switch (lang) {
    case Language::Python:
      return k_python_table;
    case Language::JavaScript:
    case Language::TypeScript:
      return k_ecmascript_table;
    case Language::Java:
      return k_java_table;
    case Language::Metta:
      break;
  }
  throw ExtractionError("no syntax table for '" + std::string(to_string(lang)) + "'");
}

}  // namespace galaxy_ast
