#pragma once

#include <gsl/span>
#include <memory>

#include "galaxy_ast/ast/ast.hpp"
#include "galaxy_ast/syntax/token.hpp"

namespace galaxy_ast::syntax
{

/**
 * Recursive-descent parser for the DSL with one token of lookahead.
 *
 *   program    := top_level*
 *   top_level  := comment | execution | expression
 *   execution  := '!' expression?
 *   expression := '(' ')' | '(' '=' signature body* ')' | '(' element* ')'
 *   signature  := '(' name element* ')'
 *   element    := expression | atom_value
 *
 * The parser never fails. Tokens that cannot start a top-level form are
 * skipped, comments inside a form are ignored, and end of input inside an
 * open form closes it where it stands.
 */
class Parser
{
public:
  /// `tokens` must outlive the parser; it normally ends with an Eof token.
  explicit Parser(gsl::span<const Token> tokens) : tokens_(tokens) {}

  [[nodiscard]] std::unique_ptr<DslNode> parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  const Token & advance();
  void skip_comments();

  // Top-level
  [[nodiscard]] std::unique_ptr<DslNode> parse_top_level();
  [[nodiscard]] std::unique_ptr<DslNode> parse_comment();
  [[nodiscard]] std::unique_ptr<DslNode> parse_execution();

  // Forms
  [[nodiscard]] std::unique_ptr<DslNode> parse_expression();
  [[nodiscard]] std::unique_ptr<DslNode> parse_function_definition(uint32_t start_line);
  [[nodiscard]] std::unique_ptr<DslNode> parse_function_signature();
  [[nodiscard]] std::unique_ptr<DslNode> parse_call(uint32_t start_line);
  [[nodiscard]] std::unique_ptr<DslNode> parse_element();
  [[nodiscard]] std::unique_ptr<DslNode> parse_atom();

  void parse_elements_into(DslNode & parent);

  gsl::span<const Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace galaxy_ast::syntax
