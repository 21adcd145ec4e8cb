#include "galaxy_ast/syntax/parser.hpp"

#include <string>
#include <string_view>

namespace galaxy_ast::syntax
{
namespace
{

const Token k_eof_token{TokenKind::Eof, {}, 1, 0};

std::string_view trim(std::string_view s)
{
  constexpr std::string_view k_blank = " \t\r\n";
  const size_t b = s.find_first_not_of(k_blank);
  if (b == std::string_view::npos) return {};
  const size_t e = s.find_last_not_of(k_blank);
  return s.substr(b, e - b + 1);
}

NodeKind atom_kind_for(TokenKind k)
{
  switch (k) {
    case TokenKind::Variable:
      return NodeKind::Variable;
    case TokenKind::AtomspaceRef:
      return NodeKind::AtomspaceRef;
    case TokenKind::String:
      return NodeKind::String;
    case TokenKind::Number:
      return NodeKind::Number;
    case TokenKind::Operator:
      return NodeKind::Operator;
    case TokenKind::Atom:
      return NodeKind::Atom;
    default:
      return NodeKind::Unknown;
  }
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur() const
{
  if (idx_ >= tokens_.size()) {
    return k_eof_token;
  }
  return tokens_[idx_];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

void Parser::skip_comments()
{
  while (at(TokenKind::Comment)) {
    advance();
  }
}

// ============================================================================
// Top-level
// ============================================================================

std::unique_ptr<DslNode> Parser::parse_program()
{
  auto root = std::make_unique<DslNode>(NodeKind::Program, std::string(), 1);
  while (!at_eof()) {
    if (auto node = parse_top_level()) {
      root->add_child(std::move(node));
    }
  }
  return root;
}

std::unique_ptr<DslNode> Parser::parse_top_level()
{
  switch (cur().kind) {
    case TokenKind::Comment:
      return parse_comment();
    case TokenKind::Execute:
      return parse_execution();
    case TokenKind::LParen:
      return parse_expression();
    default:
      // Stray top-level token: skipped without a diagnostic.
      advance();
      return nullptr;
  }
}

std::unique_ptr<DslNode> Parser::parse_comment()
{
  const Token & t = advance();
  return std::make_unique<DslNode>(NodeKind::Comment, std::string(trim(t.text)), t.line);
}

std::unique_ptr<DslNode> Parser::parse_execution()
{
  const Token & bang = advance();
  auto exec = std::make_unique<DslNode>(NodeKind::Execution, "!", bang.line);
  if (at(TokenKind::LParen)) {
    exec->add_child(parse_expression());
  }
  return exec;
}

// ============================================================================
// Forms
// ============================================================================

std::unique_ptr<DslNode> Parser::parse_expression()
{
  const Token & lparen = advance();
  const uint32_t start_line = lparen.line;

  skip_comments();
  if (at_eof() || at(TokenKind::RParen)) {
    auto empty = std::make_unique<DslNode>(NodeKind::EmptyExpression, std::string(), start_line);
    if (at(TokenKind::RParen)) {
      empty->close_at(advance().line);
    }
    return empty;
  }

  // '=' right after '(' selects a function definition.
  std::unique_ptr<DslNode> result = at(TokenKind::Equals)
                                      ? parse_function_definition(start_line)
                                      : parse_call(start_line);

  if (at(TokenKind::RParen)) {
    result->close_at(advance().line);
  }
  return result;
}

std::unique_ptr<DslNode> Parser::parse_function_definition(uint32_t start_line)
{
  advance();  // '='

  auto func = std::make_unique<DslNode>(NodeKind::FunctionDefinition, std::string(), start_line);

  skip_comments();
  if (at(TokenKind::LParen)) {
    if (auto signature = parse_function_signature()) {
      func->add_child(std::move(signature));
    }
  }

  parse_elements_into(*func);
  return func;
}

std::unique_ptr<DslNode> Parser::parse_function_signature()
{
  advance();  // '('

  skip_comments();
  if (at_eof() || at(TokenKind::RParen)) {
    // "()" is not a signature; the ')' is left for the enclosing definition.
    return nullptr;
  }

  const Token & name = advance();
  auto sig =
    std::make_unique<DslNode>(NodeKind::FunctionSignature, std::string(name.text), name.line);

  parse_elements_into(*sig);
  if (at(TokenKind::RParen)) {
    sig->close_at(advance().line);
  }
  return sig;
}

std::unique_ptr<DslNode> Parser::parse_call(uint32_t start_line)
{
  auto call = std::make_unique<DslNode>(NodeKind::Expression, std::string(), start_line);
  parse_elements_into(*call);
  return call;
}

void Parser::parse_elements_into(DslNode & parent)
{
  while (true) {
    skip_comments();
    if (at_eof() || at(TokenKind::RParen)) {
      return;
    }
    parent.add_child(parse_element());
  }
}

std::unique_ptr<DslNode> Parser::parse_element()
{
  if (at(TokenKind::LParen)) {
    return parse_expression();
  }
  return parse_atom();
}

std::unique_ptr<DslNode> Parser::parse_atom()
{
  const Token & t = advance();
  return std::make_unique<DslNode>(atom_kind_for(t.kind), std::string(t.text), t.line);
}

}  // namespace galaxy_ast::syntax
