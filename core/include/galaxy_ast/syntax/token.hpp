// galaxy_ast/syntax/token.hpp - Tokens of the MeTTa-style DSL
#pragma once

#include <cstdint>
#include <string_view>

namespace galaxy_ast::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,  // a run of characters no rule accepts

  Comment,  // ; ... (to end of line)
  Execute,  // !

  LParen,
  RParen,
  LBracket,
  RBracket,

  AtomspaceRef,  // &name
  Variable,      // $name
  String,        // "..." (token.text keeps the quotes)
  Number,        // -?digits(.digits)?
  Equals,        // =
  Operator,      // run of + - * / > < ! =
  Atom,          // identifier, optional trailing '!'
};

/**
 * A token with its 1-based line and 0-based column.
 *
 * `text` is a view into the decoded source the lexer was given; it stays
 * valid only while that buffer is alive.
 */
struct Token
{
  TokenKind kind = TokenKind::Unknown;
  std::string_view text;
  uint32_t line = 1;
  uint32_t column = 0;
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Comment:
      return "comment";
    case TokenKind::Execute:
      return "!";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::AtomspaceRef:
      return "atomspace";
    case TokenKind::Variable:
      return "variable";
    case TokenKind::String:
      return "string";
    case TokenKind::Number:
      return "number";
    case TokenKind::Equals:
      return "=";
    case TokenKind::Operator:
      return "operator";
    case TokenKind::Atom:
      return "atom";
  }
  return "";
}

}  // namespace galaxy_ast::syntax
