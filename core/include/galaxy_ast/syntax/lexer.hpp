#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "galaxy_ast/syntax/token.hpp"

namespace galaxy_ast::syntax
{

/**
 * Single left-to-right scanner for DSL source.
 *
 * At each position the rules are tried in a fixed precedence order and the
 * first one that matches wins: comment, '!', brackets, '&name', '$name',
 * string, number, '=', operator run, atom. Whitespace and newlines are
 * dropped. Characters no rule accepts are grouped into Unknown tokens so the
 * token texts still account for every non-blank character of the input.
 *
 * The output always ends with a single Eof token.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_blanks();

  // Each returns the length of the match at pos_, or 0.
  [[nodiscard]] size_t match_sigil_name() const noexcept;
  [[nodiscard]] size_t match_string() const noexcept;
  [[nodiscard]] size_t match_number() const noexcept;
  [[nodiscard]] size_t match_operator_run() const noexcept;
  [[nodiscard]] size_t match_atom() const noexcept;
  [[nodiscard]] bool starts_any_rule() const noexcept;

  [[nodiscard]] Token make_token(TokenKind kind, size_t length);

  [[nodiscard]] uint32_t column_of(size_t offset) const noexcept;
  void note_newlines(size_t from, size_t to) noexcept;

  std::string_view src_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
  size_t line_start_ = 0;
};

/// Convenience wrapper: tokenize a whole buffer.
[[nodiscard]] std::vector<Token> tokenize(std::string_view src);

}  // namespace galaxy_ast::syntax
