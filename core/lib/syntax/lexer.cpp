#include "galaxy_ast/syntax/lexer.hpp"

namespace galaxy_ast::syntax
{
namespace
{

bool is_name_start(char c)
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}
bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_name_continue(char c) { return is_name_start(c) || is_digit(c) || c == '-'; }
bool is_operator_char(char c)
{
  switch (c) {
    case '+':
    case '-':
    case '*':
    case '/':
    case '>':
    case '<':
    case '!':
    case '=':
      return true;
    default:
      return false;
  }
}
bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

}  // namespace

void Lexer::skip_blanks()
{
  while (!eof()) {
    const char c = peek();
    if (c == '\n') {
      advance(1);
      ++line_;
      line_start_ = pos_;
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\r') {
      advance(1);
      continue;
    }
    break;
  }
}

uint32_t Lexer::column_of(size_t offset) const noexcept
{
  // Columns count code points, not bytes.
  uint32_t col = 0;
  for (size_t i = line_start_; i < offset; ++i) {
    if ((static_cast<unsigned char>(src_[i]) & 0xC0) != 0x80) {
      ++col;
    }
  }
  return col;
}

void Lexer::note_newlines(size_t from, size_t to) noexcept
{
  for (size_t i = from; i < to; ++i) {
    if (src_[i] == '\n') {
      ++line_;
      line_start_ = i + 1;
    }
  }
}

size_t Lexer::match_sigil_name() const noexcept
{
  if (!is_name_start(peek(1))) return 0;
  size_t n = 2;
  while (is_name_continue(peek(n))) {
    ++n;
  }
  return n;
}

size_t Lexer::match_string() const noexcept
{
  size_t i = pos_ + 1;
  while (i < src_.size()) {
    const char c = src_[i];
    if (c == '"') {
      return i + 1 - pos_;
    }
    if (c == '\\') {
      // An escape must be followed by a character on the same line.
      if (i + 1 >= src_.size() || src_[i + 1] == '\n') {
        return 0;
      }
      i += 2;
      continue;
    }
    ++i;
  }
  return 0;  // unterminated
}

size_t Lexer::match_number() const noexcept
{
  size_t n = 0;
  if (peek() == '-') {
    n = 1;
  }
  if (!is_digit(peek(n))) return 0;
  while (is_digit(peek(n))) {
    ++n;
  }
  if (peek(n) == '.' && is_digit(peek(n + 1))) {
    n += 1;
    while (is_digit(peek(n))) {
      ++n;
    }
  }
  return n;
}

size_t Lexer::match_operator_run() const noexcept
{
  size_t n = 0;
  while (is_operator_char(peek(n))) {
    ++n;
  }
  return n;
}

size_t Lexer::match_atom() const noexcept
{
  if (!is_name_start(peek())) return 0;
  size_t n = 1;
  while (is_name_continue(peek(n))) {
    ++n;
  }
  if (peek(n) == '!') {
    ++n;
  }
  return n;
}

bool Lexer::starts_any_rule() const noexcept
{
  switch (peek()) {
    case ';':
    case '!':
    case '(':
    case ')':
    case '[':
    case ']':
    case '=':
      return true;
    case '&':
    case '$':
      return match_sigil_name() > 0;
    case '"':
      return match_string() > 0;
    default:
      break;
  }
  return match_number() > 0 || match_operator_run() > 0 || match_atom() > 0;
}

Token Lexer::make_token(TokenKind kind, size_t length)
{
  Token t;
  t.kind = kind;
  t.text = src_.substr(pos_, length);
  t.line = line_;
  t.column = column_of(pos_);
  advance(length);
  return t;
}

Token Lexer::next_token()
{
  skip_blanks();

  if (eof()) {
    Token t;
    t.kind = TokenKind::Eof;
    t.line = line_;
    t.column = column_of(pos_);
    return t;
  }

  const char c = peek();

  // Precedence order matters: e.g. "-5" is a number, "!=" is '!' then '='.
  if (c == ';') {
    size_t n = 0;
    while (pos_ + n < src_.size() && src_[pos_ + n] != '\n') {
      ++n;
    }
    return make_token(TokenKind::Comment, n);
  }
  if (c == '!') return make_token(TokenKind::Execute, 1);
  if (c == '(') return make_token(TokenKind::LParen, 1);
  if (c == ')') return make_token(TokenKind::RParen, 1);
  if (c == '[') return make_token(TokenKind::LBracket, 1);
  if (c == ']') return make_token(TokenKind::RBracket, 1);

  if (c == '&') {
    if (const size_t n = match_sigil_name(); n > 0) {
      return make_token(TokenKind::AtomspaceRef, n);
    }
  }
  if (c == '$') {
    if (const size_t n = match_sigil_name(); n > 0) {
      return make_token(TokenKind::Variable, n);
    }
  }
  if (c == '"') {
    if (const size_t n = match_string(); n > 0) {
      const size_t start = pos_;
      Token t = make_token(TokenKind::String, n);
      note_newlines(start, pos_);
      return t;
    }
  }
  if (const size_t n = match_number(); n > 0) {
    return make_token(TokenKind::Number, n);
  }
  if (c == '=') return make_token(TokenKind::Equals, 1);
  if (const size_t n = match_operator_run(); n > 0) {
    return make_token(TokenKind::Operator, n);
  }
  if (const size_t n = match_atom(); n > 0) {
    return make_token(TokenKind::Atom, n);
  }

  // Unknown run: up to the next blank or the next position some rule accepts.
  const size_t start = pos_;
  size_t end = pos_ + 1;
  while (end < src_.size() && !is_blank(src_[end])) {
    const size_t saved = pos_;
    pos_ = end;
    const bool rule = starts_any_rule();
    pos_ = saved;
    if (rule) break;
    ++end;
  }
  return make_token(TokenKind::Unknown, end - start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

std::vector<Token> tokenize(std::string_view src)
{
  Lexer lex(src);
  return lex.lex_all();
}

}  // namespace galaxy_ast::syntax
