// galaxy_ast/syntax/frontend.cpp - DSL parse pipeline
#include "galaxy_ast/syntax/frontend.hpp"

#include <string>
#include <vector>

#include "galaxy_ast/basic/source_file.hpp"
#include "galaxy_ast/syntax/lexer.hpp"
#include "galaxy_ast/syntax/parser.hpp"

namespace galaxy_ast
{

std::unique_ptr<DslNode> parse_dsl(std::string_view bytes)
{
  // Node values are copied out of the token views, so `text` may die here.
  const std::string text = decode_utf8_lossy(bytes);
  const std::vector<syntax::Token> tokens = syntax::tokenize(text);

  syntax::Parser parser(tokens);
  return parser.parse_program();
}

}  // namespace galaxy_ast
