// galaxy_ast/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "galaxy_ast/syntax/ts_ll.hpp"

#include "galaxy_ast/basic/error.hpp"

namespace galaxy_ast::ts_ll
{

Parser::Parser(const TSLanguage * language)
{
  if (language == nullptr) {
    throw ParserUnavailable("no grammar supplied to the tree-sitter parser");
  }

  parser_ = ts_parser_new();
  if (parser_ == nullptr) {
    throw ParserUnavailable("ts_parser_new() failed");
  }

  // Fails on an ABI mismatch between the grammar and the runtime.
  if (!ts_parser_set_language(parser_, language)) {
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw ParserUnavailable("grammar ABI version is not supported by the tree-sitter runtime");
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

Tree Parser::parse(std::string_view source) const
{
  // Tree-sitter consumes bytes; invalid UTF-8 is tolerated by the runtime.
  return Tree(ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size())));
}

}  // namespace galaxy_ast::ts_ll
