// galaxy_ast/extract/generic_extractor.cpp - Tree-sitter entry point of the generic extractor
#include "galaxy_ast/extract/generic_extractor.hpp"

#include "galaxy_ast/basic/error.hpp"
#include "galaxy_ast/syntax/ts_ll.hpp"

namespace galaxy_ast
{

ConventionalDefinitions extract_definitions(
  const ts_ll::Tree & tree, const SourceFile & source, Language lang)
{
  const ts_ll::Node root = tree.root_node();
  if (root.is_null()) {
    throw ExtractionError("syntax tree of '" + source.path().string() + "' has no root node");
  }

  GenericExtractor<ts_ll::Node> extractor(syntax_table(lang), source.bytes());
  return extractor.extract(root);
}

}  // namespace galaxy_ast
