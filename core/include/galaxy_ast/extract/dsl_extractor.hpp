// galaxy_ast/extract/dsl_extractor.hpp - Definitions extraction for the DSL AST
#pragma once

#include <string>

#include "galaxy_ast/ast/ast.hpp"
#include "galaxy_ast/extract/definitions.hpp"

namespace galaxy_ast
{

/**
 * Classify the nodes of a DSL AST into functions, executions, facts and
 * expressions, and collect the variables and atomspace references used.
 *
 * Pure function of the AST; calling it twice yields equal records.
 */
[[nodiscard]] DslDefinitions extract_dsl_definitions(const DslNode & root);

/**
 * Human-readable signature of a form: "op(N args)", or "op" without
 * arguments. A node without children renders as its value (or "empty").
 */
[[nodiscard]] std::string expression_signature(const DslNode & node);

}  // namespace galaxy_ast
