// galaxy_ast/extract/dsl_extractor.cpp - Definitions extraction for the DSL AST
#include "galaxy_ast/extract/dsl_extractor.hpp"

namespace galaxy_ast
{

namespace
{

// First pass: every variable and atomspace reference, anywhere in the tree.
void collect_names(const DslNode & node, DslDefinitions & out)
{
  if (node.kind() == NodeKind::Variable) {
    out.variables.insert(node.value());
  } else if (node.kind() == NodeKind::AtomspaceRef) {
    out.atomspaces.insert(node.value());
  }
  for (const auto & child : node.children()) {
    collect_names(*child, out);
  }
}

const DslNode * find_signature(const DslNode & def)
{
  for (const auto & child : def.children()) {
    if (child->kind() == NodeKind::FunctionSignature) {
      return child.get();
    }
  }
  return nullptr;
}

void record_function(const DslNode & def, DslDefinitions & out)
{
  const DslNode * sig = find_signature(def);
  if (!sig) {
    return;  // (= ...) without a usable signature
  }

  DslFunctionDef fn;
  fn.name = sig->value();
  fn.start_line = def.start_line();
  fn.end_line = def.end_line();
  for (const auto & param : sig->children()) {
    if (param->kind() == NodeKind::Variable) {
      fn.parameters.push_back(param->value());
    }
  }
  out.functions.push_back(std::move(fn));
}

bool looks_like_fact(const DslNode & expr)
{
  return expr.child_count() == 3 && expr.child(0)->kind() == NodeKind::Atom;
}

// Second pass: classification. Children are always visited, so a form under
// an execution or a function body is recorded in its own right too.
void classify(const DslNode & node, DslDefinitions & out)
{
  switch (node.kind()) {
    case NodeKind::FunctionDefinition:
      record_function(node, out);
      break;
    case NodeKind::Execution:
      if (node.child_count() > 0) {
        out.executions.push_back({node.start_line(), expression_signature(*node.child(0))});
      }
      break;
    case NodeKind::Expression:
      if (looks_like_fact(node)) {
        out.facts.push_back({node.start_line(), expression_signature(node), node.child(0)->value()});
      } else {
        out.expressions.push_back({node.start_line(), expression_signature(node)});
      }
      break;
    default:
      break;
  }

  for (const auto & child : node.children()) {
    classify(*child, out);
  }
}

}  // namespace

std::string expression_signature(const DslNode & node)
{
  if (node.child_count() == 0) {
    return node.value().empty() ? std::string("empty") : node.value();
  }

  const std::string & op = node.child(0)->value();
  const size_t args = node.child_count() - 1;
  if (args == 0) {
    return op;
  }
  return op + "(" + std::to_string(args) + " args)";
}

DslDefinitions extract_dsl_definitions(const DslNode & root)
{
  DslDefinitions out;
  collect_names(root, out);
  classify(root, out);
  return out;
}

}  // namespace galaxy_ast
