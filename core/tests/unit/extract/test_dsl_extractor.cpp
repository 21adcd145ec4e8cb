// test_dsl_extractor.cpp - Unit tests for DSL definitions extraction
//
#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "galaxy_ast/extract/dsl_extractor.hpp"
#include "galaxy_ast/syntax/frontend.hpp"

namespace galaxy_ast
{

namespace
{

DslDefinitions extract(std::string_view src)
{
  const auto root = parse_dsl(src);
  return extract_dsl_definitions(*root);
}

}  // namespace

TEST(DslExtractor, ThreeElementAtomFormIsAFact)
{
  const auto defs = extract("(Bob parent Alex)");
  ASSERT_EQ(defs.facts.size(), 1U);
  EXPECT_EQ(defs.facts[0].subject, "Bob");
  EXPECT_EQ(defs.facts[0].pattern, "Bob(2 args)");
  EXPECT_EQ(defs.facts[0].line, 1U);
  EXPECT_TRUE(defs.expressions.empty());
}

TEST(DslExtractor, OperatorHeadIsNotAFact)
{
  const auto defs = extract("(+ 1 2)");
  EXPECT_TRUE(defs.facts.empty());
  ASSERT_EQ(defs.expressions.size(), 1U);
  EXPECT_EQ(defs.expressions[0].signature, "+(2 args)");
}

TEST(DslExtractor, TwoElementFormIsAnExpression)
{
  const auto defs = extract("(a b)");
  EXPECT_TRUE(defs.facts.empty());
  ASSERT_EQ(defs.expressions.size(), 1U);
  EXPECT_EQ(defs.expressions[0].signature, "a(1 args)");
}

TEST(DslExtractor, SingleElementSignatureIsTheHead)
{
  const auto defs = extract("(ping)");
  ASSERT_EQ(defs.expressions.size(), 1U);
  EXPECT_EQ(defs.expressions[0].signature, "ping");
}

TEST(DslExtractor, ExecutionCapture)
{
  const auto defs = extract("!(foo 1 2)");
  ASSERT_EQ(defs.executions.size(), 1U);
  EXPECT_EQ(defs.executions[0].expression, "foo(2 args)");
  EXPECT_EQ(defs.executions[0].line, 1U);
  // The executed form is also recorded in its own right.
  ASSERT_EQ(defs.expressions.size(), 1U);
  EXPECT_EQ(defs.expressions[0].signature, "foo(2 args)");
}

TEST(DslExtractor, ExecutionOfEmptyFormAndBareBang)
{
  const auto defs = extract("!()\n!");
  ASSERT_EQ(defs.executions.size(), 1U);
  EXPECT_EQ(defs.executions[0].expression, "empty");
}

TEST(DslExtractor, FunctionSignature)
{
  const auto defs = extract("(= (double $x) (* $x 2))");
  ASSERT_EQ(defs.functions.size(), 1U);
  EXPECT_EQ(defs.functions[0].name, "double");
  ASSERT_EQ(defs.functions[0].parameters.size(), 1U);
  EXPECT_EQ(defs.functions[0].parameters[0], "$x");
  EXPECT_EQ(defs.functions[0].start_line, 1U);
  EXPECT_EQ(defs.functions[0].end_line, 1U);

  // The body is an ordinary expression; the signature is not.
  ASSERT_EQ(defs.expressions.size(), 1U);
  EXPECT_EQ(defs.expressions[0].signature, "*(2 args)");
  EXPECT_EQ(defs.variables.count("$x"), 1U);
}

TEST(DslExtractor, MultiLineFunctionSpansItsForm)
{
  const auto defs = extract(
    "(= (add $a $b)\n"
    "   (+ $a\n"
    "      $b))\n");
  ASSERT_EQ(defs.functions.size(), 1U);
  EXPECT_EQ(defs.functions[0].start_line, 1U);
  EXPECT_EQ(defs.functions[0].end_line, 3U);
  EXPECT_EQ(defs.functions[0].parameters, (std::vector<std::string>{"$a", "$b"}));
}

TEST(DslExtractor, SignatureParametersOnlyCountVariables)
{
  const auto defs = extract("(= (f $a 1 b $c) $a)");
  ASSERT_EQ(defs.functions.size(), 1U);
  EXPECT_EQ(defs.functions[0].parameters, (std::vector<std::string>{"$a", "$c"}));
}

TEST(DslExtractor, DefinitionWithoutSignatureIsDropped)
{
  const auto defs = extract("(= () body)");
  EXPECT_TRUE(defs.functions.empty());
}

TEST(DslExtractor, VariablesAndAtomspacesAreSortedSets)
{
  const auto defs = extract(
    "!(match &self (parent $p Alex) $p)\n"
    "(add-atom &kb ($z $a))\n");

  EXPECT_EQ(defs.atomspaces, (std::set<std::string>{"&kb", "&self"}));
  EXPECT_EQ(defs.variables, (std::set<std::string>{"$a", "$p", "$z"}));
  EXPECT_EQ(*defs.variables.begin(), "$a");

  ASSERT_EQ(defs.executions.size(), 1U);
  EXPECT_EQ(defs.executions[0].expression, "match(3 args)");

  // (parent $p Alex) is a three-element form headed by an atom.
  ASSERT_EQ(defs.facts.size(), 1U);
  EXPECT_EQ(defs.facts[0].subject, "parent");
}

TEST(DslExtractor, SummaryMatchesCollections)
{
  const auto defs = extract(
    "(Socrates is man)\n"
    "(= (mortal $x) (is $x man))\n"
    "!(mortal Socrates)\n"
    "!(match &self ($x is man) $x)\n");

  const DslSummary s = defs.summary();
  EXPECT_EQ(s.function_count, defs.functions.size());
  EXPECT_EQ(s.expression_count, defs.expressions.size());
  EXPECT_EQ(s.execution_count, defs.executions.size());
  EXPECT_EQ(s.fact_count, defs.facts.size());
  EXPECT_EQ(s.variable_count, defs.variables.size());
  EXPECT_EQ(s.atomspace_count, defs.atomspaces.size());
  EXPECT_EQ(s.function_count, 1U);
  EXPECT_EQ(s.execution_count, 2U);
}

TEST(DslExtractor, ExtractionIsIdempotent)
{
  const std::string_view src =
    "; facts\n"
    "(parent Tom Bob)\n"
    "(= (grandparent $x $z) (match &self (parent $x $y) (parent $y $z)))\n"
    "!(grandparent Tom $who)\n";

  const auto first = extract(src);
  const auto second = extract(src);
  EXPECT_EQ(first, second);
}

}  // namespace galaxy_ast
