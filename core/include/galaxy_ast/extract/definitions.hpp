// galaxy_ast/extract/definitions.hpp - Normalized per-file definitions records
#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace galaxy_ast
{

// ============================================================================
// Conventional languages
// ============================================================================

struct FunctionDef
{
  std::string name;
  uint32_t line = 0;  // 1-based
  std::vector<std::string> variables;
  uint32_t line_count = 0;  // inclusive

  bool operator==(const FunctionDef & other) const
  {
    return name == other.name && line == other.line && variables == other.variables &&
           line_count == other.line_count;
  }
};

struct ClassDef
{
  std::string name;
  uint32_t line = 0;
  std::vector<FunctionDef> functions;

  bool operator==(const ClassDef & other) const
  {
    return name == other.name && line == other.line && functions == other.functions;
  }
};

struct ConventionalDefinitions
{
  std::vector<ClassDef> classes;
  std::vector<FunctionDef> functions;  // outside any class

  bool operator==(const ConventionalDefinitions & other) const
  {
    return classes == other.classes && functions == other.functions;
  }
};

// ============================================================================
// DSL
// ============================================================================

struct DslFunctionDef
{
  std::string name;
  uint32_t start_line = 0;
  uint32_t end_line = 0;
  std::vector<std::string> parameters;

  bool operator==(const DslFunctionDef & other) const
  {
    return name == other.name && start_line == other.start_line && end_line == other.end_line &&
           parameters == other.parameters;
  }
};

struct ExecutionRecord
{
  uint32_t line = 0;
  std::string expression;  // signature of the executed form

  bool operator==(const ExecutionRecord & other) const
  {
    return line == other.line && expression == other.expression;
  }
};

struct FactRecord
{
  uint32_t line = 0;
  std::string pattern;
  std::string subject;

  bool operator==(const FactRecord & other) const
  {
    return line == other.line && pattern == other.pattern && subject == other.subject;
  }
};

struct ExpressionRecord
{
  uint32_t line = 0;
  std::string signature;

  bool operator==(const ExpressionRecord & other) const
  {
    return line == other.line && signature == other.signature;
  }
};

struct DslSummary
{
  size_t function_count = 0;
  size_t expression_count = 0;
  size_t execution_count = 0;
  size_t fact_count = 0;
  size_t variable_count = 0;
  size_t atomspace_count = 0;
};

struct DslDefinitions
{
  std::vector<DslFunctionDef> functions;
  std::vector<ExecutionRecord> executions;
  std::vector<FactRecord> facts;
  std::vector<ExpressionRecord> expressions;
  std::set<std::string> variables;   // iterates sorted
  std::set<std::string> atomspaces;

  /// Counts are derived from the collections, never stored.
  [[nodiscard]] DslSummary summary() const noexcept
  {
    return DslSummary{
      functions.size(), expressions.size(), executions.size(),
      facts.size(),     variables.size(),   atomspaces.size(),
    };
  }

  bool operator==(const DslDefinitions & other) const
  {
    return functions == other.functions && executions == other.executions &&
           facts == other.facts && expressions == other.expressions &&
           variables == other.variables && atomspaces == other.atomspaces;
  }
};

using Definitions = std::variant<ConventionalDefinitions, DslDefinitions>;

}  // namespace galaxy_ast
