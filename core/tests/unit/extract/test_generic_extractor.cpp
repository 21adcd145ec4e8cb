// test_generic_extractor.cpp - Unit tests for conventional-language extraction
//
// The extractor is exercised through an in-memory syntax tree that offers the
// same capability surface as ts_ll::Node, so no grammar library is needed.
//
#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "galaxy_ast/basic/error.hpp"
#include "galaxy_ast/extract/generic_extractor.hpp"
#include "galaxy_ast/extract/syntax_table.hpp"

namespace galaxy_ast
{

namespace
{

class FakeTree;

class FakeNode
{
public:
  FakeNode() = default;
  FakeNode(const FakeTree * tree, size_t index) : tree_(tree), index_(index) {}

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }
  [[nodiscard]] std::string_view kind() const;
  [[nodiscard]] uint32_t start_row() const;
  [[nodiscard]] uint32_t end_row() const;
  [[nodiscard]] uint32_t child_count() const;
  [[nodiscard]] FakeNode child(uint32_t i) const;
  [[nodiscard]] FakeNode child_by_field(std::string_view field) const;
  [[nodiscard]] std::string_view text(std::string_view source) const;

private:
  const FakeTree * tree_ = nullptr;
  size_t index_ = 0;
};

/// Nodes are appended parent-first; leaf text is located by search in the source.
class FakeTree
{
public:
  struct Data
  {
    std::string kind;
    uint32_t start_row = 0;
    uint32_t end_row = 0;
    uint32_t start_byte = 0;
    uint32_t end_byte = 0;
    std::vector<size_t> children;
    std::map<std::string, size_t, std::less<>> fields;
  };

  explicit FakeTree(std::string source, uint32_t last_row) : source_(std::move(source))
  {
    nodes_.push_back(Data{"module", 0, last_row, 0, 0, {}, {}});
  }

  size_t node(size_t parent, std::string kind, uint32_t start_row, uint32_t end_row)
  {
    return append(parent, Data{std::move(kind), start_row, end_row, 0, 0, {}, {}}, nullptr);
  }

  size_t leaf(
    size_t parent, std::string kind, std::string_view text, uint32_t row,
    const char * field = nullptr)
  {
    const size_t at = source_.find(text);
    EXPECT_NE(at, std::string::npos) << "leaf text not in source: " << text;
    Data d{std::move(kind), row, row, static_cast<uint32_t>(at),
           static_cast<uint32_t>(at + text.size()), {}, {}};
    return append(parent, std::move(d), field);
  }

  [[nodiscard]] FakeNode root() const { return FakeNode(this, 0); }
  [[nodiscard]] std::string_view source() const { return source_; }
  [[nodiscard]] const Data & at(size_t i) const { return nodes_[i]; }

private:
  size_t append(size_t parent, Data d, const char * field)
  {
    const size_t index = nodes_.size();
    nodes_.push_back(std::move(d));
    nodes_[parent].children.push_back(index);
    if (field) {
      nodes_[parent].fields[field] = index;
    }
    return index;
  }

  std::string source_;
  std::vector<Data> nodes_;
};

std::string_view FakeNode::kind() const { return tree_->at(index_).kind; }
uint32_t FakeNode::start_row() const { return tree_->at(index_).start_row; }
uint32_t FakeNode::end_row() const { return tree_->at(index_).end_row; }
uint32_t FakeNode::child_count() const
{
  return static_cast<uint32_t>(tree_->at(index_).children.size());
}
FakeNode FakeNode::child(uint32_t i) const
{
  return FakeNode(tree_, tree_->at(index_).children.at(i));
}
FakeNode FakeNode::child_by_field(std::string_view field) const
{
  const auto & fields = tree_->at(index_).fields;
  auto it = fields.find(field);
  return it == fields.end() ? FakeNode() : FakeNode(tree_, it->second);
}
std::string_view FakeNode::text(std::string_view source) const
{
  const auto & d = tree_->at(index_);
  return source.substr(d.start_byte, d.end_byte - d.start_byte);
}

ConventionalDefinitions run(const FakeTree & tree, Language lang)
{
  GenericExtractor<FakeNode> extractor(syntax_table(lang), tree.source());
  return extractor.extract(tree.root());
}

}  // namespace

TEST(GenericExtractor, PythonClassesFunctionsAndAssignments)
{
  FakeTree t(
    "class Greeter:\n"
    "    def greet(self):\n"
    "        msg = \"hi\"\n"
    "        return msg\n"
    "def main():\n"
    "    g = Greeter()\n",
    5);

  const size_t cls = t.node(0, "class_definition", 0, 3);
  t.leaf(cls, "identifier", "Greeter", 0, "name");
  const size_t body = t.node(cls, "block", 1, 3);
  const size_t greet = t.node(body, "function_definition", 1, 3);
  t.leaf(greet, "identifier", "greet", 1, "name");
  const size_t gblock = t.node(greet, "block", 2, 3);
  const size_t stmt = t.node(gblock, "expression_statement", 2, 2);
  const size_t assign = t.node(stmt, "assignment", 2, 2);
  t.leaf(assign, "identifier", "msg", 2);
  t.leaf(assign, "string", "\"hi\"", 2);

  const size_t main_fn = t.node(0, "function_definition", 4, 5);
  t.leaf(main_fn, "identifier", "main", 4, "name");
  const size_t assign2 = t.node(main_fn, "assignment", 5, 5);
  t.leaf(assign2, "identifier", "g", 5);

  const auto defs = run(t, Language::Python);

  ASSERT_EQ(defs.classes.size(), 1U);
  EXPECT_EQ(defs.classes[0].name, "Greeter");
  EXPECT_EQ(defs.classes[0].line, 1U);
  ASSERT_EQ(defs.classes[0].functions.size(), 1U);
  const FunctionDef & greet_def = defs.classes[0].functions[0];
  EXPECT_EQ(greet_def.name, "greet");
  EXPECT_EQ(greet_def.line, 2U);
  EXPECT_EQ(greet_def.line_count, 3U);
  EXPECT_EQ(greet_def.variables, (std::vector<std::string>{"msg"}));

  ASSERT_EQ(defs.functions.size(), 1U);
  EXPECT_EQ(defs.functions[0].name, "main");
  EXPECT_EQ(defs.functions[0].line, 5U);
  EXPECT_EQ(defs.functions[0].line_count, 2U);
  EXPECT_EQ(defs.functions[0].variables, (std::vector<std::string>{"g"}));
}

TEST(GenericExtractor, NestedClassScopesOnlyItsOwnSubtree)
{
  FakeTree t(
    "class Outer:\n"
    "    class Inner:\n"
    "        def a(self): pass\n"
    "    def b(self): pass\n",
    3);

  const size_t outer = t.node(0, "class_definition", 0, 3);
  t.leaf(outer, "identifier", "Outer", 0, "name");
  const size_t inner = t.node(outer, "class_definition", 1, 2);
  t.leaf(inner, "identifier", "Inner", 1, "name");
  const size_t a = t.node(inner, "function_definition", 2, 2);
  t.leaf(a, "identifier", "a", 2, "name");
  const size_t b = t.node(outer, "function_definition", 3, 3);
  t.leaf(b, "identifier", "b", 3, "name");

  const auto defs = run(t, Language::Python);

  ASSERT_EQ(defs.classes.size(), 2U);
  EXPECT_EQ(defs.classes[0].name, "Outer");
  ASSERT_EQ(defs.classes[0].functions.size(), 1U);
  EXPECT_EQ(defs.classes[0].functions[0].name, "b");
  EXPECT_EQ(defs.classes[1].name, "Inner");
  ASSERT_EQ(defs.classes[1].functions.size(), 1U);
  EXPECT_EQ(defs.classes[1].functions[0].name, "a");
  EXPECT_TRUE(defs.functions.empty());
}

TEST(GenericExtractor, NamelessDefinitionsAreSkippedButWalked)
{
  FakeTree t("lambda: None\ndef inner(): pass\n", 1);

  const size_t anon = t.node(0, "function_definition", 0, 1);
  const size_t named = t.node(anon, "function_definition", 1, 1);
  t.leaf(named, "identifier", "inner", 1, "name");
  t.node(0, "class_definition", 1, 1);

  const auto defs = run(t, Language::Python);
  EXPECT_TRUE(defs.classes.empty());
  ASSERT_EQ(defs.functions.size(), 1U);
  EXPECT_EQ(defs.functions[0].name, "inner");
}

TEST(GenericExtractor, JavaScriptMethodsAndDeclarators)
{
  FakeTree t(
    "class Cart {\n"
    "  total() { const sum = 0; let tax = 1; }\n"
    "}\n"
    "function helper() { var idx = 2; }\n",
    3);

  const size_t cls = t.node(0, "class_declaration", 0, 2);
  t.leaf(cls, "identifier", "Cart", 0, "name");
  const size_t method = t.node(cls, "method_definition", 1, 1);
  t.leaf(method, "property_identifier", "total", 1, "name");
  const size_t d1 = t.node(method, "variable_declarator", 1, 1);
  t.leaf(d1, "identifier", "sum", 1, "name");
  const size_t d2 = t.node(method, "variable_declarator", 1, 1);
  t.leaf(d2, "identifier", "tax", 1, "name");

  const size_t fn = t.node(0, "function_declaration", 3, 3);
  t.leaf(fn, "identifier", "helper", 3, "name");
  const size_t d3 = t.node(fn, "variable_declarator", 3, 3);
  t.leaf(d3, "identifier", "idx", 3, "name");

  for (const Language lang : {Language::JavaScript, Language::TypeScript}) {
    const auto defs = run(t, lang);
    ASSERT_EQ(defs.classes.size(), 1U);
    ASSERT_EQ(defs.classes[0].functions.size(), 1U);
    EXPECT_EQ(defs.classes[0].functions[0].name, "total");
    EXPECT_EQ(
      defs.classes[0].functions[0].variables, (std::vector<std::string>{"sum", "tax"}));
    ASSERT_EQ(defs.functions.size(), 1U);
    EXPECT_EQ(defs.functions[0].variables, (std::vector<std::string>{"idx"}));
  }
}

TEST(GenericExtractor, JavaConstructorsAreFunctions)
{
  FakeTree t(
    "class Point {\n"
    "  Point() { int xCoord = 0; }\n"
    "  int norm() { return 0; }\n"
    "}\n",
    3);

  const size_t cls = t.node(0, "class_declaration", 0, 3);
  t.leaf(cls, "identifier", "Point", 0, "name");
  const size_t body = t.node(cls, "class_body", 0, 3);
  const size_t ctor = t.node(body, "constructor_declaration", 1, 1);
  t.leaf(ctor, "identifier", "Point", 1, "name");
  const size_t decl = t.node(ctor, "variable_declarator", 1, 1);
  t.leaf(decl, "identifier", "xCoord", 1, "name");
  const size_t method = t.node(body, "method_declaration", 2, 2);
  t.leaf(method, "identifier", "norm", 2, "name");

  const auto defs = run(t, Language::Java);
  ASSERT_EQ(defs.classes.size(), 1U);
  ASSERT_EQ(defs.classes[0].functions.size(), 2U);
  EXPECT_EQ(defs.classes[0].functions[0].name, "Point");
  EXPECT_EQ(defs.classes[0].functions[0].variables, (std::vector<std::string>{"xCoord"}));
  EXPECT_EQ(defs.classes[0].functions[1].name, "norm");
  EXPECT_EQ(defs.classes[0].functions[1].line, 3U);
  EXPECT_EQ(defs.classes[0].functions[1].line_count, 1U);
}

TEST(GenericExtractor, PythonNodeKindsMeanNothingToJava)
{
  FakeTree t("def f(): pass\n", 0);
  const size_t fn = t.node(0, "function_definition", 0, 0);
  t.leaf(fn, "identifier", "f", 0, "name");

  EXPECT_TRUE(run(t, Language::Java).functions.empty());
  EXPECT_EQ(run(t, Language::Python).functions.size(), 1U);
}

TEST(GenericExtractor, DslHasNoSyntaxTable)
{
  EXPECT_THROW((void)syntax_table(Language::Metta), ExtractionError);
}

TEST(SyntaxTable, RolesPerLanguage)
{
  EXPECT_EQ(syntax_table(Language::Python).role_of("assignment"), NodeRole::VariableLike);
  EXPECT_EQ(syntax_table(Language::Python).variable_name, VariableNameSource::FirstChild);
  EXPECT_EQ(syntax_table(Language::TypeScript).role_of("class_definition"), NodeRole::ClassLike);
  EXPECT_EQ(syntax_table(Language::Java).role_of("constructor_declaration"), NodeRole::FunctionLike);
  EXPECT_EQ(syntax_table(Language::Java).role_of("block"), NodeRole::Other);
}

}  // namespace galaxy_ast
