// test_scanner.cpp - Unit tests for the scan pipeline
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "galaxy_ast/basic/error.hpp"
#include "galaxy_ast/driver/scanner.hpp"
#include "galaxy_ast/test_support/temp_dir.hpp"

namespace galaxy_ast
{

namespace fs = std::filesystem;

namespace
{

class ScannerTest : public ::testing::Test
{
protected:
  ScannerTest() : dir_("scanner")
  {
    dir_.write("project/kb/facts.metta", "(parent Tom Bob)\n(parent Bob Ann)\n");
    dir_.write("project/kb/rules.metta", "(= (grandparent $x $z) (match &self (parent $x $y) $y))\n");
    dir_.write("project/tools/run.py", "def main():\n    x = 1\n");
    dir_.write("project/README.md", "# readme\n");

    options_.root = dir_.path() / "project";
    options_.grammars.use_system_loader = false;
    options_.tree_output = dir_.path() / "out" / "tree.json";
    options_.graph_output = dir_.path() / "out" / "graph.graphml";
  }

  static std::string read_file(const fs::path & path)
  {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  test_support::TempDir dir_;
  ScanOptions options_;
};

}  // namespace

TEST_F(ScannerTest, ProducesTreeGraphAndArtifacts)
{
  const ScanResult result = Scanner::scan(options_);

  ASSERT_NE(result.tree, nullptr);
  EXPECT_EQ(result.tree->name, "project");
  EXPECT_EQ(result.stats.total_files, 4U);
  EXPECT_EQ(result.stats.dsl_files, 2U);
  EXPECT_EQ(result.stats.other_files, 2U);
  EXPECT_EQ(result.stats.errors, 1U);  // run.py: no python grammar

  EXPECT_TRUE(result.diagnostics.has_code(diag_codes::k_grammar_unavailable));
  EXPECT_TRUE(result.diagnostics.has_code(diag_codes::k_file_failed));

  const std::string root_id = result.tree->path;
  EXPECT_TRUE(result.graph.has_node(root_id));
  EXPECT_TRUE(result.graph.has_node(root_id + "/kb/rules.metta:grandparent"));

  ASSERT_EQ(result.generated_files.size(), 2U);
  ASSERT_TRUE(fs::exists(options_.tree_output));
  ASSERT_TRUE(fs::exists(options_.graph_output));
  EXPECT_FALSE(fs::exists(dir_.path() / "out" / "graph.json"));

  const auto doc = nlohmann::json::parse(read_file(options_.tree_output));
  EXPECT_EQ(doc["type"], "folder");
  EXPECT_EQ(doc["children"].size(), 3U);
  EXPECT_NE(read_file(options_.graph_output).find("<graphml"), std::string::npos);
}

TEST_F(ScannerTest, OptionalGraphJson)
{
  options_.graph_json_output = dir_.path() / "out" / "graph.json";
  options_.include_variables = true;
  const ScanResult result = Scanner::scan(options_);

  EXPECT_EQ(result.generated_files.size(), 3U);
  const auto graph = nlohmann::json::parse(read_file(options_.graph_json_output));
  EXPECT_EQ(graph["nodes"].size(), result.graph.node_count());
  EXPECT_EQ(graph["edges"].size(), result.graph.edge_count());
  EXPECT_TRUE(result.graph.has_node(result.tree->path + "/kb/rules.metta:grandparent::var::$x"));
}

TEST_F(ScannerTest, DslOnlyKeepsDslFiles)
{
  options_.dsl_only = true;
  const ScanResult result = Scanner::scan(options_);

  EXPECT_EQ(result.stats.total_files, 2U);
  EXPECT_EQ(result.stats.dsl_files, 2U);
  EXPECT_EQ(result.stats.errors, 0U);
  const auto * root = cast<FolderNode>(result.tree.get());
  ASSERT_EQ(root->children.size(), 1U);
  EXPECT_EQ(root->children[0]->name, "kb");
}

TEST_F(ScannerTest, DslOnlyWithNothingLeftGivesEmptyRoot)
{
  options_.root = dir_.path() / "project" / "tools";
  options_.dsl_only = true;
  const ScanResult result = Scanner::scan(options_);

  const auto * root = dyn_cast<FolderNode>(result.tree.get());
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->name, "tools");
  EXPECT_TRUE(root->children.empty());
  EXPECT_EQ(result.stats.total_files, 0U);
  EXPECT_EQ(result.graph.node_count(), 1U);
}

TEST_F(ScannerTest, EmptyOutputPathsSkipArtifacts)
{
  options_.tree_output.clear();
  options_.graph_output.clear();
  const ScanResult result = Scanner::scan(options_);
  EXPECT_TRUE(result.generated_files.empty());
  EXPECT_FALSE(fs::exists(dir_.path() / "out"));
}

TEST_F(ScannerTest, MissingRootThrows)
{
  options_.root = dir_.path() / "absent";
  EXPECT_THROW((void)Scanner::scan(options_), IoError);
}

TEST_F(ScannerTest, OptionsFromConfig)
{
  ProjectConfig config;
  config.scan.root = "/src";
  config.scan.dsl_only = true;
  config.parsers.grammar_dirs = {"/g"};
  config.parsers.system_loader = false;
  config.output.graph_json = "/o/g.json";
  config.output.include_variables = true;

  const ScanOptions options = scan_options_from_config(config);
  EXPECT_EQ(options.root, fs::path("/src"));
  EXPECT_TRUE(options.dsl_only);
  ASSERT_EQ(options.grammars.search_dirs.size(), 1U);
  EXPECT_FALSE(options.grammars.use_system_loader);
  EXPECT_EQ(options.tree_output, config.output.tree);
  EXPECT_EQ(options.graph_json_output, fs::path("/o/g.json"));
  EXPECT_TRUE(options.include_variables);
}

}  // namespace galaxy_ast
