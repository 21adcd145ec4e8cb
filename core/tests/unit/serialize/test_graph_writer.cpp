// test_graph_writer.cpp - Unit tests for graph JSON / GraphML output
//
#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

#include "galaxy_ast/basic/error.hpp"
#include "galaxy_ast/serialize/graph_writer.hpp"
#include "galaxy_ast/test_support/temp_dir.hpp"
#include "tinyxml2.h"

namespace galaxy_ast
{

namespace
{

Graph small_graph()
{
  Graph g;
  g.add_node("/p", {"folder", "p", std::nullopt});
  g.add_node("/p/a.py", {"file", "a.py", std::string("python")});
  g.add_node("/p/a.py:f", {"function", "f", std::nullopt});
  g.add_edge("/p", "/p/a.py", Relation::Contains);
  g.add_edge("/p/a.py", "/p/a.py:f", Relation::Defines);
  return g;
}

std::string read_file(const std::filesystem::path & path)
{
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

TEST(GraphWriterTest, JsonListsNodesAndEdges)
{
  const nlohmann::json j = graph_to_json(small_graph());
  ASSERT_EQ(j["nodes"].size(), 3U);
  ASSERT_EQ(j["edges"].size(), 2U);

  EXPECT_EQ(j["nodes"][0]["id"], "/p");
  EXPECT_EQ(j["nodes"][0]["type"], "folder");
  EXPECT_FALSE(j["nodes"][0].contains("language"));
  EXPECT_EQ(j["nodes"][1]["language"], "python");

  EXPECT_EQ(j["edges"][1]["from"], "/p/a.py");
  EXPECT_EQ(j["edges"][1]["to"], "/p/a.py:f");
  EXPECT_EQ(j["edges"][1]["relation"], "defines");
}

TEST(GraphWriterTest, GraphMLParsesBack)
{
  const std::string xml = graph_to_graphml(small_graph());

  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse(xml.c_str()), tinyxml2::XML_SUCCESS);

  const auto * root = doc.FirstChildElement("graphml");
  ASSERT_NE(root, nullptr);

  int keys = 0;
  for (const auto * key = root->FirstChildElement("key"); key; key = key->NextSiblingElement("key")) {
    ++keys;
  }
  EXPECT_EQ(keys, 4);

  const auto * graph = root->FirstChildElement("graph");
  ASSERT_NE(graph, nullptr);
  EXPECT_STREQ(graph->Attribute("edgedefault"), "directed");

  int nodes = 0;
  for (const auto * n = graph->FirstChildElement("node"); n; n = n->NextSiblingElement("node")) {
    ++nodes;
  }
  EXPECT_EQ(nodes, 3);

  const auto * edge = graph->FirstChildElement("edge");
  ASSERT_NE(edge, nullptr);
  EXPECT_STREQ(edge->Attribute("source"), "/p");
  EXPECT_STREQ(edge->Attribute("target"), "/p/a.py");
  const auto * data = edge->FirstChildElement("data");
  ASSERT_NE(data, nullptr);
  EXPECT_STREQ(data->GetText(), "contains");
}

TEST(GraphWriterTest, GraphMLEscapesIds)
{
  Graph g;
  g.add_node("/p/a&b.py", {"file", "a&b.py", std::nullopt});
  const std::string xml = graph_to_graphml(g);

  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse(xml.c_str()), tinyxml2::XML_SUCCESS);
  const auto * node = doc.FirstChildElement("graphml")->FirstChildElement("graph")->FirstChildElement("node");
  ASSERT_NE(node, nullptr);
  EXPECT_STREQ(node->Attribute("id"), "/p/a&b.py");
}

TEST(GraphWriterTest, WriteCreatesParentDirectories)
{
  const test_support::TempDir dir("writer");
  const auto target = dir.path() / "docs" / "nested" / "out.json";
  write_text_file(target, "{}\n");
  EXPECT_EQ(read_file(target), "{}\n");

  write_text_file(target, "[]\n");
  EXPECT_EQ(read_file(target), "[]\n");
}

TEST(GraphWriterTest, WriteIntoAFileFails)
{
  const test_support::TempDir dir("writer_fail");
  dir.write("blocker", "x");
  EXPECT_THROW(write_text_file(dir.path() / "blocker" / "out.json", "{}"), IoError);
}

}  // namespace galaxy_ast
