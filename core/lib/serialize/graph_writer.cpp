// galaxy_ast/serialize/graph_writer.cpp - Graph exchange formats and artifact output
#include "galaxy_ast/serialize/graph_writer.hpp"

#include <fstream>
#include <system_error>

#include "galaxy_ast/basic/error.hpp"
#include "tinyxml2.h"

namespace galaxy_ast
{

namespace
{

constexpr const char * k_key_type = "d0";
constexpr const char * k_key_name = "d1";
constexpr const char * k_key_language = "d2";
constexpr const char * k_key_relation = "d3";

void add_key(
  tinyxml2::XMLDocument & doc, tinyxml2::XMLElement * root, const char * id, const char * domain,
  const char * attr_name)
{
  auto * key = doc.NewElement("key");
  key->SetAttribute("id", id);
  key->SetAttribute("for", domain);
  key->SetAttribute("attr.name", attr_name);
  key->SetAttribute("attr.type", "string");
  root->InsertEndChild(key);
}

void add_data(
  tinyxml2::XMLDocument & doc, tinyxml2::XMLElement * parent, const char * key,
  const std::string & value)
{
  auto * data = doc.NewElement("data");
  data->SetAttribute("key", key);
  data->SetText(value.c_str());
  parent->InsertEndChild(data);
}

}  // namespace

nlohmann::json graph_to_json(const Graph & graph)
{
  nlohmann::json nodes = nlohmann::json::array();
  for (const auto & n : graph.nodes()) {
    nlohmann::json jn{{"id", n.id}, {"type", n.attrs.type}, {"name", n.attrs.name}};
    if (n.attrs.language) {
      jn["language"] = *n.attrs.language;
    }
    nodes.push_back(std::move(jn));
  }

  nlohmann::json edges = nlohmann::json::array();
  for (const auto & e : graph.edges()) {
    edges.push_back(nlohmann::json{
      {"from", e.from}, {"to", e.to}, {"relation", std::string(to_string(e.relation))}});
  }

  return nlohmann::json{{"nodes", nodes}, {"edges", edges}};
}

std::string graph_to_graphml(const Graph & graph)
{
  tinyxml2::XMLDocument doc;
  doc.InsertFirstChild(doc.NewDeclaration());

  auto * root = doc.NewElement("graphml");
  root->SetAttribute("xmlns", "http://graphml.graphdrawing.org/xmlns");
  root->SetAttribute("xmlns:xsi", "http://www.w3.org/2001/XMLSchema-instance");
  root->SetAttribute(
    "xsi:schemaLocation",
    "http://graphml.graphdrawing.org/xmlns http://graphml.graphdrawing.org/xmlns/1.0/graphml.xsd");
  doc.InsertEndChild(root);

  add_key(doc, root, k_key_type, "node", "type");
  add_key(doc, root, k_key_name, "node", "name");
  add_key(doc, root, k_key_language, "node", "language");
  add_key(doc, root, k_key_relation, "edge", "relation");

  auto * g = doc.NewElement("graph");
  g->SetAttribute("edgedefault", "directed");
  root->InsertEndChild(g);

  for (const auto & n : graph.nodes()) {
    auto * node = doc.NewElement("node");
    node->SetAttribute("id", n.id.c_str());
    add_data(doc, node, k_key_type, n.attrs.type);
    add_data(doc, node, k_key_name, n.attrs.name);
    if (n.attrs.language) {
      add_data(doc, node, k_key_language, *n.attrs.language);
    }
    g->InsertEndChild(node);
  }

  for (const auto & e : graph.edges()) {
    auto * edge = doc.NewElement("edge");
    edge->SetAttribute("source", e.from.c_str());
    edge->SetAttribute("target", e.to.c_str());
    add_data(doc, edge, k_key_relation, std::string(to_string(e.relation)));
    g->InsertEndChild(edge);
  }

  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  return {printer.CStr()};
}

void write_text_file(const std::filesystem::path & path, std::string_view text)
{
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw IoError(
        "cannot create directory '" + path.parent_path().string() + "': " + ec.message());
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw IoError("cannot open '" + path.string() + "' for writing");
  }
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!out) {
    throw IoError("failed to write '" + path.string() + "'");
  }
}

}  // namespace galaxy_ast
