// galaxy_ast/graph/graph.cpp - Graph store
#include "galaxy_ast/graph/graph.hpp"

#include <stdexcept>

namespace galaxy_ast
{

std::string_view to_string(Relation r) noexcept
{
  switch (r) {
    case Relation::Contains:
      return "contains";
    case Relation::Defines:
      return "defines";
    case Relation::HasMethod:
      return "hasMethod";
    case Relation::Uses:
      return "uses";
  }
  return "contains";
}

std::optional<Relation> relation_from_string(std::string_view s) noexcept
{
  if (s == "contains") return Relation::Contains;
  if (s == "defines") return Relation::Defines;
  if (s == "hasMethod") return Relation::HasMethod;
  if (s == "uses") return Relation::Uses;
  return std::nullopt;
}

void Graph::add_node(std::string id, GraphNodeAttrs attrs)
{
  auto it = node_index_.find(id);
  if (it != node_index_.end()) {
    nodes_[it->second].attrs = std::move(attrs);
    return;
  }
  node_index_.emplace(id, nodes_.size());
  nodes_.push_back(GraphNode{std::move(id), std::move(attrs)});
}

void Graph::add_edge(const std::string & from, const std::string & to, Relation relation)
{
  if (!has_node(from) || !has_node(to)) {
    throw std::logic_error("edge '" + from + "' -> '" + to + "' references an unknown node");
  }

  auto key = std::make_pair(from, to);
  auto it = edge_index_.find(key);
  if (it != edge_index_.end()) {
    edges_[it->second].relation = relation;
    return;
  }
  edge_index_.emplace(std::move(key), edges_.size());
  edges_.push_back(GraphEdge{from, to, relation});
}

bool Graph::has_node(const std::string & id) const { return node_index_.count(id) != 0; }

const GraphNodeAttrs * Graph::find_node(const std::string & id) const
{
  auto it = node_index_.find(id);
  return it == node_index_.end() ? nullptr : &nodes_[it->second].attrs;
}

const GraphEdge * Graph::find_edge(const std::string & from, const std::string & to) const
{
  auto it = edge_index_.find(std::make_pair(from, to));
  return it == edge_index_.end() ? nullptr : &edges_[it->second];
}

}  // namespace galaxy_ast
