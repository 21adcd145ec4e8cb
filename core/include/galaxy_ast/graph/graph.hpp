// galaxy_ast/graph/graph.hpp - Directed attributed graph derived from the source tree
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace galaxy_ast
{

enum class Relation : uint8_t {
  Contains,   // folder -> child
  Defines,    // file -> class / top-level function
  HasMethod,  // class -> function
  Uses,       // function -> variable
};

[[nodiscard]] std::string_view to_string(Relation r) noexcept;
[[nodiscard]] std::optional<Relation> relation_from_string(std::string_view s) noexcept;

struct GraphNodeAttrs
{
  std::string type;  // folder, file, class, function, variable
  std::string name;
  std::optional<std::string> language;

  bool operator==(const GraphNodeAttrs & other) const
  {
    return type == other.type && name == other.name && language == other.language;
  }
};

struct GraphNode
{
  std::string id;
  GraphNodeAttrs attrs;
};

struct GraphEdge
{
  std::string from;
  std::string to;
  Relation relation = Relation::Contains;

  bool operator==(const GraphEdge & other) const
  {
    return from == other.from && to == other.to && relation == other.relation;
  }
};

/**
 * Nodes keep insertion order and are keyed by id; re-adding an id overwrites
 * its attributes. At most one edge exists per ordered (from, to) pair;
 * re-adding it updates the relation.
 */
class Graph
{
public:
  void add_node(std::string id, GraphNodeAttrs attrs);

  /// @throws std::logic_error if either endpoint is not a node
  void add_edge(const std::string & from, const std::string & to, Relation relation);

  [[nodiscard]] bool has_node(const std::string & id) const;
  [[nodiscard]] const GraphNodeAttrs * find_node(const std::string & id) const;
  [[nodiscard]] const GraphEdge * find_edge(const std::string & from, const std::string & to) const;

  [[nodiscard]] const std::vector<GraphNode> & nodes() const noexcept { return nodes_; }
  [[nodiscard]] const std::vector<GraphEdge> & edges() const noexcept { return edges_; }
  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

private:
  std::vector<GraphNode> nodes_;
  std::unordered_map<std::string, size_t> node_index_;
  std::vector<GraphEdge> edges_;
  std::map<std::pair<std::string, std::string>, size_t> edge_index_;
};

}  // namespace galaxy_ast
