// galaxy_ast/ast/json_visitor.cpp - JSON serialization implementation
#include "galaxy_ast/ast/json_visitor.hpp"

#include <string>

namespace galaxy_ast
{

nlohmann::json to_json(const DslNode & node)
{
  nlohmann::json j{
    {"type", std::string(to_string(node.kind()))},
    {"start_line", node.start_line()},
    {"end_line", node.end_line()}};

  if (!node.value().empty()) {
    j["value"] = node.value();
  }

  if (node.child_count() > 0) {
    nlohmann::json children = nlohmann::json::array();
    for (const auto & child : node.children()) {
      children.push_back(to_json(*child));
    }
    j["children"] = std::move(children);
  }
  return j;
}

}  // namespace galaxy_ast
