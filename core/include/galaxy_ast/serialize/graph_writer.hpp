// galaxy_ast/serialize/graph_writer.hpp - Graph exchange formats and artifact output
#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>

#include "galaxy_ast/graph/graph.hpp"

namespace galaxy_ast
{

/// {nodes: [{id, type, name, language?}], edges: [{from, to, relation}]}
[[nodiscard]] nlohmann::json graph_to_json(const Graph & graph);

/**
 * GraphML document (directed). Node keys: type, name, language;
 * edge key: relation.
 */
[[nodiscard]] std::string graph_to_graphml(const Graph & graph);

/**
 * Write `text` to `path`, creating parent directories.
 *
 * @throws IoError on failure
 */
void write_text_file(const std::filesystem::path & path, std::string_view text);

}  // namespace galaxy_ast
