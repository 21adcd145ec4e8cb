// galaxy_ast/syntax/frontend.hpp - DSL parse pipeline entry point
#pragma once

#include <memory>
#include <string_view>

#include "galaxy_ast/ast/ast.hpp"

namespace galaxy_ast
{

/// Version reported for the hand-written DSL front-end.
inline constexpr const char * k_dsl_frontend_version = "custom-1.0";

// Parse pipeline:
// bytes -> lossy UTF-8 decode -> lexer (token stream) -> recursive-descent parser (AST)
//
// Never throws on malformed input; the returned root always has kind Program.
[[nodiscard]] std::unique_ptr<DslNode> parse_dsl(std::string_view bytes);

}  // namespace galaxy_ast
